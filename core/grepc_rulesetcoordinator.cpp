/*
 * This file is part of Grepc
 * Copyright (c) 2026 Grepc contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */
#include "grepc_rulesetcoordinator.h"

#include <QDebug>
#include <QRegularExpression>
#include <QScopedValueRollback>
#include <QSet>
#include <QTimer>

namespace grepc {

RuleSetCoordinator::RuleSetCoordinator(QObject* parent)
    : QObject(parent)
    , d_buffer(nullptr)
    , d_locked(false)
    , d_stale(false)
    , d_updating(false)
    , d_ruleSetPending(false)
{
    d_rebuildTimer = new QTimer(this);
    d_rebuildTimer->setSingleShot(true);
    d_rebuildTimer->setInterval(d_settings.debounceInterval());
    d_rebuildTimer->callOnTimeout(this, &RuleSetCoordinator::rebuildAll);
}

void RuleSetCoordinator::setEngineSettings(const EngineSettings& settings)
{
    bool capChanged = settings.maxOccurrences() != d_settings.maxOccurrences();

    d_settings = settings;
    d_rebuildTimer->setInterval(d_settings.debounceInterval());

    if (d_buffer && d_settings.isBufferIgnored(d_buffer->bufferId())) {
        setActiveBuffer(nullptr);
    }
    else if (capChanged) {
        rebuildAll();
    }
}

const IntervalStore* RuleSetCoordinator::store(const QString& ruleId) const
{
    auto it = d_entries.constFind(ruleId);
    if (it == d_entries.constEnd()) {
        return nullptr;
    }
    return &it->store;
}

int RuleSetCoordinator::occurrenceCount(const QString& ruleId) const
{
    auto it = d_entries.constFind(ruleId);
    if (it == d_entries.constEnd()) {
        return 0;
    }
    return static_cast<int>(it->store.size());
}

QString RuleSetCoordinator::ruleError(const QString& ruleId) const
{
    auto it = d_entries.constFind(ruleId);
    if (it == d_entries.constEnd()) {
        return QString();
    }
    return it->errorString;
}

void RuleSetCoordinator::setActiveBuffer(TextBuffer* buffer)
{
    if (buffer && d_settings.isBufferIgnored(buffer->bufferId())) {
        qDebug() << "Not tracking occurrences in ignored buffer" << buffer->bufferId();
        buffer = nullptr;
    }

    if (buffer == d_buffer) {
        return;
    }

    untrackAll();
    d_pendingEdits.clear();
    d_ruleSetPending = false;
    d_buffer = buffer;

    if (!d_buffer) {
        publishEmpty(d_enabledRules);
        return;
    }

    // Either way, the next update has to track every rule from scratch
    d_stale = true;
    if (d_locked) {
        return;
    }
    processPendingWork();
}

void RuleSetCoordinator::setLocked(bool locked)
{
    d_locked = locked;
}

void RuleSetCoordinator::notifyRuleSetChanged(const QList<Rule>& enabledRules)
{
    d_enabledRules = enabledRules;

    if (d_locked) {
        qDebug() << "Rule set is locked for update, skipping";
        d_stale = true;
        return;
    }

    if (!d_buffer) {
        publishEmpty(enabledRules);
        return;
    }

    d_ruleSetPending = true;
    processPendingWork();
}

void RuleSetCoordinator::notifyEdit(const QString& bufferId, const TextEdit& edit)
{
    if (!d_buffer || d_buffer->bufferId() != bufferId) {
        qDebug() << "Ignoring edit to inactive buffer" << bufferId;
        return;
    }

    if (d_locked) {
        qDebug() << "Rule set is locked for update, skipping edit";
        d_stale = true;
        return;
    }

    d_pendingEdits.enqueue(edit);
    processPendingWork();
}

void RuleSetCoordinator::rebuildAll()
{
    d_rebuildTimer->stop();

    if (d_locked) {
        d_stale = true;
        return;
    }
    if (!d_buffer) {
        return;
    }

    d_stale = true;
    processPendingWork();
}

void RuleSetCoordinator::scheduleRebuild()
{
    d_rebuildTimer->start();
}

void RuleSetCoordinator::processPendingWork()
{
    if (d_updating) {
        // Picked up by the loop below once the current step completes
        return;
    }

    QScopedValueRollback guard { d_updating, true };
    while (d_buffer) {
        if (d_locked) {
            if (d_ruleSetPending || !d_pendingEdits.isEmpty()) {
                d_stale = true;
            }
            d_ruleSetPending = false;
            d_pendingEdits.clear();
            break;
        }

        if (d_stale) {
            // The buffer text already includes every queued edit
            d_pendingEdits.clear();
            d_ruleSetPending = false;
            applyRuleSet(d_enabledRules, true);
        }
        else if (!d_pendingEdits.isEmpty()) {
            applyEdit(d_pendingEdits.dequeue());
        }
        else if (d_ruleSetPending) {
            d_ruleSetPending = false;
            applyRuleSet(d_enabledRules, false);
        }
        else {
            break;
        }
    }
}

static bool isRelativeOrderChanged(const QStringList& before, const QStringList& after)
{
    QSet<QString> beforeSet(before.begin(), before.end());
    QSet<QString> afterSet(after.begin(), after.end());

    QStringList commonBefore;
    for (const QString& id : before) {
        if (afterSet.contains(id)) {
            commonBefore.append(id);
        }
    }

    QStringList commonAfter;
    for (const QString& id : after) {
        if (beforeSet.contains(id)) {
            commonAfter.append(id);
        }
    }
    return commonBefore != commonAfter;
}

void RuleSetCoordinator::applyRuleSet(const QList<Rule>& enabledRules, bool forceRebuild)
{
    d_stale = false;

    QStringList newOrder;
    QList<Rule> rules;
    for (const Rule& rule : enabledRules) {
        if (newOrder.contains(rule.id)) {
            qWarning() << "Rule ID" << rule.id << "appears more than once in the enabled rules, ignoring duplicate";
            continue;
        }
        newOrder.append(rule.id);
        rules.append(rule);
    }

    // Rendering order follows list order, so reordering redoes everything
    bool reordered = isRelativeOrderChanged(d_order, newOrder);

    QStringList removed;
    for (const QString& id : std::as_const(d_order)) {
        if (!newOrder.contains(id)) {
            d_entries.remove(id);
            removed.append(id);
        }
    }

    QList<Rule> restyled;
    QStringList republished;
    const QString text = d_buffer->text();

    for (const Rule& rule : std::as_const(rules)) {
        auto it = d_entries.find(rule.id);
        if (it == d_entries.end()) {
            TrackedRule entry;
            entry.rule = rule;
            it = d_entries.insert(rule.id, entry);

            retrack(it.value(), text);
            restyled.append(rule);
            republished.append(rule.id);
            continue;
        }

        RuleChange change = classifyRuleChange(it->rule, rule);
        bool cosmetic = hasCosmeticChanged(it->rule, rule);
        if (forceRebuild || reordered) {
            change = RuleChange::CONTENT;
        }

        it->rule = rule;

        switch (change) {
            case RuleChange::NONE:
                break;
            case RuleChange::COSMETIC:
                restyled.append(rule);
                break;
            case RuleChange::CONTENT:
                retrack(it.value(), text);
                if (cosmetic || reordered) {
                    restyled.append(rule);
                }
                republished.append(rule.id);
                break;
        }
    }

    bool orderChanged = d_order != newOrder;
    d_order = newOrder;

    if (d_order.size() != d_entries.size()) {
        qWarning() << "Data integrity error: tracking" << d_entries.size()
                   << "occurrence stores for" << d_order.size() << "ordered rules";
    }

    for (const QString& id : std::as_const(removed)) {
        Q_EMIT ruleDeactivated(id);
        Q_EMIT occurrencesChanged(id, MatchRangeList(), 0);
    }
    for (const Rule& rule : std::as_const(restyled)) {
        Q_EMIT ruleStyleChanged(rule);
    }
    for (const QString& id : std::as_const(republished)) {
        publish(id);
    }
    if (orderChanged) {
        Q_EMIT ruleOrderChanged(newOrder);
    }
}

void RuleSetCoordinator::applyEdit(const TextEdit& edit)
{
    QStringList updated;
    const QString text = d_buffer->text();

    for (const QString& id : std::as_const(d_order)) {
        auto it = d_entries.find(id);
        if (it == d_entries.end()) {
            qWarning() << "Data integrity error: no occurrence store for rule" << id;
            continue;
        }

        TrackedRule& entry = it.value();
        if (entry.filteredOut || !entry.engine) {
            // The store is already empty, only its length is kept current
            entry.store.setTextLength(d_buffer->length());
            continue;
        }

        RescanResult result = entry.engine->update(entry.store, edit, *d_buffer, text);
        if (!result.valid) {
            entry.errorString = result.errorString;
        }
        updated.append(id);
    }

    for (const QString& id : std::as_const(updated)) {
        publish(id);
    }
}

void RuleSetCoordinator::retrack(TrackedRule& entry, const QString& text)
{
    entry.engine.emplace(entry.rule, d_settings.maxOccurrences());
    entry.filteredOut = false;
    entry.errorString.clear();

    QString filterError;
    if (!passesFileFilters(entry.rule, filterError)) {
        entry.filteredOut = true;
        entry.errorString = filterError;
        entry.store.clear();
        entry.store.setTextLength(d_buffer->length());
        return;
    }

    RescanResult result = entry.engine->rebuild(entry.store, *d_buffer, text);
    if (!result.valid) {
        qWarning() << "Invalid regular expression" << entry.rule.pattern
                   << "for rule" << entry.rule.title << ":" << result.errorString;
        entry.errorString = result.errorString;
    }
}

void RuleSetCoordinator::untrackAll()
{
    const QStringList ids = d_order;

    d_order.clear();
    d_entries.clear();

    for (const QString& id : ids) {
        Q_EMIT ruleDeactivated(id);
        Q_EMIT occurrencesChanged(id, MatchRangeList(), 0);
    }
    if (!ids.isEmpty()) {
        Q_EMIT ruleOrderChanged(d_order);
    }
}

void RuleSetCoordinator::publishEmpty(const QList<Rule>& rules)
{
    for (const Rule& rule : rules) {
        Q_EMIT occurrencesChanged(rule.id, MatchRangeList(), 0);
    }
}

bool RuleSetCoordinator::passesFileFilters(const Rule& rule, QString& errorString) const
{
    QString path = d_buffer->bufferId();

    if (!rule.excludedFiles.isEmpty()) {
        QRegularExpression exclude(rule.excludedFiles);
        if (!exclude.isValid()) {
            qWarning() << "Invalid excluded files filter" << rule.excludedFiles << "for rule" << rule.title;
            errorString = exclude.errorString();
            return false;
        }
        if (exclude.match(path).hasMatch()) {
            qDebug() << "Rule" << rule.title << "not applied, buffer" << path << "matches exclude filter";
            return false;
        }
    }

    if (!rule.includedFiles.isEmpty()) {
        QRegularExpression include(rule.includedFiles);
        if (!include.isValid()) {
            qWarning() << "Invalid included files filter" << rule.includedFiles << "for rule" << rule.title;
            errorString = include.errorString();
            return false;
        }
        if (!include.match(path).hasMatch()) {
            qDebug() << "Rule" << rule.title << "not applied, buffer" << path << "does not match include filter";
            return false;
        }
    }

    return true;
}

void RuleSetCoordinator::publish(const QString& ruleId)
{
    auto it = d_entries.constFind(ruleId);
    if (it == d_entries.constEnd()) {
        // Untracked by an observer of an earlier signal
        return;
    }

    // Copied, since observers may queue further edits to the store
    MatchRangeList ranges = it->store.ranges();
    Q_EMIT occurrencesChanged(ruleId, ranges, static_cast<int>(ranges.size()));
}

}

#include "moc_grepc_rulesetcoordinator.cpp"
