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
#include "grepc_ruleset.h"
#include "grepc_rulestore.h"

#include <QDebug>

#include <algorithm>

namespace grepc {

RuleSet::RuleSet(RuleStore* store, QObject* parent)
    : QObject(parent)
    , d_store(store)
    , d_locked(false)
    , d_pendingWrites(0)
{
    connect(d_store, &RuleStore::rulesWritten, this, &RuleSet::rulesWritten);
}

void RuleSet::load()
{
    if (d_locked) {
        qDebug() << "Rule set is locked for update, not loading stored rules";
        return;
    }

    d_rules = d_store->getRules();
    Q_EMIT rulesChanged();

    recastEnabledRules();
}

std::optional<Rule> RuleSet::rule(const QString& id) const
{
    qsizetype index = indexOf(id);
    if (index < 0) {
        return std::nullopt;
    }
    return d_rules.at(index);
}

int RuleSet::enabledRulesCount() const
{
    return static_cast<int>(std::count_if(d_rules.begin(), d_rules.end(), [](const Rule& rule) {
        return rule.enabled;
    }));
}

bool RuleSet::addRule(const Rule& rule)
{
    if (indexOf(rule.id) >= 0) {
        qWarning() << "Rule ID" << rule.id << "cannot be added, it already exists";
        return false;
    }

    d_rules.append(rule);
    commit();
    return true;
}

bool RuleSet::updateRule(const Rule& rule)
{
    qsizetype index = indexOf(rule.id);
    if (index < 0) {
        qWarning() << "Unable to find rule ID" << rule.id << "to update";
        return false;
    }

    d_rules[index] = rule;
    commit();
    return true;
}

bool RuleSet::removeRule(const QString& id)
{
    qsizetype index = indexOf(id);
    if (index < 0) {
        qWarning() << "Unable to find rule ID" << id << "to remove";
        return false;
    }

    d_rules.removeAt(index);
    commit();
    return true;
}

bool RuleSet::moveRule(const QString& id, int index)
{
    qsizetype from = indexOf(id);
    if (from < 0) {
        qWarning() << "Unable to find rule ID" << id << "to move";
        return false;
    }

    qsizetype to = std::clamp<qsizetype>(index, 0, d_rules.size() - 1);
    if (from == to) {
        return true;
    }

    d_rules.move(from, to);
    commit();
    return true;
}

void RuleSet::setAllEnabled(bool enabled)
{
    for (Rule& rule : d_rules) {
        rule.enabled = enabled;
    }
    commit();
}

void RuleSet::setOccurrenceCount(const QString& id, int count)
{
    qsizetype index = indexOf(id);
    if (index < 0) {
        return;
    }
    d_rules[index].occurrences = count;
}

void RuleSet::recastEnabledRules()
{
    QList<Rule> enabled;
    for (const Rule& rule : std::as_const(d_rules)) {
        if (rule.enabled) {
            enabled.append(rule);
        }
    }

    d_enabledRules = enabled;
    Q_EMIT enabledRulesChanged(d_enabledRules);
}

void RuleSet::rulesWritten(bool ok)
{
    if (d_pendingWrites == 0) {
        // Someone else wrote through the same store
        return;
    }
    if (!ok) {
        qWarning() << "Failed to persist rules, keeping them in memory only";
    }

    d_pendingWrites--;
    if (d_pendingWrites > 0) {
        return;
    }

    d_locked = false;
    Q_EMIT lockedChanged(false);

    recastEnabledRules();
}

qsizetype RuleSet::indexOf(const QString& id) const
{
    auto it = std::find_if(d_rules.begin(), d_rules.end(), [&id](const Rule& rule) {
        return rule.id == id;
    });
    return it == d_rules.end() ? -1 : std::distance(d_rules.begin(), it);
}

void RuleSet::commit()
{
    Q_EMIT rulesChanged();

    d_pendingWrites++;
    if (!d_locked) {
        d_locked = true;
        Q_EMIT lockedChanged(true);
    }

    d_store->putRules(d_rules);
}

}

#include "moc_grepc_ruleset.cpp"
