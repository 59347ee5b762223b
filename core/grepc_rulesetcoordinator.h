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
#pragma once

#include "grepc_enginesettings.h"
#include "grepc_intervalstore.h"
#include "grepc_rescanengine.h"
#include "grepc_rule.h"
#include "grepc_textbuffer.h"

#include <QHash>
#include <QList>
#include <QObject>
#include <QQueue>
#include <QStringList>

#include <optional>

QT_BEGIN_NAMESPACE
class QTimer;
QT_END_NAMESPACE

namespace grepc {

// Keeps one occurrence store per enabled rule for the active buffer, and
// decides for every rule set change or buffer edit how much of it must be
// recomputed.
class RuleSetCoordinator : public QObject
{
    Q_OBJECT

public:
    RuleSetCoordinator(QObject* parent = nullptr);

    const EngineSettings& engineSettings() const { return d_settings; }
    void setEngineSettings(const EngineSettings& settings);

    // The buffer is not owned, and must outlive its time as the active one.
    // Passing nullptr deactivates the current buffer.
    TextBuffer* activeBuffer() const { return d_buffer; }
    void setActiveBuffer(TextBuffer* buffer);

    bool isLocked() const { return d_locked; }

    // Whether an event was skipped while locked, so that the next one will
    // recompute everything.
    bool isStale() const { return d_stale; }

    QList<Rule> enabledRules() const { return d_enabledRules; }
    QStringList trackedRuleIds() const { return d_order; }

    bool isTracked(const QString& ruleId) const { return d_entries.contains(ruleId); }
    const IntervalStore* store(const QString& ruleId) const;
    int occurrenceCount(const QString& ruleId) const;

    // Why a tracked rule matches nothing, if it is due to a malformed pattern
    // or file filter.
    QString ruleError(const QString& ruleId) const;

public slots:
    void setLocked(bool locked);

    void notifyRuleSetChanged(const QList<grepc::Rule>& enabledRules);
    void notifyEdit(const QString& bufferId, const grepc::TextEdit& edit);

    void rebuildAll();
    void scheduleRebuild();

signals:
    void occurrencesChanged(const QString& ruleId, const QList<grepc::MatchRange>& ranges, int count);
    void ruleStyleChanged(const grepc::Rule& rule);
    void ruleDeactivated(const QString& ruleId);
    void ruleOrderChanged(const QStringList& ruleIds);

private:
    struct TrackedRule
    {
        Rule rule;
        IntervalStore store;
        std::optional<RescanEngine> engine;
        bool filteredOut = false;
        QString errorString;
    };

    // Run queued edits and rule set changes until none are left. Observers
    // reacting to signals emitted from here only add to the queue.
    void processPendingWork();

    void applyRuleSet(const QList<Rule>& enabledRules, bool forceRebuild);
    void applyEdit(const TextEdit& edit);

    void retrack(TrackedRule& entry, const QString& text);
    void untrackAll();
    void publishEmpty(const QList<Rule>& rules);

    bool passesFileFilters(const Rule& rule, QString& errorString) const;
    void publish(const QString& ruleId);

    EngineSettings d_settings;
    TextBuffer* d_buffer;

    bool d_locked;
    bool d_stale;
    bool d_updating;
    bool d_ruleSetPending;

    QList<Rule> d_enabledRules;
    QStringList d_order;
    QHash<QString, TrackedRule> d_entries;
    QQueue<TextEdit> d_pendingEdits;

    QTimer* d_rebuildTimer;
};

}
