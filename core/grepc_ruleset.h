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

#include "grepc_rule.h"

#include <QList>
#include <QObject>
#include <QString>

#include <optional>

namespace grepc {

class RuleStore;

// The ordered rules of one scope. Mutations are persisted through a
// RuleStore; while a write is in flight the set is locked, and once it
// completes the enabled rules are broadcast.
class RuleSet : public QObject
{
    Q_OBJECT

public:
    RuleSet(RuleStore* store, QObject* parent = nullptr);

    // Replace the in-memory rules with the stored ones, and broadcast
    void load();

    QList<Rule> rules() const { return d_rules; }
    std::optional<Rule> rule(const QString& id) const;

    int rulesCount() const { return static_cast<int>(d_rules.size()); }
    int enabledRulesCount() const;

    bool isLocked() const { return d_locked; }

    // The last broadcast list of enabled rules
    QList<Rule> enabledRules() const { return d_enabledRules; }

    bool addRule(const Rule& rule);
    bool updateRule(const Rule& rule);
    bool removeRule(const QString& id);
    bool moveRule(const QString& id, int index);
    void setAllEnabled(bool enabled);

public slots:
    // Remember the latest published occurrence count of a rule. This does
    // not count as a change to the rules; it is persisted with the next one.
    void setOccurrenceCount(const QString& id, int count);

    void recastEnabledRules();

signals:
    void lockedChanged(bool locked);
    void enabledRulesChanged(const QList<grepc::Rule>& enabledRules);
    void rulesChanged();

private slots:
    void rulesWritten(bool ok);

private:
    qsizetype indexOf(const QString& id) const;
    void commit();

    RuleStore* d_store;

    QList<Rule> d_rules;
    QList<Rule> d_enabledRules;

    bool d_locked;
    int d_pendingWrites;
};

}
