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

#include "grepc_occurrencepublisher.h"
#include "grepc_rule.h"
#include "grepc_ruleset.h"
#include "grepc_rulesetcoordinator.h"
#include "grepc_rulestore.h"

#include <QJsonArray>
#include <QObject>
#include <QString>

#include <memory>

namespace grepc {

// One independently tracked set of rules, such as the user's global rules or
// those of a workspace. Several scopes can track the same buffer side by
// side, each with its own stores and its own published occurrences.
class RuleScope : public QObject
{
    Q_OBJECT

public:
    RuleScope(const QString& name, std::unique_ptr<RuleStore> store, QObject* parent = nullptr);

    QString name() const { return d_name; }

    RuleStore* store() const { return d_store.get(); }
    RuleSet* ruleSet() { return &d_ruleSet; }
    RuleSetCoordinator* coordinator() { return &d_coordinator; }
    OccurrencePublisher* publisher() { return &d_publisher; }

    // Track _rules_ as given, without going through the rule set
    void trackRules(const QList<Rule>& rules);

    // Enabled rules of this scope with their published occurrences
    QJsonArray toJson() const;

private:
    QString d_name;
    std::unique_ptr<RuleStore> d_store;

    RuleSet d_ruleSet;
    RuleSetCoordinator d_coordinator;
    OccurrencePublisher d_publisher;
};

}
