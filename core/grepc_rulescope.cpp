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
#include "grepc_rulescope.h"

#include <QJsonObject>

namespace grepc {

RuleScope::RuleScope(const QString& name, std::unique_ptr<RuleStore> store, QObject* parent)
    : QObject(parent)
    , d_name(name)
    , d_store(std::move(store))
    , d_ruleSet(d_store.get())
    , d_publisher(&d_coordinator)
{
    connect(&d_ruleSet, &RuleSet::lockedChanged, &d_coordinator, &RuleSetCoordinator::setLocked);
    connect(&d_ruleSet, &RuleSet::enabledRulesChanged, &d_coordinator, &RuleSetCoordinator::notifyRuleSetChanged);
    connect(&d_publisher, &OccurrencePublisher::occurrencesPublished, this,
            [this](const QString& ruleId, const QList<LineRange>&, int count) {
        d_ruleSet.setOccurrenceCount(ruleId, count);
    });
}

void RuleScope::trackRules(const QList<Rule>& rules)
{
    QList<Rule> enabled;
    for (const Rule& rule : rules) {
        if (rule.enabled) {
            enabled.append(rule);
        }
    }
    d_coordinator.notifyRuleSetChanged(enabled);
}

QJsonArray RuleScope::toJson() const
{
    QJsonArray result;

    const QList<Rule> enabledRules = d_coordinator.enabledRules();
    for (const Rule& rule : enabledRules) {
        QJsonObject obj;
        obj.insert("scope", d_name);
        obj.insert("id", rule.id);
        obj.insert("title", rule.title);
        obj.insert("count", d_publisher.occurrenceCount(rule.id));
        obj.insert("occurrences", OccurrencePublisher::toJson(d_publisher.lineRanges(rule.id)));

        QString error = d_coordinator.ruleError(rule.id);
        if (!error.isEmpty()) {
            obj.insert("error", error);
        }
        result.append(obj);
    }
    return result;
}

}

#include "moc_grepc_rulescope.cpp"
