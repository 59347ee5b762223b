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

#include <memory>

QT_BEGIN_NAMESPACE
class QSettings;
QT_END_NAMESPACE

namespace grepc {

class RuleStore : public QObject
{
    Q_OBJECT

public:
    RuleStore(QObject* parent = nullptr) : QObject(parent) {}

    virtual QList<Rule> getRules() const = 0;

    // Start persisting _rules_. Completion is reported by rulesWritten().
    virtual void putRules(const QList<Rule>& rules) = 0;

signals:
    void rulesWritten(bool ok);
};

class SettingsRuleStore : public RuleStore
{
    Q_OBJECT

public:
    // With an empty _settingsFile_, the application's default settings are
    // used.
    SettingsRuleStore(const QString& settingsFile, const QString& scope, QObject* parent = nullptr);
    ~SettingsRuleStore();

    QString scope() const { return d_scope; }
    int version() const;

    QList<Rule> getRules() const override;
    void putRules(const QList<Rule>& rules) override;

private:
    void writeRules(const QList<Rule>& rules);

    QString arrayKey() const;
    QString versionKey() const;

    std::unique_ptr<QSettings> d_settings;
    QString d_scope;
};

}
