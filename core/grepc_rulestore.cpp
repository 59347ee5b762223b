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
#include "grepc_rulestore.h"

#include <QDebug>
#include <QJsonDocument>
#include <QSet>
#include <QSettings>

namespace grepc {

SettingsRuleStore::SettingsRuleStore(const QString& settingsFile, const QString& scope, QObject* parent)
    : RuleStore(parent)
    , d_scope(scope)
{
    if (settingsFile.isEmpty()) {
        d_settings = std::make_unique<QSettings>();
    }
    else {
        d_settings = std::make_unique<QSettings>(settingsFile, QSettings::IniFormat);
    }
}

SettingsRuleStore::~SettingsRuleStore()
{
}

QString SettingsRuleStore::arrayKey() const
{
    return QStringLiteral("rules/%1/array").arg(d_scope);
}

QString SettingsRuleStore::versionKey() const
{
    return QStringLiteral("rules/%1/version").arg(d_scope);
}

int SettingsRuleStore::version() const
{
    return d_settings->value(versionKey(), 0).toInt();
}

QList<Rule> SettingsRuleStore::getRules() const
{
    QByteArray data = d_settings->value(arrayKey()).toByteArray();
    if (data.isEmpty()) {
        return QList<Rule>();
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (doc.isNull()) {
        qWarning() << "Failed to parse stored rules for scope" << d_scope << ":" << error.errorString();
        return QList<Rule>();
    }
    if (!doc.isArray()) {
        qWarning() << "Stored rules for scope" << d_scope << "are not an array";
        return QList<Rule>();
    }

    QList<Rule> result;
    QSet<QString> seenIds;
    const QList<Rule> rules = rulesFromJson(doc.array());
    for (const Rule& rule : rules) {
        if (seenIds.contains(rule.id)) {
            qWarning() << "Data integrity error: duplicate rule ID" << rule.id << "in scope" << d_scope;
            continue;
        }
        seenIds.insert(rule.id);
        result.append(rule);
    }
    return result;
}

void SettingsRuleStore::putRules(const QList<Rule>& rules)
{
    QMetaObject::invokeMethod(this, [this, rules]() {
        writeRules(rules);
    }, Qt::QueuedConnection);
}

void SettingsRuleStore::writeRules(const QList<Rule>& rules)
{
    QJsonDocument doc(rulesToJson(rules));

    d_settings->setValue(arrayKey(), QString::fromUtf8(doc.toJson(QJsonDocument::Compact)));
    d_settings->setValue(versionKey(), version() + 1);
    d_settings->sync();

    bool ok = d_settings->status() == QSettings::NoError;
    if (!ok) {
        qWarning() << "Failed to write rules for scope" << d_scope << "to" << d_settings->fileName();
    }
    Q_EMIT rulesWritten(ok);
}

}

#include "moc_grepc_rulestore.cpp"
