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
#include "grepc_enginesettings.h"
#include "grepc_occurrencepublisher.h"
#include "grepc_rule.h"
#include "grepc_rulescope.h"
#include "grepc_ruleset.h"
#include "grepc_rulesetcoordinator.h"
#include "grepc_rulestore.h"
#include "grepc_textbuffer.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>
#include <QTextStream>

#include <memory>
#include <optional>
#include <vector>

static std::optional<QString> readFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Couldn't open" << path << ":" << file.errorString();
        return std::nullopt;
    }
    return QString::fromUtf8(file.readAll());
}

// Rules of each scope, keyed by scope name. A bare array holds the rules of
// _defaultScope_, as does the "rules" key of an object.
static std::optional<QHash<QString, QList<grepc::Rule>>> readRulesFile(const QString& path, const QString& defaultScope)
{
    std::optional<QString> data = readFile(path);
    if (!data) {
        return std::nullopt;
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(data->toUtf8(), &error);
    if (doc.isNull()) {
        qWarning() << "Couldn't parse rules file" << path << ":" << error.errorString();
        return std::nullopt;
    }

    QHash<QString, QList<grepc::Rule>> result;
    if (doc.isArray()) {
        result.insert(defaultScope, grepc::rulesFromJson(doc.array()));
        return result;
    }

    QJsonObject obj = doc.object();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (!it.value().isArray()) {
            qWarning() << "Ignoring" << it.key() << "in rules file, not an array";
            continue;
        }
        QString scope = it.key() == QStringLiteral("rules") ? defaultScope : it.key();
        result[scope].append(grepc::rulesFromJson(it.value().toArray()));
    }
    return result;
}

static QString unescape(const QString& text)
{
    QString result;
    result.reserve(text.size());

    for (qsizetype i = 0; i < text.size(); i++) {
        QChar ch = text[i];
        if (ch == QLatin1Char('\\') && i + 1 < text.size()) {
            QChar next = text[++i];
            if (next == QLatin1Char('n')) {
                result.append(QChar::LineFeed);
            }
            else if (next == QLatin1Char('t')) {
                result.append(QChar::Tabulation);
            }
            else {
                result.append(next);
            }
            continue;
        }
        result.append(ch);
    }
    return result;
}

// Parse "<from>:<to>:<text>". The text may contain further colons.
static std::optional<grepc::TextEdit> parseEdit(const QString& spec)
{
    qsizetype first = spec.indexOf(QLatin1Char(':'));
    qsizetype second = first < 0 ? -1 : spec.indexOf(QLatin1Char(':'), first + 1);
    if (second < 0) {
        return std::nullopt;
    }

    bool fromOk = false, toOk = false;
    int from = spec.sliced(0, first).toInt(&fromOk);
    int to = spec.sliced(first + 1, second - first - 1).toInt(&toOk);
    if (!fromOk || !toOk || from < 0 || to < from) {
        return std::nullopt;
    }

    return grepc::TextEdit { from, to, unescape(spec.sliced(second + 1)) };
}

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("Grepc");
    QCoreApplication::setApplicationName("Grepc");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Report occurrences of highlighting rules in a text file");
    parser.addPositionalArgument("file", "File to scan");
    parser.addOptions({
        QCommandLineOption{ "rules", "Read rules from a JSON file instead of the settings", "file.json" },
        QCommandLineOption{ "settings", "Engine settings mode line, applied over the stored settings", "mode" },
        QCommandLineOption{ "rule-scope", "Scope of stored rules to track. Can be repeated; global and local by default.", "scope" },
        QCommandLineOption{ "local-rules", "Settings file holding the rules of the local scope", "file.ini" },
        QCommandLineOption{ "edit", "Apply an edit after the initial scan. Can be repeated.", "from:to:text" }
    });
    parser.addVersionOption();
    parser.addHelpOption();
    parser.process(app);

    if (parser.positionalArguments().size() != 1) {
        parser.showHelp(1);
    }

    QString filePath = QFileInfo(parser.positionalArguments().at(0)).absoluteFilePath();
    std::optional<QString> content = readFile(filePath);
    if (!content) {
        return 1;
    }

    QList<grepc::TextEdit> edits;
    const QStringList editSpecs = parser.values("edit");
    for (const QString& spec : editSpecs) {
        std::optional<grepc::TextEdit> edit = parseEdit(spec);
        if (!edit) {
            qWarning() << "Invalid edit" << spec;
            return 1;
        }
        edits.append(edit.value());
    }

    QSettings settings;
    grepc::EngineSettings engineSettings = grepc::EngineSettings::fromSettings(settings);
    if (parser.isSet("settings")) {
        engineSettings.mergeSettings(grepc::EngineSettings(parser.value("settings")));
    }

    QStringList scopeNames = parser.values("rule-scope");
    if (scopeNames.isEmpty()) {
        scopeNames = QStringList { "global", "local" };
    }
    scopeNames.removeDuplicates();

    grepc::StringTextBuffer buffer(filePath, content.value());

    std::vector<std::unique_ptr<grepc::RuleScope>> scopes;
    for (const QString& name : std::as_const(scopeNames)) {
        QString settingsFile = name == QStringLiteral("local") ? parser.value("local-rules") : QString();
        auto scope = std::make_unique<grepc::RuleScope>(name, std::make_unique<grepc::SettingsRuleStore>(settingsFile, name));
        scope->coordinator()->setEngineSettings(engineSettings);
        scope->coordinator()->setActiveBuffer(&buffer);
        scopes.push_back(std::move(scope));
    }

    if (parser.isSet("rules")) {
        auto rules = readRulesFile(parser.value("rules"), scopeNames.first());
        if (!rules) {
            return 1;
        }
        for (auto it = rules->constBegin(); it != rules->constEnd(); ++it) {
            if (!scopeNames.contains(it.key())) {
                qWarning() << "Ignoring rules of untracked scope" << it.key();
            }
        }
        for (const auto& scope : scopes) {
            scope->trackRules(rules->value(scope->name()));
        }
    }
    else {
        for (const auto& scope : scopes) {
            scope->ruleSet()->load();
        }
    }

    for (const grepc::TextEdit& edit : std::as_const(edits)) {
        grepc::TextEdit applied = buffer.replace(edit.from, edit.to, edit.text);
        for (const auto& scope : scopes) {
            scope->coordinator()->notifyEdit(buffer.bufferId(), applied);
        }
    }

    QJsonArray rulesArray;
    for (const auto& scope : scopes) {
        const QJsonArray scopeRules = scope->toJson();
        for (const QJsonValue& rule : scopeRules) {
            rulesArray.append(rule);
        }
    }

    QJsonObject result;
    result.insert("rules", rulesArray);

    QTextStream out(stdout);
    out << QJsonDocument(result).toJson(QJsonDocument::Indented);
    return 0;
}
