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
#include "grepc_rule.h"

#include <QDebug>
#include <QUuid>

namespace grepc {

Rule Rule::create(const QString& title)
{
    Rule rule;
    rule.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    rule.title = title;
    return rule;
}

static QString readString(const QJsonObject& obj, QLatin1StringView key, const QString& fallback = QString())
{
    QJsonValue val = obj.value(key);
    if (val.isString()) {
        return val.toString();
    }
    if (val.isDouble()) {
        return QString::number(val.toDouble());
    }
    return fallback;
}

static bool readBool(const QJsonObject& obj, QLatin1StringView key, bool fallback)
{
    QJsonValue val = obj.value(key);
    return val.isBool() ? val.toBool() : fallback;
}

Rule Rule::fromJson(const QJsonObject& obj)
{
    Rule rule;
    rule.id = readString(obj, QLatin1StringView("id"));
    rule.title = readString(obj, QLatin1StringView("title"));
    rule.enabled = readBool(obj, QLatin1StringView("enabled"), false);

    rule.pattern = readString(obj, QLatin1StringView("regularExpression"));
    rule.patternFlags = readString(obj, QLatin1StringView("regularExpressionFlags"));
    rule.includedFiles = readString(obj, QLatin1StringView("includedFiles"));
    rule.excludedFiles = readString(obj, QLatin1StringView("excludedFiles"));

    QJsonValue maxOccurrences = obj.value(QLatin1StringView("maxOccurrences"));
    if (maxOccurrences.isDouble()) {
        rule.maxOccurrences = maxOccurrences.toInt();
    }
    else if (maxOccurrences.isNull()) {
        rule.maxOccurrences.reset();
    }

    rule.occurrences = obj.value(QLatin1StringView("occurrences")).toInt(0);

    RuleDecoration& d = rule.decoration;
    d.backgroundColor = readString(obj, QLatin1StringView("backgroundColor"));
    d.color = readString(obj, QLatin1StringView("color"));
    d.outline = readString(obj, QLatin1StringView("outline"));
    d.outlineColor = readString(obj, QLatin1StringView("outlineColor"));
    d.outlineWidth = readString(obj, QLatin1StringView("outlineWidth"));
    d.border = readString(obj, QLatin1StringView("border"));
    d.borderColor = readString(obj, QLatin1StringView("borderColor"));
    d.borderWidth = readString(obj, QLatin1StringView("borderWidth"));
    d.fontStyle = readString(obj, QLatin1StringView("fontStyle"));
    d.fontWeight = readString(obj, QLatin1StringView("fontWeight"), d.fontWeight);
    d.textDecoration = readString(obj, QLatin1StringView("textDecoration"));
    d.cursor = readString(obj, QLatin1StringView("cursor"));
    d.isWholeLine = readBool(obj, QLatin1StringView("isWholeLine"), false);
    d.overviewRulerColor = readString(obj, QLatin1StringView("overviewRulerColor"));
    d.overviewRulerLane = obj.value(QLatin1StringView("overviewRulerLane")).toInt(d.overviewRulerLane);

    return rule;
}

QJsonObject Rule::toJson() const
{
    QJsonObject obj;
    obj.insert("id", id);
    obj.insert("title", title);
    obj.insert("enabled", enabled);

    obj.insert("regularExpression", pattern);
    obj.insert("regularExpressionFlags", patternFlags);
    obj.insert("includedFiles", includedFiles);
    obj.insert("excludedFiles", excludedFiles);
    obj.insert("maxOccurrences", maxOccurrences ? QJsonValue(maxOccurrences.value()) : QJsonValue(QJsonValue::Null));
    obj.insert("occurrences", occurrences);

    obj.insert("backgroundColor", decoration.backgroundColor);
    obj.insert("color", decoration.color);
    obj.insert("outline", decoration.outline);
    obj.insert("outlineColor", decoration.outlineColor);
    obj.insert("outlineWidth", decoration.outlineWidth);
    obj.insert("border", decoration.border);
    obj.insert("borderColor", decoration.borderColor);
    obj.insert("borderWidth", decoration.borderWidth);
    obj.insert("fontStyle", decoration.fontStyle);
    obj.insert("fontWeight", decoration.fontWeight);
    obj.insert("textDecoration", decoration.textDecoration);
    obj.insert("cursor", decoration.cursor);
    obj.insert("isWholeLine", decoration.isWholeLine);
    obj.insert("overviewRulerColor", decoration.overviewRulerColor);
    obj.insert("overviewRulerLane", decoration.overviewRulerLane);

    return obj;
}

std::optional<QRegularExpression> Rule::compilePattern(QString* errorString) const
{
    QRegularExpression::PatternOptions options = QRegularExpression::NoPatternOption;

    auto invalidFlags = [this, errorString](const QString& reason) {
        if (errorString) {
            *errorString = QStringLiteral("invalid flags '%1': %2").arg(patternFlags, reason);
        }
        return std::nullopt;
    };

    for (qsizetype i = 0; i < patternFlags.size(); i++) {
        QChar flag = patternFlags.at(i);
        if (patternFlags.indexOf(flag, i + 1) >= 0) {
            return invalidFlags(QStringLiteral("'%1' given more than once").arg(flag));
        }

        switch (flag.unicode()) {
            case 'g':
            case 'y':
            case 'd':
                // Matching is always global, and match indices always reported
                break;
            case 'i':
                options |= QRegularExpression::CaseInsensitiveOption;
                break;
            case 'm':
                options |= QRegularExpression::MultilineOption;
                break;
            case 's':
                options |= QRegularExpression::DotMatchesEverythingOption;
                break;
            case 'u':
            case 'v':
                options |= QRegularExpression::UseUnicodePropertiesOption;
                break;
            default:
                return invalidFlags(QStringLiteral("unknown flag '%1'").arg(flag));
        }
    }

    if (patternFlags.contains(QLatin1Char('u')) && patternFlags.contains(QLatin1Char('v'))) {
        return invalidFlags(QStringLiteral("'u' and 'v' are mutually exclusive"));
    }

    QRegularExpression expr(pattern, options);
    if (!expr.isValid()) {
        if (errorString) {
            *errorString = QStringLiteral("%1 at offset %2").arg(expr.errorString()).arg(expr.patternErrorOffset());
        }
        return std::nullopt;
    }
    return expr;
}

bool hasContentChanged(const Rule& before, const Rule& after)
{
    return before.id != after.id
        || before.enabled != after.enabled
        || before.pattern != after.pattern
        || before.patternFlags != after.patternFlags
        || before.includedFiles != after.includedFiles
        || before.excludedFiles != after.excludedFiles
        || before.maxOccurrences != after.maxOccurrences;
}

bool hasCosmeticChanged(const Rule& before, const Rule& after)
{
    return before.title != after.title
        || before.decoration != after.decoration;
}

RuleChange classifyRuleChange(const Rule& before, const Rule& after)
{
    if (hasContentChanged(before, after)) {
        return RuleChange::CONTENT;
    }
    if (hasCosmeticChanged(before, after)) {
        return RuleChange::COSMETIC;
    }
    return RuleChange::NONE;
}

QList<Rule> rulesFromJson(const QJsonArray& array)
{
    QList<Rule> result;
    result.reserve(array.size());

    for (const QJsonValue& val : array) {
        if (!val.isObject()) {
            qWarning() << "Skipping malformed rule entry" << val;
            continue;
        }
        result.append(Rule::fromJson(val.toObject()));
    }
    return result;
}

QJsonArray rulesToJson(const QList<Rule>& rules)
{
    QJsonArray array;
    for (const Rule& rule : rules) {
        array.append(rule.toJson());
    }
    return array;
}

}
