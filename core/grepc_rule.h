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

#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QRegularExpression>
#include <QString>

#include <optional>

namespace grepc {

// Purely cosmetic attributes of a rule. None of these affect which text a
// rule matches.
struct RuleDecoration
{
    QString backgroundColor;
    QString color;

    QString outline;
    QString outlineColor;
    QString outlineWidth;

    QString border;
    QString borderColor;
    QString borderWidth;

    QString fontStyle;
    QString fontWeight = QStringLiteral("400");
    QString textDecoration;
    QString cursor;

    bool isWholeLine = false;

    QString overviewRulerColor;
    int overviewRulerLane = 7;

    bool operator==(const RuleDecoration&) const = default;
};

struct Rule
{
    static constexpr int DEFAULT_MAX_OCCURRENCES = 1000;

    QString id;
    QString title;
    bool enabled = false;

    QString pattern;
    QString patternFlags;

    QString includedFiles;
    QString excludedFiles;

    std::optional<int> maxOccurrences = DEFAULT_MAX_OCCURRENCES;

    // Last published occurrence count, persisted for display only
    int occurrences = 0;

    RuleDecoration decoration;

    bool operator==(const Rule&) const = default;

    // Create a new, disabled rule with a fresh unique ID
    static Rule create(const QString& title);

    static Rule fromJson(const QJsonObject& obj);
    QJsonObject toJson() const;

    int occurrenceCap(int defaultCap) const { return maxOccurrences.value_or(defaultCap); }

    // Compile the pattern with its flags. If either is malformed, returns
    // nothing and describes the problem in _errorString_.
    std::optional<QRegularExpression> compilePattern(QString* errorString = nullptr) const;
};

enum class RuleChange {
    NONE,
    COSMETIC,
    CONTENT,
};

// Check whether any field that influences match computation differs
bool hasContentChanged(const Rule& before, const Rule& after);

// Check whether any display attribute differs
bool hasCosmeticChanged(const Rule& before, const Rule& after);

RuleChange classifyRuleChange(const Rule& before, const Rule& after);

QList<Rule> rulesFromJson(const QJsonArray& array);
QJsonArray rulesToJson(const QList<Rule>& rules);

}

Q_DECLARE_METATYPE(grepc::Rule)
