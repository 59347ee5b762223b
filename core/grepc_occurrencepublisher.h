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

#include "grepc_intervalstore.h"

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QStringList>

#include <optional>

namespace grepc {

class RuleSetCoordinator;
class TextBuffer;

// One published occurrence, as shown in an occurrence list. Offsets are
// relative to the start of the first line the occurrence spans.
struct LineRange
{
    QString ruleId;
    int index = 0;
    QList<int> lineNumbers;
    QStringList lines;
    int startIndex = 0;
    int endIndexExcl = 0;

    bool operator==(const LineRange&) const = default;

    QJsonObject toJson() const;
};

class OccurrencePublisher : public QObject
{
    Q_OBJECT

public:
    OccurrencePublisher(RuleSetCoordinator* coordinator, QObject* parent = nullptr);

    int occurrenceCount(const QString& ruleId) const;
    MatchRangeList occurrences(const QString& ruleId) const;
    QList<LineRange> lineRanges(const QString& ruleId) const;

    // Location of the ordinal-th occurrence of a rule, if it still exists
    std::optional<MatchRange> jump(const QString& ruleId, int ordinal) const;

    static QList<LineRange> toLineRanges(const QString& ruleId, const MatchRangeList& ranges, const TextBuffer& buffer);
    static QJsonArray toJson(const QList<LineRange>& lineRanges);

public slots:
    void jumpTo(const QString& ruleId, int ordinal);

private slots:
    void updateOccurrences(const QString& ruleId, const QList<grepc::MatchRange>& ranges, int count);

signals:
    void occurrencesPublished(const QString& ruleId, const QList<grepc::LineRange>& lineRanges, int count);
    void revealRequested(const QString& ruleId, const grepc::MatchRange& range);

private:
    RuleSetCoordinator* d_coordinator;

    QHash<QString, MatchRangeList> d_occurrences;
};

}

Q_DECLARE_METATYPE(grepc::LineRange)
