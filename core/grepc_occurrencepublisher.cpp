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
#include "grepc_occurrencepublisher.h"
#include "grepc_rulesetcoordinator.h"
#include "grepc_textbuffer.h"

#include <QDebug>

#include <algorithm>

namespace grepc {

QJsonObject LineRange::toJson() const
{
    QJsonArray numbers;
    for (int line : lineNumbers) {
        numbers.append(line);
    }

    QJsonObject obj;
    obj.insert("ruleId", ruleId);
    obj.insert("index", index);
    obj.insert("lineNumbers", numbers);
    obj.insert("lines", QJsonArray::fromStringList(lines));
    obj.insert("startIndex", startIndex);
    obj.insert("endIndexExcl", endIndexExcl);
    return obj;
}

OccurrencePublisher::OccurrencePublisher(RuleSetCoordinator* coordinator, QObject* parent)
    : QObject(parent)
    , d_coordinator(coordinator)
{
    connect(d_coordinator, &RuleSetCoordinator::occurrencesChanged, this, &OccurrencePublisher::updateOccurrences);
}

int OccurrencePublisher::occurrenceCount(const QString& ruleId) const
{
    return static_cast<int>(d_occurrences.value(ruleId).size());
}

MatchRangeList OccurrencePublisher::occurrences(const QString& ruleId) const
{
    return d_occurrences.value(ruleId);
}

QList<LineRange> OccurrencePublisher::lineRanges(const QString& ruleId) const
{
    TextBuffer* buffer = d_coordinator->activeBuffer();
    if (!buffer) {
        return QList<LineRange>();
    }
    return toLineRanges(ruleId, d_occurrences.value(ruleId), *buffer);
}

std::optional<MatchRange> OccurrencePublisher::jump(const QString& ruleId, int ordinal) const
{
    auto it = d_occurrences.constFind(ruleId);
    if (it == d_occurrences.constEnd() || ordinal < 0 || ordinal >= it->size()) {
        return std::nullopt;
    }
    return it->at(ordinal);
}

void OccurrencePublisher::jumpTo(const QString& ruleId, int ordinal)
{
    std::optional<MatchRange> range = jump(ruleId, ordinal);
    if (!range) {
        qWarning() << "No occurrence" << ordinal << "for rule" << ruleId;
        return;
    }
    Q_EMIT revealRequested(ruleId, range.value());
}

void OccurrencePublisher::updateOccurrences(const QString& ruleId, const QList<MatchRange>& ranges, int count)
{
    if (ranges.isEmpty()) {
        d_occurrences.remove(ruleId);
    }
    else {
        d_occurrences.insert(ruleId, ranges);
    }

    QList<LineRange> result;
    TextBuffer* buffer = d_coordinator->activeBuffer();
    if (buffer) {
        result = toLineRanges(ruleId, ranges, *buffer);
    }
    Q_EMIT occurrencesPublished(ruleId, result, count);
}

QList<LineRange> OccurrencePublisher::toLineRanges(const QString& ruleId, const MatchRangeList& ranges, const TextBuffer& buffer)
{
    QList<LineRange> result;
    result.reserve(ranges.size());

    for (qsizetype i = 0; i < ranges.size(); i++) {
        const MatchRange& range = ranges[i];

        int firstLine = buffer.lineNumberAt(range.start);
        // A match ending in a line feed does not span the following line
        int lastLine = buffer.lineNumberAt(std::max(range.start, range.end - 1));
        int lineStart = buffer.lineAt(firstLine).startOffset;

        LineRange lr;
        lr.ruleId = ruleId;
        lr.index = static_cast<int>(i);
        for (int line = firstLine; line <= lastLine; line++) {
            lr.lineNumbers.append(line);
            lr.lines.append(buffer.lineAt(line).text);
        }
        lr.startIndex = range.start - lineStart;
        lr.endIndexExcl = range.end - lineStart;

        result.append(lr);
    }
    return result;
}

QJsonArray OccurrencePublisher::toJson(const QList<LineRange>& lineRanges)
{
    QJsonArray array;
    for (const LineRange& lr : lineRanges) {
        array.append(lr.toJson());
    }
    return array;
}

}

#include "moc_grepc_occurrencepublisher.cpp"
