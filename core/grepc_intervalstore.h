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

#include <QList>
#include <QMetaType>

#include <utility>

QT_BEGIN_NAMESPACE
class QRegularExpression;
class QString;
QT_END_NAMESPACE

namespace grepc {

// Half-open span [start, end) of buffer offsets. Zero-width spans are valid
// matches.
struct MatchRange
{
    int start = 0;
    int end = 0;

    int length() const { return end - start; }
    bool isEmpty() const { return start == end; }

    // Closed intersection test: ranges that merely touch intersect.
    bool touches(const MatchRange& other) const {
        return start <= other.end && other.start <= end;
    }

    bool operator==(const MatchRange&) const = default;
};

using MatchRangeList = QList<MatchRange>;

// The result of looking up a span in an IntervalStore. Matches at indices
// [lo, hi) intersect the padded span; _span_ is the union of the padded
// span with all of them. If nothing intersects, lo == hi is the index at
// which matches inside the span would be inserted.
struct IntersectingRun
{
    qsizetype lo = 0;
    qsizetype hi = 0;
    MatchRange span;

    bool isEmpty() const { return lo == hi; }
};

class IntervalStore
{
public:
    IntervalStore() {}

    const MatchRangeList& ranges() const { return d_ranges; }
    const MatchRange& at(qsizetype index) const { return d_ranges.at(index); }
    qsizetype size() const { return d_ranges.size(); }
    bool isEmpty() const { return d_ranges.isEmpty(); }

    // Length of the text the stored offsets refer to
    int textLength() const { return d_textLength; }
    void setTextLength(int length) { d_textLength = length; }

    // Find the maximal contiguous run of matches intersecting _range_ padded
    // by one unit on each side (clamped to the text). A match that ends
    // exactly at an edit boundary may change when text is inserted there, so
    // adjacent matches count as intersecting.
    IntersectingRun lookupIntersecting(const MatchRange& range) const;

    // Find the run of matches overlapping the half-open window. Zero-width
    // matches overlap if they lie inside [window.start, window.end).
    std::pair<qsizetype, qsizetype> lookupOverlapping(const MatchRange& window) const;

    // Replace matches at indices [lo, hi) with _matches_, which must be
    // sorted and must not overlap the neighbours of the replaced run.
    void splice(qsizetype lo, qsizetype hi, const MatchRangeList& matches);

    // Move every match from index _from_ onwards by _delta_ offsets
    void shift(qsizetype from, int delta);

    void truncate(qsizetype count);
    void clear();

    // Scan _text_ left to right, replacing the whole sequence with at most
    // _cap_ matches of _pattern_. Returns the new match count.
    qsizetype rebuild(const QString& text, const QRegularExpression& pattern, int cap);

    // Check that matches are sorted, pairwise non-overlapping and within
    // the text.
    bool isConsistent() const;

private:
    MatchRangeList d_ranges;
    int d_textLength = 0;
};

}

Q_DECLARE_METATYPE(grepc::MatchRange)
