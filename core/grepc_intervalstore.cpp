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
#include "grepc_intervalstore.h"

#include <QRegularExpression>
#include <QString>

#include <algorithm>

namespace grepc {

IntersectingRun IntervalStore::lookupIntersecting(const MatchRange& range) const
{
    MatchRange padded {
        std::max(0, range.start - 1),
        std::min(d_textLength, range.end + 1)
    };
    padded.end = std::max(padded.start, padded.end);

    qsizetype left = 0;
    qsizetype right = d_ranges.size() - 1;

    while (left <= right) {
        qsizetype middle = left + (right - left) / 2;
        const MatchRange& probe = d_ranges[middle];

        if (probe.touches(padded)) {
            // Found some intersecting match, now walk outwards to find the
            // whole contiguous run of them.
            IntersectingRun run { middle, middle + 1, padded };
            while (run.lo > 0 && d_ranges[run.lo - 1].touches(padded)) {
                run.lo--;
            }
            while (run.hi < d_ranges.size() && d_ranges[run.hi].touches(padded)) {
                run.hi++;
            }

            run.span.start = std::min(run.span.start, d_ranges[run.lo].start);
            run.span.end = std::max(run.span.end, d_ranges[run.hi - 1].end);
            return run;
        }
        else if (probe.end < padded.start) {
            left = middle + 1;
        }
        else {
            right = middle - 1;
        }
    }

    return IntersectingRun { left, left, padded };
}

std::pair<qsizetype, qsizetype> IntervalStore::lookupOverlapping(const MatchRange& window) const
{
    auto first = std::partition_point(d_ranges.begin(), d_ranges.end(), [&window](const MatchRange& r) {
        return r.end <= window.start && r.start < window.start;
    });
    auto last = std::partition_point(first, d_ranges.end(), [&window](const MatchRange& r) {
        return r.start < window.end;
    });

    return std::make_pair(
        static_cast<qsizetype>(std::distance(d_ranges.begin(), first)),
        static_cast<qsizetype>(std::distance(d_ranges.begin(), last)));
}

void IntervalStore::splice(qsizetype lo, qsizetype hi, const MatchRangeList& matches)
{
    lo = std::clamp<qsizetype>(lo, 0, d_ranges.size());
    hi = std::clamp<qsizetype>(hi, lo, d_ranges.size());

    d_ranges.remove(lo, hi - lo);
    d_ranges.insert(lo, matches.size(), MatchRange{});
    std::copy(matches.begin(), matches.end(), d_ranges.begin() + lo);
}

void IntervalStore::shift(qsizetype from, int delta)
{
    if (delta == 0) {
        return;
    }
    for (qsizetype i = std::max<qsizetype>(from, 0); i < d_ranges.size(); i++) {
        d_ranges[i].start += delta;
        d_ranges[i].end += delta;
    }
}

void IntervalStore::truncate(qsizetype count)
{
    if (count < d_ranges.size()) {
        d_ranges.resize(std::max<qsizetype>(count, 0));
    }
}

void IntervalStore::clear()
{
    d_ranges.clear();
}

qsizetype IntervalStore::rebuild(const QString& text, const QRegularExpression& pattern, int cap)
{
    d_ranges.clear();
    d_textLength = static_cast<int>(text.size());

    if (cap <= 0 || !pattern.isValid()) {
        return 0;
    }

    QRegularExpressionMatchIterator it = pattern.globalMatch(text);
    while (it.hasNext() && d_ranges.size() < cap) {
        QRegularExpressionMatch match = it.next();
        d_ranges.append(MatchRange {
            static_cast<int>(match.capturedStart()),
            static_cast<int>(match.capturedEnd())
        });
    }
    return d_ranges.size();
}

bool IntervalStore::isConsistent() const
{
    for (qsizetype i = 0; i < d_ranges.size(); i++) {
        const MatchRange& r = d_ranges[i];
        if (r.start < 0 || r.end < r.start || r.end > d_textLength) {
            return false;
        }
        if (i + 1 < d_ranges.size() && r.end > d_ranges[i + 1].start) {
            return false;
        }
    }
    return true;
}

}
