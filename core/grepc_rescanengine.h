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
#include "grepc_rule.h"
#include "grepc_textbuffer.h"

#include <QRegularExpression>
#include <QString>

#include <optional>

namespace grepc {

struct RescanResult
{
    int count = 0;
    qsizetype removed = 0;
    qsizetype inserted = 0;
    bool rebuilt = false;

    // False if the rule's pattern could not be compiled
    bool valid = true;
    QString errorString;
};

// Applies one rule's pattern to a buffer, either from scratch or
// incrementally after an edit, keeping an IntervalStore equal to the result
// of a full left-to-right scan capped at the rule's occurrence limit.
class RescanEngine
{
public:
    RescanEngine(const Rule& rule, int defaultCap);

    bool isValid() const { return d_pattern.has_value(); }
    QString errorString() const { return d_errorString; }
    int cap() const { return d_cap; }

    RescanResult rebuild(IntervalStore& store, const TextBuffer& buffer) const;
    RescanResult rebuild(IntervalStore& store, const TextBuffer& buffer, const QString& text) const;

    // Bring _store_ up to date with _buffer_, which already contains the
    // given edit. The store must reflect the buffer as it was right before
    // the edit; if it evidently does not, it is rebuilt instead.
    RescanResult update(IntervalStore& store, const TextEdit& edit, const TextBuffer& buffer) const;

    // Same, with the buffer's current _text_ already at hand
    RescanResult update(IntervalStore& store, const TextEdit& edit, const TextBuffer& buffer, const QString& text) const;

    // Number of lines before the edited ones searched for matches that
    // start there and run into the edited lines
    static constexpr int CONTEXT_LINES = 16;

private:
    RescanResult failedResult(IntervalStore& store, const TextBuffer& buffer) const;

    // Remove all stored matches overlapping the window, widening it to
    // line boundaries around them until no stored match overlaps. Removed
    // matches are appended to _evicted_.
    void evictOverlapping(IntervalStore& store, MatchRange& window, const TextBuffer& buffer, MatchRangeList& evicted) const;

    MatchRangeList rematch(IntervalStore& store, MatchRange& window, int scanStart, std::optional<MatchRange> skip,
                           qsizetype limit, const TextBuffer& buffer, const QString& text, MatchRangeList& evicted) const;

    std::optional<QRegularExpression> d_pattern;
    QString d_errorString;
    int d_cap;
};

}
