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
#include "grepc_rescanengine.h"

#include <QDebug>

#include <algorithm>

namespace grepc {

RescanEngine::RescanEngine(const Rule& rule, int defaultCap)
    : d_cap(rule.occurrenceCap(defaultCap))
{
    if (rule.pattern.isEmpty()) {
        // An empty pattern matches nothing rather than every position
        d_cap = 0;
    }
    d_pattern = rule.compilePattern(&d_errorString);
}

RescanResult RescanEngine::failedResult(IntervalStore& store, const TextBuffer& buffer) const
{
    RescanResult result;
    result.removed = store.size();
    result.valid = false;
    result.errorString = d_errorString;

    store.clear();
    store.setTextLength(buffer.length());
    return result;
}

RescanResult RescanEngine::rebuild(IntervalStore& store, const TextBuffer& buffer) const
{
    return rebuild(store, buffer, buffer.text());
}

RescanResult RescanEngine::rebuild(IntervalStore& store, const TextBuffer& buffer, const QString& text) const
{
    if (!d_pattern) {
        return failedResult(store, buffer);
    }

    RescanResult result;
    result.removed = store.size();
    result.rebuilt = true;
    result.inserted = store.rebuild(text, d_pattern.value(), d_cap);
    result.count = static_cast<int>(store.size());
    return result;
}

static MatchRange snapToLines(const TextBuffer& buffer, int start, int end)
{
    return MatchRange { buffer.lineStartAt(start), buffer.nextLineStartAt(end) };
}

static bool rangeLessThan(const MatchRange& a, const MatchRange& b)
{
    return a.start < b.start || (a.start == b.start && a.end < b.end);
}

void RescanEngine::evictOverlapping(IntervalStore& store, MatchRange& window, const TextBuffer& buffer, MatchRangeList& evicted) const
{
    int textLength = buffer.length();

    while (true) {
        // A zero-width match at the very end of the text belongs to a window
        // that reaches the end.
        MatchRange lookupWindow = window;
        if (lookupWindow.end >= textLength) {
            lookupWindow.end = textLength + 1;
        }

        auto [first, last] = store.lookupOverlapping(lookupWindow);
        if (first == last) {
            return;
        }

        int start = store.at(first).start;
        int end = store.at(last - 1).end;

        for (qsizetype i = first; i < last; i++) {
            evicted.append(store.at(i));
        }
        store.splice(first, last, MatchRangeList());

        if (start < window.start) {
            window.start = buffer.lineStartAt(start);
        }
        if (end > window.end) {
            window.end = buffer.nextLineStartAt(end);
        }
    }
}

MatchRangeList RescanEngine::rematch(IntervalStore& store, MatchRange& window, int scanStart, std::optional<MatchRange> skip,
                                     qsizetype limit, const TextBuffer& buffer, const QString& text, MatchRangeList& evicted) const
{
    MatchRangeList found;
    int textLength = static_cast<int>(text.size());

    // Only the window and the line after it are searched at first. Should a
    // match starting in the window run to the end of that, the search goes
    // on over the rest of the text.
    int bound = window.end < textLength ? buffer.nextLineStartAt(window.end) : textLength;
    bool bounded = bound < textLength;

    int resumeAt = scanStart;
    QRegularExpressionMatchIterator it;
    if (bounded) {
        it = d_pattern->globalMatchView(QStringView(text).first(bound), scanStart,
                                        QRegularExpression::PartialPreferFirstMatch);
    }
    else {
        it = d_pattern->globalMatch(text, scanStart);
    }

    while (found.size() < limit) {
        if (bounded && window.end >= bound) {
            bounded = false;
            it = d_pattern->globalMatch(text, resumeAt);
        }
        if (!it.hasNext()) {
            break;
        }

        QRegularExpressionMatch match = it.next();
        int start = static_cast<int>(match.capturedStart());
        int end = static_cast<int>(match.capturedEnd());

        if (start > window.end || (start == window.end && window.end < textLength)) {
            break;
        }

        if (match.hasPartialMatch()) {
            bounded = false;
            it = d_pattern->globalMatch(text, resumeAt);
            continue;
        }

        MatchRange range { start, end };
        if (skip && range == skip.value()) {
            // Zero-width match already held by the store, or found before
            // the search was restarted
            continue;
        }

        if (end > window.end) {
            // Ran into the retained matches after the window, which must
            // be re-matched as well.
            window.end = end;
            evictOverlapping(store, window, buffer, evicted);
        }
        found.append(range);

        resumeAt = end;
        skip = start == end ? std::make_optional(range) : std::nullopt;
    }
    return found;
}

RescanResult RescanEngine::update(IntervalStore& store, const TextEdit& edit, const TextBuffer& buffer) const
{
    return update(store, edit, buffer, buffer.text());
}

RescanResult RescanEngine::update(IntervalStore& store, const TextEdit& edit, const TextBuffer& buffer, const QString& text) const
{
    if (!d_pattern) {
        return failedResult(store, buffer);
    }

    int oldLength = store.textLength();
    int newLength = static_cast<int>(text.size());
    int delta = edit.delta();

    if (edit.from < 0 || edit.from > edit.to || edit.to > oldLength || oldLength + delta != newLength) {
        qWarning() << "Edit" << edit.from << edit.to << "does not agree with stored text length"
                   << oldLength << "- buffer length is" << newLength << ", rebuilding";
        return rebuild(store, buffer, text);
    }

    bool wasSaturated = store.size() >= d_cap;

    // Phase 1: binary search for the run of matches invalidated by the edit,
    // in offsets from before the edit. Everything after that run moves by
    // the edit's length delta.
    IntersectingRun run = store.lookupIntersecting(MatchRange { edit.from, edit.to });
    qsizetype invalidated = run.hi - run.lo;

    store.splice(run.lo, run.hi, MatchRangeList());
    store.shift(run.lo, delta);
    store.setTextLength(newLength);

    // The span, matches included or not, starts before the edit and ends
    // after it, so only its end needs translating.
    int spanStart = run.span.start;
    int spanEnd = std::clamp(run.span.end + delta, spanStart, newLength);

    // Phase 2: re-match whole lines, so that a match is never cut short by
    // the window boundary.
    MatchRange window = snapToLines(buffer, spanStart, spanEnd);

    MatchRangeList evicted;
    evictOverlapping(store, window, buffer, evicted);

    qsizetype insertAt = store.lookupOverlapping(window).first;

    // Matches before the window take precedence for the occurrence cap
    qsizetype limit = d_cap - insertAt;

    MatchRangeList found;
    if (limit > 0) {
        // A match may start a few lines back and run into the window, but
        // never before the retained match preceding it.
        int scanStart = buffer.offsetAt(std::max(buffer.lineNumberAt(window.start) - CONTEXT_LINES, 0), 0);
        std::optional<MatchRange> skip;
        if (insertAt > 0) {
            MatchRange previous = store.at(insertAt - 1);
            if (previous.end >= scanStart) {
                scanStart = previous.end;
                if (previous.isEmpty()) {
                    skip = previous;
                }
            }
        }
        found = rematch(store, window, scanStart, skip, limit, buffer, text, evicted);
    }

    store.splice(insertAt, insertAt, found);

    // Matches found again exactly where they were do not count as changes
    std::sort(evicted.begin(), evicted.end(), rangeLessThan);
    qsizetype unchanged = std::count_if(found.cbegin(), found.cend(), [&evicted](const MatchRange& range) {
        return std::binary_search(evicted.cbegin(), evicted.cend(), range, rangeLessThan);
    });

    RescanResult result;
    result.removed = invalidated + evicted.size() - unchanged;
    result.inserted = found.size() - unchanged;

    if (store.size() > d_cap) {
        store.truncate(d_cap);
    }

    if (wasSaturated && store.size() < d_cap) {
        // Matches beyond the old cap were never stored, so some of them may
        // now have to take the place of removed ones.
        return rebuild(store, buffer, text);
    }

    if (!store.isConsistent()) {
        qWarning() << "Occurrence store became inconsistent after edit" << edit.from << edit.to << ", rebuilding";
        return rebuild(store, buffer, text);
    }

    result.count = static_cast<int>(store.size());
    return result;
}

}
