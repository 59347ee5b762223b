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
#include "grepc_textbuffer.h"

#include <algorithm>

namespace grepc {

QString TextBuffer::textOf(int from, int to) const
{
    QString all = text();
    from = std::clamp(from, 0, static_cast<int>(all.size()));
    to = std::clamp(to, from, static_cast<int>(all.size()));
    return all.sliced(from, to - from);
}

int TextBuffer::lineStartAt(int offset) const
{
    return lineAt(lineNumberAt(offset)).startOffset;
}

int TextBuffer::nextLineStartAt(int offset) const
{
    int line = lineNumberAt(offset);
    if (line + 1 >= lineCount()) {
        return length();
    }
    return lineAt(line + 1).startOffset;
}

StringTextBuffer::StringTextBuffer(const QString& bufferId, const QString& text)
    : d_bufferId(bufferId)
    , d_text(text)
{
    rebuildLineIndex();
}

void StringTextBuffer::setText(const QString& text)
{
    d_text = text;
    rebuildLineIndex();
}

TextEdit StringTextBuffer::replace(int from, int to, const QString& text)
{
    from = std::clamp(from, 0, length());
    to = std::clamp(to, from, length());

    TextEdit edit { from, to, text };
    apply(edit);
    return edit;
}

void StringTextBuffer::apply(const TextEdit& edit)
{
    d_text.replace(edit.from, edit.to - edit.from, edit.text);
    rebuildLineIndex();
}

LineInfo StringTextBuffer::lineAt(int lineNumber) const
{
    lineNumber = std::clamp(lineNumber, 0, lineCount() - 1);

    int start = d_lineStarts[lineNumber];
    int end = (lineNumber + 1 < lineCount()) ? d_lineStarts[lineNumber + 1] - 1 : length();
    return LineInfo { d_text.sliced(start, end - start), start };
}

int StringTextBuffer::offsetAt(int line, int column) const
{
    if (line < 0) {
        return 0;
    }
    if (line >= lineCount()) {
        return length();
    }

    int start = d_lineStarts[line];
    int end = (line + 1 < lineCount()) ? d_lineStarts[line + 1] - 1 : length();
    return std::clamp(start + column, start, end);
}

std::pair<int, int> StringTextBuffer::positionAt(int offset) const
{
    offset = std::clamp(offset, 0, length());

    auto it = std::upper_bound(d_lineStarts.begin(), d_lineStarts.end(), offset);
    int line = static_cast<int>(std::distance(d_lineStarts.begin(), it)) - 1;
    return std::make_pair(line, offset - d_lineStarts[line]);
}

void StringTextBuffer::rebuildLineIndex()
{
    d_lineStarts.clear();
    d_lineStarts.append(0);

    for (qsizetype i = 0; i < d_text.size(); i++) {
        if (d_text[i] == QChar::LineFeed) {
            d_lineStarts.append(static_cast<int>(i + 1));
        }
    }
}

}
