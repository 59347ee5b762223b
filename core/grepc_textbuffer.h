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
#include <QString>

#include <utility>

namespace grepc {

// One atomic replacement of the span [from, to) of a buffer with _text_. The
// span is expressed in offsets of the buffer as it was before the edit.
struct TextEdit
{
    int from = 0;
    int to = 0;
    QString text;

    int delta() const { return static_cast<int>(text.size()) - (to - from); }

    bool operator==(const TextEdit&) const = default;
};

struct LineInfo
{
    QString text;
    int startOffset = 0;
};

class TextBuffer
{
public:
    virtual ~TextBuffer() {}

    // Identity of the buffer, normally its filesystem path
    virtual QString bufferId() const = 0;

    virtual QString text() const = 0;
    virtual QString textOf(int from, int to) const;
    virtual int length() const = 0;

    virtual int lineCount() const = 0;
    virtual LineInfo lineAt(int lineNumber) const = 0;

    virtual int offsetAt(int line, int column) const = 0;
    virtual std::pair<int, int> positionAt(int offset) const = 0;

    int lineNumberAt(int offset) const { return positionAt(offset).first; }

    // Offset of the start of the line containing _offset_
    int lineStartAt(int offset) const;

    // Offset of the start of the line following the one containing _offset_,
    // or the buffer length if it is on the last line.
    int nextLineStartAt(int offset) const;
};

class StringTextBuffer : public TextBuffer
{
public:
    StringTextBuffer(const QString& bufferId, const QString& text = QString());

    void setBufferId(const QString& bufferId) { d_bufferId = bufferId; }
    void setText(const QString& text);

    // Apply an edit and return the notification describing it
    TextEdit replace(int from, int to, const QString& text);
    void apply(const TextEdit& edit);

    QString bufferId() const override { return d_bufferId; }

    QString text() const override { return d_text; }
    int length() const override { return static_cast<int>(d_text.size()); }

    int lineCount() const override { return static_cast<int>(d_lineStarts.size()); }
    LineInfo lineAt(int lineNumber) const override;

    int offsetAt(int line, int column) const override;
    std::pair<int, int> positionAt(int offset) const override;

private:
    void rebuildLineIndex();

    QString d_bufferId;
    QString d_text;
    QList<int> d_lineStarts;
};

}

Q_DECLARE_METATYPE(grepc::TextEdit)
