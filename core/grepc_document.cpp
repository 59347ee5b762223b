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
#include "grepc_document.h"

#include <QScopedValueRollback>
#include <QTextBlock>

#include <algorithm>

namespace grepc {

Document::Document(QObject* parent)
    : QTextDocument(parent)
    , d_suppressContentChangeHandling(false)
    , d_knownLength(0)
{
    connect(this, &QTextDocument::contentsChange, this, &Document::propagateDocumentEdit);
}

QString Document::text() const
{
    return toPlainText();
}

int Document::length() const
{
    // Every block ends with a separator that is counted in characterCount(),
    // the last one included. That last separator is not part of the text.
    return characterCount() - 1;
}

LineInfo Document::lineAt(int lineNumber) const
{
    QTextBlock block = findBlockByNumber(std::clamp(lineNumber, 0, blockCount() - 1));
    return LineInfo { block.text(), block.position() };
}

int Document::offsetAt(int line, int column) const
{
    if (line < 0) {
        return 0;
    }
    if (line >= blockCount()) {
        return length();
    }

    QTextBlock block = findBlockByNumber(line);
    return block.position() + std::clamp(column, 0, static_cast<int>(block.text().size()));
}

std::pair<int, int> Document::positionAt(int offset) const
{
    offset = std::clamp(offset, 0, length());

    QTextBlock block = findBlock(offset);
    if (!block.isValid()) {
        block = lastBlock();
    }
    return std::make_pair(block.blockNumber(), offset - block.position());
}

void Document::setDocumentText(const QString& text)
{
    QScopedValueRollback guard { d_suppressContentChangeHandling, true };
    setPlainText(text);
    d_knownLength = length();

    Q_EMIT contentReset();
}

void Document::propagateDocumentEdit(int from, int charsRemoved, int charsAdded)
{
    if (d_suppressContentChangeHandling) {
        d_knownLength = length();
        return;
    }

    // Block separators occupy one position each in Qt's reckoning, and
    // toPlainText() renders each of them as a single line feed, so global
    // positions line up with offsets into text(). The change counts may
    // include the final separator, which text() does not contain.
    QString content = text();
    from = std::clamp(from, 0, static_cast<int>(content.size()));
    charsAdded = std::clamp(charsAdded, 0, static_cast<int>(content.size()) - from);

    int to = std::clamp(from + charsRemoved, from, std::max(from, d_knownLength));
    d_knownLength = static_cast<int>(content.size());

    TextEdit edit { from, to, content.sliced(from, charsAdded) };
    Q_EMIT contentEdited(bufferId(), edit);
}

}

#include "moc_grepc_document.cpp"
