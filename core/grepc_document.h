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

#include "grepc_textbuffer.h"

#include <QTextDocument>

namespace grepc {

class Document : public QTextDocument, public TextBuffer
{
    Q_OBJECT

public:
    Document(QObject* parent = nullptr);

    void setFilePath(const QString& filePath) { d_filePath = filePath; }

    QString bufferId() const override { return d_filePath; }

    QString text() const override;
    int length() const override;

    int lineCount() const override { return blockCount(); }
    LineInfo lineAt(int lineNumber) const override;

    int offsetAt(int line, int column) const override;
    std::pair<int, int> positionAt(int offset) const override;

public slots:
    void setDocumentText(const QString& text);

private slots:
    void propagateDocumentEdit(int from, int charsRemoved, int charsAdded);

signals:
    void contentReset();
    void contentEdited(const QString& bufferId, const grepc::TextEdit& edit);

private:
    QString d_filePath;

    bool d_suppressContentChangeHandling;
    int d_knownLength;
};

}
