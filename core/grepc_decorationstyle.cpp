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
#include "grepc_decorationstyle.h"
#include "grepc_rulesetcoordinator.h"
#include "grepc_textbuffer.h"

#include <QDebug>
#include <QFont>
#include <QRegularExpression>

#include <algorithm>

namespace grepc {

static QColor readColor(const QString& value)
{
    if (value.isEmpty()) {
        return QColor();
    }

    QColor color = QColor::fromString(value.trimmed());
    if (!color.isValid()) {
        qWarning() << "Ignoring invalid color" << value;
    }
    return color;
}

static int readFontWeight(const QString& value)
{
    QString v = value.trimmed().toLower();
    if (v == QStringLiteral("bold") || v == QStringLiteral("bolder")) {
        return QFont::Bold;
    }
    if (v == QStringLiteral("lighter")) {
        return QFont::Light;
    }

    bool ok = false;
    int weight = v.toInt(&ok);
    if (ok && weight >= QFont::Thin && weight <= QFont::Black) {
        return weight;
    }
    return QFont::Normal;
}

static int readWidth(const QString& value)
{
    static QRegularExpression re(QStringLiteral("^(\\d+)(px)?$"));

    QRegularExpressionMatch match = re.match(value.trimmed());
    if (!match.hasMatch()) {
        return 0;
    }
    return match.captured(1).toInt();
}

// Read a shorthand like "1px solid red", then apply the separate color and
// width attributes on top of it.
static QPen readFrame(const QString& shorthand, const QString& colorValue, const QString& widthValue)
{
    QColor color;
    int width = 0;
    bool hidden = false;

    const QStringList parts = shorthand.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        if (part == QStringLiteral("none") || part == QStringLiteral("hidden")) {
            hidden = true;
        }
        else if (int w = readWidth(part); w > 0) {
            width = w;
        }
        else if (QColor c = QColor::fromString(part); c.isValid()) {
            color = c;
        }
    }

    if (!colorValue.isEmpty()) {
        color = readColor(colorValue);
    }
    if (!widthValue.isEmpty()) {
        width = readWidth(widthValue);
    }

    if (hidden || !color.isValid()) {
        return QPen(Qt::NoPen);
    }

    QPen pen(color);
    pen.setWidth(std::max(width, 1));
    return pen;
}

DecorationStyle::DecorationStyle(const Rule& rule)
    : d_ruleId(rule.id)
    , d_title(rule.title)
    , d_wholeLine(rule.decoration.isWholeLine)
    , d_overviewRulerLane(rule.decoration.overviewRulerLane)
{
    const RuleDecoration& decoration = rule.decoration;

    QColor background = readColor(decoration.backgroundColor);
    if (background.isValid()) {
        d_format.setBackground(background);
    }
    QColor foreground = readColor(decoration.color);
    if (foreground.isValid()) {
        d_format.setForeground(foreground);
    }

    d_format.setFontWeight(readFontWeight(decoration.fontWeight));

    QString fontStyle = decoration.fontStyle.trimmed().toLower();
    if (fontStyle == QStringLiteral("italic") || fontStyle == QStringLiteral("oblique")) {
        d_format.setFontItalic(true);
    }

    QString textDecoration = decoration.textDecoration.toLower();
    if (textDecoration.contains(QStringLiteral("underline"))) {
        d_format.setFontUnderline(true);
    }
    if (textDecoration.contains(QStringLiteral("line-through"))) {
        d_format.setFontStrikeOut(true);
    }
    if (textDecoration.contains(QStringLiteral("overline"))) {
        d_format.setFontOverline(true);
    }

    // A border takes precedence over an outline
    d_frame = readFrame(decoration.border, decoration.borderColor, decoration.borderWidth);
    if (d_frame.style() == Qt::NoPen) {
        d_frame = readFrame(decoration.outline, decoration.outlineColor, decoration.outlineWidth);
    }

    d_overviewRulerColor = readColor(decoration.overviewRulerColor);
}

DecorationManager::DecorationManager(RuleSetCoordinator* coordinator, QObject* parent)
    : QObject(parent)
    , d_coordinator(coordinator)
{
    connect(d_coordinator, &RuleSetCoordinator::ruleStyleChanged, this, &DecorationManager::createStyle);
    connect(d_coordinator, &RuleSetCoordinator::ruleDeactivated, this, &DecorationManager::disposeStyle);
    connect(d_coordinator, &RuleSetCoordinator::occurrencesChanged, this, &DecorationManager::setRanges);
    connect(d_coordinator, &RuleSetCoordinator::ruleOrderChanged, this, &DecorationManager::setOrder);
}

std::shared_ptr<const DecorationStyle> DecorationManager::style(const QString& ruleId) const
{
    return d_styles.value(ruleId);
}

QList<QTextLayout::FormatRange> DecorationManager::formatRanges() const
{
    TextBuffer* buffer = d_coordinator->activeBuffer();
    if (!buffer) {
        return QList<QTextLayout::FormatRange>();
    }
    return formatRanges(0, buffer->length());
}

QList<DecorationManager::StyledRange> DecorationManager::clippedRanges(int from, int to) const
{
    QList<StyledRange> result;

    TextBuffer* buffer = d_coordinator->activeBuffer();
    if (!buffer || to < from) {
        return result;
    }

    for (const QString& id : d_order) {
        std::shared_ptr<const DecorationStyle> s = d_styles.value(id);
        if (!s) {
            continue;
        }

        const MatchRangeList ranges = d_ranges.value(id);
        for (const MatchRange& range : ranges) {
            int start = range.start;
            int end = range.end;
            if (s->isWholeLine()) {
                LineInfo lastLine = buffer->lineAt(buffer->lineNumberAt(end));
                start = buffer->lineStartAt(start);
                end = std::max(end, lastLine.startOffset + static_cast<int>(lastLine.text.size()));
            }

            start = std::max(start, from);
            end = std::min(end, to);
            if (end <= start) {
                continue;
            }
            result.append(std::make_pair(s, MatchRange { start - from, end - from }));
        }
    }
    return result;
}

QList<QTextLayout::FormatRange> DecorationManager::formatRanges(int from, int to) const
{
    QList<QTextLayout::FormatRange> result;

    const QList<StyledRange> ranges = clippedRanges(from, to);
    for (const auto& [s, range] : ranges) {
        QTextLayout::FormatRange fr;
        fr.start = range.start;
        fr.length = range.length();
        fr.format = s->format();
        result.append(fr);
    }
    return result;
}

QList<FrameRange> DecorationManager::frameRanges(int from, int to) const
{
    QList<FrameRange> result;

    const QList<StyledRange> ranges = clippedRanges(from, to);
    for (const auto& [s, range] : ranges) {
        if (!s->hasFrame()) {
            continue;
        }

        FrameRange frame;
        frame.start = range.start;
        frame.length = range.length();
        frame.pen = s->frame();
        result.append(frame);
    }
    return result;
}

void DecorationManager::createStyle(const Rule& rule)
{
    // A restyled rule keeps its occurrences until they are published again
    MatchRangeList ranges = d_ranges.value(rule.id);
    if (d_styles.contains(rule.id)) {
        disposeStyle(rule.id);
    }

    d_styles.insert(rule.id, std::make_shared<const DecorationStyle>(rule));
    if (!ranges.isEmpty()) {
        d_ranges.insert(rule.id, ranges);
    }
    Q_EMIT styleCreated(rule.id);
    Q_EMIT decorationsChanged();
}

void DecorationManager::disposeStyle(const QString& ruleId)
{
    if (d_styles.remove(ruleId) == 0) {
        return;
    }

    d_ranges.remove(ruleId);
    Q_EMIT styleDisposed(ruleId);
    Q_EMIT decorationsChanged();
}

void DecorationManager::setRanges(const QString& ruleId, const QList<MatchRange>& ranges, int count)
{
    Q_UNUSED(count);

    if (!d_styles.contains(ruleId)) {
        return;
    }
    d_ranges.insert(ruleId, ranges);
    Q_EMIT decorationsChanged();
}

void DecorationManager::setOrder(const QStringList& ruleIds)
{
    d_order = ruleIds;
    Q_EMIT decorationsChanged();
}

}

#include "moc_grepc_decorationstyle.cpp"
