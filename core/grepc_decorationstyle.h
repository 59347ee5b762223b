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

#include <QColor>
#include <QHash>
#include <QList>
#include <QObject>
#include <QPen>
#include <QStringList>
#include <QTextCharFormat>
#include <QTextLayout>

#include <memory>
#include <utility>

namespace grepc {

class RuleSetCoordinator;

// Visual style of one rule's occurrences
class DecorationStyle
{
public:
    explicit DecorationStyle(const Rule& rule);

    QString ruleId() const { return d_ruleId; }
    QString title() const { return d_title; }

    const QTextCharFormat& format() const { return d_format; }

    // Border drawn around each occurrence, if any
    QPen frame() const { return d_frame; }
    bool hasFrame() const { return d_frame.style() != Qt::NoPen; }

    bool isWholeLine() const { return d_wholeLine; }

    QColor overviewRulerColor() const { return d_overviewRulerColor; }
    int overviewRulerLane() const { return d_overviewRulerLane; }

private:
    QString d_ruleId;
    QString d_title;

    QTextCharFormat d_format;
    QPen d_frame;
    bool d_wholeLine;

    QColor d_overviewRulerColor;
    int d_overviewRulerLane;
};

// Border to draw around part of a text block, relative to the block start
struct FrameRange
{
    int start = 0;
    int length = 0;
    QPen pen;
};

// Owns one DecorationStyle per tracked rule of a coordinator, along with
// that rule's latest occurrences.
class DecorationManager : public QObject
{
    Q_OBJECT

public:
    DecorationManager(RuleSetCoordinator* coordinator, QObject* parent = nullptr);

    std::shared_ptr<const DecorationStyle> style(const QString& ruleId) const;
    qsizetype styleCount() const { return d_styles.size(); }

    QStringList ruleOrder() const { return d_order; }
    MatchRangeList ranges(const QString& ruleId) const { return d_ranges.value(ruleId); }

    // Formats of all occurrences in the active buffer, in rule order so that
    // later rules are drawn over earlier ones.
    QList<QTextLayout::FormatRange> formatRanges() const;

    // Same, clipped to [from, to) and relative to _from_. Suitable for a
    // single text block.
    QList<QTextLayout::FormatRange> formatRanges(int from, int to) const;

    // Borders of occurrences of rules that have one, clipped like
    // formatRanges().
    QList<FrameRange> frameRanges(int from, int to) const;

signals:
    void styleCreated(const QString& ruleId);
    void styleDisposed(const QString& ruleId);
    void decorationsChanged();

private slots:
    void createStyle(const grepc::Rule& rule);
    void disposeStyle(const QString& ruleId);
    void setRanges(const QString& ruleId, const QList<grepc::MatchRange>& ranges, int count);
    void setOrder(const QStringList& ruleIds);

private:
    using StyledRange = std::pair<std::shared_ptr<const DecorationStyle>, MatchRange>;
    QList<StyledRange> clippedRanges(int from, int to) const;

    RuleSetCoordinator* d_coordinator;

    QStringList d_order;
    QHash<QString, std::shared_ptr<const DecorationStyle>> d_styles;
    QHash<QString, MatchRangeList> d_ranges;
};

}
