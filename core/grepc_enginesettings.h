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

#include <QString>

#include <optional>

QT_BEGIN_NAMESPACE
class QSettings;
QT_END_NAMESPACE

namespace grepc {

class EngineSettings
{
public:
    EngineSettings() {}
    explicit EngineSettings(const QString& mode) {
        parseModeLine(mode);
    }

    bool operator==(const EngineSettings&) const = default;

    static EngineSettings fromSettings(const QSettings& settings);
    void saveSettings(QSettings& settings) const;

    QString toModeLine() const;

    int maxOccurrences() const;
    int debounceInterval() const;
    QString ignoredBuffersPattern() const;

    // Check if buffers with the given ID should never be decorated
    bool isBufferIgnored(const QString& bufferId) const;

    void setMaxOccurrences(int maxOccurrences) { d_maxOccurrences = maxOccurrences; }
    void setDebounceInterval(int interval) { d_debounceInterval = interval; }
    void setIgnoredBuffersPattern(const QString& pattern) { d_ignoredBuffersPattern = pattern; }

    bool hasMaxOccurrences() const { return d_maxOccurrences.has_value(); }
    bool hasDebounceInterval() const { return d_debounceInterval.has_value(); }
    bool hasIgnoredBuffersPattern() const { return d_ignoredBuffersPattern.has_value(); }

    void mergeSettings(const EngineSettings& other);

private:
    void parseModeLine(QString mode);

    std::optional<int> d_maxOccurrences;
    std::optional<int> d_debounceInterval;
    std::optional<QString> d_ignoredBuffersPattern;
};

}
