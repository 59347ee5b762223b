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
#include "grepc_enginesettings.h"

#include <QDebug>
#include <QRegularExpression>
#include <QSettings>

namespace grepc {

static constexpr QLatin1StringView SETTING_ENGINE_MODE = QLatin1StringView("engine/mode");

EngineSettings EngineSettings::fromSettings(const QSettings& settings)
{
    if (!settings.contains(SETTING_ENGINE_MODE)) {
        return EngineSettings();
    }
    return EngineSettings(settings.value(SETTING_ENGINE_MODE).toString());
}

void EngineSettings::saveSettings(QSettings& settings) const
{
    settings.setValue(SETTING_ENGINE_MODE, toModeLine());
}

void EngineSettings::parseModeLine(QString mode)
{
    // E.g. "grepc: max-occurrences 500; debounce 300; ignore-buffers \.log$;"

    qsizetype pos = mode.indexOf(QLatin1Char(':'));
    if (pos > 0 && !mode.left(pos).contains(QLatin1Char(' '))) {
        mode = mode.sliced(pos + 1, mode.size() - pos - 1);
    }

    auto parts = mode.split(QLatin1Char(';'), Qt::SkipEmptyParts);
    for (const QString& part : std::as_const(parts)) {
        QString s = part.trimmed();
        pos = s.indexOf(QLatin1Char(' '));
        if (pos < 0) {
            continue;
        }

        QString variable = s.sliced(0, pos);
        QString rest = s.sliced(pos + 1, s.size() - pos - 1).trimmed();

        if (variable == QStringLiteral("max-occurrences")) {
            bool ok = false;
            int value = rest.toInt(&ok);
            if (ok && value >= 0) {
                d_maxOccurrences = value;
            }
        }
        else if (variable == QStringLiteral("debounce")) {
            bool ok = false;
            int value = rest.toInt(&ok);
            if (ok && value >= 0) {
                d_debounceInterval = value;
            }
        }
        else if (variable == QStringLiteral("ignore-buffers")) {
            if (QRegularExpression(rest).isValid()) {
                d_ignoredBuffersPattern = rest;
            }
            else {
                qWarning() << "Ignoring invalid buffer pattern" << rest;
            }
        }
    }
}

QString EngineSettings::toModeLine() const
{
    QString result;

    if (d_maxOccurrences) {
        result += QLatin1String("max-occurrences %1; ").arg(QString::number(d_maxOccurrences.value()));
    }
    if (d_debounceInterval) {
        result += QLatin1String("debounce %1; ").arg(QString::number(d_debounceInterval.value()));
    }
    if (d_ignoredBuffersPattern) {
        result += QLatin1String("ignore-buffers %1; ").arg(d_ignoredBuffersPattern.value());
    }

    return result.trimmed();
}

int EngineSettings::maxOccurrences() const
{
    return d_maxOccurrences.value_or(1000);
}

int EngineSettings::debounceInterval() const
{
    return d_debounceInterval.value_or(300);
}

QString EngineSettings::ignoredBuffersPattern() const
{
    return d_ignoredBuffersPattern.value_or(QString());
}

bool EngineSettings::isBufferIgnored(const QString& bufferId) const
{
    QString pattern = ignoredBuffersPattern();
    if (pattern.isEmpty()) {
        return false;
    }
    return QRegularExpression(pattern).match(bufferId).hasMatch();
}

void EngineSettings::mergeSettings(const EngineSettings& other)
{
    if (other.d_maxOccurrences) {
        d_maxOccurrences = other.d_maxOccurrences;
    }
    if (other.d_debounceInterval) {
        d_debounceInterval = other.d_debounceInterval;
    }
    if (other.d_ignoredBuffersPattern) {
        d_ignoredBuffersPattern = other.d_ignoredBuffersPattern;
    }
}

}
