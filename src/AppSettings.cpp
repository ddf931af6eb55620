/************************************************************************\

    Ferryman - Rclone transfer manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "AppSettings.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QProcess>

namespace {

struct SettingsConstants {
    static constexpr int minimumParallelism = 1;
    static constexpr int maximumParallelism = 64;
    static constexpr int minimumPollIntervalMs = 10;
    static constexpr int minimumSnapshotIntervalMs = 20;
    static constexpr int minimumTerminateTimeoutMs = 0;
    static constexpr int minimumKillWaitMs = 100;
    static constexpr int minimumLogRetention = 1;
};

QString expandHome(const QString &path)
{
    if (path == QStringLiteral("~")) {
        return QDir::homePath();
    }
    if (path.startsWith(QStringLiteral("~/"))) {
        return QDir::home().filePath(path.mid(2));
    }
    return path;
}

QString defaultRcloneConfig()
{
    return QDir::home().filePath(QStringLiteral(".config/rclone/rclone.conf"));
}

// INI values may come back as a QStringList when they contain commas.
QString readString(QSettings &settings, const QString &key, const QString &fallback)
{
    const QVariant value = settings.value(key, fallback);
    if (value.userType() == QMetaType::QStringList) {
        return value.toStringList().join(QLatin1Char(','));
    }
    return value.toString();
}

int readInt(QSettings &settings, const QString &key, int fallback, int minimum)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok) {
        qWarning() << "[AppSettings] Invalid value for" << key << ", using" << fallback;
        return fallback;
    }
    if (value < minimum) {
        qWarning() << "[AppSettings]" << key << "=" << value << "clamped to" << minimum;
        return minimum;
    }
    return value;
}

} // namespace

/**
 * @brief Returns the arguments every rclone call starts with.
 *
 * The config file is only passed when it exists.
 */
QStringList TransferSettings::baseArguments() const
{
    QStringList arguments;
    if (!rcloneConfig.isEmpty() && QFileInfo::exists(rcloneConfig)) {
        arguments << QStringLiteral("--config") << rcloneConfig;
    }
    arguments << extraFlags;
    return arguments;
}

namespace AppSettings {

/**
 * @brief Loads settings from the user's INI file.
 * @return Settings with defaults for missing keys and environment overrides applied.
 */
TransferSettings load()
{
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, "Ferryman", "Ferryman");
    return fromSettings(settings);
}

TransferSettings load(const QString &iniPath)
{
    QSettings settings(iniPath, QSettings::IniFormat);
    return fromSettings(settings);
}

TransferSettings fromSettings(QSettings &settings)
{
    TransferSettings result;

    settings.beginGroup(QStringLiteral("General"));
    result.rclonePath = readString(settings, QStringLiteral("rclone_path"), result.rclonePath).trimmed();
    result.rcloneConfig = expandHome(readString(settings, QStringLiteral("rclone_config"), defaultRcloneConfig()).trimmed());
    result.extraFlags = QProcess::splitCommand(readString(settings, QStringLiteral("extra_rclone_flags"), QString()));
    result.debug = settings.value(QStringLiteral("debug"), result.debug).toBool();
    result.logRetention = readInt(settings, QStringLiteral("log_retention"), result.logRetention,
                                  SettingsConstants::minimumLogRetention);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("Transfer"));
    result.parallelism = qMin(SettingsConstants::maximumParallelism,
                              readInt(settings, QStringLiteral("parallelism"), result.parallelism,
                                      SettingsConstants::minimumParallelism));
    result.statsInterval = readString(settings, QStringLiteral("stats_interval"), result.statsInterval).trimmed();
    result.statsFlag = readString(settings, QStringLiteral("stats_flag"), result.statsFlag).trimmed();
    result.parallelismFlag = readString(settings, QStringLiteral("parallelism_flag"), result.parallelismFlag).trimmed();
    if (settings.contains(QStringLiteral("progress_flags"))) {
        result.progressFlags = QProcess::splitCommand(readString(settings, QStringLiteral("progress_flags"), QString()));
    }
    result.pollIntervalMs = readInt(settings, QStringLiteral("poll_interval_ms"), result.pollIntervalMs,
                                    SettingsConstants::minimumPollIntervalMs);
    result.snapshotIntervalMs = readInt(settings, QStringLiteral("snapshot_interval_ms"), result.snapshotIntervalMs,
                                        SettingsConstants::minimumSnapshotIntervalMs);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("Cancellation"));
    result.terminateTimeoutMs = readInt(settings, QStringLiteral("terminate_timeout_ms"), result.terminateTimeoutMs,
                                        SettingsConstants::minimumTerminateTimeoutMs);
    result.killWaitMs = readInt(settings, QStringLiteral("kill_wait_ms"), result.killWaitMs,
                                SettingsConstants::minimumKillWaitMs);
    result.autoCleanupPartial = settings.value(QStringLiteral("auto_cleanup_partial"), result.autoCleanupPartial).toBool();
    const QString suffix = readString(settings, QStringLiteral("partial_suffix"), result.partialSuffix).trimmed();
    if (!suffix.isEmpty()) {
        result.partialSuffix = suffix;
    }
    settings.endGroup();

    const QString envPath = qEnvironmentVariable("RCLONE_PATH").trimmed();
    if (!envPath.isEmpty()) {
        result.rclonePath = envPath;
    }
    const QString envConfig = qEnvironmentVariable("RCLONE_CONFIG").trimmed();
    if (!envConfig.isEmpty()) {
        result.rcloneConfig = expandHome(envConfig);
    }
    if (result.rclonePath.isEmpty()) {
        result.rclonePath = QStringLiteral("rclone");
    }
    if (result.statsInterval.isEmpty()) {
        result.statsInterval = QStringLiteral("1s");
    }

    return result;
}

QString settingsFilePath()
{
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, "Ferryman", "Ferryman");
    return settings.fileName();
}

} // namespace AppSettings
