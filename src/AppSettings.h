#pragma once

#include <QSettings>
#include <QString>
#include <QStringList>

struct TransferSettings {
    QString rclonePath = QStringLiteral("rclone");
    QString rcloneConfig;
    QStringList extraFlags;
    bool debug = false;
    int logRetention = 5;

    int parallelism = 6;
    QString statsInterval = QStringLiteral("1s");
    QString statsFlag = QStringLiteral("--stats");
    QString parallelismFlag = QStringLiteral("--transfers");
    QStringList progressFlags = {
        QStringLiteral("--stats-file-name-length"), QStringLiteral("0"),
        QStringLiteral("--log-level"), QStringLiteral("INFO")
    };
    int pollIntervalMs = 100;
    int snapshotIntervalMs = 200;

    int terminateTimeoutMs = 5000;
    int killWaitMs = 1000;
    bool autoCleanupPartial = false;
    QString partialSuffix = QStringLiteral(".partial");

    QStringList baseArguments() const;
};

namespace AppSettings {

TransferSettings load();
TransferSettings load(const QString &iniPath);
TransferSettings fromSettings(QSettings &settings);
QString settingsFilePath();

} // namespace AppSettings
