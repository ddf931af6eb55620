#pragma once

#include <QString>

namespace Logger {

// 0 = errors only, 1 = normal, 2 = debug
void install(const QString &appName, int retention = 5);
void setLogLevel(int level);
int logLevel();

void setLogFilePathOverride(const QString &absoluteFilePath);
QString logFilePath();
QString logDirPath();

} // namespace Logger
