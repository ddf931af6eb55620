#pragma once

#include <QString>

namespace PlatformUtils {

QString normalizePath(const QString &path);
bool isRemotePath(const QString &path);
QString joinPath(const QString &root, const QString &name);
QString fileName(const QString &path);
bool removeLocalFile(const QString &path, QString *error);

} // namespace PlatformUtils
