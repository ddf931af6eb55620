#pragma once

#include <QDateTime>
#include <QList>
#include <QString>
#include <QStringList>

#include <memory>

struct DirectoryEntry {
    QString relativePath;
    QString name;
    qint64 size = 0;
    QDateTime modified;
    bool isDir = false;
};

class DirectoryLister
{
public:
    virtual ~DirectoryLister() = default;

    virtual bool list(const QString &root, bool recursive, QList<DirectoryEntry> *entries, QString *error) const = 0;
    virtual bool removeFile(const QString &root, const QString &relativePath, QString *error) const = 0;

    static std::shared_ptr<DirectoryLister> forDestination(const QString &destination,
                                                           const QString &rclonePath,
                                                           const QStringList &baseArguments);
};

class LocalDirectoryLister final : public DirectoryLister
{
public:
    bool list(const QString &root, bool recursive, QList<DirectoryEntry> *entries, QString *error) const override;
    bool removeFile(const QString &root, const QString &relativePath, QString *error) const override;
};

class RcloneDirectoryLister final : public DirectoryLister
{
public:
    RcloneDirectoryLister(const QString &rclonePath, const QStringList &baseArguments, int timeoutMs = 60000);

    bool list(const QString &root, bool recursive, QList<DirectoryEntry> *entries, QString *error) const override;
    bool removeFile(const QString &root, const QString &relativePath, QString *error) const override;

    static bool parseListing(const QByteArray &json, QList<DirectoryEntry> *entries, QString *error);

private:
    bool run(const QStringList &arguments, QByteArray *output, int *exitCode, QString *error) const;

    QString m_rclonePath;
    QStringList m_baseArguments;
    int m_timeoutMs = 60000;
};
