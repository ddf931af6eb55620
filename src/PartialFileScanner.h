#pragma once

#include <QList>
#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <memory>

#include "DirectoryLister.h"
#include "TransferTypes.h"

class PartialFileScanner
{
public:
    explicit PartialFileScanner(std::shared_ptr<const DirectoryLister> lister,
                                const QString &suffix = QStringLiteral(".partial"));

    QList<PartialFileCandidate> scan(const QString &destinationRoot,
                                     bool wasDirectoryTransfer,
                                     const QStringList &originalNames = QStringList(),
                                     QString *error = nullptr) const;
    CleanupReport remove(const QList<PartialFileCandidate> &candidates) const;

    bool matches(const QString &fileName, QString *originalName = nullptr) const;
    QString suffix() const;

    static bool matchesPartialName(const QString &fileName, const QString &suffix, QString *originalName = nullptr);

private:
    static QRegularExpression buildPattern(const QString &suffix);
    static bool matchWith(const QRegularExpression &pattern, const QString &fileName, QString *originalName);

    std::shared_ptr<const DirectoryLister> m_lister;
    QString m_suffix;
    QRegularExpression m_pattern;
};
