#pragma once

#include <QList>
#include <QString>
#include <QStringList>

#include "AppSettings.h"
#include "TransferTypes.h"

struct RcloneInvocation {
    QStringList arguments;
    QString description;
    bool reportsStats = false;
};

namespace RcloneCommand {

bool plan(const TransferJob &job,
          const TransferSettings &settings,
          const QString &filterFilePath,
          QList<RcloneInvocation> *invocations,
          QString *error);

bool needsFilterFile(const TransferJob &job);
QStringList filterRules(const QList<TransferItem> &items);
QString escapeFilterPattern(const QString &name);
QStringList commonArguments(const TransferJob &job, const TransferSettings &settings);

} // namespace RcloneCommand
