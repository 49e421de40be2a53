#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(tvLog)

namespace phicore::samsungtv::ipc {

inline QString logPrefix(const QString &logId)
{
    return QStringLiteral("[%1]").arg(logId);
}

} // namespace phicore::samsungtv::ipc
