#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

namespace common
{

Q_DECLARE_LOGGING_CATEGORY(appLog)

/// Installs the timestamped stderr handler. With verbose off, info output of the
/// pipeline categories is filtered out.
void initLogging(bool verbose = false);
void logInfo(const QString& message);
void logWarning(const QString& message);
void logError(const QString& message);

} // namespace common
