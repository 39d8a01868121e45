#include "common/logging.h"

#include <QtCore/QDateTime>
#include <QtCore/QTextStream>

#include <cstdlib>

namespace common
{

Q_LOGGING_CATEGORY(appLog, "axisbend")

namespace
{

const char* levelTag(QtMsgType type)
{
    switch (type)
    {
    case QtDebugMsg: return "DEBUG";
    case QtInfoMsg: return "INFO";
    case QtWarningMsg: return "WARN";
    case QtCriticalMsg: return "ERROR";
    case QtFatalMsg: return "FATAL";
    }
    return "?";
}

// [time] LEVEL (category): message, all on stderr so stdout stays free for preview CSV and summaries.
void writeRecord(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    QTextStream stream(stderr);
    stream << '[' << QDateTime::currentDateTime().toString(Qt::ISODateWithMs) << "] " << levelTag(type);
    if (context.category != nullptr && qstrcmp(context.category, "default") != 0)
    {
        stream << " (" << context.category << ')';
    }
    stream << ": " << message << Qt::endl;

    if (type == QtFatalMsg)
    {
        abort();
    }
}

} // namespace

void initLogging(bool verbose)
{
    qInstallMessageHandler(writeRecord);
    if (!verbose)
    {
        QLoggingCategory::setFilterRules(QStringLiteral("axisbend.*.info=false"));
    }
}

void logInfo(const QString& message)
{
    qCInfo(appLog).noquote() << message;
}

void logWarning(const QString& message)
{
    qCWarning(appLog).noquote() << message;
}

void logError(const QString& message)
{
    qCCritical(appLog).noquote() << message;
}

} // namespace common
