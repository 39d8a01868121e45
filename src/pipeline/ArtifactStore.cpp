#include "pipeline/ArtifactStore.h"

#include "common/log.h"
#include "gcode/GcodeWriter.h"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QSaveFile>

#include <string_view>

namespace pipeline
{

namespace
{

constexpr std::string_view kHeaderLead = "; AxisBend stage=";

} // namespace

QString artifactPath(const QString& inputPath, Stage stage)
{
    if (stage == Stage::Raw)
    {
        return inputPath;
    }
    const QFileInfo info(inputPath);
    return info.dir().filePath(stagePrefix(stage) + info.fileName());
}

bool readLines(const QString& path, std::vector<std::string>& lines, QString& error)
{
    QFile file(path);
    if (!file.exists())
    {
        error = QStringLiteral("File not found: %1").arg(path);
        return false;
    }
    if (!file.open(QIODevice::ReadOnly))
    {
        error = QStringLiteral("Unable to open %1: %2").arg(path, file.errorString());
        return false;
    }

    const QByteArray data = file.readAll();
    if (file.error() != QFileDevice::NoError)
    {
        error = QStringLiteral("Failed to read %1: %2").arg(path, file.errorString());
        return false;
    }

    lines = gcode::splitLines(std::string_view(data.constData(), static_cast<std::size_t>(data.size())));
    return true;
}

bool hasStageHeader(const std::vector<std::string>& lines, Stage stage)
{
    return !lines.empty() && lines.front() == stageHeader(stage).toStdString();
}

void stripStageHeader(std::vector<std::string>& lines)
{
    if (!lines.empty() && std::string_view(lines.front()).substr(0, kHeaderLead.size()) == kHeaderLead)
    {
        lines.erase(lines.begin());
    }
}

bool writeArtifact(const QString& path,
                   Stage stage,
                   const std::string& body,
                   const std::atomic<bool>* cancelFlag,
                   QString& error)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        error = QStringLiteral("Unable to write %1: %2").arg(path, file.errorString());
        return false;
    }

    QByteArray content = stageHeader(stage).toUtf8();
    content.append('\n');
    content.append(body.data(), static_cast<qsizetype>(body.size()));

    if (file.write(content) != content.size())
    {
        error = QStringLiteral("Failed to write %1: %2").arg(path, file.errorString());
        file.cancelWriting();
        return false;
    }

    if (cancelFlag && cancelFlag->load(std::memory_order_relaxed))
    {
        file.cancelWriting();
        error = QStringLiteral("Write of %1 cancelled").arg(path);
        return false;
    }

    if (!file.commit())
    {
        error = QStringLiteral("Failed to save %1: %2").arg(path, file.errorString());
        return false;
    }

    LOG_INFO(Io, QStringLiteral("Wrote %1 (%2 bytes)").arg(path).arg(content.size()));
    return true;
}

} // namespace pipeline
