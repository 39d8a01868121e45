#include "pipeline/RunContext.h"

#include <QtCore/QFileInfo>

#include <utility>

namespace pipeline
{

RunContext::RunContext(QString inputPath, RunParameters params)
    : m_inputPath(std::move(inputPath))
    , m_params(std::move(params))
    , m_runId(QUuid::createUuid())
{
}

std::optional<RunContext> RunContext::create(const QString& inputPath, RunParameters params, QStringList& errors)
{
    bool ok = true;
    if (inputPath.trimmed().isEmpty())
    {
        errors.push_back(QStringLiteral("No input file given."));
        ok = false;
    }
    if (!params.validate(errors))
    {
        ok = false;
    }
    if (!ok)
    {
        return std::nullopt;
    }

    return RunContext(QFileInfo(inputPath).absoluteFilePath(), std::move(params));
}

} // namespace pipeline
