#pragma once

#include "pipeline/RunParameters.h"

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QUuid>

#include <optional>

namespace pipeline
{

/**
 * Everything one run works from: the input file, its validated parameters and an id used in the
 * log. Immutable once created; a new run gets a new context.
 */
class RunContext
{
public:
    /// Returns nullopt with the reasons appended to errors when the parameters do not validate.
    static std::optional<RunContext> create(const QString& inputPath, RunParameters params, QStringList& errors);

    [[nodiscard]] const QString& inputPath() const noexcept { return m_inputPath; }
    [[nodiscard]] const RunParameters& params() const noexcept { return m_params; }
    [[nodiscard]] const QUuid& runId() const noexcept { return m_runId; }

private:
    RunContext(QString inputPath, RunParameters params);

    QString m_inputPath;
    RunParameters m_params;
    QUuid m_runId;
};

} // namespace pipeline
