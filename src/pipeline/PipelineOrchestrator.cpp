#include "pipeline/PipelineOrchestrator.h"

#include "bend/SplineBendEngine.h"
#include "common/log.h"
#include "gcode/GcodeWriter.h"
#include "gcode/LineParser.h"
#include "kin/KinematicsTranslator.h"
#include "pipeline/ArtifactStore.h"
#include "post/ControllerEmitter.h"

#include <QtCore/QFileInfo>

#include <algorithm>
#include <utility>

namespace pipeline
{

namespace
{

QString shortId(const QUuid& id)
{
    return id.toString(QUuid::WithoutBraces).left(8);
}

StageError makeError(StageErrorKind kind, QString message, QString path = {})
{
    StageError error;
    error.kind = kind;
    error.message = std::move(message);
    error.path = std::move(path);
    return error;
}

gcode::Program parseLines(const std::vector<std::string>& lines, StageResult& result)
{
    std::vector<gcode::ParseIssue> parseIssues;
    gcode::Program program = gcode::parseProgram(lines, &parseIssues);
    result.parseErrors = static_cast<int>(parseIssues.size());
    return program;
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(RunContext context)
    : m_context(std::move(context))
{
}

bool PipelineOrchestrator::loadInput(Stage required, StageResult& result, std::vector<std::string>& lines) const
{
    const QString path = artifactPath(m_context.inputPath(), required);
    QString error;

    if (required == Stage::Raw)
    {
        if (!readLines(path, lines, error))
        {
            result.error = makeError(StageErrorKind::Io, error, path);
            return false;
        }
        return true;
    }

    if (!QFileInfo::exists(path))
    {
        result.error = makeError(StageErrorKind::StageDependency,
                                 QStringLiteral("%1 artifact is missing; run the %2 stage first")
                                     .arg(stageName(required), stageName(required).toLower()),
                                 path);
        return false;
    }
    if (!readLines(path, lines, error))
    {
        result.error = makeError(StageErrorKind::Io, error, path);
        return false;
    }
    if (!hasStageHeader(lines, required))
    {
        result.error = makeError(StageErrorKind::StageDependency,
                                 QStringLiteral("File was not produced by the %1 stage").arg(stageName(required)),
                                 path);
        return false;
    }

    stripStageHeader(lines);
    return true;
}

bool PipelineOrchestrator::promote(StageResult& result, const std::string& body, const std::atomic<bool>& cancelFlag)
{
    const QString path = artifactPath(m_context.inputPath(), result.stage);
    QString error;
    if (!writeArtifact(path, result.stage, body, &cancelFlag, error))
    {
        if (cancelFlag.load(std::memory_order_relaxed))
        {
            return false;
        }
        result.error = makeError(StageErrorKind::Io, error, path);
        return false;
    }

    result.ok = true;
    result.artifactPath = path;
    m_state = std::max(m_state, result.stage);
    return true;
}

StageResult PipelineOrchestrator::cancelled(StageResult result) const
{
    result.ok = false;
    result.error = makeError(StageErrorKind::Cancelled,
                             QStringLiteral("%1 stage cancelled; no artifact written").arg(stageName(result.stage)));
    LOG_INFO(Pipeline, QStringLiteral("[%1] %2").arg(shortId(m_context.runId()), result.summary()));
    return result;
}

StageResult PipelineOrchestrator::runBending(const std::atomic<bool>& cancelFlag,
                                             const ProgressCallback& progressCallback,
                                             const check::IssueCallback& onIssue)
{
    StageResult result;
    result.stage = Stage::Bent;

    std::vector<std::string> lines;
    if (!loadInput(Stage::Raw, result, lines))
    {
        LOG_ERR(Pipeline, result.summary());
        return result;
    }

    const RunParameters& params = m_context.params();
    const gcode::Program program = parseLines(lines, result);
    const bend::SplineCurve curve(params.spline, params.discretization_mm);

    bend::BendSettings settings;
    settings.layerHeight = params.layerHeight_mm;
    settings.warningAngleDeg = params.warningAngleDeg;
    settings.annotateBands = params.annotateBands;
    const bend::SplineBendEngine engine(settings);

    bend::BendResult bent = engine.bend(program, curve, cancelFlag, progressCallback, onIssue);
    result.issues = std::move(bent.issues);
    if (bent.cancelled)
    {
        return cancelled(std::move(result));
    }

    LOG_INFO(Pipeline, QStringLiteral("[%1] Bent %2 line(s) into %3 layer frame(s)")
                           .arg(shortId(m_context.runId()))
                           .arg(program.size())
                           .arg(bent.frames.size()));

    if (!promote(result, gcode::writeProgram(bent.program), cancelFlag))
    {
        if (!result.error)
        {
            return cancelled(std::move(result));
        }
        LOG_ERR(Pipeline, result.summary());
        return result;
    }
    LOG_INFO(Pipeline, result.summary());
    return result;
}

StageResult PipelineOrchestrator::runTranslation(const std::atomic<bool>& cancelFlag,
                                                 const ProgressCallback& progressCallback,
                                                 const check::IssueCallback& onIssue)
{
    StageResult result;
    result.stage = Stage::Translated;

    std::vector<std::string> lines;
    if (!loadInput(Stage::Bent, result, lines))
    {
        LOG_ERR(Pipeline, result.summary());
        return result;
    }

    const gcode::Program program = parseLines(lines, result);
    const RunParameters& params = m_context.params();
    const kin::KinematicsTranslator translator(params.linkage, params.layerHeight_mm);

    kin::TranslateResult translated = translator.translate(program, cancelFlag, progressCallback, onIssue);
    result.issues = std::move(translated.issues);
    if (translated.cancelled)
    {
        return cancelled(std::move(result));
    }

    if (translated.fatal)
    {
        const auto fatal = std::find_if(result.issues.begin(), result.issues.end(), [](const check::ValidationIssue& issue) {
            return issue.severity == check::Severity::Fatal;
        });
        StageError error = makeError(StageErrorKind::FatalValidation,
                                     QStringLiteral("Translation halted by a fatal issue"),
                                     artifactPath(m_context.inputPath(), Stage::Bent));
        if (fatal != result.issues.end())
        {
            error.message = QString::fromStdString(fatal->message);
            error.layer = fatal->layer;
            // Program lines start below the stage header of the bent artifact.
            error.line = fatal->line > 0 ? fatal->line + 1 : 0;
        }
        result.error = std::move(error);
        LOG_ERR(Pipeline, result.summary());
        return result;
    }

    if (!promote(result, gcode::writeProgram(translated.program), cancelFlag))
    {
        if (!result.error)
        {
            return cancelled(std::move(result));
        }
        LOG_ERR(Pipeline, result.summary());
        return result;
    }
    LOG_INFO(Pipeline, result.summary());
    return result;
}

StageResult PipelineOrchestrator::runEmission(const std::atomic<bool>& cancelFlag, const ProgressCallback& progressCallback)
{
    StageResult result;
    result.stage = Stage::Ready;

    std::vector<std::string> lines;
    if (!loadInput(Stage::Translated, result, lines))
    {
        LOG_ERR(Pipeline, result.summary());
        return result;
    }

    const gcode::Program program = parseLines(lines, result);
    const RunParameters& params = m_context.params();
    const post::KlipperEmitter emitter(params.actuator, params.layerHeight_mm);
    const post::EmitResult emitted = emitter.emitProgram(program, &cancelFlag);
    if (emitted.cancelled || cancelFlag.load(std::memory_order_relaxed))
    {
        return cancelled(std::move(result));
    }
    if (progressCallback)
    {
        progressCallback(100);
    }

    if (!promote(result, emitted.text, cancelFlag))
    {
        if (!result.error)
        {
            return cancelled(std::move(result));
        }
        LOG_ERR(Pipeline, result.summary());
        return result;
    }
    LOG_INFO(Pipeline, result.summary());
    return result;
}

StageResult PipelineOrchestrator::runStage(Stage target,
                                           const std::atomic<bool>& cancelFlag,
                                           const ProgressCallback& progressCallback,
                                           const check::IssueCallback& onIssue)
{
    switch (target)
    {
    case Stage::Bent: return runBending(cancelFlag, progressCallback, onIssue);
    case Stage::Translated: return runTranslation(cancelFlag, progressCallback, onIssue);
    case Stage::Ready: return runEmission(cancelFlag, progressCallback);
    case Stage::Raw: break;
    }

    StageResult result;
    result.stage = target;
    result.error = makeError(StageErrorKind::StageDependency, QStringLiteral("Raw is an input, not a stage"));
    return result;
}

std::vector<StageResult> PipelineOrchestrator::runAll(const std::atomic<bool>& cancelFlag,
                                                      const ProgressCallback& progressCallback,
                                                      const check::IssueCallback& onIssue)
{
    std::vector<StageResult> results;
    const Stage order[] = {Stage::Bent, Stage::Translated, Stage::Ready};
    int completed = 0;

    for (Stage stage : order)
    {
        ProgressCallback scaled;
        if (progressCallback)
        {
            scaled = [&progressCallback, completed](int value) {
                progressCallback((completed * 100 + value) / 3);
            };
        }

        results.push_back(runStage(stage, cancelFlag, scaled, onIssue));
        if (!results.back().ok)
        {
            break;
        }
        ++completed;
    }
    return results;
}

std::vector<bend::CurveSample> PipelineOrchestrator::previewCurve(const bend::SplineAnchors& anchors, double step)
{
    const bend::SplineCurve curve(anchors);
    return curve.preview(step);
}

std::string PipelineOrchestrator::writePreview(const std::vector<bend::CurveSample>& samples)
{
    std::string text = "height,lateral_offset,tangent_angle\n";
    for (const bend::CurveSample& sample : samples)
    {
        text += gcode::formatNumber(sample.height, 4) + ',' + gcode::formatNumber(sample.lateralOffset, 4) + ','
                + gcode::formatNumber(sample.tangentAngleDeg, 4) + '\n';
    }
    return text;
}

} // namespace pipeline
