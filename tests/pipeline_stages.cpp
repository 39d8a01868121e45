#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include "doctest/doctest.h"

#include "pipeline/ArtifactStore.h"
#include "pipeline/PipelineOrchestrator.h"
#include "pipeline/RunContext.h"
#include "pipeline/RunParameters.h"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QList>
#include <QtCore/QTemporaryDir>

#include <atomic>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{

const char* const kRawProgram = "; sample part\n"
                                "G28\n"
                                "G90\n"
                                "M82\n"
                                "M104 S200\n"
                                "G92 E0\n"
                                "G1 Z0.2 F3000\n"
                                "G1 X110 Y20 Z0.2 E0.5 F1200\n"
                                "G1 X130 Y20 E1.0\n"
                                "G1 X130 Y40 E1.5\n"
                                "G1 X110 Y40 E2.0\n"
                                "G1 Z0.48\n"
                                "G1 X110 Y20 Z0.48 E2.5\n"
                                "G1 X130 Y20 E3.0\n"
                                "G1 X120 Y30 Z20 E3.2\n"
                                "G1 X125 Y30 E3.4\n"
                                "M84\n";

void writeFile(const QString& path, const QByteArray& content)
{
    QFile file(path);
    DOCTEST_REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    DOCTEST_REQUIRE(file.write(content) == content.size());
}

QByteArray readFile(const QString& path)
{
    QFile file(path);
    DOCTEST_REQUIRE(file.open(QIODevice::ReadOnly));
    return file.readAll();
}

QString makeInput(const QTemporaryDir& dir)
{
    const QString path = QDir(dir.path()).filePath(QStringLiteral("part.gcode"));
    writeFile(path, QByteArray(kRawProgram));
    return path;
}

pipeline::PipelineOrchestrator makeOrchestrator(const QString& input, pipeline::RunParameters params = {})
{
    QStringList errors;
    std::optional<pipeline::RunContext> context = pipeline::RunContext::create(input, std::move(params), errors);
    DOCTEST_REQUIRE(context.has_value());
    DOCTEST_CHECK(errors.isEmpty());
    return pipeline::PipelineOrchestrator(std::move(*context));
}

} // namespace

DOCTEST_TEST_CASE(artifacts_are_named_after_the_input)
{
    const QString input = QStringLiteral("/data/prints/part.gcode");
    DOCTEST_CHECK(pipeline::artifactPath(input, pipeline::Stage::Raw) == input);
    DOCTEST_CHECK(pipeline::artifactPath(input, pipeline::Stage::Bent) == QStringLiteral("/data/prints/BENT_part.gcode"));
    DOCTEST_CHECK(pipeline::artifactPath(input, pipeline::Stage::Translated) == QStringLiteral("/data/prints/IK_part.gcode"));
    DOCTEST_CHECK(pipeline::artifactPath(input, pipeline::Stage::Ready) == QStringLiteral("/data/prints/KLIPPER_part.gcode"));
    DOCTEST_CHECK(pipeline::stageHeader(pipeline::Stage::Bent) == QStringLiteral("; AxisBend stage=Bent"));
}

DOCTEST_TEST_CASE(stages_run_in_order_and_write_headed_artifacts)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    const QString input = makeInput(dir);
    pipeline::PipelineOrchestrator orchestrator = makeOrchestrator(input);
    std::atomic<bool> cancel{false};
    DOCTEST_CHECK(orchestrator.state() == pipeline::Stage::Raw);

    std::vector<int> progress;
    const pipeline::StageResult bent = orchestrator.runBending(cancel, [&progress](int value) {
        progress.push_back(value);
    });
    DOCTEST_REQUIRE(bent.ok);
    DOCTEST_CHECK_FALSE(bent.error.has_value());
    DOCTEST_CHECK(bent.parseErrors == 0);
    DOCTEST_CHECK(orchestrator.state() == pipeline::Stage::Bent);
    DOCTEST_CHECK(QFileInfo::exists(bent.artifactPath));
    DOCTEST_REQUIRE_FALSE(progress.empty());
    DOCTEST_CHECK(progress.back() == 100);

    const QByteArray bentText = readFile(bent.artifactPath);
    DOCTEST_CHECK(bentText.startsWith("; AxisBend stage=Bent\n; sample part\nG28\n"));
    DOCTEST_CHECK(bentText.contains(";BAND 0 Z"));
    DOCTEST_CHECK(bentText.contains("M104 S200\n"));

    const pipeline::StageResult translated = orchestrator.runTranslation(cancel);
    DOCTEST_REQUIRE(translated.ok);
    DOCTEST_CHECK(orchestrator.state() == pipeline::Stage::Translated);
    DOCTEST_CHECK(readFile(translated.artifactPath).startsWith("; AxisBend stage=Translated\n"));

    const pipeline::StageResult ready = orchestrator.runEmission(cancel);
    DOCTEST_REQUIRE(ready.ok);
    DOCTEST_CHECK(orchestrator.state() == pipeline::Stage::Ready);
    DOCTEST_CHECK(ready.artifactPath.endsWith(QStringLiteral("KLIPPER_part.gcode")));

    const QByteArray readyText = readFile(ready.artifactPath);
    DOCTEST_CHECK(readyText.startsWith("; AxisBend stage=Ready\n"));
    DOCTEST_CHECK(readyText.contains("MANUAL_STEPPER STEPPER=b_stepper MOVE="));
    for (const QByteArray& line : readyText.split('\n'))
    {
        if (line.startsWith("G1"))
        {
            DOCTEST_CHECK_FALSE(line.contains(" A"));
            DOCTEST_CHECK_FALSE(line.contains(" B"));
        }
    }
}

DOCTEST_TEST_CASE(bending_twice_gives_identical_artifacts)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    const QString input = makeInput(dir);
    std::atomic<bool> cancel{false};

    pipeline::PipelineOrchestrator first = makeOrchestrator(input);
    const pipeline::StageResult a = first.runBending(cancel);
    DOCTEST_REQUIRE(a.ok);
    const QByteArray firstText = readFile(a.artifactPath);

    pipeline::PipelineOrchestrator second = makeOrchestrator(input);
    const pipeline::StageResult b = second.runBending(cancel);
    DOCTEST_REQUIRE(b.ok);
    DOCTEST_CHECK(readFile(b.artifactPath) == firstText);
    DOCTEST_CHECK(a.issues.size() == b.issues.size());
}

DOCTEST_TEST_CASE(translation_without_a_bent_artifact_is_a_dependency_error)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    const QString input = makeInput(dir);
    pipeline::PipelineOrchestrator orchestrator = makeOrchestrator(input);
    std::atomic<bool> cancel{false};

    const pipeline::StageResult translated = orchestrator.runTranslation(cancel);
    DOCTEST_CHECK_FALSE(translated.ok);
    DOCTEST_REQUIRE(translated.error.has_value());
    DOCTEST_CHECK(translated.error->kind == pipeline::StageErrorKind::StageDependency);
    DOCTEST_CHECK_FALSE(QFileInfo::exists(pipeline::artifactPath(input, pipeline::Stage::Translated)));

    const pipeline::StageResult ready = orchestrator.runEmission(cancel);
    DOCTEST_REQUIRE(ready.error.has_value());
    DOCTEST_CHECK(ready.error->kind == pipeline::StageErrorKind::StageDependency);
    DOCTEST_CHECK_FALSE(QFileInfo::exists(pipeline::artifactPath(input, pipeline::Stage::Ready)));
    DOCTEST_CHECK(orchestrator.state() == pipeline::Stage::Raw);

    // A file under the right name that bending never wrote is rejected the same way.
    writeFile(pipeline::artifactPath(input, pipeline::Stage::Bent), QByteArray(kRawProgram));
    const pipeline::StageResult forged = orchestrator.runTranslation(cancel);
    DOCTEST_REQUIRE(forged.error.has_value());
    DOCTEST_CHECK(forged.error->kind == pipeline::StageErrorKind::StageDependency);
    DOCTEST_CHECK_FALSE(QFileInfo::exists(pipeline::artifactPath(input, pipeline::Stage::Translated)));
}

DOCTEST_TEST_CASE(fatal_translation_writes_nothing_and_keeps_the_bent_artifact)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    const QString input = makeInput(dir);
    pipeline::RunParameters params;
    params.linkage.bMinDeg = -5.0;
    params.linkage.bMaxDeg = 5.0;
    pipeline::PipelineOrchestrator orchestrator = makeOrchestrator(input, params);
    std::atomic<bool> cancel{false};

    const pipeline::StageResult bent = orchestrator.runBending(cancel);
    DOCTEST_REQUIRE(bent.ok);
    const QByteArray bentText = readFile(bent.artifactPath);

    std::vector<check::ValidationIssue> reported;
    const pipeline::StageResult translated =
        orchestrator.runTranslation(cancel, {}, [&reported](const check::ValidationIssue& issue) {
            reported.push_back(issue);
        });
    DOCTEST_CHECK_FALSE(translated.ok);
    DOCTEST_REQUIRE(translated.error.has_value());
    DOCTEST_CHECK(translated.error->kind == pipeline::StageErrorKind::FatalValidation);
    DOCTEST_CHECK(translated.error->layer >= 0);
    DOCTEST_REQUIRE(reported.size() == 1);
    DOCTEST_CHECK(reported.front().severity == check::Severity::Fatal);

    // The error line points at the offending move in the bent artifact.
    const QList<QByteArray> bentLines = bentText.split('\n');
    DOCTEST_REQUIRE(translated.error->line > 1);
    DOCTEST_REQUIRE(translated.error->line <= bentLines.size());
    const QByteArray offending = bentLines.at(translated.error->line - 1);
    DOCTEST_CHECK(offending.startsWith("G1 "));
    DOCTEST_CHECK(offending.contains(" B"));

    DOCTEST_CHECK_FALSE(QFileInfo::exists(pipeline::artifactPath(input, pipeline::Stage::Translated)));
    DOCTEST_CHECK(readFile(bent.artifactPath) == bentText);
    DOCTEST_CHECK(orchestrator.state() == pipeline::Stage::Bent);
}

DOCTEST_TEST_CASE(fatal_translation_without_band_markers_still_names_a_layer)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    const QString input = makeInput(dir);
    pipeline::RunParameters params;
    params.annotateBands = false;
    params.linkage.bMinDeg = -5.0;
    params.linkage.bMaxDeg = 5.0;
    pipeline::PipelineOrchestrator orchestrator = makeOrchestrator(input, params);
    std::atomic<bool> cancel{false};

    const pipeline::StageResult bent = orchestrator.runBending(cancel);
    DOCTEST_REQUIRE(bent.ok);
    DOCTEST_CHECK_FALSE(readFile(bent.artifactPath).contains(";BAND "));

    const pipeline::StageResult translated = orchestrator.runTranslation(cancel);
    DOCTEST_CHECK_FALSE(translated.ok);
    DOCTEST_REQUIRE(translated.error.has_value());
    DOCTEST_CHECK(translated.error->kind == pipeline::StageErrorKind::FatalValidation);
    DOCTEST_CHECK(translated.error->layer >= 0);
    DOCTEST_CHECK(translated.error->line > 1);
}

DOCTEST_TEST_CASE(cancelled_stage_promotes_nothing)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    const QString input = makeInput(dir);
    pipeline::PipelineOrchestrator orchestrator = makeOrchestrator(input);
    std::atomic<bool> cancel{true};

    const pipeline::StageResult bent = orchestrator.runBending(cancel);
    DOCTEST_CHECK_FALSE(bent.ok);
    DOCTEST_REQUIRE(bent.error.has_value());
    DOCTEST_CHECK(bent.error->kind == pipeline::StageErrorKind::Cancelled);
    DOCTEST_CHECK_FALSE(QFileInfo::exists(pipeline::artifactPath(input, pipeline::Stage::Bent)));
    DOCTEST_CHECK(orchestrator.state() == pipeline::Stage::Raw);

    // Only the input remains in the directory.
    DOCTEST_CHECK(QDir(dir.path()).entryList(QDir::Files).size() == 1);
}

DOCTEST_TEST_CASE(missing_input_is_an_io_error)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    pipeline::PipelineOrchestrator orchestrator =
        makeOrchestrator(QDir(dir.path()).filePath(QStringLiteral("absent.gcode")));
    std::atomic<bool> cancel{false};

    const pipeline::StageResult bent = orchestrator.runBending(cancel);
    DOCTEST_REQUIRE(bent.error.has_value());
    DOCTEST_CHECK(bent.error->kind == pipeline::StageErrorKind::Io);
    DOCTEST_CHECK(bent.error->path.endsWith(QStringLiteral("absent.gcode")));
    DOCTEST_CHECK(bent.summary().contains(QStringLiteral("IOError")));
}

DOCTEST_TEST_CASE(state_only_moves_forward)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    const QString input = makeInput(dir);
    pipeline::PipelineOrchestrator orchestrator = makeOrchestrator(input);
    std::atomic<bool> cancel{false};

    const std::vector<pipeline::StageResult> results = orchestrator.runAll(cancel);
    DOCTEST_REQUIRE(results.size() == 3);
    for (const pipeline::StageResult& result : results)
    {
        DOCTEST_CHECK(result.ok);
    }
    DOCTEST_CHECK(orchestrator.state() == pipeline::Stage::Ready);

    DOCTEST_REQUIRE(QFile::remove(pipeline::artifactPath(input, pipeline::Stage::Bent)));
    const pipeline::StageResult again = orchestrator.runTranslation(cancel);
    DOCTEST_CHECK_FALSE(again.ok);
    DOCTEST_CHECK(orchestrator.state() == pipeline::Stage::Ready);

    const pipeline::StageResult rebent = orchestrator.runBending(cancel);
    DOCTEST_CHECK(rebent.ok);
    DOCTEST_CHECK(orchestrator.state() == pipeline::Stage::Ready);
}

DOCTEST_TEST_CASE(preview_has_no_side_effects)
{
    const auto samples = pipeline::PipelineOrchestrator::previewCurve(bend::SplineAnchors{}, 25.0);
    DOCTEST_REQUIRE(samples.size() == 5);
    DOCTEST_CHECK(samples.front().lateralOffset == doctest::Approx(0.0));
    DOCTEST_CHECK(samples.back().lateralOffset == doctest::Approx(90.0));

    const std::string text = pipeline::PipelineOrchestrator::writePreview(samples);
    DOCTEST_CHECK(text.rfind("height,lateral_offset,tangent_angle\n0.0000,0.0000,0.0000\n", 0) == 0);
}

DOCTEST_TEST_CASE(run_context_requires_valid_parameters)
{
    QStringList errors;
    pipeline::RunParameters params;
    params.layerHeight_mm = 0.0;
    params.spline.zEnd = params.spline.zStart;
    DOCTEST_CHECK_FALSE(pipeline::RunContext::create(QStringLiteral("part.gcode"), params, errors).has_value());
    DOCTEST_CHECK(errors.size() == 2);

    errors.clear();
    DOCTEST_CHECK_FALSE(pipeline::RunContext::create(QString(), pipeline::RunParameters{}, errors).has_value());
    DOCTEST_CHECK(errors.size() == 1);

    errors.clear();
    const auto context = pipeline::RunContext::create(QStringLiteral("part.gcode"), pipeline::RunParameters{}, errors);
    DOCTEST_REQUIRE(context.has_value());
    DOCTEST_CHECK(QFileInfo(context->inputPath()).isAbsolute());
    DOCTEST_CHECK_FALSE(context->runId().isNull());
}
