#include "common/logging.h"
#include "pipeline/ArtifactStore.h"
#include "pipeline/PipelineOrchestrator.h"
#include "pipeline/RunContext.h"
#include "pipeline/RunParameters.h"
#include "pipeline/StageWorker.h"
#include "remote/MoonrakerClient.h"

#include <QtCore/QCommandLineOption>
#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QEventLoop>
#include <QtCore/QFileInfo>
#include <QtCore/QTextStream>

#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitStageError = 1;
constexpr int kExitBadArguments = 2;
constexpr int kExitRemoteError = 3;

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

bool parseNumber(const QString& text, double& value)
{
    bool ok = false;
    const double parsed = text.trimmed().toDouble(&ok);
    if (ok)
    {
        value = parsed;
    }
    return ok;
}

bool parsePair(const QString& text, double& first, double& second)
{
    const QStringList parts = text.split(QLatin1Char(','));
    if (parts.size() != 2)
    {
        return false;
    }
    double a = 0.0;
    double b = 0.0;
    if (!parseNumber(parts.at(0), a) || !parseNumber(parts.at(1), b))
    {
        return false;
    }
    first = a;
    second = b;
    return true;
}

std::optional<pipeline::Stage> parseStage(const QString& text)
{
    const QString name = text.trimmed().toLower();
    if (name == QLatin1String("all"))
    {
        return pipeline::Stage::Raw;
    }
    if (name == QLatin1String("bend"))
    {
        return pipeline::Stage::Bent;
    }
    if (name == QLatin1String("translate"))
    {
        return pipeline::Stage::Translated;
    }
    if (name == QLatin1String("emit"))
    {
        return pipeline::Stage::Ready;
    }
    return std::nullopt;
}

bool applyOverrides(const QCommandLineParser& parser,
                    const QCommandLineOption& splineX,
                    const QCommandLineOption& splineZ,
                    const QCommandLineOption& layerHeight,
                    const QCommandLineOption& warningAngle,
                    const QCommandLineOption& discretization,
                    const QCommandLineOption& la,
                    const QCommandLineOption& lb,
                    pipeline::RunParameters& params,
                    QStringList& errors)
{
    const qsizetype before = errors.size();
    if (parser.isSet(splineX) && !parsePair(parser.value(splineX), params.spline.xStart, params.spline.xEnd))
    {
        errors.push_back(QStringLiteral("--spline-x expects two comma separated numbers"));
    }
    if (parser.isSet(splineZ) && !parsePair(parser.value(splineZ), params.spline.zStart, params.spline.zEnd))
    {
        errors.push_back(QStringLiteral("--spline-z expects two comma separated numbers"));
    }

    const struct
    {
        const QCommandLineOption& option;
        double& target;
    } numbers[] = {{layerHeight, params.layerHeight_mm},
                   {warningAngle, params.warningAngleDeg},
                   {discretization, params.discretization_mm},
                   {la, params.linkage.la},
                   {lb, params.linkage.lb}};
    for (const auto& entry : numbers)
    {
        if (parser.isSet(entry.option) && !parseNumber(parser.value(entry.option), entry.target))
        {
            errors.push_back(QStringLiteral("--%1 expects a number").arg(entry.option.names().constFirst()));
        }
    }
    return errors.size() == before;
}

struct RemoteActions
{
    bool test{false};
    std::optional<remote::SetupSequence> setup;
    bool upload{false};
    bool print{false};

    [[nodiscard]] bool any() const { return test || setup || upload || print; }
    [[nodiscard]] bool sendsArtifact() const { return upload || print; }
};

// Connection check first, then the setup sequence, then the artifact.
int runRemote(const remote::MoonrakerClient& client,
              const RemoteActions& actions,
              const post::ActuatorSettings& actuator,
              const QString& readyArtifact)
{
    const remote::RemoteReply connection = client.testConnection();
    if (!connection.ok)
    {
        err() << "Printer " << client.endpoint().host << ':' << client.endpoint().port
              << " unreachable: " << connection.error << Qt::endl;
        return kExitRemoteError;
    }
    out() << "Printer " << client.endpoint().host << ':' << client.endpoint().port << " connected" << Qt::endl;

    if (actions.setup)
    {
        const remote::RemoteReply setup = client.runSequence(remote::setupCommands(*actions.setup, actuator));
        if (!setup.ok)
        {
            err() << "Printer setup failed: " << setup.error << Qt::endl;
            return kExitRemoteError;
        }
    }

    if (!actions.sendsArtifact())
    {
        return kExitOk;
    }
    if (!QFileInfo::exists(readyArtifact))
    {
        err() << "No printer-ready artifact at " << readyArtifact << Qt::endl;
        return kExitRemoteError;
    }

    const remote::RemoteReply sent =
        actions.print ? client.uploadAndPrint(readyArtifact) : client.uploadFile(readyArtifact);
    if (!sent.ok)
    {
        err() << (actions.print ? "Upload and print failed: " : "Upload failed: ") << sent.error << Qt::endl;
        return kExitRemoteError;
    }
    out() << (actions.print ? "Printing " : "Uploaded ") << QFileInfo(readyArtifact).fileName() << Qt::endl;
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("axisbend"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Bends a planar G-code program along a spline and emits it for a 5-axis printer."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("input"), QStringLiteral("Raw G-code file."));

    const QCommandLineOption stageOption(QStringLiteral("stage"),
                                         QStringLiteral("Stage to run: bend, translate, emit or all."),
                                         QStringLiteral("stage"),
                                         QStringLiteral("all"));
    const QCommandLineOption previewOption(QStringLiteral("preview"),
                                           QStringLiteral("Print curve samples every <step> mm and exit."),
                                           QStringLiteral("step"));
    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("JSON parameter file."),
                                          QStringLiteral("file"));
    const QCommandLineOption splineXOption(QStringLiteral("spline-x"),
                                           QStringLiteral("Lateral curve endpoints, mm."),
                                           QStringLiteral("a,b"));
    const QCommandLineOption splineZOption(QStringLiteral("spline-z"),
                                           QStringLiteral("Height curve endpoints, mm."),
                                           QStringLiteral("a,b"));
    const QCommandLineOption layerHeightOption(QStringLiteral("layer-height"),
                                               QStringLiteral("Band size, mm."),
                                               QStringLiteral("mm"));
    const QCommandLineOption warningAngleOption(QStringLiteral("warning-angle"),
                                                QStringLiteral("AngleExceeded threshold, degrees."),
                                                QStringLiteral("deg"));
    const QCommandLineOption discretizationOption(QStringLiteral("discretization"),
                                                  QStringLiteral("Arc-length table step, mm (0 disables)."),
                                                  QStringLiteral("mm"));
    const QCommandLineOption laOption(QStringLiteral("la"), QStringLiteral("Link A length, mm."), QStringLiteral("mm"));
    const QCommandLineOption lbOption(QStringLiteral("lb"), QStringLiteral("Link B length, mm."), QStringLiteral("mm"));
    const QCommandLineOption printerOption(QStringLiteral("printer"),
                                           QStringLiteral("Moonraker endpoint of the printer, default port 7125."),
                                           QStringLiteral("host[:port]"));
    const QCommandLineOption printerTestOption(QStringLiteral("printer-test"),
                                               QStringLiteral("Check that the printer answers."));
    const QCommandLineOption printerSetupOption(QStringLiteral("printer-setup"),
                                                QStringLiteral("Position the printer: mass-production or five-axis."),
                                                QStringLiteral("sequence"));
    const QCommandLineOption uploadOption(QStringLiteral("upload"),
                                          QStringLiteral("Upload the printer-ready artifact after a successful run."));
    const QCommandLineOption printOption(QStringLiteral("print"),
                                         QStringLiteral("Upload the printer-ready artifact and start the print."));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Log per-stage details."));

    parser.addOptions({stageOption,
                       previewOption,
                       configOption,
                       splineXOption,
                       splineZOption,
                       layerHeightOption,
                       warningAngleOption,
                       discretizationOption,
                       laOption,
                       lbOption,
                       printerOption,
                       printerTestOption,
                       printerSetupOption,
                       uploadOption,
                       printOption,
                       verboseOption});
    parser.process(app);

    common::initLogging(parser.isSet(verboseOption));

    pipeline::RunParameters params;
    QStringList messages;
    if (parser.isSet(configOption)
        && !pipeline::loadParametersFromFile(parser.value(configOption), params, messages))
    {
        for (const QString& message : messages)
        {
            err() << message << Qt::endl;
        }
        return kExitBadArguments;
    }
    for (const QString& message : messages)
    {
        common::logWarning(message);
    }
    messages.clear();

    if (!applyOverrides(parser,
                        splineXOption,
                        splineZOption,
                        layerHeightOption,
                        warningAngleOption,
                        discretizationOption,
                        laOption,
                        lbOption,
                        params,
                        messages))
    {
        for (const QString& message : messages)
        {
            err() << message << Qt::endl;
        }
        return kExitBadArguments;
    }

    if (parser.isSet(previewOption))
    {
        double step = 0.0;
        if (!parseNumber(parser.value(previewOption), step))
        {
            err() << "--preview expects a number" << Qt::endl;
            return kExitBadArguments;
        }
        try
        {
            const auto samples = pipeline::PipelineOrchestrator::previewCurve(params.spline, step);
            out() << QString::fromStdString(pipeline::PipelineOrchestrator::writePreview(samples));
            out().flush();
        }
        catch (const std::invalid_argument& ex)
        {
            err() << QString::fromUtf8(ex.what()) << Qt::endl;
            return kExitBadArguments;
        }
        return kExitOk;
    }

    RemoteActions remoteActions;
    remoteActions.test = parser.isSet(printerTestOption);
    remoteActions.upload = parser.isSet(uploadOption);
    remoteActions.print = parser.isSet(printOption);
    if (parser.isSet(printerSetupOption))
    {
        remoteActions.setup = remote::parseSetupSequence(parser.value(printerSetupOption));
        if (!remoteActions.setup)
        {
            err() << "Unknown printer setup: " << parser.value(printerSetupOption) << Qt::endl;
            return kExitBadArguments;
        }
    }

    std::optional<remote::MoonrakerClient> printer;
    if (parser.isSet(printerOption))
    {
        const std::optional<remote::PrinterEndpoint> endpoint = remote::parseEndpoint(parser.value(printerOption));
        if (!endpoint)
        {
            err() << "--printer expects host or host:port" << Qt::endl;
            return kExitBadArguments;
        }
        printer.emplace(*endpoint);
    }
    else if (remoteActions.any())
    {
        err() << "--printer-test, --printer-setup, --upload and --print need --printer" << Qt::endl;
        return kExitBadArguments;
    }

    const std::optional<pipeline::Stage> target = parseStage(parser.value(stageOption));
    if (!target)
    {
        err() << "Unknown stage: " << parser.value(stageOption) << Qt::endl;
        return kExitBadArguments;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty() && printer && remoteActions.any() && !remoteActions.sendsArtifact())
    {
        return runRemote(*printer, remoteActions, params.actuator, QString());
    }
    if (positional.size() != 1)
    {
        err() << "Expected exactly one input file." << Qt::endl;
        parser.showHelp(kExitBadArguments);
    }

    std::optional<pipeline::RunContext> context = pipeline::RunContext::create(positional.constFirst(), params, messages);
    if (!context)
    {
        for (const QString& message : messages)
        {
            err() << message << Qt::endl;
        }
        return kExitBadArguments;
    }

    const QString readyArtifact = pipeline::artifactPath(context->inputPath(), pipeline::Stage::Ready);
    common::logInfo(QStringLiteral("Run %1 on %2")
                        .arg(context->runId().toString(QUuid::WithoutBraces), context->inputPath()));
    auto orchestrator = std::make_shared<pipeline::PipelineOrchestrator>(std::move(*context));
    pipeline::StageWorker worker(orchestrator, *target);
    QEventLoop loop;

    QObject::connect(&worker, &pipeline::StageWorker::issueFound, &loop, [](const check::ValidationIssue& issue) {
        err() << QString::fromStdString(check::describe(issue)) << Qt::endl;
    });
    QObject::connect(&worker, &pipeline::StageWorker::finished, &loop, [](const pipeline::StageResult& result) {
        (result.ok ? out() : err()) << result.summary() << Qt::endl;
    });
    QObject::connect(&worker, &pipeline::StageWorker::error, &loop, [](const QString& message) {
        common::logError(message);
    });
    QObject::connect(&worker, &QThread::finished, &loop, &QEventLoop::quit);

    worker.start();
    loop.exec();
    worker.wait();
    QCoreApplication::processEvents();

    const std::vector<pipeline::StageResult>& results = worker.results();
    if (results.empty())
    {
        return kExitStageError;
    }
    for (const pipeline::StageResult& result : results)
    {
        if (!result.ok)
        {
            return kExitStageError;
        }
    }

    if (printer && remoteActions.any())
    {
        if (remoteActions.sendsArtifact() && orchestrator->state() != pipeline::Stage::Ready)
        {
            err() << "--upload and --print need a run that reaches the printer-ready stage" << Qt::endl;
            return kExitRemoteError;
        }
        return runRemote(*printer, remoteActions, params.actuator, readyArtifact);
    }
    return kExitOk;
}
