#include "remote/MoonrakerClient.h"

#include "common/log.h"
#include "gcode/GcodeWriter.h"

#include <QtCore/QEventLoop>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QUrl>
#include <QtCore/QVariant>
#include <QtNetwork/QHttpMultiPart>
#include <QtNetwork/QHttpPart>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

#include <utility>

namespace remote
{

namespace
{

constexpr int kQueryTimeoutMs = 5000;
constexpr int kCommandTimeoutMs = 10000;
constexpr int kUploadTimeoutMs = 30000;
constexpr auto kUploadRoot = "gcodes";
constexpr auto kRotaryAStepper = "a_stepper";

QNetworkRequest makeRequest(const QUrl& url, int timeoutMs)
{
    QNetworkRequest request(url);
#if QT_VERSION >= QT_VERSION_CHECK(5, 15, 0)
    request.setTransferTimeout(timeoutMs);
#else
    Q_UNUSED(timeoutMs);
#endif
    return request;
}

QNetworkRequest makeJsonRequest(const QUrl& url, int timeoutMs)
{
    QNetworkRequest request = makeRequest(url, timeoutMs);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    return request;
}

// Waits for the reply, reads status and JSON body, then releases it. finished() also follows
// errors and timeouts, and by then an error body has been read in full.
RemoteReply collect(QNetworkReply* reply)
{
    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished())
    {
        loop.exec();
    }

    RemoteReply result;
    result.httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    const QByteArray payload = reply->readAll();
    if (!payload.isEmpty())
    {
        QJsonParseError parseError;
        const QJsonDocument document = QJsonDocument::fromJson(payload, &parseError);
        if (parseError.error == QJsonParseError::NoError && document.isObject())
        {
            result.body = document.object();
        }
    }

    if (reply->error() != QNetworkReply::NoError)
    {
        result.error = reply->errorString();
        // Moonraker reports the reason as {"error": {"message": ...}}.
        const QString serverMessage = result.body.value(QStringLiteral("error")).toObject().value(QStringLiteral("message")).toString();
        if (!serverMessage.isEmpty())
        {
            result.error += QStringLiteral(" (%1)").arg(serverMessage);
        }
    }
    else if (result.httpStatus < 200 || result.httpStatus >= 300)
    {
        result.error = QStringLiteral("Unexpected HTTP status %1").arg(result.httpStatus);
    }
    else
    {
        result.ok = true;
    }

    reply->deleteLater();
    return result;
}

QByteArray jsonBody(const QJsonObject& object)
{
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

QString manualStepperLine(const post::ActuatorSettings& actuator, const QString& stepper, double position)
{
    return QStringLiteral("%1 STEPPER=%2 MOVE=%3")
        .arg(QString::fromStdString(actuator.command), stepper, QString::fromStdString(gcode::formatCompact(position)));
}

} // namespace

std::optional<PrinterEndpoint> parseEndpoint(const QString& text)
{
    const QString trimmed = text.trimmed();
    PrinterEndpoint endpoint;
    const qsizetype colon = trimmed.lastIndexOf(QLatin1Char(':'));
    if (colon < 0)
    {
        endpoint.host = trimmed;
    }
    else
    {
        bool ok = false;
        endpoint.host = trimmed.left(colon);
        endpoint.port = trimmed.mid(colon + 1).toInt(&ok);
        if (!ok || endpoint.port < 1 || endpoint.port > 65535)
        {
            return std::nullopt;
        }
    }
    if (endpoint.host.isEmpty())
    {
        return std::nullopt;
    }
    return endpoint;
}

std::optional<SetupSequence> parseSetupSequence(const QString& text)
{
    const QString name = text.trimmed().toLower();
    if (name == QLatin1String("mass-production"))
    {
        return SetupSequence::MassProduction;
    }
    if (name == QLatin1String("five-axis"))
    {
        return SetupSequence::FiveAxis;
    }
    return std::nullopt;
}

QStringList setupCommands(SetupSequence sequence, const post::ActuatorSettings& actuator)
{
    const QString bStepper = QString::fromStdString(actuator.stepper);
    switch (sequence)
    {
    case SetupSequence::MassProduction:
        return {QStringLiteral("G91"),
                QStringLiteral("G1 Z15 F1000"),
                QStringLiteral("G90"),
                manualStepperLine(actuator, QString::fromLatin1(kRotaryAStepper), 90.0),
                manualStepperLine(actuator, bStepper, -45.0)};
    case SetupSequence::FiveAxis:
        break;
    }
    return {QStringLiteral("G91"),
            QStringLiteral("G1 Z25 F1000"),
            QStringLiteral("G90"),
            manualStepperLine(actuator, bStepper, -90.0)};
}

MoonrakerClient::MoonrakerClient(PrinterEndpoint endpoint)
    : m_endpoint(std::move(endpoint))
    , m_baseUrl(QStringLiteral("http://%1:%2").arg(m_endpoint.host).arg(m_endpoint.port))
{
}

RemoteReply MoonrakerClient::testConnection() const
{
    QNetworkAccessManager manager;
    RemoteReply reply = collect(manager.get(makeRequest(QUrl(m_baseUrl + QStringLiteral("/server/info")), kQueryTimeoutMs)));
    if (reply.ok)
    {
        LOG_INFO(Remote, QStringLiteral("Moonraker reachable at %1").arg(m_baseUrl));
    }
    else
    {
        LOG_WARN(Remote, QStringLiteral("Moonraker at %1 unreachable: %2").arg(m_baseUrl, reply.error));
    }
    return reply;
}

RemoteReply MoonrakerClient::sendGcode(const QString& script) const
{
    QNetworkAccessManager manager;
    QJsonObject body;
    body.insert(QStringLiteral("script"), script);
    const QNetworkRequest request =
        makeJsonRequest(QUrl(m_baseUrl + QStringLiteral("/printer/gcode/script")), kCommandTimeoutMs);
    RemoteReply reply = collect(manager.post(request, jsonBody(body)));
    if (!reply.ok)
    {
        LOG_WARN(Remote, QStringLiteral("G-code '%1' rejected: %2").arg(script, reply.error));
    }
    return reply;
}

RemoteReply MoonrakerClient::uploadFile(const QString& path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
    {
        RemoteReply reply;
        reply.error = QStringLiteral("Cannot read %1: %2").arg(path, file.errorString());
        LOG_ERR(Remote, reply.error);
        return reply;
    }
    const QByteArray content = file.readAll();
    const QString fileName = QFileInfo(path).fileName();

    auto* multiPart = new QHttpMultiPart(QHttpMultiPart::FormDataType);

    QHttpPart filePart;
    filePart.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("text/plain"));
    filePart.setHeader(QNetworkRequest::ContentDispositionHeader,
                       QStringLiteral("form-data; name=\"file\"; filename=\"%1\"").arg(fileName));
    filePart.setBody(content);
    multiPart->append(filePart);

    QHttpPart rootPart;
    rootPart.setHeader(QNetworkRequest::ContentDispositionHeader, QStringLiteral("form-data; name=\"root\""));
    rootPart.setBody(QByteArray(kUploadRoot));
    multiPart->append(rootPart);

    QNetworkAccessManager manager;
    const QNetworkRequest request =
        makeRequest(QUrl(m_baseUrl + QStringLiteral("/server/files/upload")), kUploadTimeoutMs);
    QNetworkReply* pending = manager.post(request, multiPart);
    multiPart->setParent(pending);

    RemoteReply reply = collect(pending);
    if (reply.ok)
    {
        LOG_INFO(Remote, QStringLiteral("Uploaded %1 (%2 bytes)").arg(fileName).arg(content.size()));
    }
    else
    {
        LOG_ERR(Remote, QStringLiteral("Upload of %1 failed: %2").arg(fileName, reply.error));
    }
    return reply;
}

RemoteReply MoonrakerClient::startPrint(const QString& filename) const
{
    QNetworkAccessManager manager;
    QJsonObject body;
    body.insert(QStringLiteral("filename"), filename);
    const QNetworkRequest request =
        makeJsonRequest(QUrl(m_baseUrl + QStringLiteral("/printer/print/start")), kCommandTimeoutMs);
    RemoteReply reply = collect(manager.post(request, jsonBody(body)));
    if (reply.ok)
    {
        LOG_INFO(Remote, QStringLiteral("Print of %1 started").arg(filename));
    }
    else
    {
        LOG_ERR(Remote, QStringLiteral("Print of %1 not started: %2").arg(filename, reply.error));
    }
    return reply;
}

RemoteReply MoonrakerClient::uploadAndPrint(const QString& path) const
{
    RemoteReply uploaded = uploadFile(path);
    if (!uploaded.ok)
    {
        return uploaded;
    }

    const QString stored =
        uploaded.body.value(QStringLiteral("item")).toObject().value(QStringLiteral("path")).toString();
    if (stored.isEmpty())
    {
        uploaded.ok = false;
        uploaded.error = QStringLiteral("Could not determine uploaded filename");
        LOG_ERR(Remote, uploaded.error);
        return uploaded;
    }
    return startPrint(stored);
}

RemoteReply MoonrakerClient::printerStatus() const
{
    QNetworkAccessManager manager;
    const QUrl url(m_baseUrl + QStringLiteral("/printer/objects/query?print_stats&toolhead&extruder"));
    return collect(manager.get(makeRequest(url, kQueryTimeoutMs)));
}

RemoteReply MoonrakerClient::emergencyStop() const
{
    LOG_WARN(Remote, QStringLiteral("Emergency stop requested"));
    return sendGcode(QStringLiteral("M112"));
}

RemoteReply MoonrakerClient::homeAll() const
{
    return sendGcode(QStringLiteral("G28"));
}

RemoteReply MoonrakerClient::setManualStepper(const QString& stepper, double position) const
{
    return sendGcode(manualStepperLine(post::ActuatorSettings{}, stepper, position));
}

RemoteReply MoonrakerClient::runSequence(const QStringList& commands) const
{
    RemoteReply reply;
    reply.ok = true;
    const qsizetype total = commands.size();
    for (qsizetype i = 0; i < total; ++i)
    {
        const QString& command = commands.at(i);
        LOG_INFO(Remote, QStringLiteral("Step %1/%2: %3").arg(i + 1).arg(total).arg(command));
        reply = sendGcode(command);
        if (!reply.ok)
        {
            reply.error = QStringLiteral("Step %1/%2 (%3): %4").arg(i + 1).arg(total).arg(command, reply.error);
            LOG_ERR(Remote, reply.error);
            return reply;
        }
    }
    return reply;
}

} // namespace remote
