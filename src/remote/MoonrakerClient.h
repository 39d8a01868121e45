#pragma once

#include "post/ControllerEmitter.h"

#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <optional>

namespace remote
{

inline constexpr int kDefaultMoonrakerPort = 7125;

struct PrinterEndpoint
{
    QString host;
    int port{kDefaultMoonrakerPort};
};

/// "host" or "host:port"; std::nullopt for an empty host or a port outside 1..65535.
std::optional<PrinterEndpoint> parseEndpoint(const QString& text);

struct RemoteReply
{
    bool ok{false};
    int httpStatus{0};
    QJsonObject body;
    QString error;
};

enum class SetupSequence
{
    MassProduction,
    FiveAxis
};

/// "mass-production" or "five-axis".
std::optional<SetupSequence> parseSetupSequence(const QString& text);

/// Positioning commands run before a print; the rotary moves use the emitter's actuator naming.
QStringList setupCommands(SetupSequence sequence, const post::ActuatorSettings& actuator);

/**
 * Blocking client for the Moonraker HTTP API in front of a Klipper controller. Each call runs its
 * own request to completion on a local event loop and reports failures in the reply, never by
 * throwing. A QCoreApplication must exist.
 */
class MoonrakerClient
{
public:
    explicit MoonrakerClient(PrinterEndpoint endpoint);

    const PrinterEndpoint& endpoint() const noexcept { return m_endpoint; }

    /// Succeeds when GET /server/info answers 200.
    RemoteReply testConnection() const;
    RemoteReply sendGcode(const QString& script) const;
    /// Multipart upload into the "gcodes" root; the reply body carries item.path.
    RemoteReply uploadFile(const QString& path) const;
    RemoteReply startPrint(const QString& filename) const;
    /// Upload, then start the file under the name the server stored it as.
    RemoteReply uploadAndPrint(const QString& path) const;
    RemoteReply printerStatus() const;

    RemoteReply emergencyStop() const;
    RemoteReply homeAll() const;
    RemoteReply setManualStepper(const QString& stepper, double position) const;

    /// Sends the commands in order and stops at the first failure, naming it "Step i/N".
    RemoteReply runSequence(const QStringList& commands) const;

private:
    PrinterEndpoint m_endpoint;
    QString m_baseUrl;
};

} // namespace remote
