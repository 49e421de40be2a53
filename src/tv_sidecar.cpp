#include "tv_sidecar.h"

#include <iostream>
#include <variant>

#include <QDateTime>
#include <QJsonDocument>

#include "tv_commands.h"
#include "tv_probe.h"
#include "tv_schema.h"
#include "tv_session.h"

namespace phicore::samsungtv::ipc {

namespace {

namespace v1 = phicore::adapter::v1;
namespace sdk = phicore::adapter::sdk;

std::optional<bool> scalarAsBool(const v1::ScalarValue &value)
{
    if (const auto *b = std::get_if<bool>(&value))
        return *b;
    if (const auto *i = std::get_if<std::int64_t>(&value))
        return *i != 0;
    if (const auto *d = std::get_if<double>(&value))
        return *d != 0.0;
    if (const auto *s = std::get_if<std::string>(&value)) {
        const QString text = QString::fromStdString(*s).trimmed().toLower();
        if (text == QLatin1String("1") || text == QLatin1String("true") || text == QLatin1String("on"))
            return true;
        if (text == QLatin1String("0") || text == QLatin1String("false") || text == QLatin1String("off"))
            return false;
    }
    return std::nullopt;
}

QJsonObject parseParams(const std::string &paramsJson)
{
    if (paramsJson.empty())
        return {};
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(paramsJson));
    return doc.isObject() ? doc.object() : QJsonObject{};
}

} // namespace

bool SamsungTvSidecar::HostConfigStore::updateConfig(const DeviceConfig &config, QString *error)
{
    return m_owner.persistConfig(config, error);
}

SamsungTvSidecar::SamsungTvSidecar()
    : m_http(&m_network)
    , m_store(*this)
{
}

SamsungTvSidecar::~SamsungTvSidecar()
{
    if (m_registry)
        m_registry->closeAll();
}

void SamsungTvSidecar::tick()
{
    if (!m_hasBootstrap || !m_registry)
        return;

    if (m_connectPending) {
        m_connectPending = false;
        if (DeviceSession *tv = session()) {
            tv->connectDevice();
            tv->startPolling();
        }
    }

    drainEvents();
}

void SamsungTvSidecar::onConnected()
{
    std::cerr << "samsungtv-ipc connected" << '\n';
}

void SamsungTvSidecar::onDisconnected()
{
    std::cerr << "samsungtv-ipc disconnected" << '\n';
}

void SamsungTvSidecar::onBootstrap(const sdk::BootstrapRequest &request)
{
    AdapterSidecar::onBootstrap(request);
    applyBootstrapAdapter(request.adapter);
    m_hasBootstrap = true;
    m_connectPending = true;

    const DeviceConfig *config = m_registry ? m_registry->config(m_deviceId) : nullptr;
    std::cerr << "samsungtv-ipc bootstrap adapterId=" << request.adapterId
              << " externalId=" << request.adapter.externalId
              << " address=" << (config ? config->address.toStdString() : std::string())
              << " reportsPowerState=" << (config && config->reportsPowerState ? "true" : "false")
              << " cloud=" << (config && config->hasCloudAuth() ? "true" : "false")
              << '\n';
}

phicore::adapter::v1::CmdResponse SamsungTvSidecar::onChannelInvoke(const sdk::ChannelInvokeRequest &request)
{
    if (!m_hasBootstrap)
        return failureResponse(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not bootstrapped"));

    DeviceSession *tv = session();
    if (!tv || QString::fromStdString(request.deviceExternalId) != m_deviceId)
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Unknown device"));

    const QString channelExternalId = QString::fromStdString(request.channelExternalId);
    if (channelExternalId != QLatin1String(kPowerChannelId)) {
        return failureResponse(request.cmdId,
                               CmdStatus::NotImplemented,
                               QStringLiteral("Channel %1 is read-only").arg(channelExternalId));
    }

    const std::optional<bool> on = request.hasScalarValue ? scalarAsBool(request.value) : std::nullopt;
    if (!on.has_value())
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Power value must be boolean"));

    const CommandResult result = *on ? tv->turnOn() : tv->turnOff();
    drainEvents();
    if (result != CommandResult::Success) {
        return failureResponse(request.cmdId,
                               toCmdStatus(result),
                               QStringLiteral("Power %1 %2").arg(*on ? QStringLiteral("on") : QStringLiteral("off"),
                                                                 QString::fromLatin1(commandResultName(result))));
    }

    CmdResponse resp = successResponse(request.cmdId);
    resp.finalValue = *on;
    return resp;
}

phicore::adapter::v1::ActionResponse SamsungTvSidecar::onAdapterActionInvoke(const sdk::AdapterActionInvokeRequest &request)
{
    const QString actionId = QString::fromStdString(request.actionId);
    if (actionId == QLatin1String("probe"))
        return invokeProbe(request);
    if (actionId == QLatin1String("togglePower")
        || actionId == QLatin1String("sendKey")
        || actionId == QLatin1String("launchApp")
        || actionId == QLatin1String("command")) {
        return invokeSessionAction(actionId, request);
    }

    ActionResponse resp;
    resp.id = request.cmdId;
    resp.status = CmdStatus::NotImplemented;
    resp.error = "Unsupported adapter action";
    resp.tsMs = nowMs();
    return resp;
}

phicore::adapter::v1::Utf8String SamsungTvSidecar::displayName() const
{
    return phicore::samsungtv::ipc::displayName();
}

phicore::adapter::v1::Utf8String SamsungTvSidecar::description() const
{
    return phicore::samsungtv::ipc::description();
}

phicore::adapter::v1::Utf8String SamsungTvSidecar::iconSvg() const
{
    return phicore::samsungtv::ipc::iconSvg();
}

phicore::adapter::v1::Utf8String SamsungTvSidecar::apiVersion() const
{
    return "1.0.0";
}

int SamsungTvSidecar::timeoutMs() const
{
    // Covers a first pairing handshake, which waits for the user on the TV.
    return 35000;
}

phicore::adapter::v1::AdapterCapabilities SamsungTvSidecar::capabilities() const
{
    return phicore::samsungtv::ipc::capabilities();
}

phicore::adapter::v1::JsonText SamsungTvSidecar::configSchemaJson() const
{
    return phicore::samsungtv::ipc::configSchemaJson();
}

std::int64_t SamsungTvSidecar::nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

SamsungTvSidecar::CmdStatus SamsungTvSidecar::toCmdStatus(CommandResult result)
{
    switch (result) {
    case CommandResult::Success:
        return CmdStatus::Success;
    case CommandResult::NotDelivered:
        return CmdStatus::TemporarilyOffline;
    case CommandResult::Unsupported:
        return CmdStatus::NotImplemented;
    case CommandResult::Failure:
        break;
    }
    return CmdStatus::Failure;
}

DeviceConfig SamsungTvSidecar::configFromAdapter(const v1::Adapter &adapter) const
{
    QString identifier = QString::fromStdString(adapter.externalId).trimmed();
    DeviceConfig config = deviceConfigFromJson(m_meta, identifier);
    if (config.identifier().isEmpty()) {
        const QString host = QString::fromStdString(adapter.host).trimmed();
        const QString ip = QString::fromStdString(adapter.ip).trimmed();
        identifier = host.isEmpty() ? ip : host;
        config = deviceConfigFromJson(m_meta, identifier);
    }

    if (config.address.isEmpty())
        config.address = m_meta.value(QStringLiteral("host")).toString().trimmed();
    if (config.address.isEmpty())
        config.address = QString::fromStdString(adapter.ip).trimmed();
    if (config.address.isEmpty())
        config.address = QString::fromStdString(adapter.host).trimmed();
    if (config.authToken.isEmpty())
        config.authToken = QString::fromStdString(adapter.token).trimmed();
    return config;
}

void SamsungTvSidecar::applyBootstrapAdapter(const v1::Adapter &adapter)
{
    m_adapterInfo = adapter;

    m_meta = QJsonObject{};
    const QByteArray metaBytes = QByteArray::fromStdString(adapter.metaJson);
    if (!metaBytes.trimmed().isEmpty()) {
        const QJsonDocument metaDoc = QJsonDocument::fromJson(metaBytes);
        if (metaDoc.isObject())
            m_meta = metaDoc.object();
    }

    if (m_registry) {
        m_registry->closeAll();
        m_registry.reset();
    }
    m_lastPowerValue.reset();
    m_connected = false;

    const DeviceConfig config = configFromAdapter(adapter);
    m_deviceId = config.identifier();
    m_registry = std::make_unique<DeviceRegistry>(&m_store,
                                                  networkSessionFactory(m_http,
                                                                        sessionSettingsFromMeta(m_meta),
                                                                        cloudSettingsFromMeta(m_meta)));
    if (!m_registry->add(config)) {
        std::cerr << "samsungtv-ipc bootstrap without usable device identifier" << '\n';
        sendError("Samsung TV adapter needs a host or external id");
        return;
    }

    m_entry = buildDeviceEntry(config, PowerState::Off, false);
    publishDevice();
}

DeviceSession *SamsungTvSidecar::session() const
{
    return m_registry ? m_registry->session(m_deviceId) : nullptr;
}

bool SamsungTvSidecar::persistConfig(const DeviceConfig &config, QString *error)
{
    const QJsonObject patch = toJson(config);
    for (auto it = patch.constBegin(); it != patch.constEnd(); ++it)
        m_meta.insert(it.key(), it.value());

    v1::Utf8String sendError;
    if (!sendAdapterMetaUpdated(QJsonDocument(patch).toJson(QJsonDocument::Compact).toStdString(), &sendError)) {
        if (error)
            *error = QString::fromStdString(sendError);
        std::cerr << "samsungtv-ipc failed to send adapterMetaUpdated: " << sendError << '\n';
        return false;
    }

    if (config.identifier() == m_deviceId) {
        syncDeviceMeta(&m_entry, config);
        publishDevice();
    }
    return true;
}

void SamsungTvSidecar::drainEvents()
{
    if (!m_registry)
        return;

    EventChannel &events = m_registry->events();
    while (std::optional<DeviceEvent> event = events.take()) {
        if (eventDeviceId(*event) != m_deviceId)
            continue;

        if (const auto *state = std::get_if<StateChanged>(&*event)) {
            handleStateChanged(*state);
        } else if (std::holds_alternative<Connected>(*event)) {
            setConnectionState(true);
        } else if (std::holds_alternative<Disconnected>(*event)) {
            setConnectionState(false);
        } else if (const auto *failure = std::get_if<ConnectionError>(&*event)) {
            const QString message = failure->message.isEmpty()
                ? QStringLiteral("Samsung TV refused the connection")
                : failure->message;
            std::cerr << "samsungtv-ipc connection error: " << message.toStdString() << '\n';
            sendError(message.toStdString());
        }
    }
}

void SamsungTvSidecar::handleStateChanged(const StateChanged &event)
{
    const bool on = displayState(event.powerState) == PowerState::On;
    if (m_lastPowerValue != on) {
        m_lastPowerValue = on;
        v1::Utf8String sendError;
        if (!sendChannelStateUpdated(m_deviceId.toStdString(), kPowerChannelId, on, nowMs(), &sendError))
            std::cerr << "samsungtv-ipc failed to send power state: " << sendError << '\n';
    }

    if (!mergeStateIntoMeta(&m_entry.attributes, event))
        return;

    setPowerValue(&m_entry, event.powerState);
    if (const DeviceConfig *config = m_registry->config(m_deviceId))
        syncDeviceMeta(&m_entry, *config);
    publishDevice();
}

void SamsungTvSidecar::publishDevice()
{
    v1::Utf8String sendError;
    if (!sendDeviceUpdated(m_entry.device, m_entry.channels, &sendError))
        std::cerr << "samsungtv-ipc failed to send deviceUpdated: " << sendError << '\n';
}

void SamsungTvSidecar::setConnectionState(bool connected)
{
    if (m_connected == connected)
        return;
    m_connected = connected;
    setConnectivityValue(&m_entry, connected);

    v1::Utf8String error;
    if (!sendConnectionStateChanged(connected, &error))
        std::cerr << "samsungtv-ipc failed to send connectionStateChanged: " << error << '\n';
    if (!sendChannelStateUpdated(m_deviceId.toStdString(),
                                 kConnectivityChannelId,
                                 connectivityValue(connected),
                                 nowMs(),
                                 &error)) {
        std::cerr << "samsungtv-ipc failed to send connectivity state: " << error << '\n';
    }
}

phicore::adapter::v1::ActionResponse SamsungTvSidecar::invokeProbe(const sdk::AdapterActionInvokeRequest &request)
{
    ActionResponse response;
    response.id = request.cmdId;
    response.tsMs = nowMs();

    DeviceConfig config = m_registry && m_registry->config(m_deviceId)
        ? *m_registry->config(m_deviceId)
        : DeviceConfig(m_deviceId);
    const QJsonObject params = parseParams(request.paramsJson);
    if (params.contains(QStringLiteral("host")))
        config.address = params.value(QStringLiteral("host")).toString().trimmed();
    if (params.contains(QStringLiteral("ip")))
        config.address = params.value(QStringLiteral("ip")).toString().trimmed();

    if (config.address.isEmpty()) {
        response.status = CmdStatus::InvalidArgument;
        response.error = "TV host is empty";
        response.resultType = v1::ActionResultType::None;
        return response;
    }

    RestStatusProbe probe(m_http, config);
    const ProbeResult result = probe.probe(5000);
    if (!result.ok) {
        response.status = CmdStatus::Failure;
        response.error = result.error.toStdString();
        response.resultType = v1::ActionResultType::None;
        return response;
    }

    QJsonObject metaPatch;
    if (!result.macAddress.isEmpty())
        metaPatch.insert(QStringLiteral("macAddress"), result.macAddress);
    if (result.power != PowerIndicator::Absent)
        metaPatch.insert(QStringLiteral("reportsPowerState"), true);
    if (result.artModeSupported)
        metaPatch.insert(QStringLiteral("supportsArtMode"), true);
    if (!metaPatch.isEmpty()) {
        v1::Utf8String sendError;
        const QByteArray patch = QJsonDocument(metaPatch).toJson(QJsonDocument::Compact);
        if (!sendAdapterMetaUpdated(patch.toStdString(), &sendError))
            std::cerr << "samsungtv-ipc failed to send adapterMetaUpdated(probe): " << sendError << '\n';
    }

    const QString model = result.modelName.isEmpty() ? QStringLiteral("Samsung TV") : result.modelName;
    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = QStringLiteral("%1 reachable, power state %2")
                               .arg(model, QString::fromLatin1(powerIndicatorName(result.power)))
                               .toStdString();
    return response;
}

phicore::adapter::v1::ActionResponse SamsungTvSidecar::invokeSessionAction(const QString &actionId,
                                                                        const sdk::AdapterActionInvokeRequest &request)
{
    DeviceSession *tv = session();
    if (!tv) {
        ActionResponse response;
        response.id = request.cmdId;
        response.tsMs = nowMs();
        response.status = CmdStatus::TemporarilyOffline;
        response.error = "Adapter not bootstrapped";
        return response;
    }

    const QJsonObject params = parseParams(request.paramsJson);
    CommandResult result = CommandResult::Failure;
    if (actionId == QLatin1String("togglePower")) {
        result = tv->toggle();
    } else if (actionId == QLatin1String("sendKey")) {
        result = tv->sendKey(params.value(QStringLiteral("key")).toString(),
                             params.value(QStringLiteral("holdMs")).toInt(0));
    } else if (actionId == QLatin1String("launchApp")) {
        QString source = params.value(QStringLiteral("source")).toString();
        if (source.isEmpty())
            source = params.value(QStringLiteral("app")).toString();
        result = tv->launchApp(source);
    } else {
        const QString command = params.value(QStringLiteral("command")).toString();
        if (const std::optional<QueryResult> query = executeQuery(*tv, command)) {
            drainEvents();
            ActionResponse response = actionResponse(request.cmdId, query->result, command);
            response.resultType = v1::ActionResultType::String;
            response.resultValue = QJsonDocument(query->info).toJson(QJsonDocument::Compact).toStdString();
            return response;
        }
        result = executeCommand(*tv, command, params);
    }

    drainEvents();
    return actionResponse(request.cmdId, result, actionId);
}

phicore::adapter::v1::ActionResponse SamsungTvSidecar::actionResponse(std::uint64_t cmdId,
                                                                   CommandResult result,
                                                                   const QString &context) const
{
    ActionResponse response;
    response.id = cmdId;
    response.tsMs = nowMs();
    response.status = toCmdStatus(result);
    response.resultType = v1::ActionResultType::None;
    if (result != CommandResult::Success)
        response.error = QStringLiteral("%1: %2").arg(context, QString::fromLatin1(commandResultName(result))).toStdString();
    return response;
}

phicore::adapter::v1::CmdResponse SamsungTvSidecar::failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = status;
    response.error = error.toStdString();
    response.tsMs = nowMs();
    return response;
}

phicore::adapter::v1::CmdResponse SamsungTvSidecar::successResponse(std::uint64_t cmdId) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = CmdStatus::Success;
    response.tsMs = nowMs();
    return response;
}

} // namespace phicore::samsungtv::ipc
