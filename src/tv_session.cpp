#include "tv_session.h"

#include <algorithm>
#include <utility>

#include <QVariant>

#include "tv_cloud.h"
#include "tv_config.h"
#include "tv_log.h"
#include "tv_probe.h"
#include "tv_wol.h"

namespace phicore::samsungtv::ipc {

namespace {

bool isFeedbackKey(const QString &key)
{
    static const QStringList keys = {
        QStringLiteral("KEY_VOLUP"),
        QStringLiteral("KEY_VOLDOWN"),
        QStringLiteral("KEY_MUTE"),
        QStringLiteral("KEY_PLAY"),
        QStringLiteral("KEY_PAUSE"),
        QStringLiteral("KEY_STOP"),
        QStringLiteral("KEY_PLAYPAUSE"),
        QStringLiteral("KEY_PLAY_BACK"),
        QStringLiteral("KEY_FF"),
        QStringLiteral("KEY_REWIND"),
    };
    return keys.contains(key);
}

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

} // namespace

SessionSettings sessionSettingsFromMeta(const QJsonObject &meta)
{
    SessionSettings settings;
    const int pollIntervalMs = readInt(meta, QStringLiteral("pollIntervalMs"), settings.pollIntervalMs);
    settings.pollIntervalMs = pollIntervalMs <= 0 ? 0 : std::clamp(pollIntervalMs, 1000, 600000);
    settings.timings.probeTimeoutMs =
        std::clamp(readInt(meta, QStringLiteral("probeTimeoutMs"), settings.timings.probeTimeoutMs), 250, 10000);
    return settings;
}

QStringList baselineSources()
{
    return {
        QStringLiteral("TV"),
        QStringLiteral("HDMI"),
        QStringLiteral("HDMI1"),
        QStringLiteral("HDMI2"),
        QStringLiteral("HDMI3"),
        QStringLiteral("HDMI4"),
    };
}

bool isHdmiSource(const QString &name)
{
    return name != QLatin1String("TV") && baselineSources().contains(name);
}

DeviceSession::DeviceSession(DeviceConfig &config,
                             EventChannel &events,
                             ConfigStore *store,
                             TransportFactory transportFactory,
                             std::unique_ptr<StatusProbe> probe,
                             std::unique_ptr<WakeOnLanSender> wol,
                             std::unique_ptr<CloudClient> cloud,
                             SessionSettings settings,
                             Clock clock,
                             QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_events(events)
    , m_store(store)
    , m_transportFactory(std::move(transportFactory))
    , m_probe(std::move(probe))
    , m_wol(std::move(wol))
    , m_cloud(std::move(cloud))
    , m_settings(settings)
    , m_clock(clock ? std::move(clock) : systemClock())
    , m_engine(config, *this, *m_probe, *m_wol, events, store, settings.timings, m_clock)
    , m_sources(baselineSources())
{
    m_engine.setCloudClient(m_cloud.get());

    m_appListTimer.setSingleShot(true);
    m_appListTimer.setInterval(m_settings.appListDelayMs);
    connect(&m_appListTimer, &QTimer::timeout, this, &DeviceSession::refreshAppList);

    m_cloudStatusTimer.setSingleShot(true);
    connect(&m_cloudStatusTimer, &QTimer::timeout, this, [this]() { queryCloudStatus(true); });

    connect(&m_pollTimer, &QTimer::timeout, this, &DeviceSession::poll);
}

DeviceSession::~DeviceSession()
{
    ++m_generation;
    if (m_pendingTransport)
        m_pendingTransport->close();
    m_engine.cancelWake();
    if (m_transport)
        m_transport->close();
}

bool DeviceSession::transportAlive() const
{
    return m_transport && m_transport->isAlive();
}

void DeviceSession::connectDevice()
{
    establish(false);
}

bool DeviceSession::establish(bool quiet)
{
    if (m_connecting) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "connect already in progress";
        return false;
    }
    if (transportAlive())
        return true;

    dropTransport();
    std::unique_ptr<Transport> transport = m_transportFactory ? m_transportFactory(m_config) : nullptr;
    if (!transport) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId()) << "no remote-control transport available";
        m_engine.reportUnreachable(!quiet);
        return false;
    }

    const quint64 generation = ++m_generation;
    const int timeoutMs = m_config.authToken.isEmpty() ? kHandshakeTimeoutPairingMs : kHandshakeTimeoutMs;
    qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "connecting to" << m_config.address;

    m_connecting = true;
    m_pendingTransport = transport.get();
    QString error;
    const TransportStatus status = transport->open(timeoutMs, &error);
    m_pendingTransport = nullptr;
    m_connecting = false;

    if (status == TransportStatus::Aborted || generation != m_generation) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "connect cancelled";
        transport->close();
        return false;
    }

    if (status != TransportStatus::Ok) {
        if (status == TransportStatus::Unauthorized) {
            qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                       << "TV refused the remote-control connection:" << error;
            m_events.post(ConnectionError{ m_config.identifier(), error });
        } else {
            qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                     << "could not connect, TV likely off:" << error;
        }
        transport->close();
        m_engine.reportUnreachable(!quiet);
        return false;
    }

    persistToken(transport->token());
    if (!transport->isAlive()) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "connection not alive, TV is off";
        transport->close();
        m_engine.reportUnreachable(!quiet);
        return false;
    }

    m_transport = std::move(transport);
    m_events.post(Connected{ m_config.identifier() });
    qCInfo(tvLog).noquote() << logPrefix(m_config.logId()) << "connected";

    if (!m_config.reportsPowerState)
        m_engine.discoverCapabilities();
    if (generation != m_generation)
        return false;
    if (quiet)
        m_engine.pollPowerState();
    else
        m_engine.refreshPowerState();
    if (generation != m_generation)
        return false;

    initCloud();
    if (generation != m_generation)
        return false;

    m_appListTimer.start();
    return true;
}

void DeviceSession::dropTransport()
{
    if (!m_transport)
        return;
    m_transport->close();
    m_transport.reset();
}

void DeviceSession::persistToken(const QString &token)
{
    if (token.isEmpty() || token == m_config.authToken)
        return;
    qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "remote-control token updated";
    m_config.authToken = token;
    persistConfig("token");
}

void DeviceSession::persistConfig(const char *what)
{
    if (!m_store)
        return;
    QString error;
    if (!m_store->updateConfig(m_config, &error)) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "failed to persist" << what << ":" << error;
    }
}

bool DeviceSession::cloudReady() const
{
    return m_cloud && !m_cloudDeviceId.isEmpty() && m_cloud->isAvailable();
}

void DeviceSession::initCloud()
{
    if (!m_cloud || !m_config.hasCloudAuth() || !m_cloudDeviceId.isEmpty())
        return;

    m_cloud->refreshTokenIfExpiring();
    const std::optional<CloudMatch> match = m_cloud->discoverDevice(m_engine.deviceUuid());
    if (!match)
        return;

    m_cloudDeviceId = match->deviceId;
    if (m_config.supportsCloudWake != match->supportsNetworkWake) {
        m_config.supportsCloudWake = match->supportsNetworkWake;
        persistConfig("cloud wake capability");
    }
}

void DeviceSession::disconnectDevice()
{
    qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "disconnecting";

    ++m_generation;
    if (m_pendingTransport)
        m_pendingTransport->close();
    m_engine.cancelWake();

    m_appListTimer.stop();
    m_cloudStatusTimer.stop();
    stopPolling();
    dropTransport();

    m_engine.forceOff();
    m_events.post(Disconnected{ m_config.identifier() });
}

void DeviceSession::close()
{
    disconnectDevice();
    m_cloudDeviceId.clear();
    m_lastCloudPollMs.reset();
}

void DeviceSession::checkConnectionAndReconnect()
{
    if (m_connecting)
        return;
    if (!m_transport) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "no connection, connecting";
        establish(true);
        return;
    }
    if (!m_transport->isAlive()) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "connection lost, reconnecting";
        dropTransport();
        establish(true);
    }
}

bool DeviceSession::deliverKey(const QString &key, int holdMs)
{
    checkConnectionAndReconnect();
    const std::shared_ptr<Transport> transport = m_transport;
    if (!transport || !transport->isAlive()) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "cannot send" << key << "- TV is not connected";
        return false;
    }

    QString error;
    if (!transport->sendKey(key, holdMs, &error)) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "sending" << key << "failed:" << error;
        return false;
    }

    if (isFeedbackKey(key) && cloudReady())
        scheduleCloudStatus(m_settings.keyFeedbackDelayMs);
    return true;
}

CommandResult DeviceSession::turnOn()
{
    return m_engine.requestOn();
}

CommandResult DeviceSession::turnOff()
{
    return m_engine.requestOff();
}

CommandResult DeviceSession::toggle(std::optional<bool> target)
{
    return m_engine.toggle(target);
}

CommandResult DeviceSession::sendKey(const QString &key, int holdMs)
{
    const QString trimmed = key.trimmed();
    if (trimmed.isEmpty())
        return CommandResult::Failure;
    return deliverKey(trimmed, holdMs) ? CommandResult::Success : CommandResult::NotDelivered;
}

CommandResult DeviceSession::launchApp(const QString &appNameOrId)
{
    const QString target = appNameOrId.trimmed();
    if (target.isEmpty())
        return CommandResult::Failure;

    if (m_engine.offGuardActive()) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "TV is powering off, not launching" << target;
        return CommandResult::NotDelivered;
    }

    if (target == QLatin1String("TV"))
        return sendKey(QStringLiteral("KEY_TV"));

    if (isHdmiSource(target)) {
        if (cloudReady()) {
            if (m_cloud->setInputSource(m_cloudDeviceId, target)) {
                m_activeSource = target;
                publishSources();
                return CommandResult::Success;
            }
            qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                       << "cloud input switch to" << target << "failed, using key";
        }
        return sendKey(QStringLiteral("KEY_") + target);
    }

    QString appId = m_apps.value(target);
    QString appName = target;
    if (appId.isEmpty()) {
        appName = m_apps.key(target);
        if (!appName.isEmpty())
            appId = target;
    }
    if (appId.isEmpty()) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "app" << target << "not found in app list, cannot launch";
        return CommandResult::Failure;
    }

    checkConnectionAndReconnect();
    if (!transportAlive()) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "cannot launch" << appName << "- TV is not connected";
        return CommandResult::NotDelivered;
    }

    QString error;
    if (!m_probe->runApp(appId, m_settings.timings.probeTimeoutMs, &error)) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "launching" << appName << "failed:" << error;
        return CommandResult::NotDelivered;
    }

    m_activeSource = appName;
    if (cloudReady())
        scheduleCloudStatus(m_settings.launchFeedbackDelayMs);
    return CommandResult::Success;
}

CommandResult DeviceSession::setArtMode(bool on)
{
    if (!m_config.supportsArtMode || !m_artChannels) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "TV has no art mode";
        return CommandResult::Unsupported;
    }

    const std::unique_ptr<ArtModeChannel> channel = m_artChannels(m_config);
    QString error;
    if (!channel || !channel->setArtMode(on, m_settings.artTimeoutMs, &error)) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "setting art mode" << (on ? "on" : "off") << "failed:" << error;
        return CommandResult::NotDelivered;
    }
    return CommandResult::Success;
}

ProbeResult DeviceSession::deviceInfo()
{
    return m_engine.discoverCapabilities();
}

ArtInfo DeviceSession::artInfo()
{
    ArtInfo info;
    const ProbeResult device = m_engine.discoverCapabilities();
    info.supported = device.ok ? device.artModeSupported : m_config.supportsArtMode;
    if (!info.supported || !m_artChannels)
        return info;

    const std::unique_ptr<ArtModeChannel> channel = m_artChannels(m_config);
    if (!channel)
        return info;
    QString error;
    info.artModeOn = channel->artMode(m_settings.artTimeoutMs, &error);
    if (!info.artModeOn) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "art mode status unavailable:" << error;
    }
    return info;
}

void DeviceSession::refreshAppList()
{
    const std::shared_ptr<Transport> transport = m_transport;
    if (transport && transport->isAlive()) {
        const std::optional<AppList> apps = transport->appList(m_settings.appListTimeoutMs);
        if (apps && !apps->empty()) {
            qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                     << "retrieved" << apps->size() << "apps";
            m_apps.clear();
            for (const InstalledApp &app : *apps)
                m_apps.insert(app.name, app.appId);
        }
    }

    QStringList sources = baselineSources();
    for (auto it = m_apps.constBegin(); it != m_apps.constEnd(); ++it) {
        if (!sources.contains(it.key()))
            sources.append(it.key());
    }

    if (m_apps.isEmpty()) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId()) << "no apps found in app list";
        if (cloudReady()) {
            const std::optional<CloudStatus> status = m_cloud->queryStatus(m_cloudDeviceId);
            if (status) {
                for (const QString &source : status->supportedInputSources) {
                    if (!sources.contains(source))
                        sources.append(source);
                }
            }
        }
    }

    m_sources = sources;
    publishSources();
}

void DeviceSession::publishSources()
{
    StateChanged event;
    event.deviceId = m_config.identifier();
    event.powerState = displayState(m_engine.state());
    event.sourceList = m_sources;
    if (!m_activeSource.isEmpty())
        event.activeSource = m_activeSource;
    m_events.post(std::move(event));
}

void DeviceSession::scheduleCloudStatus(int delayMs)
{
    m_cloudStatusTimer.start(delayMs);
}

void DeviceSession::queryCloudStatus(bool force)
{
    if (!cloudReady())
        return;

    const std::int64_t now = m_clock();
    if (!force && m_lastCloudPollMs && now - *m_lastCloudPollMs < m_settings.cloudPollMinIntervalMs)
        return;
    m_lastCloudPollMs = now;

    const std::optional<CloudStatus> status = m_cloud->queryStatus(m_cloudDeviceId);
    if (!status)
        return;
    if (status->media.isEmpty() && !status->inputSource)
        return;

    StateChanged event;
    event.deviceId = m_config.identifier();
    event.powerState = displayState(m_engine.state());
    event.media = status->media;
    if (status->inputSource) {
        m_activeSource = *status->inputSource;
        event.activeSource = m_activeSource;
    }
    m_events.post(std::move(event));
}

void DeviceSession::startPolling()
{
    if (m_settings.pollIntervalMs <= 0) {
        m_pollTimer.stop();
        return;
    }
    m_pollTimer.start(m_settings.pollIntervalMs);
}

void DeviceSession::stopPolling()
{
    m_pollTimer.stop();
}

void DeviceSession::poll()
{
    if (m_connecting)
        return;
    checkConnectionAndReconnect();
    m_engine.pollPowerState();
    if (m_engine.state() == PowerState::On)
        queryCloudStatus(false);
}

} // namespace phicore::samsungtv::ipc
