#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include <QJsonObject>
#include <QMap>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include "tv_art.h"
#include "tv_events.h"
#include "tv_power.h"
#include "tv_transport.h"

namespace phicore::samsungtv::ipc {

class CloudClient;
class ConfigStore;
class DeviceConfig;
class StatusProbe;
class WakeOnLanSender;

using TransportFactory = std::function<std::unique_ptr<Transport>(const DeviceConfig &)>;

struct SessionSettings {
    PowerTimings timings;
    int pollIntervalMs = 10000;
    int appListDelayMs = 1000;
    int appListTimeoutMs = 5000;
    int keyFeedbackDelayMs = 300;
    int launchFeedbackDelayMs = 1000;
    int cloudPollMinIntervalMs = 5000;
    int artTimeoutMs = 5000;
};

// pollIntervalMs (0 disables polling) and probeTimeoutMs from adapter meta.
SessionSettings sessionSettingsFromMeta(const QJsonObject &meta);

// Inputs that are always offered as sources, in this order.
QStringList baselineSources();
bool isHdmiSource(const QString &name);

// Owns the remote-control channel of one TV and dispatches outbound commands
// through the reconnect guard. Connection failures resolve to power state OFF
// and never reach the caller.
class DeviceSession : public QObject, public EngineHost
{
    Q_OBJECT
public:
    DeviceSession(DeviceConfig &config,
                  EventChannel &events,
                  ConfigStore *store,
                  TransportFactory transportFactory,
                  std::unique_ptr<StatusProbe> probe,
                  std::unique_ptr<WakeOnLanSender> wol,
                  std::unique_ptr<CloudClient> cloud = nullptr,
                  SessionSettings settings = {},
                  Clock clock = {},
                  QObject *parent = nullptr);
    ~DeviceSession() override;

    // Without a factory art mode commands are unsupported.
    void setArtChannelFactory(ArtChannelFactory factory) { m_artChannels = std::move(factory); }

    const DeviceConfig &config() const { return m_config; }
    PowerStateEngine &engine() { return m_engine; }
    const PowerStateEngine &engine() const { return m_engine; }
    PowerState powerState() const { return m_engine.state(); }

    bool isConnecting() const { return m_connecting; }
    bool hasTransport() const { return static_cast<bool>(m_transport); }
    const QStringList &sourceList() const { return m_sources; }
    const QString &activeSource() const { return m_activeSource; }
    const QMap<QString, QString> &installedApps() const { return m_apps; }

    // Idempotent while a handshake is running or the channel is alive.
    void connectDevice();
    void disconnectDevice();
    // Disconnect and forget the cloud device association.
    void close();

    CommandResult turnOn();
    CommandResult turnOff();
    CommandResult toggle(std::optional<bool> target = std::nullopt);
    CommandResult sendKey(const QString &key, int holdMs = 0);
    CommandResult launchApp(const QString &appNameOrId);
    CommandResult setArtMode(bool on);

    // REST device info; missing capabilities are filled in and persisted.
    ProbeResult deviceInfo();
    ArtInfo artInfo();

    void refreshAppList();
    void queryCloudStatus(bool force);

    void startPolling();
    void stopPolling();
    void poll();

    // EngineHost
    bool transportAlive() const override;
    bool deliverKey(const QString &key, int holdMs) override;
    void checkConnectionAndReconnect() override;
    QString cloudDeviceId() const override { return m_cloudDeviceId; }

private:
    bool establish(bool quiet);
    void dropTransport();
    void persistToken(const QString &token);
    void persistConfig(const char *what);
    void initCloud();
    bool cloudReady() const;
    void publishSources();
    void scheduleCloudStatus(int delayMs);

    DeviceConfig &m_config;
    EventChannel &m_events;
    ConfigStore *m_store = nullptr;
    TransportFactory m_transportFactory;
    ArtChannelFactory m_artChannels;
    std::unique_ptr<StatusProbe> m_probe;
    std::unique_ptr<WakeOnLanSender> m_wol;
    std::unique_ptr<CloudClient> m_cloud;
    SessionSettings m_settings;
    Clock m_clock;
    PowerStateEngine m_engine;

    // Shared only with the call frames that block on it, so a teardown that
    // happens inside a nested event loop cannot free it underneath them.
    std::shared_ptr<Transport> m_transport;
    Transport *m_pendingTransport = nullptr;
    quint64 m_generation = 0;
    bool m_connecting = false;

    QMap<QString, QString> m_apps; // name -> app id
    QStringList m_sources;
    QString m_activeSource;
    QString m_cloudDeviceId;
    std::optional<std::int64_t> m_lastCloudPollMs;

    QTimer m_pollTimer;
    QTimer m_appListTimer;
    QTimer m_cloudStatusTimer;
};

} // namespace phicore::samsungtv::ipc
