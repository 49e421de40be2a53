#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include <QObject>
#include <QString>

#include "tv_events.h"
#include "tv_probe.h"

namespace phicore::samsungtv::ipc {

class CloudClient;
class ConfigStore;
class DeviceConfig;
class WakeOnLanSender;
class WakeSequence;

using Clock = std::function<std::int64_t()>;

Clock systemClock();

struct PowerTimings {
    int offGuardArtMs = 5000;
    int offGuardLegacyMs = 65000;
    int onGuardMs = 17000;
    int wakeAttempts = 8;
    int wakeIntervalMs = 2000;
    int probeTimeoutMs = 2000;
};

inline constexpr char kPowerKey[] = "KEY_POWER";

// What the engine needs from the owner of the remote-control channel.
class EngineHost
{
public:
    virtual ~EngineHost() = default;

    virtual bool transportAlive() const = 0;
    // Runs the reconnect guard before dispatching.
    virtual bool deliverKey(const QString &key, int holdMs) = 0;
    virtual void checkConnectionAndReconnect() = 0;
    virtual QString cloudDeviceId() const = 0;
};

// Holds the authoritative power state of one TV and mediates every power
// transition. Guard windows are plain deadlines checked against the clock;
// they never block, they only change how ambiguous signals are read.
class PowerStateEngine : public QObject
{
    Q_OBJECT
public:
    PowerStateEngine(DeviceConfig &config,
                     EngineHost &host,
                     StatusProbe &probe,
                     WakeOnLanSender &wol,
                     EventChannel &events,
                     ConfigStore *store,
                     PowerTimings timings = {},
                     Clock clock = {},
                     QObject *parent = nullptr);
    ~PowerStateEngine() override;

    void setCloudClient(CloudClient *cloud) { m_cloud = cloud; }

    PowerState state() const { return m_state; }
    const PowerTimings &timings() const { return m_timings; }
    const QString &deviceUuid() const { return m_deviceUuid; }

    bool offGuardActive() const;
    bool onGuardActive() const;
    bool wakeInProgress() const;
    std::optional<std::int64_t> offGuardUntil() const { return m_offGuardUntil; }
    std::optional<std::int64_t> onGuardUntil() const { return m_onGuardUntil; }

    CommandResult requestOn();
    CommandResult requestOff();
    CommandResult toggle(std::optional<bool> target = std::nullopt);

    // Probes and always emits the resulting state.
    PowerState refreshPowerState();
    // Probes and emits only when the state changed. Returns true on change.
    bool pollPowerState();
    // Full status probe for metadata (MAC, art mode, UUID); fills missing
    // capabilities and writes them through.
    ProbeResult discoverCapabilities();

    // The remote channel could not be opened.
    void reportUnreachable(bool emitAlways = true);
    // Session teardown: cancels any wake and publishes OFF.
    void forceOff();
    void cancelWake();

private slots:
    void onWakeFinished(bool poweredOn);

private:
    std::int64_t now() const;
    PowerState probeState();
    PowerState resolve(PowerState probed);
    bool setState(PowerState state, bool emitAlways);
    void emitState();
    void absorbProbeMetadata(const ProbeResult &result);

    CommandResult startWake();
    CommandResult cancelPowerOff();
    bool launchWake();

    DeviceConfig &m_config;
    EngineHost &m_host;
    StatusProbe &m_probe;
    WakeOnLanSender &m_wol;
    EventChannel &m_events;
    ConfigStore *m_store = nullptr;
    CloudClient *m_cloud = nullptr;
    PowerTimings m_timings;
    Clock m_clock;

    PowerState m_state = PowerState::Unknown;
    std::optional<std::int64_t> m_offGuardUntil;
    std::optional<std::int64_t> m_onGuardUntil;
    WakeSequence *m_wake = nullptr;
    QString m_deviceUuid;
};

} // namespace phicore::samsungtv::ipc
