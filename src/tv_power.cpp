#include "tv_power.h"

#include <utility>

#include <QDateTime>

#include "tv_cloud.h"
#include "tv_config.h"
#include "tv_log.h"
#include "tv_wake.h"
#include "tv_wol.h"

namespace phicore::samsungtv::ipc {

Clock systemClock()
{
    return []() { return static_cast<std::int64_t>(QDateTime::currentMSecsSinceEpoch()); };
}

PowerStateEngine::PowerStateEngine(DeviceConfig &config,
                                   EngineHost &host,
                                   StatusProbe &probe,
                                   WakeOnLanSender &wol,
                                   EventChannel &events,
                                   ConfigStore *store,
                                   PowerTimings timings,
                                   Clock clock,
                                   QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_host(host)
    , m_probe(probe)
    , m_wol(wol)
    , m_events(events)
    , m_store(store)
    , m_timings(timings)
    , m_clock(clock ? std::move(clock) : systemClock())
{
}

PowerStateEngine::~PowerStateEngine()
{
    cancelWake();
}

std::int64_t PowerStateEngine::now() const
{
    return m_clock();
}

bool PowerStateEngine::offGuardActive() const
{
    return m_offGuardUntil && now() < *m_offGuardUntil;
}

bool PowerStateEngine::onGuardActive() const
{
    return m_onGuardUntil && now() < *m_onGuardUntil;
}

bool PowerStateEngine::wakeInProgress() const
{
    return m_wake && m_wake->isRunning();
}

PowerState PowerStateEngine::probeState()
{
    if (m_config.reportsPowerState) {
        const ProbeResult result = m_probe.probe(m_timings.probeTimeoutMs);
        if (!result.ok) {
            qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                     << "status probe failed, TV likely off:" << result.error;
            return PowerState::Off;
        }
        absorbProbeMetadata(result);
        switch (result.power) {
        case PowerIndicator::On:
            return PowerState::On;
        case PowerIndicator::Standby:
            return PowerState::Standby;
        case PowerIndicator::Off:
        case PowerIndicator::Absent:
            break;
        }
        return PowerState::Off;
    }

    if (!m_host.transportAlive())
        return PowerState::Off;
    if (offGuardActive()) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "remote channel alive but power-off grace period active";
        return PowerState::Off;
    }
    return PowerState::On;
}

PowerState PowerStateEngine::resolve(PowerState probed)
{
    if (probed == PowerState::On) {
        if (offGuardActive()) {
            // Lagging ON report after a power-off; keep the commanded state.
            return m_state == PowerState::Standby ? PowerState::Standby : PowerState::Off;
        }
        m_onGuardUntil.reset();
        return PowerState::On;
    }
    if (onGuardActive() || wakeInProgress())
        return PowerState::On;
    return probed;
}

bool PowerStateEngine::setState(PowerState state, bool emitAlways)
{
    const bool changed = state != m_state;
    if (changed) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "power state"
                                 << powerStateName(m_state) << "->" << powerStateName(state);
    }
    m_state = state;
    if (changed || emitAlways)
        emitState();
    return changed;
}

void PowerStateEngine::emitState()
{
    StateChanged event;
    event.deviceId = m_config.identifier();
    event.powerState = displayState(m_state);
    m_events.post(std::move(event));
}

void PowerStateEngine::absorbProbeMetadata(const ProbeResult &result)
{
    if (!result.deviceUuid.isEmpty())
        m_deviceUuid = result.deviceUuid;

    bool changed = false;
    if (!m_config.hasMacAddress()) {
        const QString mac = normalizeMacAddress(result.macAddress);
        if (!mac.isEmpty()) {
            m_config.macAddress = result.macAddress.trimmed();
            changed = true;
            qCInfo(tvLog).noquote() << logPrefix(m_config.logId())
                                    << "discovered MAC address" << m_config.macAddress;
        }
    }
    if (result.artModeSupported && !m_config.supportsArtMode) {
        m_config.supportsArtMode = true;
        changed = true;
        qCInfo(tvLog).noquote() << logPrefix(m_config.logId()) << "TV supports art mode";
    }

    if (!changed || !m_store)
        return;
    QString error;
    if (!m_store->updateConfig(m_config, &error)) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "failed to persist discovered capabilities:" << error;
    }
}

PowerState PowerStateEngine::refreshPowerState()
{
    setState(resolve(probeState()), true);
    return m_state;
}

bool PowerStateEngine::pollPowerState()
{
    return setState(resolve(probeState()), false);
}

ProbeResult PowerStateEngine::discoverCapabilities()
{
    const ProbeResult result = m_probe.probe(m_timings.probeTimeoutMs);
    if (result.ok) {
        absorbProbeMetadata(result);
    } else {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "device info unavailable:" << result.error;
    }
    return result;
}

void PowerStateEngine::reportUnreachable(bool emitAlways)
{
    setState(resolve(PowerState::Off), emitAlways);
}

void PowerStateEngine::forceOff()
{
    cancelWake();
    m_onGuardUntil.reset();
    setState(PowerState::Off, true);
}

void PowerStateEngine::cancelWake()
{
    if (!m_wake)
        return;
    WakeSequence *wake = std::exchange(m_wake, nullptr);
    wake->cancel();
    wake->deleteLater();
}

CommandResult PowerStateEngine::requestOn()
{
    if (offGuardActive())
        return cancelPowerOff();

    if (onGuardActive() || wakeInProgress()) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "power-on already in progress, ignoring";
        return CommandResult::Success;
    }

    switch (m_state) {
    case PowerState::On:
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "TV is already on";
        return CommandResult::Success;
    case PowerState::Standby:
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "TV in standby, sending power key";
        if (!m_host.deliverKey(QString::fromLatin1(kPowerKey), 0))
            return CommandResult::NotDelivered;
        setState(PowerState::On, true);
        return CommandResult::Success;
    case PowerState::Off:
    case PowerState::Unknown:
        break;
    }
    return startWake();
}

CommandResult PowerStateEngine::startWake()
{
    if (!launchWake()) {
        setState(PowerState::Off, true);
        return CommandResult::Failure;
    }
    setState(PowerState::On, true);
    return CommandResult::Success;
}

bool PowerStateEngine::launchWake()
{
    cancelWake();

    WakeSteps steps;
    steps.reconnect = [this]() { m_host.checkConnectionAndReconnect(); };
    steps.probe = [this]() {
        const PowerState probed = probeState();
        setState(resolve(probed), false);
        return probed;
    };

    auto *wake = new WakeSequence(m_config, m_wol, std::move(steps),
                                  m_timings.wakeAttempts, m_timings.wakeIntervalMs, this);
    wake->setCloudWake(m_cloud, m_host.cloudDeviceId());
    if (!wake->canRun()) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "cannot power on: no MAC address for Wake-on-LAN";
        delete wake;
        m_onGuardUntil.reset();
        return false;
    }

    m_onGuardUntil = now() + m_timings.onGuardMs;
    m_wake = wake;
    connect(wake, &WakeSequence::finished, this, &PowerStateEngine::onWakeFinished);
    if (!wake->start()) {
        cancelWake();
        m_onGuardUntil.reset();
        return false;
    }
    return true;
}

CommandResult PowerStateEngine::cancelPowerOff()
{
    qCInfo(tvLog).noquote() << logPrefix(m_config.logId())
                            << "TV is powering off, cancelling and powering on";
    m_offGuardUntil.reset();

    const bool delivered = m_host.deliverKey(QString::fromLatin1(kPowerKey), 0);
    if (!delivered) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "power key not delivered, relying on wake sequence";
    }

    if (!launchWake() && !delivered) {
        setState(PowerState::Off, true);
        return CommandResult::NotDelivered;
    }
    setState(PowerState::On, true);
    return CommandResult::Success;
}

CommandResult PowerStateEngine::requestOff()
{
    if (offGuardActive()) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "power-off already in progress, ignoring";
        return CommandResult::Success;
    }
    if (onGuardActive() || wakeInProgress()) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "power-on in progress, ignoring power-off";
        return CommandResult::Success;
    }

    bool delivered = false;
    const QString cloudDeviceId = m_host.cloudDeviceId();
    if (m_cloud && !cloudDeviceId.isEmpty() && m_cloud->isAvailable()) {
        delivered = m_cloud->powerOffDevice(cloudDeviceId);
        if (!delivered) {
            qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                       << "cloud power-off failed, using power key";
        }
    }
    if (!delivered)
        delivered = m_host.deliverKey(QString::fromLatin1(kPowerKey), 0);
    if (!delivered) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "power-off not delivered, TV unreachable";
    }

    if (m_config.supportsArtMode) {
        m_offGuardUntil = now() + m_timings.offGuardArtMs;
        setState(PowerState::Standby, true);
    } else {
        m_offGuardUntil = now() + m_timings.offGuardLegacyMs;
        setState(PowerState::Off, true);
    }
    return delivered ? CommandResult::Success : CommandResult::NotDelivered;
}

CommandResult PowerStateEngine::toggle(std::optional<bool> target)
{
    if (offGuardActive() && target.value_or(true))
        return cancelPowerOff();

    if (onGuardActive() || wakeInProgress()) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "power-on in progress, ignoring power command";
        return CommandResult::Success;
    }

    bool powerOn = false;
    if (target) {
        powerOn = *target;
    } else {
        const PowerState current = refreshPowerState();
        powerOn = current == PowerState::Off || current == PowerState::Standby;
    }
    return powerOn ? requestOn() : requestOff();
}

void PowerStateEngine::onWakeFinished(bool poweredOn)
{
    Q_UNUSED(poweredOn);
    WakeSequence *wake = qobject_cast<WakeSequence *>(sender());
    if (!wake || wake != m_wake)
        return;

    const int attempts = wake->attempts();
    m_wake = nullptr;
    wake->deleteLater();
    m_onGuardUntil.reset();

    const PowerState finalState = refreshPowerState();
    if (finalState != PowerState::On) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "unable to wake TV after" << attempts
                                   << "attempts, final state:" << powerStateName(finalState);
    }
}

} // namespace phicore::samsungtv::ipc
