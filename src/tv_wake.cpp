#include "tv_wake.h"

#include <utility>

#include "tv_cloud.h"
#include "tv_config.h"
#include "tv_log.h"
#include "tv_wol.h"

namespace phicore::samsungtv::ipc {

WakeSequence::WakeSequence(const DeviceConfig &config,
                           WakeOnLanSender &wol,
                           WakeSteps steps,
                           int maxAttempts,
                           int intervalMs,
                           QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_wol(wol)
    , m_steps(std::move(steps))
    , m_maxAttempts(maxAttempts > 0 ? maxAttempts : 1)
{
    m_timer.setSingleShot(true);
    m_timer.setInterval(intervalMs);
    connect(&m_timer, &QTimer::timeout, this, &WakeSequence::onIntervalElapsed);
    m_sendPackets = !normalizeMacAddress(m_config.macAddress).isEmpty();
}

void WakeSequence::setCloudWake(CloudClient *cloud, const QString &cloudDeviceId)
{
    m_cloud = cloud;
    m_cloudDeviceId = cloudDeviceId;
}

bool WakeSequence::hasCloudWake() const
{
    return m_cloud && !m_cloudDeviceId.isEmpty() && m_config.supportsCloudWake && m_cloud->isAvailable();
}

bool WakeSequence::canRun() const
{
    return m_sendPackets || hasCloudWake();
}

bool WakeSequence::start()
{
    if (m_running || m_cancelled)
        return false;
    if (!canRun()) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "cannot wake TV: no valid MAC address configured";
        return false;
    }

    if (!m_sendPackets) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "no valid MAC address, relying on cloud wake only";
    }

    qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "starting wake sequence";
    m_running = true;
    if (hasCloudWake())
        QTimer::singleShot(0, this, &WakeSequence::fireCloudWake);

    sendPacket();
    m_timer.start();
    return true;
}

void WakeSequence::cancel()
{
    if (m_cancelled)
        return;
    m_cancelled = true;
    m_running = false;
    m_timer.stop();
    qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                             << "wake sequence cancelled after" << m_attempt << "attempts";
}

void WakeSequence::sendPacket()
{
    ++m_attempt;
    if (!m_sendPackets)
        return;

    qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                             << QStringLiteral("sending magic packet (%1/%2)").arg(m_attempt).arg(m_maxAttempts);
    QString error;
    if (!m_wol.sendMagicPacket(m_config.macAddress, &error)) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "magic packet failed:" << error;
    }
}

void WakeSequence::fireCloudWake()
{
    if (m_cancelled || !m_running || !hasCloudWake())
        return;
    if (m_cloud->wakeDevice(m_cloudDeviceId)) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "cloud power-on command accepted";
    } else {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "cloud power-on failed, continuing with Wake-on-LAN";
    }
}

void WakeSequence::onIntervalElapsed()
{
    if (m_cancelled)
        return;

    if (m_steps.reconnect)
        m_steps.reconnect();
    if (m_cancelled)
        return;

    const PowerState state = m_steps.probe ? m_steps.probe() : PowerState::Off;
    if (m_cancelled)
        return;

    if (state == PowerState::On) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "TV powered on after" << m_attempt << "attempts";
        finish(true);
        return;
    }

    qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                             << "TV not fully on yet, state:" << powerStateName(state);
    if (m_attempt >= m_maxAttempts) {
        finish(false);
        return;
    }

    sendPacket();
    m_timer.start();
}

void WakeSequence::finish(bool poweredOn)
{
    m_running = false;
    m_timer.stop();
    emit finished(poweredOn);
}

} // namespace phicore::samsungtv::ipc
