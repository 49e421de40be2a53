#pragma once

#include <functional>

#include <QObject>
#include <QString>
#include <QTimer>

#include "tv_events.h"

namespace phicore::samsungtv::ipc {

class CloudClient;
class DeviceConfig;
class WakeOnLanSender;

struct WakeSteps {
    std::function<void()> reconnect;
    // Returns the state reported by the device, before any guard is applied.
    std::function<PowerState()> probe;
};

// Timer driven power-on attempt: magic packet, wait, reconnect, probe.
// Stops on the first ON result or after maxAttempts; emits finished() once
// unless cancelled.
class WakeSequence : public QObject
{
    Q_OBJECT
public:
    WakeSequence(const DeviceConfig &config,
                 WakeOnLanSender &wol,
                 WakeSteps steps,
                 int maxAttempts,
                 int intervalMs,
                 QObject *parent = nullptr);

    void setCloudWake(CloudClient *cloud, const QString &cloudDeviceId);

    // False when there is no usable wake path (no valid MAC and no cloud wake).
    bool canRun() const;
    bool start();
    void cancel();

    bool isRunning() const { return m_running; }
    bool isCancelled() const { return m_cancelled; }
    int attempts() const { return m_attempt; }

signals:
    void finished(bool poweredOn);

private slots:
    void onIntervalElapsed();

private:
    bool hasCloudWake() const;
    void sendPacket();
    void fireCloudWake();
    void finish(bool poweredOn);

    const DeviceConfig &m_config;
    WakeOnLanSender &m_wol;
    WakeSteps m_steps;
    CloudClient *m_cloud = nullptr;
    QString m_cloudDeviceId;
    QTimer m_timer;
    int m_maxAttempts = 8;
    int m_attempt = 0;
    bool m_sendPackets = false;
    bool m_running = false;
    bool m_cancelled = false;
};

} // namespace phicore::samsungtv::ipc
