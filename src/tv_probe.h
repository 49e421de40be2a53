#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

#include "tv_http.h"

namespace phicore::samsungtv::ipc {

class DeviceConfig;

enum class PowerIndicator {
    Absent,
    Off,
    Standby,
    On
};

struct ProbeResult {
    bool ok = false;
    QString error;
    PowerIndicator power = PowerIndicator::Absent;
    bool artModeSupported = false;
    QString macAddress;
    QString deviceUuid;
    QString modelName;
    QStringList capabilities;
};

// Out-of-band queries against the TV's local REST endpoint. Independent of the
// persistent remote-control transport.
class StatusProbe
{
public:
    virtual ~StatusProbe() = default;

    virtual ProbeResult probe(int timeoutMs) = 0;
    virtual bool runApp(const QString &appId, int timeoutMs, QString *error = nullptr) = 0;
};

inline constexpr int kTvRestPort = 8002;

ProbeResult parseDeviceInfo(const QByteArray &payload);
PowerIndicator parsePowerIndicator(const QString &value);
const char *powerIndicatorName(PowerIndicator power);

class RestStatusProbe final : public StatusProbe
{
public:
    RestStatusProbe(HttpRequester &http, const DeviceConfig &config);

    ProbeResult probe(int timeoutMs) override;
    bool runApp(const QString &appId, int timeoutMs, QString *error = nullptr) override;

private:
    Endpoint endpoint() const;

    HttpRequester &m_http;
    const DeviceConfig &m_config;
};

} // namespace phicore::samsungtv::ipc
