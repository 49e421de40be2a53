#include "tv_probe.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>

#include "tv_config.h"

namespace phicore::samsungtv::ipc {

namespace {

// The REST endpoint reports booleans as "true"/"false" strings.
bool readFlag(const QJsonObject &obj, const QString &key)
{
    const QJsonValue value = obj.value(key);
    if (value.isBool())
        return value.toBool();
    return value.toString().trimmed().compare(QLatin1String("true"), Qt::CaseInsensitive) == 0;
}

QStringList parseSupportFlags(const QJsonValue &value)
{
    QJsonObject flags;
    if (value.isObject()) {
        flags = value.toObject();
    } else if (value.isString()) {
        const QJsonDocument doc = QJsonDocument::fromJson(value.toString().toUtf8());
        if (doc.isObject())
            flags = doc.object();
    }

    QStringList out;
    for (auto it = flags.constBegin(); it != flags.constEnd(); ++it) {
        if (readFlag(flags, it.key()))
            out.append(it.key());
    }
    out.sort();
    return out;
}

} // namespace

PowerIndicator parsePowerIndicator(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized.isEmpty())
        return PowerIndicator::Absent;
    if (normalized == QLatin1String("on"))
        return PowerIndicator::On;
    if (normalized == QLatin1String("standby"))
        return PowerIndicator::Standby;
    return PowerIndicator::Off;
}

const char *powerIndicatorName(PowerIndicator power)
{
    switch (power) {
    case PowerIndicator::On:
        return "on";
    case PowerIndicator::Standby:
        return "standby";
    case PowerIndicator::Off:
        return "off";
    case PowerIndicator::Absent:
        break;
    }
    return "not reported";
}

ProbeResult parseDeviceInfo(const QByteArray &payload)
{
    ProbeResult out;

    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isObject()) {
        out.error = QStringLiteral("Device info is not a JSON object");
        return out;
    }

    const QJsonObject root = doc.object();
    const QJsonObject device = root.value(QStringLiteral("device")).toObject();
    if (device.isEmpty()) {
        out.error = QStringLiteral("Device info has no device object");
        return out;
    }

    out.ok = true;
    out.power = parsePowerIndicator(device.value(QStringLiteral("PowerState")).toString());
    out.artModeSupported = readFlag(device, QStringLiteral("FrameTVSupport"));
    out.macAddress = device.value(QStringLiteral("wifiMac")).toString().trimmed().toUpper();
    out.modelName = device.value(QStringLiteral("modelName")).toString().trimmed();

    QString duid = device.value(QStringLiteral("duid")).toString().trimmed();
    if (duid.startsWith(QLatin1String("uuid:")))
        duid = duid.mid(5);
    out.deviceUuid = duid;

    out.capabilities = parseSupportFlags(root.value(QStringLiteral("isSupport")));
    return out;
}

RestStatusProbe::RestStatusProbe(HttpRequester &http, const DeviceConfig &config)
    : m_http(http)
    , m_config(config)
{
}

Endpoint RestStatusProbe::endpoint() const
{
    return tvRestEndpoint(m_config.address, kTvRestPort);
}

ProbeResult RestStatusProbe::probe(int timeoutMs)
{
    ProbeResult out;

    if (m_config.address.trimmed().isEmpty()) {
        out.error = QStringLiteral("Host must not be empty");
        return out;
    }

    const HttpResult result = m_http.get(endpoint(), QStringLiteral("/api/v2/"), timeoutMs);
    if (!result.ok) {
        out.error = result.error.isEmpty() ? QStringLiteral("Device info request failed") : result.error;
        return out;
    }

    return parseDeviceInfo(result.payload);
}

bool RestStatusProbe::runApp(const QString &appId, int timeoutMs, QString *error)
{
    if (appId.trimmed().isEmpty()) {
        if (error)
            *error = QStringLiteral("App id must not be empty");
        return false;
    }

    const QString path = QStringLiteral("/api/v2/applications/%1")
                             .arg(QString::fromUtf8(QUrl::toPercentEncoding(appId)));
    const HttpResult result = m_http.postJson(endpoint(), path, QByteArrayLiteral("{}"), timeoutMs);
    if (!result.ok) {
        if (error)
            *error = result.error.isEmpty() ? QStringLiteral("App launch failed") : result.error;
        return false;
    }
    return true;
}

} // namespace phicore::samsungtv::ipc
