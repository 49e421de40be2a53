#include "tv_cloud.h"

#include <utility>

#include <QDateTime>
#include <QJsonDocument>

#include "tv_config.h"
#include "tv_log.h"

namespace phicore::samsungtv::ipc {

namespace {

QString normalizedNetworkId(const QString &value)
{
    QString out = value;
    out.remove(QLatin1Char(':'));
    return out.trimmed().toUpper();
}

QString attributeString(const QHash<QString, QJsonValue> &attributes, const QString &name)
{
    const QJsonValue value = attributes.value(name);
    if (value.isString())
        return value.toString().trimmed();
    if (value.isDouble())
        return QString::number(value.toDouble());
    return {};
}

QStringList parseSourceList(const QJsonValue &value)
{
    QJsonArray entries;
    if (value.isArray()) {
        entries = value.toArray();
    } else if (value.isString()) {
        const QJsonDocument doc = QJsonDocument::fromJson(value.toString().toUtf8());
        if (doc.isArray())
            entries = doc.array();
    }

    QStringList out;
    for (const QJsonValue &entry : std::as_const(entries)) {
        QString source = entry.isObject()
            ? entry.toObject().value(QStringLiteral("id")).toString()
            : entry.toString();
        source = source.trimmed();
        if (!source.isEmpty() && !out.contains(source))
            out.append(source);
    }
    return out;
}

} // namespace

CloudSettings cloudSettingsFromMeta(const QJsonObject &meta)
{
    CloudSettings settings;
    const QString apiUrl = meta.value(QStringLiteral("cloudApiUrl")).toString().trimmed();
    if (!apiUrl.isEmpty())
        settings.apiUrl = QUrl(apiUrl);
    const QString refreshUrl = meta.value(QStringLiteral("cloudRefreshUrl")).toString().trimmed();
    if (!refreshUrl.isEmpty())
        settings.refreshUrl = QUrl(refreshUrl);
    return settings;
}

std::optional<CloudMatch> matchCloudDevice(const QJsonArray &items,
                                           const QString &deviceUuid,
                                           const QString &macAddress,
                                           const QString &name)
{
    const QString uuid = deviceUuid.trimmed().toLower();
    const QString mac = normalizedNetworkId(macAddress);
    std::optional<CloudMatch> byMac;
    std::optional<CloudMatch> byName;

    for (const QJsonValue &value : items) {
        const QJsonObject device = value.toObject();
        const QString deviceId = device.value(QStringLiteral("deviceId")).toString();
        if (deviceId.isEmpty())
            continue;
        const QString networkId = device.value(QStringLiteral("deviceNetworkId")).toString();
        const QString label = device.value(QStringLiteral("label")).toString();

        if (!uuid.isEmpty()
            && (deviceId.toLower().contains(uuid) || networkId.toLower().contains(uuid))) {
            return CloudMatch{ deviceId, label, QStringLiteral("uuid"), false };
        }

        if (!byMac && !mac.isEmpty() && normalizedNetworkId(networkId) == mac)
            byMac = CloudMatch{ deviceId, label, QStringLiteral("mac"), false };

        if (!byName && !label.isEmpty() && !name.isEmpty()) {
            QString cleaned = label;
            if (cleaned.startsWith(QLatin1String("[TV] ")))
                cleaned = cleaned.mid(5);
            if (cleaned.trimmed() == name.trimmed())
                byName = CloudMatch{ deviceId, label, QStringLiteral("name"), false };
        }
    }
    return byMac ? byMac : byName;
}

QHash<QString, QJsonValue> flattenStatusAttributes(const QJsonObject &status)
{
    QHash<QString, QJsonValue> out;
    const QJsonObject main = status.value(QStringLiteral("components")).toObject()
                                 .value(QStringLiteral("main")).toObject();
    for (auto cap = main.constBegin(); cap != main.constEnd(); ++cap) {
        const QJsonObject attributes = cap.value().toObject();
        for (auto attr = attributes.constBegin(); attr != attributes.constEnd(); ++attr) {
            const QJsonValue value = attr.value().toObject().value(QStringLiteral("value"));
            if (value.isUndefined() || value.isNull())
                continue;
            out.insert(attr.key(), value);
        }
    }
    return out;
}

CloudStatus parseCloudStatus(const QJsonObject &status)
{
    CloudStatus out;
    const QHash<QString, QJsonValue> attributes = flattenStatusAttributes(status);

    const QJsonValue volume = attributes.value(QStringLiteral("volume"));
    if (volume.isDouble())
        out.media.volume = volume.toInt();

    const QString mute = attributeString(attributes, QStringLiteral("mute"));
    if (!mute.isEmpty())
        out.media.muted = mute == QLatin1String("muted");

    const QString input = attributeString(attributes, QStringLiteral("inputSource"));
    if (!input.isEmpty())
        out.inputSource = input;

    out.supportedInputSources = parseSourceList(attributes.value(QStringLiteral("supportedInputSources")));

    for (const char *key : { "mediaTitle", "title", "programName", "trackDescription" }) {
        const QString title = attributeString(attributes, QString::fromLatin1(key));
        if (!title.isEmpty()) {
            out.media.mediaTitle = title;
            break;
        }
    }

    const QString artist = attributeString(attributes, QStringLiteral("trackDescription"));
    if (!artist.isEmpty() && out.media.mediaTitle != artist)
        out.media.mediaArtist = artist;

    if (!out.media.mediaTitle) {
        QStringList parts;
        const QString channel = attributeString(attributes, QStringLiteral("tvChannel"));
        const QString channelName = attributeString(attributes, QStringLiteral("tvChannelName"));
        if (!channel.isEmpty())
            parts.append(QStringLiteral("Channel %1").arg(channel));
        if (!channelName.isEmpty())
            parts.append(channelName);
        if (!parts.isEmpty())
            out.media.mediaTitle = parts.join(QStringLiteral(" - "));
    }
    return out;
}

bool parseSupportsNetworkWake(const QJsonObject &status)
{
    const QJsonValue value = flattenStatusAttributes(status).value(QStringLiteral("supportsPowerOnByOcf"));
    if (value.isBool())
        return value.toBool();
    return value.toString().trimmed().compare(QLatin1String("true"), Qt::CaseInsensitive) == 0;
}

SmartThingsClient::SmartThingsClient(HttpRequester &http, DeviceConfig &config, CloudSettings settings)
    : m_http(http)
    , m_config(config)
    , m_settings(std::move(settings))
{
}

bool SmartThingsClient::isAvailable() const
{
    return !m_degraded && m_config.hasCloudAuth();
}

void SmartThingsClient::refreshTokenIfExpiring()
{
    const std::int64_t now = QDateTime::currentSecsSinceEpoch();
    if (!m_config.cloudTokenExpiresWithin(now, kProactiveRefreshWindowSecs))
        return;

    qCInfo(tvLog).noquote() << logPrefix(m_config.logId())
                            << "cloud access token expires soon, refreshing";
    refreshAccessToken();
}

bool SmartThingsClient::refreshAccessToken()
{
    if (m_config.cloud.refreshToken.isEmpty()) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "cannot refresh cloud token: no refresh token";
        return false;
    }
    if (!m_settings.refreshUrl.isValid() || m_settings.refreshUrl.host().isEmpty()) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "cannot refresh cloud token: no refresh endpoint configured";
        return false;
    }

    QJsonObject body;
    body.insert(QStringLiteral("refresh_token"), m_config.cloud.refreshToken);
    const HttpResult result = m_http.postJson(endpointFromUrl(m_settings.refreshUrl),
                                              QString(),
                                              QJsonDocument(body).toJson(QJsonDocument::Compact),
                                              m_settings.timeoutMs);
    if (!result.ok) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "cloud token refresh failed:" << result.error;
        return false;
    }

    const QJsonObject tokenData = result.jsonObject();
    const QString accessToken = tokenData.value(QStringLiteral("access_token")).toString().trimmed();
    if (accessToken.isEmpty()) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "cloud token refresh returned no access token";
        return false;
    }

    const QString refreshToken = tokenData.value(QStringLiteral("refresh_token")).toString().trimmed();
    const std::int64_t expiresIn = tokenData.contains(QStringLiteral("expires_in"))
        ? static_cast<std::int64_t>(tokenData.value(QStringLiteral("expires_in")).toDouble())
        : kDefaultTokenLifetimeSecs;

    m_config.cloud.accessToken = accessToken;
    if (!refreshToken.isEmpty())
        m_config.cloud.refreshToken = refreshToken;
    m_config.cloud.expiresAt = QDateTime::currentSecsSinceEpoch() + expiresIn;
    m_degraded = false;

    if (m_tokensUpdated)
        m_tokensUpdated(m_config);

    qCInfo(tvLog).noquote() << logPrefix(m_config.logId())
                            << "cloud access token refreshed, expires in" << expiresIn << "s";
    return true;
}

std::optional<CloudMatch> SmartThingsClient::discoverDevice(const QString &deviceUuid)
{
    const HttpResult result = call(QByteArrayLiteral("GET"), QStringLiteral("/devices"));
    if (!result.ok) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "cloud device list failed:" << result.error;
        return std::nullopt;
    }

    const QJsonArray items = result.jsonObject().value(QStringLiteral("items")).toArray();
    std::optional<CloudMatch> match = matchCloudDevice(items, deviceUuid, m_config.macAddress, m_config.name);
    if (!match) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "cloud device not found among" << items.size() << "devices";
        return std::nullopt;
    }

    const std::optional<QJsonObject> status = fetchStatus(match->deviceId);
    if (status)
        match->supportsNetworkWake = parseSupportsNetworkWake(*status);

    qCInfo(tvLog).noquote() << logPrefix(m_config.logId())
                            << "found cloud device" << match->deviceId << "by" << match->matchedBy
                            << "network wake:" << match->supportsNetworkWake;
    return match;
}

bool SmartThingsClient::wakeDevice(const QString &deviceId)
{
    return sendCommand(deviceId, QStringLiteral("switch"), QStringLiteral("on"));
}

bool SmartThingsClient::powerOffDevice(const QString &deviceId)
{
    return sendCommand(deviceId, QStringLiteral("switch"), QStringLiteral("off"));
}

bool SmartThingsClient::setInputSource(const QString &deviceId, const QString &source)
{
    return sendCommand(deviceId,
                       QStringLiteral("samsungvd.mediaInputSource"),
                       QStringLiteral("setInputSource"),
                       QJsonArray{ source });
}

std::optional<CloudStatus> SmartThingsClient::queryStatus(const QString &deviceId)
{
    const std::optional<QJsonObject> status = fetchStatus(deviceId);
    if (!status)
        return std::nullopt;
    return parseCloudStatus(*status);
}

HttpResult SmartThingsClient::call(const QByteArray &method, const QString &path, const QByteArray &payload)
{
    if (!isAvailable()) {
        HttpResult unavailable;
        unavailable.error = QStringLiteral("Cloud access unavailable");
        return unavailable;
    }

    HttpResult result = send(method, path, payload);
    if (!result.unauthorized())
        return result;

    qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                               << "cloud API rejected the access token, refreshing";
    if (!refreshAccessToken()) {
        degrade(QStringLiteral("token refresh failed"));
        return result;
    }

    result = send(method, path, payload);
    if (result.unauthorized())
        degrade(QStringLiteral("token rejected after refresh"));
    return result;
}

HttpResult SmartThingsClient::send(const QByteArray &method, const QString &path, const QByteArray &payload)
{
    Endpoint endpoint = endpointFromUrl(m_settings.apiUrl);
    endpoint.bearerToken = m_config.cloud.accessToken;
    if (method == QByteArrayLiteral("POST"))
        return m_http.postJson(endpoint, path, payload, m_settings.timeoutMs);
    return m_http.get(endpoint, path, m_settings.timeoutMs);
}

bool SmartThingsClient::sendCommand(const QString &deviceId,
                                    const QString &capability,
                                    const QString &command,
                                    const QJsonArray &arguments)
{
    if (deviceId.isEmpty())
        return false;

    QJsonObject entry;
    entry.insert(QStringLiteral("component"), QStringLiteral("main"));
    entry.insert(QStringLiteral("capability"), capability);
    entry.insert(QStringLiteral("command"), command);
    entry.insert(QStringLiteral("arguments"), arguments);

    QJsonObject body;
    body.insert(QStringLiteral("commands"), QJsonArray{ entry });

    const HttpResult result = call(QByteArrayLiteral("POST"),
                                   QStringLiteral("/devices/%1/commands").arg(deviceId),
                                   QJsonDocument(body).toJson(QJsonDocument::Compact));
    if (!result.ok) {
        qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                                   << "cloud command" << capability << command << "failed:" << result.error;
        return false;
    }
    return true;
}

std::optional<QJsonObject> SmartThingsClient::fetchStatus(const QString &deviceId)
{
    if (deviceId.isEmpty())
        return std::nullopt;

    const HttpResult result = call(QByteArrayLiteral("GET"),
                                   QStringLiteral("/devices/%1/status").arg(deviceId));
    if (!result.ok) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId())
                                 << "cloud status query failed:" << result.error;
        return std::nullopt;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(result.payload);
    if (!doc.isObject())
        return std::nullopt;
    return doc.object();
}

void SmartThingsClient::degrade(const QString &reason)
{
    if (m_degraded)
        return;
    m_degraded = true;
    qCWarning(tvLog).noquote() << logPrefix(m_config.logId())
                               << "cloud access disabled (" + reason + "), using Wake-on-LAN only";
}

} // namespace phicore::samsungtv::ipc
