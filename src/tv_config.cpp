#include "tv_config.h"

#include <utility>

#include <QJsonValue>

#include "tv_wol.h"

namespace phicore::samsungtv::ipc {

namespace {

QString readString(const QJsonObject &obj, const QString &key)
{
    return obj.value(key).toString().trimmed();
}

std::optional<std::int64_t> readTimestamp(const QJsonObject &obj, const QString &key)
{
    const QJsonValue value = obj.value(key);
    if (value.isDouble())
        return static_cast<std::int64_t>(value.toDouble());
    if (value.isString()) {
        bool ok = false;
        const qlonglong parsed = value.toString().toLongLong(&ok);
        if (ok)
            return static_cast<std::int64_t>(parsed);
    }
    return std::nullopt;
}

} // namespace

DeviceConfig::DeviceConfig(QString identifier)
    : m_identifier(std::move(identifier))
{
}

QString DeviceConfig::logId() const
{
    return name.isEmpty() ? m_identifier : name;
}

bool DeviceConfig::hasMacAddress() const
{
    return !normalizeMacAddress(macAddress).isEmpty();
}

bool DeviceConfig::hasCloudAuth() const
{
    return !cloud.accessToken.isEmpty();
}

bool DeviceConfig::cloudTokenExpiresWithin(std::int64_t nowSecs, std::int64_t seconds) const
{
    if (!cloud.expiresAt.has_value())
        return false;
    return *cloud.expiresAt - nowSecs <= seconds;
}

QJsonObject toJson(const DeviceConfig &config)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("identifier"), config.identifier());
    obj.insert(QStringLiteral("name"), config.name);
    obj.insert(QStringLiteral("address"), config.address);
    obj.insert(QStringLiteral("token"), config.authToken);
    if (!config.macAddress.isEmpty())
        obj.insert(QStringLiteral("macAddress"), config.macAddress);
    obj.insert(QStringLiteral("reportsPowerState"), config.reportsPowerState);
    obj.insert(QStringLiteral("supportsArtMode"), config.supportsArtMode);
    obj.insert(QStringLiteral("supportsCloudWake"), config.supportsCloudWake);

    if (config.hasCloudAuth() || !config.cloud.refreshToken.isEmpty()) {
        QJsonObject cloud;
        cloud.insert(QStringLiteral("accessToken"), config.cloud.accessToken);
        if (!config.cloud.refreshToken.isEmpty())
            cloud.insert(QStringLiteral("refreshToken"), config.cloud.refreshToken);
        if (config.cloud.expiresAt.has_value())
            cloud.insert(QStringLiteral("expiresAt"), static_cast<double>(*config.cloud.expiresAt));
        obj.insert(QStringLiteral("cloud"), cloud);
    }
    return obj;
}

DeviceConfig deviceConfigFromJson(const QJsonObject &obj, const QString &fallbackIdentifier)
{
    QString identifier = readString(obj, QStringLiteral("identifier"));
    if (identifier.isEmpty())
        identifier = fallbackIdentifier.trimmed();

    DeviceConfig config(identifier);
    config.name = readString(obj, QStringLiteral("name"));
    config.address = readString(obj, QStringLiteral("address"));
    config.authToken = readString(obj, QStringLiteral("token"));
    config.macAddress = readString(obj, QStringLiteral("macAddress"));
    config.reportsPowerState = obj.value(QStringLiteral("reportsPowerState")).toBool(false);
    config.supportsArtMode = obj.value(QStringLiteral("supportsArtMode")).toBool(false);
    config.supportsCloudWake = obj.value(QStringLiteral("supportsCloudWake")).toBool(false);

    const QJsonObject cloud = obj.value(QStringLiteral("cloud")).toObject();
    config.cloud.accessToken = readString(cloud, QStringLiteral("accessToken"));
    config.cloud.refreshToken = readString(cloud, QStringLiteral("refreshToken"));
    config.cloud.expiresAt = readTimestamp(cloud, QStringLiteral("expiresAt"));

    // Flat keys as entered in the adapter settings form.
    if (config.cloud.accessToken.isEmpty())
        config.cloud.accessToken = readString(obj, QStringLiteral("cloudAccessToken"));
    if (config.cloud.refreshToken.isEmpty())
        config.cloud.refreshToken = readString(obj, QStringLiteral("cloudRefreshToken"));
    if (!config.cloud.expiresAt)
        config.cloud.expiresAt = readTimestamp(obj, QStringLiteral("cloudTokenExpiresAt"));
    return config;
}

} // namespace phicore::samsungtv::ipc
