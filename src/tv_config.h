#pragma once

#include <cstdint>
#include <optional>

#include <QJsonObject>
#include <QString>

namespace phicore::samsungtv::ipc {

struct CloudAuth {
    QString accessToken;
    QString refreshToken;
    std::optional<std::int64_t> expiresAt; // unix seconds
};

// Persisted identity and configuration of one physical TV.
class DeviceConfig
{
public:
    explicit DeviceConfig(QString identifier = {});

    const QString &identifier() const noexcept { return m_identifier; }
    QString logId() const;

    bool hasMacAddress() const;
    bool hasCloudAuth() const;
    bool cloudTokenExpiresWithin(std::int64_t nowSecs, std::int64_t seconds) const;

    QString name;
    QString address;
    QString authToken;
    QString macAddress;
    bool reportsPowerState = false;
    bool supportsArtMode = false;
    bool supportsCloudWake = false;
    CloudAuth cloud;

private:
    QString m_identifier;
};

QJsonObject toJson(const DeviceConfig &config);
DeviceConfig deviceConfigFromJson(const QJsonObject &obj, const QString &fallbackIdentifier = {});

// Write-through persistence. Called whenever the token or a discovered
// capability changes.
class ConfigStore
{
public:
    virtual ~ConfigStore() = default;
    virtual bool updateConfig(const DeviceConfig &config, QString *error = nullptr) = 0;
};

} // namespace phicore::samsungtv::ipc
