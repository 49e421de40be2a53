#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <QUrl>

#include "tv_events.h"
#include "tv_http.h"

namespace phicore::samsungtv::ipc {

class DeviceConfig;

struct CloudMatch {
    QString deviceId;
    QString label;
    QString matchedBy;
    bool supportsNetworkWake = false;
};

struct CloudStatus {
    MediaAttributes media;
    std::optional<QString> inputSource;
    QStringList supportedInputSources;
};

// Optional remote API for the TV. Every call degrades to a failure result;
// nothing here may block the local power and key paths for long.
class CloudClient
{
public:
    virtual ~CloudClient() = default;

    virtual bool isAvailable() const = 0;
    virtual void refreshTokenIfExpiring() = 0;
    virtual std::optional<CloudMatch> discoverDevice(const QString &deviceUuid) = 0;
    virtual bool wakeDevice(const QString &deviceId) = 0;
    virtual bool powerOffDevice(const QString &deviceId) = 0;
    virtual bool setInputSource(const QString &deviceId, const QString &source) = 0;
    virtual std::optional<CloudStatus> queryStatus(const QString &deviceId) = 0;
};

struct CloudSettings {
    QUrl apiUrl = QUrl(QStringLiteral("https://api.smartthings.com/v1"));
    QUrl refreshUrl;
    int timeoutMs = 10000;
};

// cloudApiUrl and cloudRefreshUrl from adapter meta.
CloudSettings cloudSettingsFromMeta(const QJsonObject &meta);

inline constexpr std::int64_t kProactiveRefreshWindowSecs = 12 * 60 * 60;
inline constexpr std::int64_t kDefaultTokenLifetimeSecs = 24 * 60 * 60;

std::optional<CloudMatch> matchCloudDevice(const QJsonArray &items,
                                           const QString &deviceUuid,
                                           const QString &macAddress,
                                           const QString &name);
QHash<QString, QJsonValue> flattenStatusAttributes(const QJsonObject &status);
CloudStatus parseCloudStatus(const QJsonObject &status);
bool parseSupportsNetworkWake(const QJsonObject &status);

class SmartThingsClient final : public CloudClient
{
public:
    using TokensUpdated = std::function<void(const DeviceConfig &)>;

    SmartThingsClient(HttpRequester &http, DeviceConfig &config, CloudSettings settings = {});

    void setTokensUpdatedCallback(TokensUpdated callback) { m_tokensUpdated = std::move(callback); }

    bool isAvailable() const override;
    void refreshTokenIfExpiring() override;
    std::optional<CloudMatch> discoverDevice(const QString &deviceUuid) override;
    bool wakeDevice(const QString &deviceId) override;
    bool powerOffDevice(const QString &deviceId) override;
    bool setInputSource(const QString &deviceId, const QString &source) override;
    std::optional<CloudStatus> queryStatus(const QString &deviceId) override;

    bool refreshAccessToken();

private:
    HttpResult call(const QByteArray &method, const QString &path, const QByteArray &payload = {});
    HttpResult send(const QByteArray &method, const QString &path, const QByteArray &payload);
    bool sendCommand(const QString &deviceId,
                     const QString &capability,
                     const QString &command,
                     const QJsonArray &arguments = {});
    std::optional<QJsonObject> fetchStatus(const QString &deviceId);
    void degrade(const QString &reason);

    HttpRequester &m_http;
    DeviceConfig &m_config;
    CloudSettings m_settings;
    TokensUpdated m_tokensUpdated;
    bool m_degraded = false;
};

} // namespace phicore::samsungtv::ipc
