#pragma once

#include <functional>
#include <memory>
#include <optional>

#include <QByteArray>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QWebSocket>

#include "tv_transport.h"

namespace phicore::samsungtv::ipc {

class DeviceConfig;

// Art mode switch of Frame TVs, reached through the art app channel next to
// the remote-control channel. Every call opens and closes its own connection.
class ArtModeChannel
{
public:
    virtual ~ArtModeChannel() = default;

    virtual bool setArtMode(bool on, int timeoutMs, QString *error = nullptr) = 0;
    virtual std::optional<bool> artMode(int timeoutMs, QString *error = nullptr) = 0;
};

struct ArtInfo {
    bool supported = false;
    std::optional<bool> artModeOn; // unknown when the art channel did not answer
};

using ArtChannelFactory = std::function<std::unique_ptr<ArtModeChannel>(const DeviceConfig &)>;

inline constexpr char kArtChannelPath[] = "/api/v2/channels/com.samsung.art-app";

// ms.channel.emit art_app_request; the request travels as a JSON string in data.
QByteArray buildArtRequest(const QJsonObject &request);
QJsonObject setArtModeRequest(bool on, const QString &requestId);
QJsonObject getArtModeRequest(const QString &requestId);
// "on"/"off" from a d2d_service_message carrying artmode_status or
// art_mode_changed, nullopt for anything else.
std::optional<bool> parseArtModeStatus(const QJsonObject &event);

class WebSocketArtChannel final : public QObject, public ArtModeChannel
{
    Q_OBJECT
public:
    explicit WebSocketArtChannel(const DeviceConfig &config, QObject *parent = nullptr);
    ~WebSocketArtChannel() override;

    bool setArtMode(bool on, int timeoutMs, QString *error = nullptr) override;
    std::optional<bool> artMode(int timeoutMs, QString *error = nullptr) override;

signals:
    void ready();
    void statusReceived();

private slots:
    void onTextMessageReceived(const QString &message);

private:
    bool open(int timeoutMs, QString *error);
    bool waitFor(void (WebSocketArtChannel::*signal)(), int timeoutMs);

    const DeviceConfig &m_config;
    QWebSocket m_socket;
    std::optional<TransportStatus> m_handshake;
    bool m_ready = false;
    std::optional<bool> m_status;
};

} // namespace phicore::samsungtv::ipc
