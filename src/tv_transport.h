#pragma once

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QUrl>
#include <QWebSocket>

namespace phicore::samsungtv::ipc {

class DeviceConfig;

enum class TransportStatus {
    Ok,
    Unreachable,
    Unauthorized,
    Aborted
};

struct InstalledApp {
    QString name;
    QString appId;
};

using AppList = std::vector<InstalledApp>;

// Persistent remote-control channel to one TV.
class Transport
{
public:
    virtual ~Transport() = default;

    virtual TransportStatus open(int timeoutMs, QString *error = nullptr) = 0;
    virtual bool isAlive() const = 0;
    virtual bool sendKey(const QString &key, int holdMs = 0, QString *error = nullptr) = 0;
    virtual std::optional<AppList> appList(int timeoutMs) = 0;
    // Token negotiated during the last handshake, empty when none was issued.
    virtual QString token() const = 0;
    // Also aborts an open() that is still waiting for the handshake.
    virtual void close() = 0;
};

inline constexpr int kRemoteControlPort = 8002;
inline constexpr int kHandshakeTimeoutPairingMs = 30000;
inline constexpr int kHandshakeTimeoutMs = 3000;
inline constexpr char kRemoteClientName[] = "phi Samsung TV adapter";

// wss://<host>:8002<channelPath>?name=<base64 client name>[&token=<token>]
QUrl channelUrl(const QString &host, const QString &channelPath, const QString &token);
// Maps a handshake event to its outcome, nullopt for events that do not end the handshake.
std::optional<TransportStatus> handshakeOutcome(const QString &event);

QByteArray buildKeyMessage(const QString &command, const QString &key);
QByteArray buildInstalledAppRequest();
AppList parseInstalledApps(const QJsonObject &event);

class WebSocketTransport final : public QObject, public Transport
{
    Q_OBJECT
public:
    explicit WebSocketTransport(const DeviceConfig &config, QObject *parent = nullptr);
    ~WebSocketTransport() override;

    TransportStatus open(int timeoutMs, QString *error = nullptr) override;
    bool isAlive() const override;
    bool sendKey(const QString &key, int holdMs = 0, QString *error = nullptr) override;
    std::optional<AppList> appList(int timeoutMs) override;
    QString token() const override { return m_token; }
    void close() override;

signals:
    void handshakeFinished();
    void installedAppsReceived();

private slots:
    void onTextMessageReceived(const QString &message);
    void onSocketDisconnected();

private:
    bool waitFor(void (WebSocketTransport::*signal)(), int timeoutMs);

    const DeviceConfig &m_config;
    QWebSocket m_socket;
    QString m_token;
    TransportStatus m_handshakeStatus = TransportStatus::Unreachable;
    bool m_handshakeDone = false;
    bool m_authorized = false;
    bool m_closing = false;
    std::optional<AppList> m_pendingApps;
};

} // namespace phicore::samsungtv::ipc
