#include "tv_transport.h"

#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#include <QUrlQuery>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslError>
#include <QSslSocket>
#endif

#include "tv_config.h"
#include "tv_log.h"

namespace phicore::samsungtv::ipc {

namespace {

const QString kEventConnect = QStringLiteral("ms.channel.connect");
const QString kEventUnauthorized = QStringLiteral("ms.channel.unauthorized");
const QString kEventTimeout = QStringLiteral("ms.channel.timeOut");
const QString kEventInstalledApps = QStringLiteral("ed.installedApp.get");

} // namespace

QUrl channelUrl(const QString &host, const QString &channelPath, const QString &token)
{
    QUrl url;
    url.setScheme(QStringLiteral("wss"));
    url.setHost(host.trimmed());
    url.setPort(kRemoteControlPort);
    url.setPath(channelPath);

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("name"),
                       QString::fromLatin1(QByteArray(kRemoteClientName).toBase64()));
    if (!token.isEmpty())
        query.addQueryItem(QStringLiteral("token"), token);
    url.setQuery(query);
    return url;
}

std::optional<TransportStatus> handshakeOutcome(const QString &event)
{
    if (event == kEventConnect)
        return TransportStatus::Ok;
    // timeOut: the pairing prompt on the TV was left unanswered.
    if (event == kEventUnauthorized || event == kEventTimeout)
        return TransportStatus::Unauthorized;
    return std::nullopt;
}

QByteArray buildKeyMessage(const QString &command, const QString &key)
{
    QJsonObject params;
    params.insert(QStringLiteral("Cmd"), command);
    params.insert(QStringLiteral("DataOfCmd"), key);
    params.insert(QStringLiteral("Option"), QStringLiteral("false"));
    params.insert(QStringLiteral("TypeOfRemote"), QStringLiteral("SendRemoteKey"));

    QJsonObject root;
    root.insert(QStringLiteral("method"), QStringLiteral("ms.remote.control"));
    root.insert(QStringLiteral("params"), params);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray buildInstalledAppRequest()
{
    QJsonObject params;
    params.insert(QStringLiteral("event"), kEventInstalledApps);
    params.insert(QStringLiteral("to"), QStringLiteral("host"));

    QJsonObject root;
    root.insert(QStringLiteral("method"), QStringLiteral("ms.channel.emit"));
    root.insert(QStringLiteral("params"), params);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

AppList parseInstalledApps(const QJsonObject &event)
{
    AppList out;
    const QJsonArray entries = event.value(QStringLiteral("data")).toObject()
                                   .value(QStringLiteral("data")).toArray();
    for (const QJsonValue &value : entries) {
        const QJsonObject entry = value.toObject();
        const QString name = entry.value(QStringLiteral("name")).toString().trimmed();
        const QString appId = entry.value(QStringLiteral("appId")).toString().trimmed();
        if (name.isEmpty() || appId.isEmpty())
            continue;
        out.push_back({ name, appId });
    }
    return out;
}

WebSocketTransport::WebSocketTransport(const DeviceConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_token(config.authToken)
{
    connect(&m_socket, &QWebSocket::textMessageReceived,
            this, &WebSocketTransport::onTextMessageReceived);
    connect(&m_socket, &QWebSocket::disconnected,
            this, &WebSocketTransport::onSocketDisconnected);
#if QT_CONFIG(ssl)
    connect(&m_socket, &QWebSocket::sslErrors, this, [this](const QList<QSslError> &) {
        m_socket.ignoreSslErrors();
    });
#endif
}

WebSocketTransport::~WebSocketTransport()
{
    m_closing = true;
    m_socket.abort();
}

bool WebSocketTransport::waitFor(void (WebSocketTransport::*signal)(), int timeoutMs)
{
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    connect(this, signal, &loop, &QEventLoop::quit);
    connect(&m_socket, &QWebSocket::stateChanged, &loop,
            [&loop](QAbstractSocket::SocketState state) {
        if (state == QAbstractSocket::UnconnectedState)
            loop.quit();
    });
    connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(timeoutMs > 0 ? timeoutMs : kHandshakeTimeoutMs);
    loop.exec();
    return !timedOut;
}

TransportStatus WebSocketTransport::open(int timeoutMs, QString *error)
{
    if (m_config.address.trimmed().isEmpty()) {
        if (error)
            *error = QStringLiteral("Host must not be empty");
        return TransportStatus::Unreachable;
    }

    m_closing = false;
    m_handshakeDone = false;
    m_authorized = false;
    m_handshakeStatus = TransportStatus::Unreachable;

    QNetworkRequest request(channelUrl(m_config.address,
                                       QStringLiteral("/api/v2/channels/samsung.remote.control"),
                                       m_token));
#if QT_CONFIG(ssl)
    QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
    ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
    request.setSslConfiguration(ssl);
#endif
    m_socket.open(request);

    const bool finished = waitFor(&WebSocketTransport::handshakeFinished, timeoutMs);
    if (m_closing) {
        if (error)
            *error = QStringLiteral("Connect aborted");
        return TransportStatus::Aborted;
    }
    if (!finished || !m_handshakeDone) {
        if (error) {
            *error = finished ? m_socket.errorString() : QStringLiteral("Handshake timed out");
        }
        m_socket.abort();
        return TransportStatus::Unreachable;
    }
    if (m_handshakeStatus != TransportStatus::Ok) {
        if (error)
            *error = QStringLiteral("Remote control access was denied on the TV");
        m_socket.abort();
        return m_handshakeStatus;
    }
    return TransportStatus::Ok;
}

bool WebSocketTransport::isAlive() const
{
    return m_authorized && m_socket.state() == QAbstractSocket::ConnectedState;
}

bool WebSocketTransport::sendKey(const QString &key, int holdMs, QString *error)
{
    if (!isAlive()) {
        if (error)
            *error = QStringLiteral("Remote channel is not connected");
        return false;
    }

    if (holdMs <= 0) {
        m_socket.sendTextMessage(QString::fromUtf8(buildKeyMessage(QStringLiteral("Click"), key)));
        return true;
    }

    m_socket.sendTextMessage(QString::fromUtf8(buildKeyMessage(QStringLiteral("Press"), key)));

    QEventLoop loop;
    QTimer::singleShot(holdMs, &loop, &QEventLoop::quit);
    connect(&m_socket, &QWebSocket::disconnected, &loop, &QEventLoop::quit);
    loop.exec();

    if (!isAlive()) {
        if (error)
            *error = QStringLiteral("Remote channel dropped while holding key");
        return false;
    }
    m_socket.sendTextMessage(QString::fromUtf8(buildKeyMessage(QStringLiteral("Release"), key)));
    return true;
}

std::optional<AppList> WebSocketTransport::appList(int timeoutMs)
{
    if (!isAlive())
        return std::nullopt;

    m_pendingApps.reset();
    m_socket.sendTextMessage(QString::fromUtf8(buildInstalledAppRequest()));
    waitFor(&WebSocketTransport::installedAppsReceived, timeoutMs);

    std::optional<AppList> apps;
    apps.swap(m_pendingApps);
    return apps;
}

void WebSocketTransport::close()
{
    m_closing = true;
    m_authorized = false;
    m_socket.close();
    emit handshakeFinished();
}

void WebSocketTransport::onTextMessageReceived(const QString &message)
{
    const QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8());
    if (!doc.isObject())
        return;

    const QJsonObject root = doc.object();
    const QString event = root.value(QStringLiteral("event")).toString();

    const std::optional<TransportStatus> outcome = handshakeOutcome(event);
    if (outcome == TransportStatus::Ok) {
        const QString token = root.value(QStringLiteral("data")).toObject()
                                  .value(QStringLiteral("token")).toString().trimmed();
        if (!token.isEmpty())
            m_token = token;
        m_authorized = true;
        m_handshakeDone = true;
        m_handshakeStatus = TransportStatus::Ok;
        emit handshakeFinished();
        return;
    }

    if (outcome) {
        qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "remote channel refused:" << event;
        m_authorized = false;
        m_handshakeDone = true;
        m_handshakeStatus = *outcome;
        emit handshakeFinished();
        return;
    }

    if (event == kEventInstalledApps) {
        m_pendingApps = parseInstalledApps(root);
        emit installedAppsReceived();
    }
}

void WebSocketTransport::onSocketDisconnected()
{
    m_authorized = false;
}

} // namespace phicore::samsungtv::ipc
