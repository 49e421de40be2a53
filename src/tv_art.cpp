#include "tv_art.h"

#include <QEventLoop>
#include <QJsonDocument>
#include <QNetworkRequest>
#include <QTimer>
#include <QUuid>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslError>
#include <QSslSocket>
#endif

#include "tv_config.h"
#include "tv_log.h"

namespace phicore::samsungtv::ipc {

namespace {

const QString kEventReady = QStringLiteral("ms.channel.ready");
const QString kEventServiceMessage = QStringLiteral("d2d_service_message");

QString newRequestId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

} // namespace

QByteArray buildArtRequest(const QJsonObject &request)
{
    QJsonObject params;
    params.insert(QStringLiteral("event"), QStringLiteral("art_app_request"));
    params.insert(QStringLiteral("to"), QStringLiteral("host"));
    params.insert(QStringLiteral("data"),
                  QString::fromUtf8(QJsonDocument(request).toJson(QJsonDocument::Compact)));

    QJsonObject root;
    root.insert(QStringLiteral("method"), QStringLiteral("ms.channel.emit"));
    root.insert(QStringLiteral("params"), params);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QJsonObject setArtModeRequest(bool on, const QString &requestId)
{
    return QJsonObject{
        { QStringLiteral("request"), QStringLiteral("set_artmode_status") },
        { QStringLiteral("value"), on ? QStringLiteral("on") : QStringLiteral("off") },
        { QStringLiteral("id"), requestId },
    };
}

QJsonObject getArtModeRequest(const QString &requestId)
{
    return QJsonObject{
        { QStringLiteral("request"), QStringLiteral("get_artmode_status") },
        { QStringLiteral("id"), requestId },
    };
}

std::optional<bool> parseArtModeStatus(const QJsonObject &event)
{
    if (event.value(QStringLiteral("event")).toString() != kEventServiceMessage)
        return std::nullopt;

    const QJsonValue raw = event.value(QStringLiteral("data"));
    const QJsonObject data = raw.isString()
        ? QJsonDocument::fromJson(raw.toString().toUtf8()).object()
        : raw.toObject();

    const QString inner = data.value(QStringLiteral("event")).toString();
    QString value;
    if (inner == QLatin1String("artmode_status"))
        value = data.value(QStringLiteral("value")).toString();
    else if (inner == QLatin1String("art_mode_changed"))
        value = data.value(QStringLiteral("status")).toString();
    else
        return std::nullopt;

    if (value == QLatin1String("on"))
        return true;
    if (value == QLatin1String("off"))
        return false;
    return std::nullopt;
}

WebSocketArtChannel::WebSocketArtChannel(const DeviceConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
{
    connect(&m_socket, &QWebSocket::textMessageReceived,
            this, &WebSocketArtChannel::onTextMessageReceived);
#if QT_CONFIG(ssl)
    connect(&m_socket, &QWebSocket::sslErrors, this, [this](const QList<QSslError> &) {
        m_socket.ignoreSslErrors();
    });
#endif
}

WebSocketArtChannel::~WebSocketArtChannel()
{
    m_socket.abort();
}

bool WebSocketArtChannel::waitFor(void (WebSocketArtChannel::*signal)(), int timeoutMs)
{
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    connect(this, signal, &loop, &QEventLoop::quit);
    connect(&m_socket, &QWebSocket::disconnected, &loop, &QEventLoop::quit);
    connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(timeoutMs > 0 ? timeoutMs : kHandshakeTimeoutMs);
    loop.exec();
    return !timedOut;
}

bool WebSocketArtChannel::open(int timeoutMs, QString *error)
{
    if (m_config.address.trimmed().isEmpty()) {
        if (error)
            *error = QStringLiteral("Host must not be empty");
        return false;
    }

    m_handshake.reset();
    m_ready = false;

    QNetworkRequest request(channelUrl(m_config.address,
                                       QString::fromLatin1(kArtChannelPath),
                                       m_config.authToken));
#if QT_CONFIG(ssl)
    QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
    ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
    request.setSslConfiguration(ssl);
#endif
    m_socket.open(request);

    // The art app answers ms.channel.connect first and ms.channel.ready once
    // it accepts requests.
    waitFor(&WebSocketArtChannel::ready, timeoutMs);
    if (m_ready)
        return true;

    if (error) {
        if (m_handshake == TransportStatus::Unauthorized)
            *error = QStringLiteral("Art channel access was denied on the TV");
        else
            *error = QStringLiteral("Art channel did not become ready");
    }
    m_socket.abort();
    return false;
}

bool WebSocketArtChannel::setArtMode(bool on, int timeoutMs, QString *error)
{
    if (!open(timeoutMs, error))
        return false;

    m_socket.sendTextMessage(QString::fromUtf8(buildArtRequest(setArtModeRequest(on, newRequestId()))));
    m_socket.flush();
    qCDebug(tvLog).noquote() << logPrefix(m_config.logId()) << "art mode" << (on ? "on" : "off") << "requested";
    m_socket.close();
    return true;
}

std::optional<bool> WebSocketArtChannel::artMode(int timeoutMs, QString *error)
{
    if (!open(timeoutMs, error))
        return std::nullopt;

    m_status.reset();
    m_socket.sendTextMessage(QString::fromUtf8(buildArtRequest(getArtModeRequest(newRequestId()))));
    waitFor(&WebSocketArtChannel::statusReceived, timeoutMs);
    m_socket.close();

    if (!m_status && error)
        *error = QStringLiteral("No art mode status received");
    return m_status;
}

void WebSocketArtChannel::onTextMessageReceived(const QString &message)
{
    const QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8());
    if (!doc.isObject())
        return;

    const QJsonObject root = doc.object();
    const QString event = root.value(QStringLiteral("event")).toString();

    if (event == kEventReady) {
        m_ready = m_handshake == TransportStatus::Ok;
        emit ready();
        return;
    }

    if (const std::optional<TransportStatus> outcome = handshakeOutcome(event)) {
        m_handshake = outcome;
        if (*outcome != TransportStatus::Ok)
            emit ready();
        return;
    }

    if (const std::optional<bool> status = parseArtModeStatus(root)) {
        m_status = status;
        emit statusReceived();
    }
}

} // namespace phicore::samsungtv::ipc
