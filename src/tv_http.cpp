#include "tv_http.h"

#include <QEventLoop>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

namespace phicore::samsungtv::ipc {

namespace {

constexpr int kDefaultTimeoutMs = 10000;

QString joinPath(const QString &base, const QString &path)
{
    QString out = base;
    if (out.endsWith(QLatin1Char('/')))
        out.chop(1);
    if (!path.isEmpty() && !path.startsWith(QLatin1Char('/')))
        out.append(QLatin1Char('/'));
    out.append(path);
    return out.isEmpty() ? QStringLiteral("/") : out;
}

} // namespace

QUrl Endpoint::url(const QString &path) const
{
    QUrl out;
    out.setScheme(tls ? QStringLiteral("https") : QStringLiteral("http"));
    out.setHost(host.trimmed());
    out.setPort(port > 0 ? port : (tls ? 443 : 80));
    out.setPath(joinPath(basePath, path));
    return out;
}

Endpoint tvRestEndpoint(const QString &host, int port)
{
    Endpoint endpoint;
    endpoint.host = host.trimmed();
    endpoint.port = port;
    endpoint.verifyPeer = false;
    return endpoint;
}

Endpoint endpointFromUrl(const QUrl &url)
{
    Endpoint endpoint;
    endpoint.tls = url.scheme() != QLatin1String("http");
    endpoint.host = url.host();
    endpoint.port = url.port(endpoint.tls ? 443 : 80);
    endpoint.basePath = url.path();
    return endpoint;
}

QJsonObject HttpResult::jsonObject() const
{
    return QJsonDocument::fromJson(payload).object();
}

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

HttpResult HttpClient::get(const Endpoint &endpoint, const QString &path, int timeoutMs) const
{
    return send(endpoint, QByteArrayLiteral("GET"), path, {}, timeoutMs);
}

HttpResult HttpClient::postJson(const Endpoint &endpoint,
                                const QString &path,
                                const QByteArray &payload,
                                int timeoutMs) const
{
    return send(endpoint, QByteArrayLiteral("POST"), path, payload, timeoutMs);
}

QNetworkRequest HttpClient::buildRequest(const Endpoint &endpoint, const QString &path, bool jsonBody) const
{
    QNetworkRequest request(endpoint.url(path));
    request.setRawHeader("Accept", "application/json");
    request.setRawHeader("User-Agent", "phi-adapter-samsungtv-ipc/1.0");
    if (jsonBody)
        request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    if (!endpoint.bearerToken.isEmpty())
        request.setRawHeader("Authorization", "Bearer " + endpoint.bearerToken.toUtf8());

#if QT_CONFIG(ssl)
    if (endpoint.tls && !endpoint.verifyPeer) {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        request.setSslConfiguration(ssl);
    }
#endif
    return request;
}

HttpResult HttpClient::send(const Endpoint &endpoint,
                            const QByteArray &method,
                            const QString &path,
                            const QByteArray &payload,
                            int timeoutMs) const
{
    HttpResult result;
    if (!m_manager) {
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }
    if (endpoint.host.trimmed().isEmpty()) {
        result.error = QStringLiteral("Host is empty");
        return result;
    }

    const QNetworkRequest request = buildRequest(endpoint, path, method != "GET");
    QNetworkReply *reply = method == "GET"
        ? m_manager->get(request)
        : m_manager->sendCustomRequest(request, method, payload);
    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&deadline, &QTimer::timeout, &loop, [&]() {
        result.timedOut = true;
        loop.quit();
    });
    deadline.start(timeoutMs > 0 ? timeoutMs : kDefaultTimeoutMs);
    loop.exec(QEventLoop::ExcludeUserInputEvents);

    if (result.timedOut) {
        reply->abort();
        reply->deleteLater();
        result.error = QStringLiteral("%1 %2 timed out after %3 ms")
                           .arg(QString::fromLatin1(method), request.url().path())
                           .arg(timeoutMs);
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();
    // 401 arrives as a reply error; keep the status so callers can refresh.
    if (reply->error() != QNetworkReply::NoError && result.statusCode == 0) {
        result.error = reply->errorString();
    } else if (result.statusCode >= 200 && result.statusCode < 300) {
        result.ok = true;
    } else {
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    }
    reply->deleteLater();
    return result;
}

} // namespace phicore::samsungtv::ipc
