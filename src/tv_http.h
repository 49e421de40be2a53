#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkRequest;

namespace phicore::samsungtv::ipc {

// Target of a request. Paths passed to HttpClient are appended to basePath.
struct Endpoint {
    QString host;
    int port = 443;
    bool tls = true;
    bool verifyPeer = true;
    QString basePath;
    QString bearerToken;

    QUrl url(const QString &path) const;
};

// The TV's own REST API serves a self-signed certificate.
Endpoint tvRestEndpoint(const QString &host, int port);
Endpoint endpointFromUrl(const QUrl &url);

struct HttpResult {
    bool ok = false;
    bool timedOut = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;

    bool unauthorized() const { return statusCode == 401; }
    QJsonObject jsonObject() const;
};

class HttpRequester
{
public:
    virtual ~HttpRequester() = default;

    virtual HttpResult get(const Endpoint &endpoint, const QString &path, int timeoutMs) const = 0;
    virtual HttpResult postJson(const Endpoint &endpoint,
                                const QString &path,
                                const QByteArray &payload,
                                int timeoutMs) const = 0;
};

// Blocking request helper; spins a local event loop until the reply finishes
// or the timeout elapses.
class HttpClient final : public HttpRequester
{
public:
    explicit HttpClient(QNetworkAccessManager *manager);

    HttpResult get(const Endpoint &endpoint, const QString &path, int timeoutMs) const override;
    HttpResult postJson(const Endpoint &endpoint,
                        const QString &path,
                        const QByteArray &payload,
                        int timeoutMs) const override;

private:
    QNetworkRequest buildRequest(const Endpoint &endpoint, const QString &path, bool jsonBody) const;
    HttpResult send(const Endpoint &endpoint,
                    const QByteArray &method,
                    const QString &path,
                    const QByteArray &payload,
                    int timeoutMs) const;

    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace phicore::samsungtv::ipc
