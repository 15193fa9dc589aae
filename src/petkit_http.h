#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>

class QNetworkAccessManager;

namespace phicore::petkit::ipc {

struct HttpRequest {
    QByteArray method = QByteArrayLiteral("GET");
    QUrl url;
    QList<QPair<QByteArray, QByteArray>> headers;
    QByteArray contentType;
    QByteArray body;
    int timeoutMs = 20000;

    QByteArray header(const QByteArray &name) const;
};

struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    virtual HttpResult send(const HttpRequest &request) = 0;
};

// Blocking request on top of QNetworkAccessManager: a local event loop runs
// until the reply finishes or the timeout fires.
class HttpClient final : public HttpTransport
{
public:
    explicit HttpClient(QNetworkAccessManager *manager);

    HttpResult send(const HttpRequest &request) override;

private:
    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace phicore::petkit::ipc
