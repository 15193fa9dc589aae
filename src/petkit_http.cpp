#include "petkit_http.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

namespace phicore::petkit::ipc {

QByteArray HttpRequest::header(const QByteArray &name) const
{
    for (const auto &entry : headers) {
        if (entry.first.compare(name, Qt::CaseInsensitive) == 0)
            return entry.second;
    }
    return {};
}

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

HttpResult HttpClient::send(const HttpRequest &request)
{
    HttpResult result;

    if (!m_manager) {
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }
    if (!request.url.isValid()) {
        result.error = QStringLiteral("Invalid URL %1").arg(request.url.toString());
        return result;
    }

    QNetworkRequest requestObj(request.url);
    requestObj.setRawHeader("Accept", "application/json");
    for (const auto &entry : request.headers)
        requestObj.setRawHeader(entry.first, entry.second);
    if (!request.contentType.isEmpty())
        requestObj.setHeader(QNetworkRequest::ContentTypeHeader, QString::fromLatin1(request.contentType));

    QNetworkReply *reply = nullptr;
    if (request.method == QByteArrayLiteral("GET")) {
        reply = m_manager->get(requestObj);
    } else if (request.method == QByteArrayLiteral("POST")) {
        reply = m_manager->post(requestObj, request.body);
    } else {
        reply = m_manager->sendCustomRequest(requestObj, request.method, request.body);
    }

    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(request.timeoutMs > 0 ? request.timeoutMs : 20000);
    loop.exec();

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.error = QStringLiteral("Request timed out");
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    if (reply->error() != QNetworkReply::NoError) {
        result.error = reply->errorString();
        reply->deleteLater();
        return result;
    }

    if (result.statusCode >= 200 && result.statusCode < 300) {
        result.ok = true;
    } else {
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    }

    reply->deleteLater();
    return result;
}

} // namespace phicore::petkit::ipc
