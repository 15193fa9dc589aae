#include "petkit_api.h"

#include <QJsonDocument>
#include <QJsonValue>

#include "petkit_log.h"

namespace phicore::petkit::ipc {

int ApiResult::errorCode() const
{
    const QJsonValue error = body.value(QStringLiteral("error"));
    if (!error.isObject())
        return 0;
    bool ok = false;
    const int code = error.toObject().value(QStringLiteral("code")).toVariant().toInt(&ok);
    return ok ? code : 0;
}

QString ApiResult::errorMessage() const
{
    const QString msg = body.value(QStringLiteral("error")).toObject().value(QStringLiteral("msg")).toString();
    if (!msg.isEmpty())
        return msg;
    return QStringLiteral("Petkit error code %1").arg(errorCode());
}

QJsonObject ApiResult::result() const
{
    return body.value(QStringLiteral("result")).toObject();
}

ApiClient::ApiClient(HttpTransport *transport)
    : m_transport(transport)
{
}

QUrl ApiClient::endpointUrl(const QString &apiBase, const QString &path)
{
    QString base = apiBase.trimmed();
    while (base.endsWith(QLatin1Char('/')))
        base.chop(1);
    QString api = path;
    while (api.startsWith(QLatin1Char('/')))
        api.remove(0, 1);
    return QUrl(base + QLatin1Char('/') + api);
}

QByteArray ApiClient::methodVerb(ApiMethod method)
{
    switch (method) {
    case ApiMethod::Get:
        return QByteArrayLiteral("GET");
    case ApiMethod::PostGet:
    case ApiMethod::Post:
        return QByteArrayLiteral("POST");
    case ApiMethod::Put:
        return QByteArrayLiteral("PUT");
    }
    return QByteArrayLiteral("GET");
}

HttpRequest ApiClient::buildRequest(const ConnectionSettings &settings,
                                    const QString &path,
                                    const QUrlQuery &params,
                                    ApiMethod method) const
{
    HttpRequest request;
    request.method = methodVerb(method);
    request.url = endpointUrl(settings.apiBase, path);
    request.timeoutMs = settings.timeoutMs;
    request.headers = {
        {QByteArrayLiteral("User-Agent"), QByteArray(kUserAgent)},
        {QByteArrayLiteral("X-Api-Version"), QByteArray(kApiVersion)},
        {QByteArrayLiteral("X-Client"), QByteArray(kClientDescriptor)},
        {QByteArrayLiteral("X-Session"), settings.token.toUtf8()},
    };

    if (method == ApiMethod::Get || method == ApiMethod::PostGet) {
        if (!params.isEmpty())
            request.url.setQuery(params);
    } else {
        request.contentType = QByteArrayLiteral("application/x-www-form-urlencoded");
        request.body = params.toString(QUrl::FullyEncoded).toUtf8();
    }
    return request;
}

ApiResult ApiClient::call(const ConnectionSettings &settings,
                          const QString &path,
                          const QUrlQuery &params,
                          ApiMethod method) const
{
    ApiResult out;

    if (!m_transport) {
        out.error = QStringLiteral("HTTP transport unavailable");
        qCWarning(petkitLog) << "Request Petkit api failed:" << path << out.error;
        return out;
    }

    const HttpRequest request = buildRequest(settings, path, params, method);
    const HttpResult http = m_transport->send(request);

    // The vendor reports failures inside the JSON envelope, so any object
    // body counts even on a non 2xx status.
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(http.payload, &parseError);
    if (!doc.isObject()) {
        out.error = http.error.isEmpty()
            ? QStringLiteral("Response is not a JSON object: %1").arg(parseError.errorString())
            : http.error;
        qCWarning(petkitLog).noquote() << "Request Petkit api failed:" << request.method
                                       << request.url.toString() << out.error;
        return out;
    }

    out.ok = true;
    out.body = doc.object();
    return out;
}

} // namespace phicore::petkit::ipc
