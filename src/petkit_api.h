#pragma once

#include <QJsonObject>
#include <QString>
#include <QUrlQuery>

#include "petkit_http.h"

namespace phicore::petkit::ipc {

inline constexpr int kErrorSessionExpired = 5;

inline constexpr const char kUserAgent[] = "okhttp/3.12.1";
inline constexpr const char kApiVersion[] = "7.29.1";
inline constexpr const char kClientDescriptor[] = "Android(7.1.1;MP1602)";

enum class ApiMethod {
    Get,
    // POST verb, parameters still delivered in the query string (login).
    PostGet,
    Post,
    Put,
};

struct ConnectionSettings {
    QString apiBase;
    QString token;
    int timeoutMs = 20000;
};

struct ApiResult {
    bool ok = false;
    QJsonObject body;
    QString error;

    // error.code of the vendor envelope, 0 when absent.
    int errorCode() const;
    bool isSessionExpired() const { return errorCode() == kErrorSessionExpired; }
    // error.msg of the vendor envelope, or the code when no text is given.
    QString errorMessage() const;
    QJsonObject result() const;
};

class ApiClient
{
public:
    explicit ApiClient(HttpTransport *transport);

    // Never fails loudly: transport errors, timeouts and non JSON bodies are
    // logged and come back as ok == false with an empty body.
    ApiResult call(const ConnectionSettings &settings,
                   const QString &path,
                   const QUrlQuery &params = QUrlQuery(),
                   ApiMethod method = ApiMethod::Get) const;

    static QUrl endpointUrl(const QString &apiBase, const QString &path);
    static QByteArray methodVerb(ApiMethod method);

private:
    HttpRequest buildRequest(const ConnectionSettings &settings,
                             const QString &path,
                             const QUrlQuery &params,
                             ApiMethod method) const;

    HttpTransport *m_transport = nullptr;
};

} // namespace phicore::petkit::ipc
