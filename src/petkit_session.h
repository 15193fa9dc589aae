#pragma once

#include <functional>

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include "petkit_api.h"
#include "petkit_config.h"
#include "petkit_store.h"

namespace phicore::petkit::ipc {

struct Session {
    QString token;
    QString userId;
    QString updatedAt;

    bool isValid() const { return !token.isEmpty(); }
};

struct LoginResult {
    bool ok = false;
    Session session;
    QString error;
};

// Credentials, token and the persisted session cache of one account.
class SessionManager
{
public:
    using Clock = std::function<QDateTime()>;

    SessionManager(const AccountConfig &config, ApiClient *api, KeyValueStore *store);

    // Sends the hashed credentials to user/login. On success the token and
    // user id are kept and written to the cache.
    LoginResult login();

    // Adopts a cached token (or a configured one) without touching the
    // network, logs in otherwise. A stale cached token only shows up as a
    // session-expired error on the first API call.
    LoginResult loadOrLogin();

    // Writes the account minus its password plus the current token. The
    // previous updateAt is kept while the token is unchanged unless
    // forceTimestampRefresh is set.
    bool persist(bool forceTimestampRefresh = false, QString *error = nullptr);

    ApiResult request(const QString &path,
                      const QUrlQuery &params = QUrlQuery(),
                      ApiMethod method = ApiMethod::Get) const;

    const AccountConfig &config() const { return m_config; }
    const Session &session() const { return m_session; }
    ConnectionSettings connectionSettings() const;
    QString storageKey() const;

    void setClock(Clock clock);

private:
    QString nowText() const;

    AccountConfig m_config;
    ApiClient *m_api = nullptr;
    KeyValueStore *m_store = nullptr;
    Session m_session;
    Clock m_clock;
};

} // namespace phicore::petkit::ipc
