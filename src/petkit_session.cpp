#include "petkit_session.h"

#include <QJsonDocument>

#include "petkit_log.h"

namespace phicore::petkit::ipc {

namespace {

QString jsonText(const QJsonObject &obj)
{
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

QString idText(const QJsonValue &value)
{
    if (value.isDouble())
        return QString::number(static_cast<qint64>(value.toDouble()));
    return value.toString().trimmed();
}

} // namespace

SessionManager::SessionManager(const AccountConfig &config, ApiClient *api, KeyValueStore *store)
    : m_config(config)
    , m_api(api)
    , m_store(store)
    , m_clock([]() { return QDateTime::currentDateTime(); })
{
    m_session.userId = m_config.uid;
}

void SessionManager::setClock(Clock clock)
{
    if (clock)
        m_clock = std::move(clock);
}

QString SessionManager::nowText() const
{
    return m_clock().toString(Qt::ISODateWithMs);
}

QString SessionManager::storageKey() const
{
    // Token-only accounts may have no username; the uid keeps their files apart.
    const QString owner = m_config.username.isEmpty() ? m_config.accountId() : m_config.username;
    return QStringLiteral("petkit/auth-%1.json").arg(owner);
}

ConnectionSettings SessionManager::connectionSettings() const
{
    ConnectionSettings settings;
    settings.apiBase = m_config.apiBase;
    settings.token = m_session.token;
    settings.timeoutMs = m_config.timeoutMs;
    return settings;
}

ApiResult SessionManager::request(const QString &path, const QUrlQuery &params, ApiMethod method) const
{
    if (!m_api) {
        ApiResult out;
        out.error = QStringLiteral("API client unavailable");
        return out;
    }
    return m_api->call(connectionSettings(), path, params, method);
}

LoginResult SessionManager::login()
{
    LoginResult out;

    QUrlQuery params;
    params.addQueryItem(QStringLiteral("encrypt"), QStringLiteral("1"));
    params.addQueryItem(QStringLiteral("username"), m_config.username);
    params.addQueryItem(QStringLiteral("password"), m_config.passwordHash());
    params.addQueryItem(QStringLiteral("oldVersion"), QString());

    const ApiResult rsp = request(QStringLiteral("user/login"), params, ApiMethod::PostGet);
    const QJsonObject session = rsp.result().value(QStringLiteral("session")).toObject();
    const QString sid = idText(session.value(QStringLiteral("id")));
    if (sid.isEmpty()) {
        out.error = rsp.ok ? QStringLiteral("Login response has no session: %1").arg(jsonText(rsp.body))
                           : QStringLiteral("Login request failed: %1").arg(rsp.error);
        qCWarning(petkitLog).noquote() << "Petkit login" << m_config.username << "failed:" << out.error;
        return out;
    }

    m_session.token = sid;
    m_session.userId = idText(session.value(QStringLiteral("userId")));

    QString persistError;
    if (m_store && !persist(false, &persistError))
        qCWarning(petkitLog).noquote() << "Petkit session for" << m_config.username
                                       << "not saved:" << persistError;

    out.ok = true;
    out.session = m_session;
    return out;
}

LoginResult SessionManager::loadOrLogin()
{
    const QJsonObject cached = m_store ? m_store->load(storageKey()) : QJsonObject{};
    const QString cachedToken = cached.value(QStringLiteral("token")).toString();
    if (!cachedToken.isEmpty()) {
        m_session.token = cachedToken;
        m_session.userId = idText(cached.value(QStringLiteral("userId")));
        m_session.updatedAt = cached.value(QStringLiteral("updateAt")).toString();
        qCInfo(petkitLog) << "Petkit session for" << m_config.username << "loaded from cache";

        LoginResult out;
        out.ok = true;
        out.session = m_session;
        return out;
    }

    if (!m_config.token.isEmpty()) {
        m_session.token = m_config.token;
        m_session.userId = m_config.uid;
        qCInfo(petkitLog) << "Petkit session for" << m_config.accountId() << "taken from configuration";

        LoginResult out;
        out.ok = true;
        out.session = m_session;
        return out;
    }

    if (m_config.password.isEmpty()) {
        LoginResult out;
        out.error = QStringLiteral("No cached session and no password for %1").arg(m_config.accountId());
        qCWarning(petkitLog).noquote() << out.error;
        return out;
    }

    return login();
}

bool SessionManager::persist(bool forceTimestampRefresh, QString *error)
{
    if (!m_store) {
        if (error)
            *error = QStringLiteral("No session store");
        return false;
    }

    const QString key = storageKey();
    const QJsonObject old = m_store->load(key);

    QJsonObject cfg;
    cfg.insert(QStringLiteral("username"), m_config.username);
    cfg.insert(QStringLiteral("apiBase"), m_config.apiBase);
    cfg.insert(QStringLiteral("token"), m_session.token);
    cfg.insert(QStringLiteral("userId"), m_session.userId);

    const bool sameToken = old.value(QStringLiteral("token")).toString() == m_session.token;
    if (sameToken && !forceTimestampRefresh && old.contains(QStringLiteral("updateAt")))
        cfg.insert(QStringLiteral("updateAt"), old.value(QStringLiteral("updateAt")));
    else
        cfg.insert(QStringLiteral("updateAt"), nowText());

    m_session.updatedAt = cfg.value(QStringLiteral("updateAt")).toString();

    if (cfg == old) {
        if (error)
            error->clear();
        return true;
    }
    return m_store->save(key, cfg, error);
}

} // namespace phicore::petkit::ipc
