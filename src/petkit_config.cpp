#include "petkit_config.h"

#include <algorithm>

#include <QCryptographicHash>
#include <QJsonArray>
#include <QStandardPaths>

namespace phicore::petkit::ipc {

namespace {

QString readString(const QJsonObject &obj, const QJsonObject &defaults, const QString &key,
                   const QString &fallback = QString())
{
    if (obj.contains(key))
        return obj.value(key).toVariant().toString().trimmed();
    if (defaults.contains(key))
        return defaults.value(key).toVariant().toString().trimmed();
    return fallback;
}

int readInt(const QJsonObject &obj, const QJsonObject &defaults, const QString &key, int fallback)
{
    const QJsonObject &source = obj.contains(key) ? obj : defaults;
    if (!source.contains(key))
        return fallback;
    bool ok = false;
    const int value = source.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

AccountConfig accountFromObject(const QJsonObject &obj, const QJsonObject &defaults)
{
    AccountConfig cfg;
    // Credentials belong to the account entry, only tuning keys fall back
    // to the top-level defaults. Passwords are taken verbatim.
    cfg.username = obj.value(QStringLiteral("username")).toString().trimmed();
    cfg.password = obj.value(QStringLiteral("password")).toString();
    cfg.uid = obj.value(QStringLiteral("uid")).toVariant().toString().trimmed();
    cfg.token = obj.value(QStringLiteral("token")).toString().trimmed();
    cfg.apiBase = readString(obj, defaults, QStringLiteral("apiBase"), QString::fromLatin1(kDefaultApiBase));
    if (cfg.apiBase.isEmpty())
        cfg.apiBase = QString::fromLatin1(kDefaultApiBase);
    cfg.pollIntervalMs = std::clamp(readInt(obj, defaults, QStringLiteral("pollIntervalMs"), kDefaultPollIntervalMs),
                                    10000,
                                    86400000);
    cfg.timeoutMs = std::clamp(readInt(obj, defaults, QStringLiteral("timeoutMs"), kDefaultTimeoutMs), 1000, 120000);
    return cfg;
}

} // namespace

QString AccountConfig::accountId() const
{
    return uid.isEmpty() ? username : uid;
}

QString AccountConfig::passwordHash() const
{
    return hashPassword(password);
}

bool AccountConfig::hasCredentials() const
{
    return !password.isEmpty() || !token.isEmpty();
}

QString hashPassword(const QString &password)
{
    if (password.size() == kPasswordHashLength)
        return password;
    return QString::fromLatin1(QCryptographicHash::hash(password.toUtf8(), QCryptographicHash::Md5).toHex());
}

QList<AccountConfig> parseAccountConfigs(const QJsonObject &meta)
{
    QList<AccountConfig> out;

    const QJsonArray accounts = meta.value(QStringLiteral("accounts")).toArray();
    for (const QJsonValue &entry : accounts) {
        if (!entry.isObject())
            continue;
        const AccountConfig cfg = accountFromObject(entry.toObject(), meta);
        if (cfg.hasCredentials())
            out.append(cfg);
    }

    if (meta.contains(QStringLiteral("password")) || meta.contains(QStringLiteral("token"))) {
        const AccountConfig cfg = accountFromObject(meta, QJsonObject{});
        if (cfg.hasCredentials())
            out.append(cfg);
    }

    return out;
}

QString storageDirectory(const QJsonObject &meta)
{
    const QString configured = meta.value(QStringLiteral("storageDir")).toString().trimmed();
    if (!configured.isEmpty())
        return configured;
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

} // namespace phicore::petkit::ipc
