#pragma once

#include <QJsonObject>
#include <QList>
#include <QString>

namespace phicore::petkit::ipc {

inline constexpr const char kDefaultApiBase[] = "http://api.petkit.cn/6/";
inline constexpr int kDefaultPollIntervalMs = 2 * 60 * 1000;
inline constexpr int kDefaultTimeoutMs = 20000;
inline constexpr int kPasswordHashLength = 32;

struct AccountConfig {
    QString username;
    QString password;
    QString uid;
    QString token;
    QString apiBase = QString::fromLatin1(kDefaultApiBase);
    int pollIntervalMs = kDefaultPollIntervalMs;
    int timeoutMs = kDefaultTimeoutMs;

    // Configured uid, falling back to the username.
    QString accountId() const;

    // Password as sent to the vendor: MD5 hex digest unless the configured
    // value already has the digest length.
    QString passwordHash() const;

    bool hasCredentials() const;
};

QString hashPassword(const QString &password);

// Reads the adapter meta object. Top-level apiBase, pollIntervalMs and
// timeoutMs act as defaults for every entry of the optional "accounts"
// array; a top-level password or token also defines an account of its own.
// Entries without password and token are dropped.
QList<AccountConfig> parseAccountConfigs(const QJsonObject &meta);

QString storageDirectory(const QJsonObject &meta);

} // namespace phicore::petkit::ipc
