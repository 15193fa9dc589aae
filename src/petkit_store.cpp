#include "petkit_store.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

#include "petkit_log.h"

namespace phicore::petkit::ipc {

JsonFileStore::JsonFileStore(const QString &rootDir)
    : m_rootDir(rootDir)
{
}

QString JsonFileStore::filePath(const QString &key) const
{
    return QDir(m_rootDir).filePath(key);
}

QJsonObject JsonFileStore::load(const QString &key) const
{
    QFile file(filePath(key));
    if (!file.exists())
        return {};
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(petkitLog) << "Cannot read" << file.fileName() << file.errorString();
        return {};
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        qCWarning(petkitLog) << "Ignoring malformed store file" << file.fileName() << parseError.errorString();
        return {};
    }
    return doc.object();
}

bool JsonFileStore::save(const QString &key, const QJsonObject &value, QString *error)
{
    const QString path = filePath(key);
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        if (error)
            *error = QStringLiteral("Cannot create directory for %1").arg(path);
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error)
            *error = file.errorString();
        return false;
    }
    file.write(QJsonDocument(value).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (error)
            *error = file.errorString();
        return false;
    }

    if (error)
        error->clear();
    return true;
}

} // namespace phicore::petkit::ipc
