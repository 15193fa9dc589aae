#pragma once

#include <QJsonObject>
#include <QString>

namespace phicore::petkit::ipc {

class KeyValueStore
{
public:
    virtual ~KeyValueStore() = default;

    // Empty object when the key has never been saved or cannot be read.
    virtual QJsonObject load(const QString &key) const = 0;
    virtual bool save(const QString &key, const QJsonObject &value, QString *error = nullptr) = 0;
};

// One JSON document per key below a root directory. Keys may contain '/'
// to form sub directories.
class JsonFileStore final : public KeyValueStore
{
public:
    explicit JsonFileStore(const QString &rootDir);

    QJsonObject load(const QString &key) const override;
    bool save(const QString &key, const QJsonObject &value, QString *error = nullptr) override;

    QString filePath(const QString &key) const;

private:
    QString m_rootDir;
};

} // namespace phicore::petkit::ipc
