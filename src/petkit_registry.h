#pragma once

#include <map>
#include <memory>

#include <QJsonObject>
#include <QList>
#include <QString>

#include "petkit_device.h"

namespace phicore::petkit::ipc {

// Device id -> Device. Entries are created once and then updated in place
// so listener registrations on a Device survive every refresh.
class DeviceRegistry
{
public:
    // Creates the device for a new id, otherwise hands the data to the
    // existing one. Returns nullptr for an empty id.
    Device *upsert(const QString &id, const QJsonObject &data, SessionManager *session, bool *created = nullptr);

    Device *find(const QString &id) const;
    bool contains(const QString &id) const { return m_devices.count(id) > 0; }
    int size() const { return static_cast<int>(m_devices.size()); }
    QList<Device *> devices() const;

private:
    std::map<QString, std::unique_ptr<Device>> m_devices;
};

} // namespace phicore::petkit::ipc
