#include "petkit_registry.h"

namespace phicore::petkit::ipc {

Device *DeviceRegistry::upsert(const QString &id, const QJsonObject &data, SessionManager *session, bool *created)
{
    if (created)
        *created = false;
    if (id.isEmpty())
        return nullptr;

    auto it = m_devices.find(id);
    if (it != m_devices.end()) {
        it->second->updateData(data);
        return it->second.get();
    }

    auto device = std::make_unique<Device>(id, data, session);
    Device *out = device.get();
    m_devices.emplace(id, std::move(device));
    if (created)
        *created = true;
    return out;
}

Device *DeviceRegistry::find(const QString &id) const
{
    const auto it = m_devices.find(id);
    return it == m_devices.end() ? nullptr : it->second.get();
}

QList<Device *> DeviceRegistry::devices() const
{
    QList<Device *> out;
    out.reserve(static_cast<qsizetype>(m_devices.size()));
    for (const auto &entry : m_devices)
        out.append(entry.second.get());
    return out;
}

} // namespace phicore::petkit::ipc
