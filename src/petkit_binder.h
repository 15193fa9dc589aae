#pragma once

#include <functional>
#include <map>
#include <memory>

#include <QList>
#include <QString>

#include "petkit_device.h"
#include "petkit_entity.h"

namespace phicore::petkit::ipc {

// Keeps exactly one entity per (domain, capability, device) for the
// lifetime of the process. Entities are never unbound.
class EntityBinder
{
public:
    using RegistrationHandler = std::function<void(const QList<Entity *> &)>;

    // Domains without a handler are skipped by bind(); attach the handler
    // and call bindAll() to catch up on devices that already exist.
    void setRegistrationHandler(EntityDomain domain, RegistrationHandler handler);
    bool hasRegistrationHandler(EntityDomain domain) const;

    // Returns the number of entities created by this call.
    int bind(EntityDomain domain, Device *device);
    int bindAll(EntityDomain domain, const QList<Device *> &devices);

    Entity *find(EntityDomain domain, const QString &name, const QString &deviceId) const;
    QList<Entity *> entities() const;
    int size() const { return static_cast<int>(m_entities.size()); }

    static QString bindingKey(EntityDomain domain, const QString &name, const QString &deviceId);

private:
    std::map<EntityDomain, RegistrationHandler> m_handlers;
    std::map<QString, std::unique_ptr<Entity>> m_entities;
};

} // namespace phicore::petkit::ipc
