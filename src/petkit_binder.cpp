#include "petkit_binder.h"

#include "petkit_log.h"

namespace phicore::petkit::ipc {

QString EntityBinder::bindingKey(EntityDomain domain, const QString &name, const QString &deviceId)
{
    return QStringLiteral("%1.%2.%3").arg(domainName(domain), name, deviceId);
}

void EntityBinder::setRegistrationHandler(EntityDomain domain, RegistrationHandler handler)
{
    if (handler)
        m_handlers[domain] = std::move(handler);
    else
        m_handlers.erase(domain);
}

bool EntityBinder::hasRegistrationHandler(EntityDomain domain) const
{
    return m_handlers.count(domain) > 0;
}

int EntityBinder::bind(EntityDomain domain, Device *device)
{
    if (!device)
        return 0;
    const auto handler = m_handlers.find(domain);
    if (handler == m_handlers.end())
        return 0;

    QList<Entity *> created;
    for (const Capability &capability : device->capabilities(domain)) {
        const QString key = bindingKey(domain, capability.name, device->deviceId());
        if (m_entities.count(key) > 0)
            continue;

        std::unique_ptr<Entity> entity = createEntity(device, capability);
        if (!entity)
            continue;
        entity->attach();
        created.append(entity.get());
        m_entities.emplace(key, std::move(entity));
    }

    if (created.isEmpty())
        return 0;

    qCDebug(petkitLog) << "Bound" << created.size() << domainName(domain) << "entities for device"
                       << device->deviceId();
    handler->second(created);
    return static_cast<int>(created.size());
}

int EntityBinder::bindAll(EntityDomain domain, const QList<Device *> &devices)
{
    int created = 0;
    for (Device *device : devices)
        created += bind(domain, device);
    return created;
}

Entity *EntityBinder::find(EntityDomain domain, const QString &name, const QString &deviceId) const
{
    const auto it = m_entities.find(bindingKey(domain, name, deviceId));
    return it == m_entities.end() ? nullptr : it->second.get();
}

QList<Entity *> EntityBinder::entities() const
{
    QList<Entity *> out;
    for (const auto &entry : m_entities)
        out.append(entry.second.get());
    return out;
}

} // namespace phicore::petkit::ipc
