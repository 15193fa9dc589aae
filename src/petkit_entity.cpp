#include "petkit_entity.h"

#include "petkit_log.h"

namespace phicore::petkit::ipc {

Entity::Entity(Device *device, const Capability &capability)
    : m_device(device)
    , m_capability(capability)
{
}

Entity::~Entity()
{
    if (m_device && m_listenerId != 0)
        m_device->unsubscribe(m_listenerId);
}

QString Entity::entityId() const
{
    return QStringLiteral("%1.%2_%3").arg(QLatin1String(kEntityDomainPrefix), m_device->deviceKey(), name());
}

QString Entity::uniqueId() const
{
    return m_device->deviceKey() + QLatin1Char('-') + name();
}

QString Entity::displayName() const
{
    return QStringLiteral("%1 %2").arg(m_device->deviceName(), name()).trimmed();
}

QString Entity::stateText() const
{
    return m_value.toString();
}

void Entity::attach()
{
    if (!m_device || m_listenerId != 0)
        return;
    m_listenerId = m_device->subscribe([this]() { refresh(); });
    refresh();
}

void Entity::setUpdateHandler(UpdateHandler handler)
{
    m_updateHandler = std::move(handler);
}

void Entity::refresh()
{
    project();
    qCDebug(petkitLog) << "Petkit entity update:" << entityId() << m_value;
    if (m_updateHandler)
        m_updateHandler(*this);
}

void Entity::project()
{
    m_value = m_capability.value ? m_capability.value() : QVariant();
    m_attributes = m_capability.attributes ? m_capability.attributes() : QJsonObject{};
}

QString BinarySensorEntity::stateText() const
{
    return m_isOn ? QStringLiteral("on") : QStringLiteral("off");
}

void BinarySensorEntity::project()
{
    Entity::project();
    m_isOn = m_value.isValid() && m_value.toBool();
}

QString SwitchEntity::stateText() const
{
    return isOn() ? QStringLiteral("on") : QStringLiteral("off");
}

void SwitchEntity::project()
{
    Entity::project();
    if (!m_value.isValid())
        m_value = false;
}

ApiResult SwitchEntity::turnOn(const QVariantMap &params)
{
    if (!m_capability.action) {
        ApiResult out;
        out.error = QStringLiteral("%1 has no action").arg(entityId());
        return out;
    }
    return m_capability.action(params);
}

std::unique_ptr<Entity> createEntity(Device *device, const Capability &capability)
{
    switch (capability.domain) {
    case EntityDomain::Sensor:
        return std::make_unique<SensorEntity>(device, capability);
    case EntityDomain::BinarySensor:
        return std::make_unique<BinarySensorEntity>(device, capability);
    case EntityDomain::Switch:
        return std::make_unique<SwitchEntity>(device, capability);
    }
    return nullptr;
}

} // namespace phicore::petkit::ipc
