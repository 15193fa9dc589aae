#pragma once

#include <functional>
#include <memory>

#include <QJsonObject>
#include <QString>
#include <QVariant>
#include <QVariantMap>

#include "petkit_device.h"

namespace phicore::petkit::ipc {

inline constexpr const char kEntityDomainPrefix[] = "petkit";

// Passive observer of one capability of one device. It caches the
// capability projection and tells the host whenever the device changes.
class Entity
{
public:
    using UpdateHandler = std::function<void(const Entity &)>;

    Entity(Device *device, const Capability &capability);
    virtual ~Entity();

    Entity(const Entity &) = delete;
    Entity &operator=(const Entity &) = delete;

    EntityDomain domain() const { return m_capability.domain; }
    const QString &name() const { return m_capability.name; }
    const Capability &capability() const { return m_capability; }
    Device *device() const { return m_device; }

    QString entityId() const;
    QString uniqueId() const;
    QString displayName() const;

    const QVariant &value() const { return m_value; }
    const QJsonObject &attributes() const { return m_attributes; }
    virtual QString stateText() const;

    // Registers as device listener and takes the first snapshot.
    void attach();
    bool isAttached() const { return m_listenerId != 0; }

    void refresh();
    void setUpdateHandler(UpdateHandler handler);

protected:
    virtual void project();

    Device *m_device = nullptr;
    Capability m_capability;
    QVariant m_value;
    QJsonObject m_attributes;

private:
    Device::ListenerId m_listenerId = 0;
    UpdateHandler m_updateHandler;
};

class SensorEntity final : public Entity
{
public:
    using Entity::Entity;
};

class BinarySensorEntity final : public Entity
{
public:
    using Entity::Entity;

    bool isOn() const { return m_isOn; }
    QString stateText() const override;

protected:
    void project() override;

private:
    bool m_isOn = false;
};

class SwitchEntity final : public Entity
{
public:
    using Entity::Entity;

    bool isOn() const { return m_value.toBool(); }
    QString stateText() const override;

    // Runs the capability action, e.g. an immediate feed.
    ApiResult turnOn(const QVariantMap &params = QVariantMap());

protected:
    void project() override;
};

std::unique_ptr<Entity> createEntity(Device *device, const Capability &capability);

} // namespace phicore::petkit::ipc
