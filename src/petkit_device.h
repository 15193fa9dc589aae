#pragma once

#include <functional>
#include <map>

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QVariant>
#include <QVariantMap>

#include "petkit_api.h"

namespace phicore::petkit::ipc {

class SessionManager;

inline constexpr double kMaxFeedAmount = 100.0;

enum class EntityDomain {
    Sensor,
    BinarySensor,
    Switch,
};

QString domainName(EntityDomain domain);
QList<EntityDomain> supportedDomains();

// One observable or actionable attribute of a device. Entities bind to
// these descriptors and never look at the device type themselves.
struct Capability {
    QString name;
    EntityDomain domain = EntityDomain::Sensor;
    std::function<QVariant()> value;
    QString unit;
    QString icon;
    QString deviceClass;
    std::function<QJsonObject()> attributes;
    std::function<ApiResult(const QVariantMap &params)> action;
};

using CapabilityList = QList<Capability>;

class Device
{
public:
    using Listener = std::function<void()>;
    using ListenerId = int;

    Device(const QString &id, const QJsonObject &data, SessionManager *session);

    Device(const Device &) = delete;
    Device &operator=(const Device &) = delete;

    // Replaces the whole state blob, then runs every listener in place.
    void updateData(const QJsonObject &data);

    ListenerId subscribe(Listener listener);
    bool unsubscribe(ListenerId id);
    int listenerCount() const { return static_cast<int>(m_listeners.size()); }

    QString deviceId() const { return m_id; }
    QString deviceType() const;
    QString deviceName() const;
    QString deviceKey() const;
    const QJsonObject &data() const { return m_data; }
    QJsonObject status() const;
    SessionManager *session() const { return m_session; }

    QVariant stateCode() const;
    // Label for the known state codes, the raw code otherwise.
    QVariant state() const;
    int desiccantLeftDays() const;
    int foodStatus() const;
    bool foodPresent() const { return foodStatus() == 0; }
    bool isFeeding() const;

    QJsonObject stateAttributes() const;
    QJsonObject foodStateAttributes() const;
    QJsonObject feedingAttributes() const;

    const CapabilityList &capabilities(EntityDomain domain) const;

    // Failures are logged, the caller only gets the raw vendor response.
    ApiResult feedNow(double amount = 1.0);

    static QString feedEndpoint(const QString &deviceType);
    // Finite and within (0, kMaxFeedAmount].
    static bool isValidFeedAmount(double amount);
    // Deciunits; out of range amounts are clamped, non finite ones give 0.
    static qint64 feedAmountParam(double amount);
    static QString stateLabel(int code);
    static QString idFromJson(const QJsonValue &value);

private:
    void buildCapabilities();
    void notifyListeners();

    QString m_id;
    QJsonObject m_data;
    SessionManager *m_session = nullptr;
    std::map<ListenerId, Listener> m_listeners;
    ListenerId m_nextListenerId = 1;
    CapabilityList m_sensors;
    CapabilityList m_binarySensors;
    CapabilityList m_switches;
};

} // namespace phicore::petkit::ipc
