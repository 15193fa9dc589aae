#include "petkit_device.h"

#include <algorithm>
#include <cmath>

#include <QDate>
#include <QJsonDocument>

#include "petkit_log.h"
#include "petkit_session.h"

namespace phicore::petkit::ipc {

namespace {

constexpr int kStateFeeding = 3;

QVariant scalarFromJson(const QJsonValue &value)
{
    if (value.isDouble())
        return static_cast<qint64>(value.toDouble());
    if (value.isBool())
        return value.toBool();
    return value.toString().trimmed();
}

} // namespace

QString domainName(EntityDomain domain)
{
    switch (domain) {
    case EntityDomain::Sensor:
        return QStringLiteral("sensor");
    case EntityDomain::BinarySensor:
        return QStringLiteral("binary_sensor");
    case EntityDomain::Switch:
        return QStringLiteral("switch");
    }
    return QString();
}

QList<EntityDomain> supportedDomains()
{
    return {EntityDomain::Sensor, EntityDomain::BinarySensor, EntityDomain::Switch};
}

Device::Device(const QString &id, const QJsonObject &data, SessionManager *session)
    : m_id(id)
    , m_data(data)
    , m_session(session)
{
    buildCapabilities();
}

void Device::updateData(const QJsonObject &data)
{
    m_data = data;
    notifyListeners();
    qCDebug(petkitLog).noquote() << "Update petkit device data:"
                                 << QJsonDocument(data).toJson(QJsonDocument::Compact);
}

Device::ListenerId Device::subscribe(Listener listener)
{
    const ListenerId id = m_nextListenerId++;
    m_listeners.emplace(id, std::move(listener));
    return id;
}

bool Device::unsubscribe(ListenerId id)
{
    return m_listeners.erase(id) > 0;
}

void Device::notifyListeners()
{
    // Copy so a listener may unsubscribe itself.
    const auto listeners = m_listeners;
    for (const auto &entry : listeners) {
        if (entry.second)
            entry.second();
    }
}

QString Device::idFromJson(const QJsonValue &value)
{
    if (value.isDouble())
        return QString::number(static_cast<qint64>(value.toDouble()));
    return value.toString().trimmed();
}

QString Device::deviceType() const
{
    return m_data.value(QStringLiteral("type")).toString().toLower();
}

QString Device::deviceName() const
{
    return m_data.value(QStringLiteral("name")).toString();
}

QString Device::deviceKey() const
{
    return deviceType() + QLatin1Char('_') + m_id;
}

QJsonObject Device::status() const
{
    return m_data.value(QStringLiteral("status")).toObject();
}

QVariant Device::stateCode() const
{
    const QVariant raw = scalarFromJson(m_data.value(QStringLiteral("state")));
    if (raw.toString().isEmpty() || (raw.typeId() == QMetaType::Bool && !raw.toBool()))
        return static_cast<qint64>(0);
    return raw;
}

QString Device::stateLabel(int code)
{
    switch (code) {
    case 1:
        return QStringLiteral("online");
    case 2:
        return QStringLiteral("offline");
    case 3:
        return QStringLiteral("feeding");
    case 4:
        return QStringLiteral("mate_ota");
    case 5:
        return QStringLiteral("device_error");
    case 6:
        return QStringLiteral("battery_mode");
    default:
        return QString();
    }
}

QVariant Device::state() const
{
    const QVariant code = stateCode();
    bool ok = false;
    const int numeric = code.toString().trimmed().toInt(&ok);
    if (ok) {
        const QString label = stateLabel(numeric);
        if (!label.isEmpty())
            return label;
    }
    return code;
}

int Device::desiccantLeftDays() const
{
    return status().value(QStringLiteral("desiccantLeftDays")).toVariant().toInt();
}

int Device::foodStatus() const
{
    return status().value(QStringLiteral("food")).toVariant().toInt();
}

bool Device::isFeeding() const
{
    return stateCode().toString().trimmed().toInt() == kStateFeeding;
}

QJsonObject Device::stateAttributes() const
{
    QJsonObject attrs;
    attrs.insert(QStringLiteral("state"), m_data.value(QStringLiteral("state")));
    attrs.insert(QStringLiteral("desc"), m_data.value(QStringLiteral("desc")));
    attrs.insert(QStringLiteral("status"), status());
    attrs.insert(QStringLiteral("shared"), m_data.value(QStringLiteral("deviceShared")));
    return attrs;
}

QJsonObject Device::foodStateAttributes() const
{
    QJsonObject attrs;
    attrs.insert(QStringLiteral("state"), status().value(QStringLiteral("food")));
    attrs.insert(QStringLiteral("desc"), foodPresent() ? QStringLiteral("normal") : QStringLiteral("few"));
    return attrs;
}

QJsonObject Device::feedingAttributes() const
{
    QJsonObject attrs;
    attrs.insert(QStringLiteral("desc"), m_data.value(QStringLiteral("desc")));
    attrs.insert(QStringLiteral("error"), status().value(QStringLiteral("errorMsg")));
    return attrs;
}

void Device::buildCapabilities()
{
    Capability state;
    state.name = QStringLiteral("state");
    state.domain = EntityDomain::Sensor;
    state.value = [this]() { return this->state(); };
    state.attributes = [this]() { return stateAttributes(); };
    m_sensors.append(state);

    Capability desiccant;
    desiccant.name = QStringLiteral("desiccant");
    desiccant.domain = EntityDomain::Sensor;
    desiccant.value = [this]() { return QVariant(desiccantLeftDays()); };
    desiccant.unit = QStringLiteral("days");
    m_sensors.append(desiccant);

    // On means a problem: the bowl is running low.
    Capability food;
    food.name = QStringLiteral("food_state");
    food.domain = EntityDomain::BinarySensor;
    food.value = [this]() { return QVariant(!foodPresent()); };
    food.icon = QStringLiteral("mdi:food-drumstick-outline");
    food.deviceClass = QStringLiteral("problem");
    food.attributes = [this]() { return foodStateAttributes(); };
    m_binarySensors.append(food);

    Capability feeding;
    feeding.name = QStringLiteral("feeding");
    feeding.domain = EntityDomain::Switch;
    feeding.value = [this]() { return QVariant(isFeeding()); };
    feeding.icon = QStringLiteral("mdi:shaker");
    feeding.attributes = [this]() { return feedingAttributes(); };
    feeding.action = [this](const QVariantMap &params) {
        return feedNow(params.value(QStringLiteral("amount"), 1.0).toDouble());
    };
    m_switches.append(feeding);
}

const CapabilityList &Device::capabilities(EntityDomain domain) const
{
    switch (domain) {
    case EntityDomain::BinarySensor:
        return m_binarySensors;
    case EntityDomain::Switch:
        return m_switches;
    case EntityDomain::Sensor:
        break;
    }
    return m_sensors;
}

QString Device::feedEndpoint(const QString &deviceType)
{
    const QString type = deviceType.toLower();
    if (type == QLatin1String("feedermini"))
        return QStringLiteral("feedermini/save_dailyfeed");
    if (type == QLatin1String("d3") || type == QLatin1String("d4"))
        return type + QStringLiteral("/saveDailyFeed");
    return QStringLiteral("feeder/save_dailyfeed");
}

bool Device::isValidFeedAmount(double amount)
{
    return std::isfinite(amount) && amount > 0.0 && amount <= kMaxFeedAmount;
}

qint64 Device::feedAmountParam(double amount)
{
    if (!std::isfinite(amount))
        return 0;
    // Ties go to the even neighbour.
    return static_cast<qint64>(std::nearbyint(std::clamp(amount, 0.0, kMaxFeedAmount) * 10.0));
}

ApiResult Device::feedNow(double amount)
{
    if (!isValidFeedAmount(amount)) {
        ApiResult out;
        out.error = QStringLiteral("Feed amount %1 is outside 0..%2").arg(amount).arg(kMaxFeedAmount);
        qCWarning(petkitLog).noquote() << "Petkit feeding now failed:" << m_id << out.error;
        return out;
    }

    QUrlQuery params;
    params.addQueryItem(QStringLiteral("deviceId"), m_id);
    params.addQueryItem(QStringLiteral("day"), QDate::currentDate().toString(QStringLiteral("yyyyMMdd")));
    params.addQueryItem(QStringLiteral("time"), QStringLiteral("-1"));
    params.addQueryItem(QStringLiteral("amount"), QString::number(feedAmountParam(amount)));

    if (!m_session) {
        ApiResult out;
        out.error = QStringLiteral("Device %1 has no session").arg(m_id);
        qCWarning(petkitLog).noquote() << "Petkit feeding now failed:" << out.error;
        return out;
    }

    const ApiResult rsp = m_session->request(feedEndpoint(deviceType()), params);
    qCInfo(petkitLog).noquote() << "Petkit feeding now:" << m_id
                                << QJsonDocument(rsp.body).toJson(QJsonDocument::Compact);
    return rsp;
}

} // namespace phicore::petkit::ipc
