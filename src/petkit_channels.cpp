#include "petkit_channels.h"

#include <cstdint>
#include <string>

#include <QJsonDocument>
#include <QJsonObject>

namespace phicore::petkit::ipc {

namespace {

namespace v1 = phicore::adapter::v1;

QString sdkDeviceName(const Device &device)
{
    const QString name = device.deviceName().trimmed();
    if (!name.isEmpty())
        return name;
    const QString type = device.data().value(QStringLiteral("type")).toString().trimmed();
    return type.isEmpty() ? QStringLiteral("Petkit Device") : QStringLiteral("Petkit %1").arg(type);
}

std::optional<v1::ScalarValue> scalarFromVariant(const QVariant &value)
{
    if (!value.isValid() || value.isNull())
        return std::nullopt;

    switch (value.typeId()) {
    case QMetaType::Bool:
        return v1::ScalarValue(value.toBool());
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
        return v1::ScalarValue(static_cast<std::int64_t>(value.toLongLong()));
    case QMetaType::Double:
    case QMetaType::Float:
        return v1::ScalarValue(value.toDouble());
    default:
        break;
    }
    return v1::ScalarValue(value.toString().toStdString());
}

QJsonObject channelMeta(const Entity &entity)
{
    QJsonObject meta;
    meta.insert(QStringLiteral("entityId"), entity.entityId());
    meta.insert(QStringLiteral("uniqueId"), entity.uniqueId());
    meta.insert(QStringLiteral("domain"), domainName(entity.domain()));
    if (!entity.capability().icon.isEmpty())
        meta.insert(QStringLiteral("icon"), entity.capability().icon);
    if (!entity.capability().deviceClass.isEmpty())
        meta.insert(QStringLiteral("deviceClass"), entity.capability().deviceClass);
    if (!entity.attributes().isEmpty())
        meta.insert(QStringLiteral("attributes"), entity.attributes());
    return meta;
}

v1::Channel makeStateChannel()
{
    v1::Channel channel;
    channel.dataType = v1::ChannelDataType::Enum;
    channel.flags = v1::kChannelFlagDefaultRead;

    for (int code = 1; code <= 6; ++code) {
        v1::AdapterConfigOption option;
        option.value = std::to_string(code);
        option.label = Device::stateLabel(code).toStdString();
        channel.choices.push_back(std::move(option));
    }
    return channel;
}

} // namespace

v1::Device makeSdkDevice(const Device &device)
{
    v1::Device out;
    out.externalId = device.deviceKey().toStdString();
    out.name = sdkDeviceName(device).toStdString();
    out.manufacturer = "Petkit";
    out.model = device.data().value(QStringLiteral("type")).toString().toStdString();
    out.firmware = device.data().value(QStringLiteral("firmware")).toVariant().toString().toStdString();
    out.deviceClass = v1::DeviceClass::Unknown;
    out.metaJson = QJsonDocument(device.data()).toJson(QJsonDocument::Compact).toStdString();
    return out;
}

v1::Channel makeChannel(const Entity &entity)
{
    v1::Channel channel;
    if (entity.name() == QLatin1String("state")) {
        channel = makeStateChannel();
    } else {
        switch (entity.domain()) {
        case EntityDomain::Sensor:
            channel.dataType = v1::ChannelDataType::Int;
            channel.flags = v1::kChannelFlagDefaultRead;
            channel.minValue = 0.0;
            channel.stepValue = 1.0;
            break;
        case EntityDomain::BinarySensor:
            channel.dataType = v1::ChannelDataType::Bool;
            channel.flags = v1::kChannelFlagDefaultRead;
            break;
        case EntityDomain::Switch:
            channel.kind = v1::ChannelKind::PowerOnOff;
            channel.dataType = v1::ChannelDataType::Bool;
            channel.flags = v1::kChannelFlagDefaultWrite;
            break;
        }
    }

    channel.externalId = entity.name().toStdString();
    channel.name = entity.displayName().toStdString();
    if (!entity.capability().unit.isEmpty())
        channel.unit = entity.capability().unit.toStdString();
    channel.metaJson = QJsonDocument(channelMeta(entity)).toJson(QJsonDocument::Compact).toStdString();

    const auto value = channelValue(entity);
    if (value.has_value()) {
        channel.hasValue = true;
        channel.lastValue = *value;
    }
    return channel;
}

std::optional<v1::ScalarValue> channelValue(const Entity &entity)
{
    // The state channel carries the numeric code, the label lives in the
    // enum choices.
    if (entity.name() == QLatin1String("state")) {
        bool ok = false;
        const qint64 code = entity.device()->stateCode().toString().toLongLong(&ok);
        if (ok)
            return v1::ScalarValue(static_cast<std::int64_t>(code));
    }
    return scalarFromVariant(entity.value());
}

void upsertChannel(v1::ChannelList *channels, v1::Channel channel)
{
    const QString channelId = QString::fromStdString(channel.externalId);
    for (v1::Channel &existing : *channels) {
        if (QString::fromStdString(existing.externalId) != channelId)
            continue;
        existing = std::move(channel);
        return;
    }
    channels->push_back(std::move(channel));
}

} // namespace phicore::petkit::ipc
