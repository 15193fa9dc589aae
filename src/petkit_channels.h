#pragma once

#include <optional>

#include <QList>
#include <QVariant>

#include "petkit_device.h"
#include "petkit_entity.h"
#include "phi/adapter/sdk/sidecar.h"

namespace phicore::petkit::ipc {

struct DeviceEntry {
    phicore::adapter::v1::Device device;
    phicore::adapter::v1::ChannelList channels;
};

phicore::adapter::v1::Device makeSdkDevice(const Device &device);

// One channel per bound entity; the channel id is the capability name.
phicore::adapter::v1::Channel makeChannel(const Entity &entity);

std::optional<phicore::adapter::v1::ScalarValue> channelValue(const Entity &entity);

void upsertChannel(phicore::adapter::v1::ChannelList *channels, phicore::adapter::v1::Channel channel);

} // namespace phicore::petkit::ipc
