#pragma once

#include <cstdint>

#include <QJsonObject>
#include <QString>

#include "phi/adapter/sdk/sidecar.h"
#include "tv_events.h"

namespace phicore::samsungtv::ipc {

class DeviceConfig;

inline constexpr char kPowerChannelId[] = "power";
inline constexpr char kConnectivityChannelId[] = "connectivity";

struct DeviceEntry {
    phicore::adapter::v1::Device device;
    phicore::adapter::v1::ChannelList channels;
    QJsonObject attributes;
};

DeviceEntry buildDeviceEntry(const DeviceConfig &config, PowerState power, bool connected);

void setPowerValue(DeviceEntry *entry, PowerState power);
void setConnectivityValue(DeviceEntry *entry, bool connected);
// Refreshes device.metaJson from the entry attributes.
void syncDeviceMeta(DeviceEntry *entry, const DeviceConfig &config);

std::int64_t connectivityValue(bool connected);

} // namespace phicore::samsungtv::ipc
