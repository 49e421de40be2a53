#include "tv_model.h"

#include <string>

#include <QJsonDocument>

#include "tv_config.h"

namespace phicore::samsungtv::ipc {

namespace {

namespace v1 = phicore::adapter::v1;

v1::Channel makePowerChannel(bool value)
{
    v1::Channel channel;
    channel.externalId = kPowerChannelId;
    channel.name = "Power";
    channel.kind = v1::ChannelKind::PowerOnOff;
    channel.dataType = v1::ChannelDataType::Bool;
    channel.flags = v1::kChannelFlagDefaultWrite;
    channel.hasValue = true;
    channel.lastValue = value;
    return channel;
}

v1::Channel makeConnectivityChannel(std::int64_t value)
{
    v1::Channel channel;
    channel.externalId = kConnectivityChannelId;
    channel.name = "Connectivity";
    channel.kind = v1::ChannelKind::ConnectivityStatus;
    channel.dataType = v1::ChannelDataType::Enum;
    channel.flags = v1::kChannelFlagDefaultRead;

    auto addChoice = [&channel](v1::ConnectivityStatus status, const char *label) {
        v1::AdapterConfigOption option;
        option.value = std::to_string(static_cast<int>(status));
        option.label = label;
        channel.choices.push_back(std::move(option));
    };
    addChoice(v1::ConnectivityStatus::Connected, "Connected");
    addChoice(v1::ConnectivityStatus::Disconnected, "Disconnected");

    channel.hasValue = true;
    channel.lastValue = value;
    return channel;
}

v1::Channel *findChannel(DeviceEntry *entry, const char *externalId)
{
    for (v1::Channel &channel : entry->channels) {
        if (channel.externalId == externalId)
            return &channel;
    }
    return nullptr;
}

} // namespace

std::int64_t connectivityValue(bool connected)
{
    return static_cast<std::int64_t>(connected ? v1::ConnectivityStatus::Connected
                                               : v1::ConnectivityStatus::Disconnected);
}

DeviceEntry buildDeviceEntry(const DeviceConfig &config, PowerState power, bool connected)
{
    DeviceEntry entry;
    entry.device.externalId = config.identifier().toStdString();
    entry.device.name = (config.name.isEmpty() ? QStringLiteral("Samsung TV") : config.name).toStdString();
    entry.device.manufacturer = "Samsung";
    entry.device.deviceClass = v1::DeviceClass::Unknown;

    entry.channels.push_back(makePowerChannel(displayState(power) == PowerState::On));
    entry.channels.push_back(makeConnectivityChannel(connectivityValue(connected)));

    entry.attributes.insert(QStringLiteral("powerState"),
                            QString::fromLatin1(powerStateName(displayState(power))));
    syncDeviceMeta(&entry, config);
    return entry;
}

void setPowerValue(DeviceEntry *entry, PowerState power)
{
    if (v1::Channel *channel = findChannel(entry, kPowerChannelId)) {
        channel->hasValue = true;
        channel->lastValue = displayState(power) == PowerState::On;
    }
}

void setConnectivityValue(DeviceEntry *entry, bool connected)
{
    if (v1::Channel *channel = findChannel(entry, kConnectivityChannelId)) {
        channel->hasValue = true;
        channel->lastValue = connectivityValue(connected);
    }
}

void syncDeviceMeta(DeviceEntry *entry, const DeviceConfig &config)
{
    QJsonObject meta = entry->attributes;
    meta.insert(QStringLiteral("address"), config.address);
    if (config.hasMacAddress())
        meta.insert(QStringLiteral("macAddress"), config.macAddress);
    meta.insert(QStringLiteral("supportsArtMode"), config.supportsArtMode);
    meta.insert(QStringLiteral("supportsCloudWake"), config.supportsCloudWake);
    entry->device.metaJson = QJsonDocument(meta).toJson(QJsonDocument::Compact).toStdString();
}

} // namespace phicore::samsungtv::ipc
