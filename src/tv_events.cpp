#include "tv_events.h"

#include <utility>

#include <QJsonArray>

namespace phicore::samsungtv::ipc {

PowerState displayState(PowerState state)
{
    return state == PowerState::Unknown ? PowerState::Off : state;
}

const char *powerStateName(PowerState state)
{
    switch (state) {
    case PowerState::Off:
        return "OFF";
    case PowerState::Standby:
        return "STANDBY";
    case PowerState::On:
        return "ON";
    case PowerState::Unknown:
        break;
    }
    return "UNKNOWN";
}

const char *commandResultName(CommandResult result)
{
    switch (result) {
    case CommandResult::Success:
        return "success";
    case CommandResult::NotDelivered:
        return "not delivered";
    case CommandResult::Failure:
        return "failure";
    case CommandResult::Unsupported:
        return "unsupported";
    }
    return "failure";
}

QString eventDeviceId(const DeviceEvent &event)
{
    return std::visit([](const auto &e) { return e.deviceId; }, event);
}

namespace {

bool setAttribute(QJsonObject *meta, const QString &key, const QJsonValue &value)
{
    if (meta->value(key) == value)
        return false;
    meta->insert(key, value);
    return true;
}

} // namespace

bool mergeStateIntoMeta(QJsonObject *meta, const StateChanged &event)
{
    if (!meta)
        return false;

    bool changed = setAttribute(meta, QStringLiteral("powerState"),
                                QString::fromLatin1(powerStateName(displayState(event.powerState))));
    if (event.sourceList)
        changed |= setAttribute(meta, QStringLiteral("sourceList"), QJsonArray::fromStringList(*event.sourceList));
    if (event.activeSource)
        changed |= setAttribute(meta, QStringLiteral("activeSource"), *event.activeSource);
    if (event.media.volume)
        changed |= setAttribute(meta, QStringLiteral("volume"), *event.media.volume);
    if (event.media.muted)
        changed |= setAttribute(meta, QStringLiteral("muted"), *event.media.muted);
    if (event.media.mediaTitle)
        changed |= setAttribute(meta, QStringLiteral("mediaTitle"), *event.media.mediaTitle);
    if (event.media.mediaArtist)
        changed |= setAttribute(meta, QStringLiteral("mediaArtist"), *event.media.mediaArtist);
    return changed;
}

EventChannel::EventChannel(QObject *parent)
    : QObject(parent)
{
}

void EventChannel::post(DeviceEvent event)
{
    m_queue.enqueue(std::move(event));
    emit eventPosted();
}

std::optional<DeviceEvent> EventChannel::take()
{
    if (m_queue.isEmpty())
        return std::nullopt;
    return m_queue.dequeue();
}

void EventChannel::clear()
{
    m_queue.clear();
}

} // namespace phicore::samsungtv::ipc
