#include <QJsonArray>
#include <QJsonObject>

#include <gtest/gtest.h>

#include "tv_events.h"

using namespace phicore::samsungtv::ipc;

namespace {

TEST(EventChannelTest, PreservesOrder)
{
    EventChannel events;
    int notified = 0;
    QObject::connect(&events, &EventChannel::eventPosted, [&]() { ++notified; });

    events.post(Connected{ QStringLiteral("tv-1") });
    events.post(StateChanged{ QStringLiteral("tv-1"), PowerState::On, {}, {}, {} });
    events.post(Disconnected{ QStringLiteral("tv-1") });

    EXPECT_EQ(notified, 3);
    EXPECT_EQ(events.size(), 3);

    auto first = events.take();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(std::holds_alternative<Connected>(*first));
    EXPECT_TRUE(std::holds_alternative<StateChanged>(*events.take()));
    EXPECT_TRUE(std::holds_alternative<Disconnected>(*events.take()));
    EXPECT_FALSE(events.take().has_value());
}

TEST(EventChannelTest, DeviceIdOfAnyEvent)
{
    EXPECT_EQ(eventDeviceId(ConnectionError{ QStringLiteral("tv-9"), QStringLiteral("denied") }),
              QStringLiteral("tv-9"));
}

TEST(PowerStateTest, UnknownIsShownAsOff)
{
    EXPECT_EQ(displayState(PowerState::Unknown), PowerState::Off);
    EXPECT_EQ(displayState(PowerState::Standby), PowerState::Standby);
    EXPECT_STREQ(powerStateName(PowerState::On), "ON");
    EXPECT_STREQ(powerStateName(PowerState::Standby), "STANDBY");
    EXPECT_STREQ(commandResultName(CommandResult::NotDelivered), "not delivered");
}

TEST(MetaMergeTest, TracksChangedAttributes)
{
    QJsonObject meta;
    StateChanged event;
    event.deviceId = QStringLiteral("tv-1");
    event.powerState = PowerState::On;
    event.sourceList = QStringList{ QStringLiteral("TV"), QStringLiteral("HDMI1") };
    event.media.volume = 20;

    EXPECT_TRUE(mergeStateIntoMeta(&meta, event));
    EXPECT_EQ(meta.value(QStringLiteral("powerState")).toString(), QStringLiteral("ON"));
    EXPECT_EQ(meta.value(QStringLiteral("sourceList")).toArray().size(), 2);
    EXPECT_EQ(meta.value(QStringLiteral("volume")).toInt(), 20);
    EXPECT_FALSE(meta.contains(QStringLiteral("muted")));

    EXPECT_FALSE(mergeStateIntoMeta(&meta, event));

    StateChanged update;
    update.deviceId = event.deviceId;
    update.powerState = PowerState::On;
    update.media.muted = true;
    EXPECT_TRUE(mergeStateIntoMeta(&meta, update));
    EXPECT_EQ(meta.value(QStringLiteral("volume")).toInt(), 20);
    EXPECT_TRUE(meta.value(QStringLiteral("muted")).toBool());

    EXPECT_FALSE(mergeStateIntoMeta(nullptr, update));
}

} // namespace
