#include <memory>

#include <gtest/gtest.h>

#include "fakes.h"
#include "tv_power.h"

using namespace phicore::samsungtv::ipc;
using namespace phicore::samsungtv::ipc::fakes;

namespace {

const QString kMac = QStringLiteral("AA:BB:CC:DD:EE:FF");

class PowerEngineTest : public ::testing::Test
{
protected:
    PowerEngineTest()
    {
        config.name = QStringLiteral("Living Room");
        config.address = QStringLiteral("192.168.1.20");
    }

    std::unique_ptr<PowerStateEngine> makeEngine()
    {
        PowerTimings timings;
        timings.wakeIntervalMs = 10;
        auto engine = std::make_unique<PowerStateEngine>(config, host, probe, wol, events, &store,
                                                         timings, clock.clock());
        engine->setCloudClient(cloud.get());
        return engine;
    }

    void enableCloud()
    {
        cloud = std::make_unique<FakeCloud>(cloudLog);
        host.cloudId = QStringLiteral("cloud-1");
    }

    DeviceConfig config{ QStringLiteral("tv-1") };
    FakeHost host;
    std::shared_ptr<ProbeLog> probeLog = std::make_shared<ProbeLog>();
    std::shared_ptr<WolLog> wolLog = std::make_shared<WolLog>();
    std::shared_ptr<CloudLog> cloudLog = std::make_shared<CloudLog>();
    FakeProbe probe{ probeLog };
    FakeWol wol{ wolLog };
    std::unique_ptr<FakeCloud> cloud;
    EventChannel events;
    FakeStore store;
    ManualClock clock;
};

TEST_F(PowerEngineTest, LiveChannelWithoutPowerReportingIsOn)
{
    host.alive = true;
    auto engine = makeEngine();

    EXPECT_EQ(engine->refreshPowerState(), PowerState::On);

    const auto states = postedStates(drain(events));
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states.front(), PowerState::On);
}

TEST_F(PowerEngineTest, DeadChannelWithoutPowerReportingIsOff)
{
    auto engine = makeEngine();
    EXPECT_EQ(engine->refreshPowerState(), PowerState::Off);
}

TEST_F(PowerEngineTest, LegacyPowerOffHoldsOffForWholeGuardWindow)
{
    host.alive = true;
    auto engine = makeEngine();
    engine->refreshPowerState();

    EXPECT_EQ(engine->requestOff(), CommandResult::Success);
    EXPECT_EQ(host.keys, QStringList{ QStringLiteral("KEY_POWER") });
    EXPECT_EQ(engine->state(), PowerState::Off);
    ASSERT_TRUE(engine->offGuardUntil().has_value());
    EXPECT_EQ(*engine->offGuardUntil(), *clock.now + 65000);

    // The remote channel keeps answering while the panel shuts down.
    clock.advance(64000);
    EXPECT_EQ(engine->refreshPowerState(), PowerState::Off);

    clock.advance(1500);
    EXPECT_FALSE(engine->offGuardActive());
    EXPECT_EQ(engine->refreshPowerState(), PowerState::On);
}

TEST_F(PowerEngineTest, RepeatedPowerOffDuringGuardIsIgnored)
{
    host.alive = true;
    auto engine = makeEngine();
    engine->refreshPowerState();

    EXPECT_EQ(engine->requestOff(), CommandResult::Success);
    EXPECT_EQ(engine->requestOff(), CommandResult::Success);
    EXPECT_EQ(host.keys.size(), 1);
}

TEST_F(PowerEngineTest, PowerOffWhileUnreachableStillSetsGuard)
{
    auto engine = makeEngine();

    EXPECT_EQ(engine->requestOff(), CommandResult::NotDelivered);
    EXPECT_EQ(engine->state(), PowerState::Off);
    EXPECT_TRUE(engine->offGuardActive());
}

TEST_F(PowerEngineTest, ArtModePowerOffGoesToStandby)
{
    config.supportsArtMode = true;
    config.reportsPowerState = true;
    host.alive = true;
    probeLog->queue.push_back(probeReport(PowerIndicator::On));
    auto engine = makeEngine();
    engine->refreshPowerState();

    EXPECT_EQ(engine->requestOff(), CommandResult::Success);
    EXPECT_EQ(engine->state(), PowerState::Standby);
    ASSERT_TRUE(engine->offGuardUntil().has_value());
    EXPECT_EQ(*engine->offGuardUntil(), *clock.now + 5000);
    EXPECT_EQ(host.keys.size(), 1);

    // A lagging ON report inside the window does not flip the state back.
    clock.advance(3000);
    probeLog->queue.push_back(probeReport(PowerIndicator::On));
    EXPECT_EQ(engine->refreshPowerState(), PowerState::Standby);

    clock.advance(3000);
    probeLog->queue.push_back(probeReport(PowerIndicator::Standby));
    EXPECT_EQ(engine->refreshPowerState(), PowerState::Standby);
}

TEST_F(PowerEngineTest, StandbyReportedByProbeIsStandby)
{
    config.reportsPowerState = true;
    host.alive = true;
    probeLog->queue.push_back(probeReport(PowerIndicator::Standby));
    auto engine = makeEngine();

    EXPECT_EQ(engine->refreshPowerState(), PowerState::Standby);
}

TEST_F(PowerEngineTest, FailedProbeMeansOff)
{
    config.reportsPowerState = true;
    host.alive = true;
    auto engine = makeEngine();

    EXPECT_EQ(engine->refreshPowerState(), PowerState::Off);
}

TEST_F(PowerEngineTest, PowerOnFromStandbySendsSingleKey)
{
    config.supportsArtMode = true;
    config.reportsPowerState = true;
    config.macAddress = kMac;
    host.alive = true;
    probeLog->queue.push_back(probeReport(PowerIndicator::Standby));
    auto engine = makeEngine();
    engine->refreshPowerState();

    EXPECT_EQ(engine->requestOn(), CommandResult::Success);
    EXPECT_EQ(host.keys, QStringList{ QStringLiteral("KEY_POWER") });
    EXPECT_EQ(engine->state(), PowerState::On);
    EXPECT_TRUE(wolLog->packets.isEmpty());
    EXPECT_FALSE(engine->wakeInProgress());
}

TEST_F(PowerEngineTest, PowerOnDuringWakeIsIgnored)
{
    config.macAddress = kMac;
    auto engine = makeEngine();
    engine->refreshPowerState();

    EXPECT_EQ(engine->requestOn(), CommandResult::Success);
    EXPECT_EQ(engine->state(), PowerState::On);
    EXPECT_TRUE(engine->onGuardActive());
    EXPECT_TRUE(engine->wakeInProgress());
    EXPECT_EQ(wolLog->packets.size(), 1);

    EXPECT_EQ(engine->requestOn(), CommandResult::Success);
    EXPECT_EQ(engine->toggle(true), CommandResult::Success);
    EXPECT_EQ(engine->requestOff(), CommandResult::Success);
    EXPECT_EQ(wolLog->packets.size(), 1);
    EXPECT_TRUE(host.keys.isEmpty());

    engine->cancelWake();
}

TEST_F(PowerEngineTest, WakeStopsOnceTvAnswers)
{
    config.macAddress = kMac;
    host.onReconnect = [this](int count) {
        if (count == 3)
            host.alive = true;
    };
    auto engine = makeEngine();
    engine->refreshPowerState();
    drain(events);

    EXPECT_EQ(engine->requestOn(), CommandResult::Success);
    ASSERT_TRUE(waitUntil([&]() { return !engine->wakeInProgress(); }));

    EXPECT_EQ(wolLog->packets.size(), 3);
    for (const QString &mac : std::as_const(wolLog->packets))
        EXPECT_EQ(mac, kMac);
    EXPECT_EQ(engine->state(), PowerState::On);
    EXPECT_FALSE(engine->onGuardActive());

    const auto states = postedStates(drain(events));
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.back(), PowerState::On);
}

TEST_F(PowerEngineTest, WakeGivesUpAfterEightAttempts)
{
    config.macAddress = kMac;
    auto engine = makeEngine();
    engine->refreshPowerState();

    EXPECT_EQ(engine->requestOn(), CommandResult::Success);
    ASSERT_TRUE(waitUntil([&]() { return !engine->wakeInProgress(); }, 3000));

    EXPECT_EQ(wolLog->packets.size(), 8);
    EXPECT_EQ(host.reconnects, 8);
    EXPECT_FALSE(engine->onGuardActive());
    EXPECT_EQ(engine->state(), PowerState::Off);
}

TEST_F(PowerEngineTest, PowerOnWithoutMacFails)
{
    auto engine = makeEngine();
    engine->refreshPowerState();

    EXPECT_EQ(engine->requestOn(), CommandResult::Failure);
    EXPECT_EQ(engine->state(), PowerState::Off);
    EXPECT_TRUE(wolLog->packets.isEmpty());
    EXPECT_FALSE(engine->onGuardActive());
    EXPECT_FALSE(engine->wakeInProgress());
}

TEST_F(PowerEngineTest, PowerOnWithoutMacUsesCloudWake)
{
    enableCloud();
    config.supportsCloudWake = true;
    auto engine = makeEngine();
    engine->refreshPowerState();

    EXPECT_EQ(engine->requestOn(), CommandResult::Success);
    ASSERT_TRUE(waitUntil([&]() { return cloudLog->wakeCalls == 1; }));
    EXPECT_TRUE(wolLog->packets.isEmpty());

    engine->cancelWake();
}

TEST_F(PowerEngineTest, PowerOnDuringPowerOffCancelsIt)
{
    config.macAddress = kMac;
    host.alive = true;
    auto engine = makeEngine();
    engine->refreshPowerState();

    EXPECT_EQ(engine->requestOff(), CommandResult::Success);
    EXPECT_EQ(engine->requestOn(), CommandResult::Success);

    EXPECT_EQ(host.keys, QStringList({ QStringLiteral("KEY_POWER"), QStringLiteral("KEY_POWER") }));
    EXPECT_FALSE(engine->offGuardActive());
    EXPECT_TRUE(engine->onGuardActive());
    EXPECT_EQ(engine->state(), PowerState::On);
    EXPECT_EQ(wolLog->packets.size(), 1);

    engine->cancelWake();
}

TEST_F(PowerEngineTest, ToggleWithoutTargetFollowsCurrentState)
{
    host.alive = true;
    auto engine = makeEngine();

    EXPECT_EQ(engine->toggle(), CommandResult::Success);
    EXPECT_EQ(engine->state(), PowerState::Off);
    EXPECT_EQ(host.keys, QStringList{ QStringLiteral("KEY_POWER") });
}

TEST_F(PowerEngineTest, PollOnlyEmitsOnChange)
{
    host.alive = true;
    auto engine = makeEngine();
    engine->refreshPowerState();
    drain(events);

    EXPECT_FALSE(engine->pollPowerState());
    EXPECT_TRUE(events.isEmpty());

    host.alive = false;
    EXPECT_TRUE(engine->pollPowerState());
    const auto states = postedStates(drain(events));
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states.front(), PowerState::Off);
}

TEST_F(PowerEngineTest, ProbeFillsMissingCapabilities)
{
    config.reportsPowerState = true;
    ProbeResult report = probeReport(PowerIndicator::On);
    report.macAddress = QStringLiteral("A0:B1:C2:D3:E4:F5");
    report.artModeSupported = true;
    report.deviceUuid = QStringLiteral("0f1e2d3c-aaaa-bbbb-cccc-0123456789ab");
    probeLog->queue.push_back(report);
    auto engine = makeEngine();

    EXPECT_EQ(engine->refreshPowerState(), PowerState::On);
    EXPECT_EQ(config.macAddress, QStringLiteral("A0:B1:C2:D3:E4:F5"));
    EXPECT_TRUE(config.supportsArtMode);
    EXPECT_EQ(engine->deviceUuid(), report.deviceUuid);
    ASSERT_EQ(store.saved.size(), 1u);
    EXPECT_EQ(store.saved.front().macAddress, config.macAddress);
}

TEST_F(PowerEngineTest, ConfiguredMacIsNotOverwritten)
{
    config.reportsPowerState = true;
    config.macAddress = kMac;
    ProbeResult report = probeReport(PowerIndicator::On);
    report.macAddress = QStringLiteral("A0:B1:C2:D3:E4:F5");
    probeLog->queue.push_back(report);
    auto engine = makeEngine();

    engine->refreshPowerState();
    EXPECT_EQ(config.macAddress, kMac);
    EXPECT_TRUE(store.saved.empty());
}

TEST_F(PowerEngineTest, MalformedMacIsReplacedByReportedMac)
{
    config.reportsPowerState = true;
    config.macAddress = QStringLiteral("AA:BB");
    ProbeResult report = probeReport(PowerIndicator::On);
    report.macAddress = QStringLiteral("A0:B1:C2:D3:E4:F5");
    probeLog->queue.push_back(report);
    auto engine = makeEngine();

    engine->refreshPowerState();
    EXPECT_EQ(config.macAddress, QStringLiteral("A0:B1:C2:D3:E4:F5"));
    ASSERT_EQ(store.saved.size(), 1u);
}

TEST_F(PowerEngineTest, CloudPowerOffReplacesKey)
{
    enableCloud();
    host.alive = true;
    auto engine = makeEngine();
    engine->refreshPowerState();

    EXPECT_EQ(engine->requestOff(), CommandResult::Success);
    EXPECT_EQ(cloudLog->powerOffCalls, 1);
    EXPECT_TRUE(host.keys.isEmpty());
}

TEST_F(PowerEngineTest, FailedCloudPowerOffFallsBackToKey)
{
    enableCloud();
    cloudLog->commandsOk = false;
    host.alive = true;
    auto engine = makeEngine();
    engine->refreshPowerState();

    EXPECT_EQ(engine->requestOff(), CommandResult::Success);
    EXPECT_EQ(cloudLog->powerOffCalls, 1);
    EXPECT_EQ(host.keys, QStringList{ QStringLiteral("KEY_POWER") });
}

TEST_F(PowerEngineTest, ForceOffCancelsWake)
{
    config.macAddress = kMac;
    auto engine = makeEngine();
    engine->refreshPowerState();
    engine->requestOn();

    engine->forceOff();
    EXPECT_FALSE(engine->wakeInProgress());
    EXPECT_FALSE(engine->onGuardActive());
    EXPECT_EQ(engine->state(), PowerState::Off);

    spin(50);
    EXPECT_EQ(wolLog->packets.size(), 1);
}

} // namespace
