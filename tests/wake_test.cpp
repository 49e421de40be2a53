#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "fakes.h"
#include "tv_wake.h"
#include "tv_wol.h"

using namespace phicore::samsungtv::ipc;
using namespace phicore::samsungtv::ipc::fakes;

namespace {

TEST(WakeOnLanTest, NormalizesMacAddress)
{
    EXPECT_EQ(normalizeMacAddress(QStringLiteral("aa:bb:cc:dd:ee:ff")), QStringLiteral("AABBCCDDEEFF"));
    EXPECT_EQ(normalizeMacAddress(QStringLiteral("AA-BB-CC-DD-EE-FF")), QStringLiteral("AABBCCDDEEFF"));
    EXPECT_EQ(normalizeMacAddress(QStringLiteral("aabb.ccdd.eeff")), QStringLiteral("AABBCCDDEEFF"));
    EXPECT_TRUE(normalizeMacAddress(QStringLiteral("AA:BB:CC:DD:EE")).isEmpty());
    EXPECT_TRUE(normalizeMacAddress(QStringLiteral("GG:BB:CC:DD:EE:FF")).isEmpty());
    EXPECT_TRUE(normalizeMacAddress(QString()).isEmpty());
}

TEST(WakeOnLanTest, MagicPacketLayout)
{
    const QByteArray packet = buildMagicPacket(QStringLiteral("01:23:45:67:89:AB"));
    ASSERT_EQ(packet.size(), 102);
    EXPECT_EQ(packet.left(6), QByteArray(6, char(0xFF)));

    const QByteArray mac = QByteArray::fromHex("0123456789AB");
    for (int i = 0; i < 16; ++i)
        EXPECT_EQ(packet.mid(6 + i * 6, 6), mac) << "repetition " << i;

    EXPECT_TRUE(buildMagicPacket(QStringLiteral("not-a-mac")).isEmpty());
}

class WakeSequenceTest : public ::testing::Test
{
protected:
    WakeSequenceTest() { config.macAddress = QStringLiteral("AA:BB:CC:DD:EE:FF"); }

    std::unique_ptr<WakeSequence> makeWake(int answerOnAttempt)
    {
        WakeSteps steps;
        steps.reconnect = [this]() { ++reconnects; };
        steps.probe = [this, answerOnAttempt]() {
            ++probes;
            return probes >= answerOnAttempt ? PowerState::On : PowerState::Off;
        };
        return std::make_unique<WakeSequence>(config, wol, std::move(steps), 8, 10);
    }

    void watch(WakeSequence *wake)
    {
        QObject::connect(wake, &WakeSequence::finished, [this](bool poweredOn) { results.push_back(poweredOn); });
    }

    DeviceConfig config{ QStringLiteral("tv-3") };
    std::shared_ptr<WolLog> wolLog = std::make_shared<WolLog>();
    FakeWol wol{ wolLog };
    int reconnects = 0;
    int probes = 0;
    std::vector<bool> results;
};

TEST_F(WakeSequenceTest, StopsWhenTvReportsOn)
{
    auto wake = makeWake(2);
    watch(wake.get());

    ASSERT_TRUE(wake->start());
    EXPECT_TRUE(wake->isRunning());
    ASSERT_TRUE(waitUntil([&]() { return !results.empty(); }));

    EXPECT_TRUE(results.front());
    EXPECT_EQ(wake->attempts(), 2);
    EXPECT_EQ(wolLog->packets.size(), 2);
    EXPECT_EQ(reconnects, 2);
    EXPECT_FALSE(wake->isRunning());
}

TEST_F(WakeSequenceTest, ReportsFailureAfterLastAttempt)
{
    auto wake = makeWake(100);
    watch(wake.get());

    ASSERT_TRUE(wake->start());
    ASSERT_TRUE(waitUntil([&]() { return !results.empty(); }));

    EXPECT_FALSE(results.front());
    EXPECT_EQ(wake->attempts(), 8);
    EXPECT_EQ(wolLog->packets.size(), 8);
}

TEST_F(WakeSequenceTest, CancelStopsSilently)
{
    auto wake = makeWake(100);
    watch(wake.get());

    ASSERT_TRUE(wake->start());
    wake->cancel();
    spin(60);

    EXPECT_TRUE(wake->isCancelled());
    EXPECT_FALSE(wake->isRunning());
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(wolLog->packets.size(), 1);
    EXPECT_FALSE(wake->start());
}

TEST_F(WakeSequenceTest, CannotRunWithoutMacOrCloud)
{
    config.macAddress = QStringLiteral("invalid");
    auto wake = makeWake(1);

    EXPECT_FALSE(wake->canRun());
    EXPECT_FALSE(wake->start());
    EXPECT_TRUE(wolLog->packets.isEmpty());
}

TEST_F(WakeSequenceTest, CloudWakeRunsAlongsidePackets)
{
    config.supportsCloudWake = true;
    auto cloudLog = std::make_shared<CloudLog>();
    FakeCloud cloud(cloudLog);
    auto wake = makeWake(100);
    wake->setCloudWake(&cloud, QStringLiteral("st-device"));

    ASSERT_TRUE(wake->start());
    EXPECT_EQ(wolLog->packets.size(), 1);
    ASSERT_TRUE(waitUntil([&]() { return cloudLog->wakeCalls == 1; }));
    wake->cancel();
}

TEST_F(WakeSequenceTest, CloudWakeNeedsCapability)
{
    config.macAddress.clear();
    auto cloudLog = std::make_shared<CloudLog>();
    FakeCloud cloud(cloudLog);
    auto wake = makeWake(100);
    wake->setCloudWake(&cloud, QStringLiteral("st-device"));

    EXPECT_FALSE(wake->canRun());

    config.supportsCloudWake = true;
    EXPECT_TRUE(wake->canRun());
}

} // namespace
