#include <memory>

#include <gtest/gtest.h>

#include "fakes.h"
#include "tv_registry.h"

using namespace phicore::samsungtv::ipc;
using namespace phicore::samsungtv::ipc::fakes;

namespace {

class RegistryTest : public ::testing::Test
{
protected:
    SessionFactory factory()
    {
        return [this](DeviceConfig &config, EventChannel &events, ConfigStore *store) {
            ++sessionsCreated;
            return std::make_unique<DeviceSession>(config,
                                                   events,
                                                   store,
                                                   fakeTransportFactory(transportLog),
                                                   std::make_unique<FakeProbe>(std::make_shared<ProbeLog>()),
                                                   std::make_unique<FakeWol>(std::make_shared<WolLog>()));
        };
    }

    static DeviceConfig tv(const QString &id)
    {
        DeviceConfig config(id);
        config.address = QStringLiteral("192.168.1.40");
        return config;
    }

    std::shared_ptr<TransportLog> transportLog = std::make_shared<TransportLog>();
    FakeStore store;
    int sessionsCreated = 0;
};

TEST_F(RegistryTest, OneSessionPerIdentifier)
{
    DeviceRegistry registry(&store, factory());

    DeviceSession *first = registry.add(tv(QStringLiteral("tv-1")));
    DeviceSession *again = registry.add(tv(QStringLiteral("tv-1")));
    registry.add(tv(QStringLiteral("tv-2")));

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, again);
    EXPECT_EQ(sessionsCreated, 2);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.identifiers(), QStringList({ QStringLiteral("tv-1"), QStringLiteral("tv-2") }));
    EXPECT_EQ(registry.session(QStringLiteral("tv-2"))->config().identifier(), QStringLiteral("tv-2"));
}

TEST_F(RegistryTest, RejectsMissingIdentifier)
{
    DeviceRegistry registry(&store, factory());
    EXPECT_EQ(registry.add(DeviceConfig()), nullptr);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(RegistryTest, SessionWritesIntoOwnedConfig)
{
    transportLog->token = QStringLiteral("55555555");
    DeviceRegistry registry(&store, factory());
    DeviceSession *session = registry.add(tv(QStringLiteral("tv-1")));

    session->connectDevice();

    EXPECT_EQ(registry.config(QStringLiteral("tv-1"))->authToken, QStringLiteral("55555555"));
    ASSERT_EQ(store.saved.size(), 1u);
}

TEST_F(RegistryTest, RemoveClosesSession)
{
    DeviceRegistry registry(&store, factory());
    registry.add(tv(QStringLiteral("tv-1")))->connectDevice();
    drain(registry.events());

    EXPECT_TRUE(registry.remove(QStringLiteral("tv-1")));
    EXPECT_FALSE(registry.remove(QStringLiteral("tv-1")));

    EXPECT_FALSE(registry.contains(QStringLiteral("tv-1")));
    EXPECT_EQ(transportLog->closed, 1);
    EXPECT_EQ(countOf<Disconnected>(drain(registry.events())), 1);
}

TEST_F(RegistryTest, EventsCarryDeviceIdentifier)
{
    DeviceRegistry registry(&store, factory());
    registry.add(tv(QStringLiteral("tv-1")))->connectDevice();
    registry.add(tv(QStringLiteral("tv-2")))->connectDevice();

    QStringList seen;
    for (const DeviceEvent &event : drain(registry.events())) {
        const QString id = eventDeviceId(event);
        if (!seen.contains(id))
            seen.append(id);
    }
    EXPECT_EQ(seen, QStringList({ QStringLiteral("tv-1"), QStringLiteral("tv-2") }));
}

} // namespace
