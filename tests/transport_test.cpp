#include <QJsonDocument>
#include <QJsonObject>
#include <QUrlQuery>

#include <gtest/gtest.h>

#include "tv_transport.h"

using namespace phicore::samsungtv::ipc;

namespace {

QJsonObject parse(const QByteArray &json)
{
    return QJsonDocument::fromJson(json).object();
}

TEST(TransportMessageTest, KeyClick)
{
    const QJsonObject message = parse(buildKeyMessage(QStringLiteral("Click"), QStringLiteral("KEY_VOLUP")));

    EXPECT_EQ(message.value(QStringLiteral("method")).toString(), QStringLiteral("ms.remote.control"));
    const QJsonObject params = message.value(QStringLiteral("params")).toObject();
    EXPECT_EQ(params.value(QStringLiteral("Cmd")).toString(), QStringLiteral("Click"));
    EXPECT_EQ(params.value(QStringLiteral("DataOfCmd")).toString(), QStringLiteral("KEY_VOLUP"));
    EXPECT_EQ(params.value(QStringLiteral("Option")).toString(), QStringLiteral("false"));
    EXPECT_EQ(params.value(QStringLiteral("TypeOfRemote")).toString(), QStringLiteral("SendRemoteKey"));
}

TEST(TransportMessageTest, InstalledAppRequest)
{
    const QJsonObject message = parse(buildInstalledAppRequest());

    EXPECT_EQ(message.value(QStringLiteral("method")).toString(), QStringLiteral("ms.channel.emit"));
    const QJsonObject params = message.value(QStringLiteral("params")).toObject();
    EXPECT_EQ(params.value(QStringLiteral("event")).toString(), QStringLiteral("ed.installedApp.get"));
    EXPECT_EQ(params.value(QStringLiteral("to")).toString(), QStringLiteral("host"));
}

TEST(TransportMessageTest, ParsesInstalledApps)
{
    const QJsonObject event = parse(R"({
        "event": "ed.installedApp.get",
        "data": {"data": [
            {"appId": "11101200001", "app_type": 2, "name": "Netflix"},
            {"appId": "", "name": "Broken"},
            {"appId": "111299001912", "app_type": 2, "name": " YouTube "}
        ]}
    })");

    const AppList apps = parseInstalledApps(event);
    ASSERT_EQ(apps.size(), 2u);
    EXPECT_EQ(apps[0].name, QStringLiteral("Netflix"));
    EXPECT_EQ(apps[0].appId, QStringLiteral("11101200001"));
    EXPECT_EQ(apps[1].name, QStringLiteral("YouTube"));
}

TEST(TransportMessageTest, MissingAppDataGivesEmptyList)
{
    EXPECT_TRUE(parseInstalledApps(parse(R"({"event":"ed.installedApp.get"})")).empty());
}

TEST(TransportHandshakeTest, MapsChannelEvents)
{
    EXPECT_EQ(handshakeOutcome(QStringLiteral("ms.channel.connect")), TransportStatus::Ok);
    EXPECT_EQ(handshakeOutcome(QStringLiteral("ms.channel.unauthorized")), TransportStatus::Unauthorized);
    // Pairing prompt left unanswered on the TV.
    EXPECT_EQ(handshakeOutcome(QStringLiteral("ms.channel.timeOut")), TransportStatus::Unauthorized);
    EXPECT_FALSE(handshakeOutcome(QStringLiteral("ms.channel.clientConnect")).has_value());
}

TEST(TransportHandshakeTest, ChannelUrlCarriesNameAndToken)
{
    const QUrl url = channelUrl(QStringLiteral(" 192.168.1.20 "),
                                QStringLiteral("/api/v2/channels/com.samsung.art-app"),
                                QStringLiteral("12345678"));
    EXPECT_EQ(url.scheme(), QStringLiteral("wss"));
    EXPECT_EQ(url.host(), QStringLiteral("192.168.1.20"));
    EXPECT_EQ(url.port(), 8002);
    EXPECT_EQ(url.path(), QStringLiteral("/api/v2/channels/com.samsung.art-app"));

    const QUrlQuery query(url);
    EXPECT_EQ(query.queryItemValue(QStringLiteral("token")), QStringLiteral("12345678"));
    EXPECT_EQ(QByteArray::fromBase64(query.queryItemValue(QStringLiteral("name"), QUrl::FullyDecoded).toLatin1()),
              QByteArray(kRemoteClientName));

    EXPECT_FALSE(QUrlQuery(channelUrl(QStringLiteral("tv"), QStringLiteral("/x"), QString()))
                     .hasQueryItem(QStringLiteral("token")));
}

} // namespace
