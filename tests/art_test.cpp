#include <QJsonDocument>
#include <QJsonObject>

#include <gtest/gtest.h>

#include "tv_art.h"

using namespace phicore::samsungtv::ipc;

namespace {

QJsonObject parse(const QByteArray &json)
{
    return QJsonDocument::fromJson(json).object();
}

TEST(ArtMessageTest, SetArtModeRequestIsEmbeddedAsString)
{
    const QJsonObject message = parse(buildArtRequest(setArtModeRequest(true, QStringLiteral("req-1"))));

    EXPECT_EQ(message.value(QStringLiteral("method")).toString(), QStringLiteral("ms.channel.emit"));
    const QJsonObject params = message.value(QStringLiteral("params")).toObject();
    EXPECT_EQ(params.value(QStringLiteral("event")).toString(), QStringLiteral("art_app_request"));
    EXPECT_EQ(params.value(QStringLiteral("to")).toString(), QStringLiteral("host"));
    ASSERT_TRUE(params.value(QStringLiteral("data")).isString());

    const QJsonObject data = parse(params.value(QStringLiteral("data")).toString().toUtf8());
    EXPECT_EQ(data.value(QStringLiteral("request")).toString(), QStringLiteral("set_artmode_status"));
    EXPECT_EQ(data.value(QStringLiteral("value")).toString(), QStringLiteral("on"));
    EXPECT_EQ(data.value(QStringLiteral("id")).toString(), QStringLiteral("req-1"));
}

TEST(ArtMessageTest, GetArtModeRequest)
{
    const QJsonObject request = getArtModeRequest(QStringLiteral("req-2"));
    EXPECT_EQ(request.value(QStringLiteral("request")).toString(), QStringLiteral("get_artmode_status"));
    EXPECT_FALSE(request.contains(QStringLiteral("value")));
}

TEST(ArtStatusTest, ParsesStatusReply)
{
    const QJsonObject reply = parse(R"({"event":"d2d_service_message",
        "data":"{\"id\":\"req-2\",\"event\":\"artmode_status\",\"value\":\"off\"}"})");
    const std::optional<bool> status = parseArtModeStatus(reply);
    ASSERT_TRUE(status.has_value());
    EXPECT_FALSE(*status);
}

TEST(ArtStatusTest, ParsesChangeNotification)
{
    const QJsonObject change = parse(R"({"event":"d2d_service_message",
        "data":"{\"event\":\"art_mode_changed\",\"status\":\"on\"}"})");
    EXPECT_EQ(parseArtModeStatus(change), std::optional<bool>(true));
}

TEST(ArtStatusTest, IgnoresOtherMessages)
{
    EXPECT_FALSE(parseArtModeStatus(parse(R"({"event":"ms.channel.ready"})")).has_value());
    EXPECT_FALSE(parseArtModeStatus(parse(R"({"event":"d2d_service_message",
        "data":"{\"event\":\"current_artwork\",\"content_id\":\"MY_F0001\"}"})")).has_value());
    EXPECT_FALSE(parseArtModeStatus(parse(R"({"event":"d2d_service_message",
        "data":"{\"event\":\"artmode_status\",\"value\":\"pending\"}"})")).has_value());
}

} // namespace
