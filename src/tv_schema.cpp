#include "tv_schema.h"

#include <vector>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace phicore::samsungtv::ipc {

namespace {

enum class FieldFlag { None, Required, Secret };

struct FieldSpec {
    const char *key;
    const char *type;
    const char *label;
    const char *description;
    QJsonValue defaultValue;
    FieldFlag flag = FieldFlag::None;
};

const std::vector<FieldSpec> &connectionSpecs()
{
    static const std::vector<FieldSpec> specs{
        { "host", "Hostname", "TV address", "IP address or hostname of the TV.", QJsonValue(), FieldFlag::Required },
        { "macAddress", "String", "MAC address",
          "Needed for Wake-on-LAN. Filled in from the TV when left empty.", QJsonValue() },
        { "token", "Password", "Pairing token",
          "Issued by the TV after the pairing prompt was accepted.", QJsonValue(), FieldFlag::Secret },
        { "reportsPowerState", "Boolean", "TV reports power state",
          "Use the REST power indicator instead of the connection state.", QJsonValue(false) },
        { "supportsArtMode", "Boolean", "Art mode",
          "Power off enters standby (art mode) instead of off.", QJsonValue(false) },
        { "pollIntervalMs", "Integer", "Poll interval",
          "Power state refresh interval, 0 disables polling.", QJsonValue(10000) },
        { "probeTimeoutMs", "Integer", "Probe timeout", "Timeout of the REST status query.", QJsonValue(2000) },
    };
    return specs;
}

const std::vector<FieldSpec> &cloudSpecs()
{
    static const std::vector<FieldSpec> specs{
        { "cloudAccessToken", "Password", "SmartThings access token",
          "Optional. Enables cloud power-on and input switching.", QJsonValue(), FieldFlag::Secret },
        { "cloudRefreshToken", "Password", "SmartThings refresh token",
          "Used to renew the access token.", QJsonValue(), FieldFlag::Secret },
        { "cloudRefreshUrl", "String", "Token refresh endpoint",
          "URL that exchanges the refresh token for a new access token.", QJsonValue() },
    };
    return specs;
}

QJsonObject toField(const FieldSpec &spec)
{
    QJsonObject out{
        { QStringLiteral("key"), QLatin1String(spec.key) },
        { QStringLiteral("type"), QLatin1String(spec.type) },
        { QStringLiteral("label"), QLatin1String(spec.label) },
        { QStringLiteral("description"), QLatin1String(spec.description) },
    };
    if (!spec.defaultValue.isNull())
        out.insert(QStringLiteral("default"), spec.defaultValue);
    if (spec.flag == FieldFlag::Required)
        out.insert(QStringLiteral("flags"), QJsonArray{ QStringLiteral("Required") });
    else if (spec.flag == FieldFlag::Secret)
        out.insert(QStringLiteral("flags"), QJsonArray{ QStringLiteral("Secret") });
    return out;
}

void appendFields(QJsonArray &fields, const std::vector<FieldSpec> &specs)
{
    for (const FieldSpec &spec : specs)
        fields.append(toField(spec));
}

// Two columns from md upwards, label left of the control.
QJsonObject formLayout()
{
    const QJsonObject span{
        { QStringLiteral("xs"), 24 }, { QStringLiteral("sm"), 24 }, { QStringLiteral("md"), 12 },
        { QStringLiteral("lg"), 12 }, { QStringLiteral("xl"), 12 }, { QStringLiteral("xxl"), 12 },
    };
    const QJsonObject defaults{
        { QStringLiteral("span"), span },
        { QStringLiteral("labelPosition"), QStringLiteral("Left") },
        { QStringLiteral("labelSpan"), 8 },
        { QStringLiteral("controlSpan"), 16 },
        { QStringLiteral("actionPosition"), QStringLiteral("Inline") },
        { QStringLiteral("actionSpan"), 6 },
    };
    return QJsonObject{
        { QStringLiteral("gridUnits"), 24 },
        { QStringLiteral("gutter"), QJsonArray{ 12, 8 } },
        { QStringLiteral("defaults"), defaults },
    };
}

QJsonObject section(const QString &description, const QJsonArray &fields)
{
    return QJsonObject{
        { QStringLiteral("title"), QStringLiteral("Samsung TV") },
        { QStringLiteral("description"), description },
        { QStringLiteral("layout"), formLayout() },
        { QStringLiteral("fields"), fields },
    };
}

} // namespace

phicore::adapter::v1::Utf8String displayName()
{
    return "Samsung TV";
}

phicore::adapter::v1::Utf8String description()
{
    return "Power and remote control for Samsung smart TVs";
}

phicore::adapter::v1::Utf8String iconSvg()
{
    return
        "<svg width=\"24\" height=\"24\" viewBox=\"0 0 24 24\" xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"TV\">"
        "<rect x=\"2\" y=\"4\" width=\"20\" height=\"13\" rx=\"1.5\" fill=\"none\" stroke=\"#1428A0\" stroke-width=\"1.8\"/>"
        "<path d=\"M8 20h8\" stroke=\"#1428A0\" stroke-width=\"1.8\" stroke-linecap=\"round\"/>"
        "</svg>";
}

phicore::adapter::v1::AdapterCapabilities capabilities()
{
    namespace v1 = phicore::adapter::v1;

    v1::AdapterCapabilities caps;
    caps.required = v1::AdapterRequirement::Host;
    caps.optional = v1::AdapterRequirement::AppKey;
    caps.flags = v1::AdapterFlag::SupportsProbe
        | v1::AdapterFlag::RequiresPolling;

    v1::AdapterActionDescriptor probe;
    probe.id = "probe";
    probe.label = "Test connection";
    probe.description = "Query the TV status endpoint";
    probe.metaJson = R"({"placement":"card","kind":"command","requiresAck":true})";
    caps.factoryActions.push_back(probe);

    v1::AdapterActionDescriptor toggle;
    toggle.id = "togglePower";
    toggle.label = "Toggle power";
    toggle.description = "Turn the TV on or off depending on its current state.";
    toggle.metaJson = R"({"placement":"card","kind":"command","requiresAck":true})";
    caps.instanceActions.push_back(toggle);

    v1::AdapterActionDescriptor sendKey;
    sendKey.id = "sendKey";
    sendKey.label = "Send key";
    sendKey.description = "Send a remote-control key, e.g. KEY_HOME.";
    sendKey.metaJson = R"({"placement":"card","kind":"command","params":["key","holdMs"]})";
    caps.instanceActions.push_back(sendKey);

    v1::AdapterActionDescriptor launchApp;
    launchApp.id = "launchApp";
    launchApp.label = "Select source";
    launchApp.description = "Switch to an input or launch an installed app.";
    launchApp.metaJson = R"({"placement":"card","kind":"command","params":["source"]})";
    caps.instanceActions.push_back(launchApp);

    v1::AdapterActionDescriptor command;
    command.id = "command";
    command.label = "Remote command";
    command.description = "Run a media-player command such as volume_up, standby, art_mode_on or device_info.";
    command.metaJson = R"({"placement":"card","kind":"command","params":["command","repeat"]})";
    caps.instanceActions.push_back(command);

    caps.defaultsJson = R"({"reportsPowerState":false,"supportsArtMode":false,"pollIntervalMs":10000,"probeTimeoutMs":2000})";
    return caps;
}

phicore::adapter::v1::JsonText configSchemaJson()
{
    QJsonArray factoryFields;
    appendFields(factoryFields, connectionSpecs());

    QJsonArray instanceFields = factoryFields;
    appendFields(instanceFields, cloudSpecs());

    const QJsonObject schema{
        { QStringLiteral("factory"),
          section(QStringLiteral("Configure connection to a Samsung smart TV."), factoryFields) },
        { QStringLiteral("instance"),
          section(QStringLiteral("Connection, polling and optional SmartThings access."), instanceFields) },
    };
    return QJsonDocument(schema).toJson(QJsonDocument::Compact).toStdString();
}

} // namespace phicore::samsungtv::ipc
