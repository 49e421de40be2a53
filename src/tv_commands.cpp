#include "tv_commands.h"

#include <algorithm>
#include <vector>

#include <QJsonArray>

#include "tv_log.h"
#include "tv_session.h"

namespace phicore::samsungtv::ipc {

namespace {

struct CommandEntry {
    const char *id;
    const char *key;
    int holdMs;
};

const std::vector<CommandEntry> &commandTable()
{
    static const std::vector<CommandEntry> table = {
        { "standby", "KEY_POWER", 2000 },
        { "force_power", "KEY_POWER", 0 },
        { "volume_up", "KEY_VOLUP", 0 },
        { "volume_down", "KEY_VOLDOWN", 0 },
        { "mute_toggle", "KEY_MUTE", 0 },
        { "channel_up", "KEY_CHUP", 0 },
        { "channel_down", "KEY_CHDOWN", 0 },
        { "cursor_up", "KEY_UP", 0 },
        { "cursor_down", "KEY_DOWN", 0 },
        { "cursor_left", "KEY_LEFT", 0 },
        { "cursor_right", "KEY_RIGHT", 0 },
        { "cursor_enter", "KEY_ENTER", 0 },
        { "digit_0", "KEY_0", 0 },
        { "digit_1", "KEY_1", 0 },
        { "digit_2", "KEY_2", 0 },
        { "digit_3", "KEY_3", 0 },
        { "digit_4", "KEY_4", 0 },
        { "digit_5", "KEY_5", 0 },
        { "digit_6", "KEY_6", 0 },
        { "digit_7", "KEY_7", 0 },
        { "digit_8", "KEY_8", 0 },
        { "digit_9", "KEY_9", 0 },
        { "home", "KEY_HOME", 0 },
        { "menu", "KEY_MENU", 0 },
        { "info", "KEY_INFO", 0 },
        { "guide", "KEY_GUIDE", 0 },
        { "back", "KEY_RETURN", 0 },
        { "play_pause", "KEY_PLAY_BACK", 0 },
        { "settings", "KEY_TOOLS", 0 },
        { "function_red", "KEY_RED", 0 },
        { "function_green", "KEY_GREEN", 0 },
        { "function_yellow", "KEY_YELLOW", 0 },
        { "function_blue", "KEY_BLUE", 0 },
        { "exit", "KEY_EXIT", 0 },
        { "ch_list", "KEY_CH_LIST", 0 },
    };
    return table;
}

int repeatCount(const QJsonObject &params)
{
    const QJsonValue value = params.value(QStringLiteral("repeat"));
    int repeat = 1;
    if (value.isDouble())
        repeat = value.toInt(1);
    else if (value.isString())
        repeat = value.toString().toInt();
    return std::clamp(repeat, 1, 20);
}

} // namespace

std::optional<RemoteKey> keyForCommand(const QString &commandId)
{
    const QString id = commandId.trimmed().toLower();
    for (const CommandEntry &entry : commandTable()) {
        if (id == QLatin1String(entry.id))
            return RemoteKey{ QString::fromLatin1(entry.key), entry.holdMs };
    }
    return std::nullopt;
}

QStringList supportedCommands()
{
    QStringList out = {
        QStringLiteral("on"),
        QStringLiteral("off"),
        QStringLiteral("toggle"),
        QStringLiteral("select_source"),
        QStringLiteral("art_mode_on"),
        QStringLiteral("art_mode_off"),
        QStringLiteral("art_info"),
        QStringLiteral("device_info"),
    };
    for (const CommandEntry &entry : commandTable())
        out.append(QString::fromLatin1(entry.id));
    return out;
}

CommandResult executeCommand(DeviceSession &session, const QString &commandId, const QJsonObject &params)
{
    const QString id = commandId.trimmed().toLower();
    if (id == QLatin1String("on"))
        return session.turnOn();
    if (id == QLatin1String("off"))
        return session.turnOff();
    if (id == QLatin1String("toggle"))
        return session.toggle();
    if (id == QLatin1String("select_source"))
        return session.launchApp(params.value(QStringLiteral("source")).toString());
    if (id == QLatin1String("art_mode_on") || id == QLatin1String("art_mode_off"))
        return session.setArtMode(id == QLatin1String("art_mode_on"));
    if (const std::optional<QueryResult> query = executeQuery(session, id))
        return query->result;

    const std::optional<RemoteKey> key = keyForCommand(id);
    if (!key) {
        qCDebug(tvLog) << "unsupported command" << commandId;
        return CommandResult::Unsupported;
    }

    CommandResult result = CommandResult::Success;
    const int repeat = repeatCount(params);
    for (int i = 0; i < repeat; ++i) {
        result = session.sendKey(key->key, key->holdMs);
        if (result != CommandResult::Success)
            break;
    }
    return result;
}

std::optional<QueryResult> executeQuery(DeviceSession &session, const QString &commandId)
{
    const QString id = commandId.trimmed().toLower();
    QueryResult out;
    if (id == QLatin1String("device_info")) {
        const ProbeResult result = session.deviceInfo();
        out.result = result.ok ? CommandResult::Success : CommandResult::NotDelivered;
        out.info = deviceInfoJson(result);
        return out;
    }
    if (id == QLatin1String("art_info")) {
        const ArtInfo info = session.artInfo();
        out.result = info.supported ? CommandResult::Success : CommandResult::Unsupported;
        out.info = artInfoJson(info);
        return out;
    }
    return std::nullopt;
}

QJsonObject deviceInfoJson(const ProbeResult &result)
{
    QJsonObject out;
    out.insert(QStringLiteral("reachable"), result.ok);
    if (!result.ok) {
        out.insert(QStringLiteral("error"), result.error);
        return out;
    }
    out.insert(QStringLiteral("powerState"), QString::fromLatin1(powerIndicatorName(result.power)));
    out.insert(QStringLiteral("artModeSupported"), result.artModeSupported);
    if (!result.modelName.isEmpty())
        out.insert(QStringLiteral("model"), result.modelName);
    if (!result.macAddress.isEmpty())
        out.insert(QStringLiteral("macAddress"), result.macAddress);
    if (!result.deviceUuid.isEmpty())
        out.insert(QStringLiteral("uuid"), result.deviceUuid);
    out.insert(QStringLiteral("capabilities"), QJsonArray::fromStringList(result.capabilities));
    return out;
}

QJsonObject artInfoJson(const ArtInfo &info)
{
    QJsonObject out;
    out.insert(QStringLiteral("supported"), info.supported);
    if (info.artModeOn)
        out.insert(QStringLiteral("artMode"), *info.artModeOn ? QStringLiteral("on") : QStringLiteral("off"));
    return out;
}

} // namespace phicore::samsungtv::ipc
