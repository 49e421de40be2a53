#pragma once

#include <optional>

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "tv_art.h"
#include "tv_events.h"
#include "tv_probe.h"

namespace phicore::samsungtv::ipc {

class DeviceSession;

struct RemoteKey {
    QString key;
    int holdMs = 0;
};

// Remote-control key for a media-player style command id, if it maps to one.
std::optional<RemoteKey> keyForCommand(const QString &commandId);
QStringList supportedCommands();

// Runs a command id against a session. "on", "off", "toggle" and
// "select_source" (param "source") go through the power and app paths,
// "art_mode_on"/"art_mode_off" through the art channel; the optional "repeat"
// param repeats key commands.
CommandResult executeCommand(DeviceSession &session, const QString &commandId, const QJsonObject &params = {});

struct QueryResult {
    CommandResult result = CommandResult::Failure;
    QJsonObject info;
};

// "device_info" and "art_info" answer with a JSON object. nullopt for any
// other command id.
std::optional<QueryResult> executeQuery(DeviceSession &session, const QString &commandId);

QJsonObject deviceInfoJson(const ProbeResult &result);
QJsonObject artInfoJson(const ArtInfo &info);

} // namespace phicore::samsungtv::ipc
