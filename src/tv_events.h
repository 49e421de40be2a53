#pragma once

#include <cstdint>
#include <optional>
#include <variant>

#include <QJsonObject>
#include <QObject>
#include <QQueue>
#include <QString>
#include <QStringList>

namespace phicore::samsungtv::ipc {

// Unknown only exists between session construction and the first probe.
enum class PowerState {
    Unknown,
    Off,
    Standby,
    On
};

PowerState displayState(PowerState state);
const char *powerStateName(PowerState state);

enum class CommandResult {
    Success,
    NotDelivered,
    Failure,
    Unsupported
};

const char *commandResultName(CommandResult result);

// Partial attributes reported by the cloud status query.
struct MediaAttributes {
    std::optional<int> volume;
    std::optional<bool> muted;
    std::optional<QString> mediaTitle;
    std::optional<QString> mediaArtist;

    bool isEmpty() const
    {
        return !volume && !muted && !mediaTitle && !mediaArtist;
    }
};

struct StateChanged {
    QString deviceId;
    PowerState powerState = PowerState::Off;
    std::optional<QStringList> sourceList;
    std::optional<QString> activeSource;
    MediaAttributes media;
};

struct Connected {
    QString deviceId;
};

struct Disconnected {
    QString deviceId;
};

struct ConnectionError {
    QString deviceId;
    QString message;
};

using DeviceEvent = std::variant<StateChanged, Connected, Disconnected, ConnectionError>;

QString eventDeviceId(const DeviceEvent &event);

// Folds a state change into the device attribute object published to the
// host (powerState, sourceList, activeSource, volume, muted, mediaTitle,
// mediaArtist). Returns true when an attribute changed.
bool mergeStateIntoMeta(QJsonObject *meta, const StateChanged &event);

// FIFO of typed device events. Producers post, the bridge drains on its own
// schedule; ordering is preserved per producer.
class EventChannel : public QObject
{
    Q_OBJECT
public:
    explicit EventChannel(QObject *parent = nullptr);

    void post(DeviceEvent event);
    std::optional<DeviceEvent> take();

    bool isEmpty() const { return m_queue.isEmpty(); }
    qsizetype size() const { return m_queue.size(); }
    void clear();

signals:
    void eventPosted();

private:
    QQueue<DeviceEvent> m_queue;
};

} // namespace phicore::samsungtv::ipc
