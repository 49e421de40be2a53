#pragma once

#include <functional>
#include <map>
#include <memory>

#include <QObject>
#include <QString>
#include <QStringList>

#include "tv_cloud.h"
#include "tv_events.h"
#include "tv_session.h"

namespace phicore::samsungtv::ipc {

class ConfigStore;
class DeviceConfig;
class HttpRequester;

using SessionFactory =
    std::function<std::unique_ptr<DeviceSession>(DeviceConfig &, EventChannel &, ConfigStore *)>;

// Sessions talking to real TVs: WebSocket transport, REST probe, UDP
// Wake-on-LAN and, when cloud auth is configured, the SmartThings client.
// The HttpRequester must outlive every session created by the factory.
SessionFactory networkSessionFactory(HttpRequester &http,
                                     SessionSettings settings = {},
                                     CloudSettings cloudSettings = {});

// Per-process set of configured TVs, owned by the bootstrap code. One live
// session per identifier.
class DeviceRegistry : public QObject
{
    Q_OBJECT
public:
    DeviceRegistry(ConfigStore *store, SessionFactory factory, QObject *parent = nullptr);
    ~DeviceRegistry() override;

    EventChannel &events() { return m_events; }

    // Returns the existing session when the identifier is already known.
    DeviceSession *add(const DeviceConfig &config);
    bool remove(const QString &identifier);
    void closeAll();

    DeviceSession *session(const QString &identifier) const;
    DeviceConfig *config(const QString &identifier) const;
    QStringList identifiers() const;
    bool contains(const QString &identifier) const { return m_entries.count(identifier) > 0; }
    std::size_t size() const { return m_entries.size(); }

private:
    struct Entry {
        std::unique_ptr<DeviceConfig> config;
        std::unique_ptr<DeviceSession> session;
    };

    EventChannel m_events;
    ConfigStore *m_store = nullptr;
    SessionFactory m_factory;
    std::map<QString, Entry> m_entries;
};

} // namespace phicore::samsungtv::ipc
