#include "tv_registry.h"

#include <utility>

#include "tv_art.h"
#include "tv_config.h"
#include "tv_http.h"
#include "tv_log.h"
#include "tv_probe.h"
#include "tv_transport.h"
#include "tv_wol.h"

namespace phicore::samsungtv::ipc {

SessionFactory networkSessionFactory(HttpRequester &http, SessionSettings settings, CloudSettings cloudSettings)
{
    return [&http, settings, cloudSettings](DeviceConfig &config, EventChannel &events, ConfigStore *store) {
        TransportFactory transports = [](const DeviceConfig &cfg) -> std::unique_ptr<Transport> {
            return std::make_unique<WebSocketTransport>(cfg);
        };

        std::unique_ptr<CloudClient> cloud;
        if (config.hasCloudAuth()) {
            auto smartThings = std::make_unique<SmartThingsClient>(http, config, cloudSettings);
            smartThings->setTokensUpdatedCallback([store](const DeviceConfig &updated) {
                if (!store)
                    return;
                QString error;
                if (!store->updateConfig(updated, &error)) {
                    qCWarning(tvLog).noquote() << logPrefix(updated.logId())
                                               << "failed to persist cloud tokens:" << error;
                }
            });
            cloud = std::move(smartThings);
        }

        auto session = std::make_unique<DeviceSession>(config,
                                                       events,
                                                       store,
                                                       std::move(transports),
                                                       std::make_unique<RestStatusProbe>(http, config),
                                                       std::make_unique<UdpWakeOnLanSender>(),
                                                       std::move(cloud),
                                                       settings);
        session->setArtChannelFactory([](const DeviceConfig &cfg) -> std::unique_ptr<ArtModeChannel> {
            return std::make_unique<WebSocketArtChannel>(cfg);
        });
        return session;
    };
}

DeviceRegistry::DeviceRegistry(ConfigStore *store, SessionFactory factory, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_factory(std::move(factory))
{
}

DeviceRegistry::~DeviceRegistry()
{
    m_entries.clear();
}

DeviceSession *DeviceRegistry::add(const DeviceConfig &config)
{
    const QString identifier = config.identifier();
    if (identifier.isEmpty()) {
        qCWarning(tvLog) << "refusing to register a TV without identifier";
        return nullptr;
    }

    auto existing = m_entries.find(identifier);
    if (existing != m_entries.end())
        return existing->second.session.get();

    if (!m_factory)
        return nullptr;

    Entry entry;
    entry.config = std::make_unique<DeviceConfig>(config);
    entry.session = m_factory(*entry.config, m_events, m_store);
    if (!entry.session) {
        qCWarning(tvLog).noquote() << logPrefix(config.logId()) << "could not create session";
        return nullptr;
    }

    DeviceSession *session = entry.session.get();
    m_entries.emplace(identifier, std::move(entry));
    qCDebug(tvLog).noquote() << logPrefix(config.logId()) << "registered";
    return session;
}

bool DeviceRegistry::remove(const QString &identifier)
{
    auto it = m_entries.find(identifier);
    if (it == m_entries.end())
        return false;

    // Detach first so nothing re-enters the entry while the session closes.
    Entry entry = std::move(it->second);
    m_entries.erase(it);
    if (entry.session)
        entry.session->close();
    return true;
}

void DeviceRegistry::closeAll()
{
    for (auto &[identifier, entry] : m_entries) {
        Q_UNUSED(identifier);
        if (entry.session)
            entry.session->close();
    }
}

DeviceSession *DeviceRegistry::session(const QString &identifier) const
{
    auto it = m_entries.find(identifier);
    return it == m_entries.end() ? nullptr : it->second.session.get();
}

DeviceConfig *DeviceRegistry::config(const QString &identifier) const
{
    auto it = m_entries.find(identifier);
    return it == m_entries.end() ? nullptr : it->second.config.get();
}

QStringList DeviceRegistry::identifiers() const
{
    QStringList out;
    for (const auto &entry : m_entries)
        out.append(entry.first);
    return out;
}

} // namespace phicore::samsungtv::ipc
