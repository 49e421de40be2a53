#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QString>

#include "phi/adapter/sdk/sidecar.h"
#include "tv_config.h"
#include "tv_events.h"
#include "tv_http.h"
#include "tv_model.h"
#include "tv_registry.h"

namespace phicore::samsungtv::ipc {

class SamsungTvSidecar final : public phicore::adapter::sdk::AdapterSidecar
{
public:
    SamsungTvSidecar();
    ~SamsungTvSidecar() override;

    void tick();

protected:
    void onConnected() override;
    void onDisconnected() override;
    void onBootstrap(const phicore::adapter::sdk::BootstrapRequest &request) override;

    phicore::adapter::v1::CmdResponse onChannelInvoke(
        const phicore::adapter::sdk::ChannelInvokeRequest &request) override;
    phicore::adapter::v1::ActionResponse onAdapterActionInvoke(
        const phicore::adapter::sdk::AdapterActionInvokeRequest &request) override;

    phicore::adapter::v1::Utf8String displayName() const override;
    phicore::adapter::v1::Utf8String description() const override;
    phicore::adapter::v1::Utf8String iconSvg() const override;
    phicore::adapter::v1::Utf8String apiVersion() const override;
    int timeoutMs() const override;
    phicore::adapter::v1::AdapterCapabilities capabilities() const override;
    phicore::adapter::v1::JsonText configSchemaJson() const override;

private:
    using CmdResponse = phicore::adapter::v1::CmdResponse;
    using ActionResponse = phicore::adapter::v1::ActionResponse;
    using CmdStatus = phicore::adapter::v1::CmdStatus;

    // Write-through of DeviceConfig changes as adapter meta patches.
    class HostConfigStore final : public ConfigStore
    {
    public:
        explicit HostConfigStore(SamsungTvSidecar &owner) : m_owner(owner) {}
        bool updateConfig(const DeviceConfig &config, QString *error = nullptr) override;

    private:
        SamsungTvSidecar &m_owner;
    };

    static std::int64_t nowMs();
    static CmdStatus toCmdStatus(CommandResult result);

    void applyBootstrapAdapter(const phicore::adapter::v1::Adapter &adapter);
    DeviceConfig configFromAdapter(const phicore::adapter::v1::Adapter &adapter) const;
    DeviceSession *session() const;

    bool persistConfig(const DeviceConfig &config, QString *error);
    void drainEvents();
    void handleStateChanged(const StateChanged &event);
    void publishDevice();
    void setConnectionState(bool connected);

    ActionResponse invokeProbe(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeSessionAction(const QString &actionId,
                                       const phicore::adapter::sdk::AdapterActionInvokeRequest &request);

    ActionResponse actionResponse(std::uint64_t cmdId, CommandResult result, const QString &context) const;
    CmdResponse failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const;
    CmdResponse successResponse(std::uint64_t cmdId) const;

    QNetworkAccessManager m_network;
    HttpClient m_http;
    HostConfigStore m_store;
    std::unique_ptr<DeviceRegistry> m_registry;

    phicore::adapter::v1::Adapter m_adapterInfo;
    QJsonObject m_meta;
    QString m_deviceId;
    DeviceEntry m_entry;
    std::optional<bool> m_lastPowerValue;

    bool m_hasBootstrap = false;
    bool m_connectPending = false;
    bool m_connected = false;
};

} // namespace phicore::samsungtv::ipc
