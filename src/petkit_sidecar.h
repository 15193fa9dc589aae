#pragma once

#include <cstdint>
#include <memory>

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QNetworkAccessManager>
#include <QString>

#include "petkit_channels.h"
#include "petkit_config.h"
#include "petkit_context.h"
#include "petkit_http.h"
#include "petkit_store.h"
#include "phi/adapter/sdk/sidecar.h"

namespace phicore::petkit::ipc {

class PetkitSidecar final : public phicore::adapter::sdk::AdapterSidecar
{
public:
    PetkitSidecar();
    ~PetkitSidecar() override;

    void tick();

protected:
    void onConnected() override;
    void onDisconnected() override;
    void onBootstrap(const phicore::adapter::sdk::BootstrapRequest &request) override;

    phicore::adapter::v1::CmdResponse onChannelInvoke(
        const phicore::adapter::sdk::ChannelInvokeRequest &request) override;
    phicore::adapter::v1::ActionResponse onAdapterActionInvoke(
        const phicore::adapter::sdk::AdapterActionInvokeRequest &request) override;
    phicore::adapter::v1::CmdResponse onDeviceNameUpdate(
        const phicore::adapter::sdk::DeviceNameUpdateRequest &request) override;
    phicore::adapter::v1::CmdResponse onSceneInvoke(
        const phicore::adapter::sdk::SceneInvokeRequest &request) override;

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

    static std::int64_t nowMs();
    static QString channelKey(const QString &deviceExternalId, const QString &channelExternalId);

    void applyBootstrapAdapter(const phicore::adapter::v1::Adapter &adapter);
    void startContext();
    void stopContext();

    void registerEntities(const QList<Entity *> &entities);
    void publishEntityState(const Entity &entity);
    void setConnectionState(bool connected);

    ActionResponse invokeProbe(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeRefresh(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);

    CmdResponse failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const;
    CmdResponse successResponse(std::uint64_t cmdId) const;

    QNetworkAccessManager m_network;
    HttpClient m_http;

    phicore::adapter::v1::Adapter m_adapterInfo;
    QJsonObject m_meta;
    QList<AccountConfig> m_accounts;

    std::unique_ptr<JsonFileStore> m_store;
    std::unique_ptr<ApplicationContext> m_context;

    bool m_connected = false;
    bool m_hasBootstrap = false;

    QHash<QString, DeviceEntry> m_devices;
    QHash<QString, Entity *> m_entityByChannel;
};

} // namespace phicore::petkit::ipc
