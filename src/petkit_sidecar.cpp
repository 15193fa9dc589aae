#include "petkit_sidecar.h"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <QDateTime>
#include <QJsonDocument>
#include <QSet>

#include "petkit_schema.h"
#include "petkit_session.h"

namespace phicore::petkit::ipc {

namespace {

namespace v1 = phicore::adapter::v1;
namespace sdk = phicore::adapter::sdk;

std::optional<double> scalarAsAmount(const v1::ScalarValue &value)
{
    if (const auto *b = std::get_if<bool>(&value))
        return *b ? 1.0 : 0.0;
    if (const auto *i = std::get_if<std::int64_t>(&value))
        return static_cast<double>(*i);
    if (const auto *d = std::get_if<double>(&value))
        return *d;
    if (const auto *s = std::get_if<std::string>(&value)) {
        const QString text = QString::fromStdString(*s).trimmed().toLower();
        if (text == QLatin1String("true") || text == QLatin1String("on"))
            return 1.0;
        if (text == QLatin1String("false") || text == QLatin1String("off"))
            return 0.0;
        bool ok = false;
        const double amount = text.toDouble(&ok);
        if (ok)
            return amount;
    }
    return std::nullopt;
}

} // namespace

PetkitSidecar::PetkitSidecar()
    : m_http(&m_network)
{
}

PetkitSidecar::~PetkitSidecar()
{
    stopContext();
}

void PetkitSidecar::tick()
{
    if (!m_hasBootstrap || !m_context)
        return;

    // Polling itself runs on the coordinator timers; only the link state is
    // mirrored here.
    setConnectionState(m_context->isHealthy());
}

void PetkitSidecar::onConnected()
{
    std::cerr << "petkit-ipc connected" << '\n';
}

void PetkitSidecar::onDisconnected()
{
    setConnectionState(false);
    std::cerr << "petkit-ipc disconnected" << '\n';
}

void PetkitSidecar::onBootstrap(const sdk::BootstrapRequest &request)
{
    AdapterSidecar::onBootstrap(request);
    applyBootstrapAdapter(request.adapter);
    m_hasBootstrap = true;

    std::cerr << "petkit-ipc bootstrap adapterId=" << request.adapterId
              << " externalId=" << request.adapter.externalId
              << " accounts=" << m_accounts.size()
              << '\n';

    startContext();
}

phicore::adapter::v1::CmdResponse PetkitSidecar::onChannelInvoke(const sdk::ChannelInvokeRequest &request)
{
    if (!m_hasBootstrap || !m_context)
        return failureResponse(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not bootstrapped"));

    const QString deviceExternalId = QString::fromStdString(request.deviceExternalId);
    const QString channelExternalId = QString::fromStdString(request.channelExternalId);

    Entity *entity = m_entityByChannel.value(channelKey(deviceExternalId, channelExternalId), nullptr);
    if (!entity)
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Unknown Petkit channel"));

    auto *toggle = dynamic_cast<SwitchEntity *>(entity);
    if (!toggle)
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Channel is read-only"));

    double amount = 1.0;
    if (request.hasScalarValue) {
        const auto requested = scalarAsAmount(request.value);
        if (!requested.has_value())
            return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Unsupported value"));
        if (std::isfinite(*requested) && *requested <= 0.0)
            return failureResponse(request.cmdId, CmdStatus::NotImplemented, QStringLiteral("Feeding cannot be stopped"));
        if (!Device::isValidFeedAmount(*requested))
            return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Feed amount out of range"));
        amount = *requested;
    }

    QVariantMap params;
    params.insert(QStringLiteral("amount"), amount);
    const ApiResult rsp = toggle->turnOn(params);
    if (!rsp.ok) {
        const QString error = rsp.error.isEmpty() ? QStringLiteral("Feed command could not be sent") : rsp.error;
        return failureResponse(request.cmdId, CmdStatus::TemporarilyOffline, error);
    }
    if (rsp.errorCode() != 0)
        return failureResponse(request.cmdId, CmdStatus::Failure, rsp.errorMessage());

    CmdResponse resp = successResponse(request.cmdId);
    if (request.hasScalarValue)
        resp.finalValue = request.value;
    return resp;
}

phicore::adapter::v1::ActionResponse PetkitSidecar::onAdapterActionInvoke(const sdk::AdapterActionInvokeRequest &request)
{
    const QString actionId = QString::fromStdString(request.actionId);
    if (actionId == QLatin1String(kActionProbe))
        return invokeProbe(request);
    if (actionId == QLatin1String(kActionRefresh))
        return invokeRefresh(request);

    ActionResponse resp;
    resp.id = request.cmdId;
    resp.status = CmdStatus::NotImplemented;
    resp.error = "Unsupported adapter action";
    resp.tsMs = nowMs();
    return resp;
}

phicore::adapter::v1::CmdResponse PetkitSidecar::onDeviceNameUpdate(const sdk::DeviceNameUpdateRequest &request)
{
    return failureResponse(request.cmdId, CmdStatus::NotImplemented, QStringLiteral("Petkit devices cannot be renamed"));
}

phicore::adapter::v1::CmdResponse PetkitSidecar::onSceneInvoke(const sdk::SceneInvokeRequest &request)
{
    return failureResponse(request.cmdId, CmdStatus::NotImplemented, QStringLiteral("Petkit has no scenes"));
}

phicore::adapter::v1::Utf8String PetkitSidecar::displayName() const
{
    return phicore::petkit::ipc::displayName();
}

phicore::adapter::v1::Utf8String PetkitSidecar::description() const
{
    return phicore::petkit::ipc::description();
}

phicore::adapter::v1::Utf8String PetkitSidecar::iconSvg() const
{
    return phicore::petkit::ipc::iconSvg();
}

phicore::adapter::v1::Utf8String PetkitSidecar::apiVersion() const
{
    return "1.0.0";
}

int PetkitSidecar::timeoutMs() const
{
    return 30000;
}

phicore::adapter::v1::AdapterCapabilities PetkitSidecar::capabilities() const
{
    return phicore::petkit::ipc::capabilities();
}

phicore::adapter::v1::JsonText PetkitSidecar::configSchemaJson() const
{
    return phicore::petkit::ipc::configSchemaJson();
}

std::int64_t PetkitSidecar::nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

QString PetkitSidecar::channelKey(const QString &deviceExternalId, const QString &channelExternalId)
{
    return deviceExternalId + QLatin1Char('|') + channelExternalId;
}

void PetkitSidecar::applyBootstrapAdapter(const v1::Adapter &adapter)
{
    m_adapterInfo = adapter;

    m_meta = QJsonObject{};
    const QByteArray metaBytes = QByteArray::fromStdString(adapter.metaJson);
    if (!metaBytes.trimmed().isEmpty()) {
        const QJsonDocument metaDoc = QJsonDocument::fromJson(metaBytes);
        if (metaDoc.isObject())
            m_meta = metaDoc.object();
    }

    m_accounts = parseAccountConfigs(m_meta);
}

void PetkitSidecar::startContext()
{
    stopContext();

    m_store = std::make_unique<JsonFileStore>(storageDirectory(m_meta));
    m_context = std::make_unique<ApplicationContext>(&m_http, m_store.get());
    for (EntityDomain domain : supportedDomains()) {
        m_context->binder().setRegistrationHandler(domain, [this](const QList<Entity *> &entities) {
            registerEntities(entities);
        });
    }

    const int started = m_context->setup(m_accounts);
    std::cerr << "petkit-ipc started " << started << " of " << m_accounts.size() << " accounts, "
              << m_context->registry().size() << " devices" << '\n';

    setConnectionState(m_context->isHealthy());
    if (started > 0) {
        v1::Utf8String sendError;
        sendFullSyncCompleted(&sendError);
    }
}

void PetkitSidecar::stopContext()
{
    // Entities go away with the context, drop the raw pointers first.
    m_entityByChannel.clear();
    m_devices.clear();
    if (m_context)
        m_context->stop();
    m_context.reset();
    m_store.reset();
}

void PetkitSidecar::registerEntities(const QList<Entity *> &entities)
{
    QSet<QString> touched;
    for (Entity *entity : entities) {
        if (!entity || !entity->device())
            continue;
        const Device &device = *entity->device();
        const QString deviceExternalId = device.deviceKey();

        auto it = m_devices.find(deviceExternalId);
        if (it == m_devices.end()) {
            DeviceEntry entry;
            entry.device = makeSdkDevice(device);
            it = m_devices.insert(deviceExternalId, std::move(entry));
        }
        upsertChannel(&it->channels, makeChannel(*entity));
        m_entityByChannel.insert(channelKey(deviceExternalId, entity->name()), entity);
        entity->setUpdateHandler([this](const Entity &updated) { publishEntityState(updated); });
        touched.insert(deviceExternalId);
    }

    for (const QString &deviceExternalId : std::as_const(touched)) {
        const DeviceEntry &entry = m_devices.value(deviceExternalId);
        v1::Utf8String sendError;
        if (!sendDeviceUpdated(entry.device, entry.channels, &sendError))
            std::cerr << "petkit-ipc failed to send deviceUpdated(" << deviceExternalId.toStdString()
                      << "): " << sendError << '\n';
    }
}

void PetkitSidecar::publishEntityState(const Entity &entity)
{
    const auto value = channelValue(entity);
    if (!value.has_value())
        return;

    v1::Utf8String sendError;
    if (!sendChannelStateUpdated(entity.device()->deviceKey().toStdString(),
                                 entity.name().toStdString(),
                                 *value,
                                 nowMs(),
                                 &sendError)) {
        std::cerr << "petkit-ipc failed to send channelStateUpdated(" << entity.entityId().toStdString()
                  << "): " << sendError << '\n';
    }
}

void PetkitSidecar::setConnectionState(bool connected)
{
    if (m_connected == connected)
        return;
    m_connected = connected;
    v1::Utf8String error;
    if (!sendConnectionStateChanged(connected, &error)) {
        std::cerr << "petkit-ipc failed to send connectionStateChanged: " << error << '\n';
    }
}

phicore::adapter::v1::ActionResponse PetkitSidecar::invokeProbe(const sdk::AdapterActionInvokeRequest &request)
{
    ActionResponse response;
    response.id = request.cmdId;
    response.tsMs = nowMs();

    QJsonObject params = m_meta;
    if (!request.paramsJson.empty()) {
        const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(request.paramsJson));
        if (doc.isObject()) {
            const QJsonObject overrides = doc.object();
            for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it)
                params.insert(it.key(), it.value());
        }
    }
    params.remove(QStringLiteral("accounts"));
    params.remove(QStringLiteral("token"));

    const QList<AccountConfig> configs = parseAccountConfigs(params);
    if (configs.isEmpty() || configs.constFirst().password.isEmpty()) {
        response.status = CmdStatus::InvalidArgument;
        response.error = "Username and password are required";
        response.resultType = v1::ActionResultType::None;
        return response;
    }

    ApiClient api(&m_http);
    SessionManager probe(configs.constFirst(), &api, nullptr);
    const LoginResult login = probe.login();
    if (!login.ok) {
        response.status = CmdStatus::Failure;
        response.error = login.error.toStdString();
        response.resultType = v1::ActionResultType::None;
        return response;
    }

    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = QStringLiteral("Logged in as user %1").arg(login.session.userId).toStdString();
    return response;
}

phicore::adapter::v1::ActionResponse PetkitSidecar::invokeRefresh(const sdk::AdapterActionInvokeRequest &request)
{
    ActionResponse response;
    response.id = request.cmdId;
    response.tsMs = nowMs();

    if (!m_context) {
        response.status = CmdStatus::TemporarilyOffline;
        response.error = "Adapter not bootstrapped";
        return response;
    }

    m_context->refreshAll();
    setConnectionState(m_context->isHealthy());

    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = QStringLiteral("%1 devices").arg(m_context->registry().size()).toStdString();
    return response;
}

phicore::adapter::v1::CmdResponse PetkitSidecar::failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = status;
    response.error = error.toStdString();
    response.tsMs = nowMs();
    return response;
}

phicore::adapter::v1::CmdResponse PetkitSidecar::successResponse(std::uint64_t cmdId) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = CmdStatus::Success;
    response.tsMs = nowMs();
    return response;
}

} // namespace phicore::petkit::ipc
