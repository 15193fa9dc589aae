#include "petkit_coordinator.h"

#include <utility>

#include <QJsonArray>
#include <QJsonDocument>

#include "petkit_log.h"

namespace phicore::petkit::ipc {

PollingCoordinator::PollingCoordinator(SessionManager *session,
                                       DeviceRegistry *registry,
                                       EntityBinder *binder,
                                       TickGate *gate)
    : m_session(session)
    , m_registry(registry)
    , m_binder(binder)
    , m_gate(gate)
    , m_intervalMs(session ? session->config().pollIntervalMs : kDefaultPollIntervalMs)
{
    m_timer.setSingleShot(true);
    QObject::connect(&m_timer, &QTimer::timeout, &m_timer, [this]() { onTimeout(); });
}

PollingCoordinator::~PollingCoordinator()
{
    stop();
}

QString PollingCoordinator::name() const
{
    const QString uid = m_session ? m_session->config().accountId() : QString();
    return QStringLiteral("petkit-%1-devices").arg(uid);
}

void PollingCoordinator::setIntervalMs(int intervalMs)
{
    m_intervalMs = intervalMs > 0 ? intervalMs : kDefaultPollIntervalMs;
}

void PollingCoordinator::start()
{
    if (m_running)
        return;
    m_running = true;
    refresh();
    scheduleNext();
}

void PollingCoordinator::stop()
{
    m_running = false;
    m_timer.stop();
}

void PollingCoordinator::scheduleNext()
{
    if (m_running)
        m_timer.start(m_intervalMs);
}

void PollingCoordinator::onTimeout()
{
    const TickReport report = refresh();
    if (report.deferred && m_running)
        m_timer.start(kDeferredTickMs);
    else
        scheduleNext();
}

QJsonArray PollingCoordinator::fetchRoster(TickReport *report)
{
    m_state = TickState::Fetching;
    ApiResult rsp = m_session->request(QString::fromLatin1(kRosterApi));

    if (rsp.isSessionExpired()) {
        m_state = TickState::AuthRetry;
        qCInfo(petkitLog) << "Petkit session expired for" << m_session->config().username << ", logging in again";
        const LoginResult login = m_session->login();
        if (login.ok) {
            report->reauthenticated = true;
            rsp = m_session->request(QString::fromLatin1(kRosterApi));
        }
    }

    report->fetched = rsp.ok && rsp.errorCode() == 0;
    if (!rsp.ok)
        report->error = rsp.error;
    else if (rsp.errorCode() != 0)
        report->error = rsp.errorMessage();

    const QJsonArray devices = rsp.result().value(QStringLiteral("devices")).toArray();
    if (devices.isEmpty()) {
        qCWarning(petkitLog).noquote() << "Got petkit devices for" << m_session->config().username << "failed:"
                                       << QJsonDocument(rsp.body).toJson(QJsonDocument::Compact);
    }
    return devices;
}

TickReport PollingCoordinator::refresh()
{
    TickReport report;
    if (!m_session || !m_registry) {
        report.error = QStringLiteral("Coordinator is not wired");
        return report;
    }
    if (m_state != TickState::Idle) {
        // Listeners must not trigger a refresh from inside a tick.
        qCWarning(petkitLog) << name() << "refresh requested while a tick is running";
        report.error = QStringLiteral("Tick already running");
        return report;
    }
    if (m_gate && m_gate->busy) {
        qCDebug(petkitLog) << name() << "deferred, another account is refreshing";
        report.deferred = true;
        report.error = QStringLiteral("Another account is refreshing");
        return report;
    }
    if (m_gate)
        m_gate->busy = true;

    const QJsonArray roster = fetchRoster(&report);

    m_state = TickState::Reconciling;
    QList<Device *> touched;
    for (const QJsonValue &entry : roster) {
        const QJsonObject dvc = entry.toObject();
        QJsonObject data = dvc.value(QStringLiteral("data")).toObject();
        const QString id = Device::idFromJson(data.value(QStringLiteral("id")));
        if (id.isEmpty())
            continue;
        data.insert(QStringLiteral("type"), dvc.value(QStringLiteral("type")).toString());

        bool created = false;
        Device *device = m_registry->upsert(id, data, m_session, &created);
        if (!device)
            continue;
        if (created)
            ++report.created;
        touched.append(device);
    }
    report.devices = static_cast<int>(touched.size());

    m_state = TickState::Notifying;
    if (m_binder) {
        for (Device *device : std::as_const(touched)) {
            for (EntityDomain domain : supportedDomains())
                m_binder->bind(domain, device);
        }
    }

    m_state = TickState::Idle;
    if (m_gate)
        m_gate->busy = false;
    ++m_tickCount;
    m_lastReport = report;
    return report;
}

} // namespace phicore::petkit::ipc
