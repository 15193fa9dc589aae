#pragma once

#include <memory>
#include <vector>

#include <QList>
#include <QString>

#include "petkit_api.h"
#include "petkit_binder.h"
#include "petkit_config.h"
#include "petkit_coordinator.h"
#include "petkit_registry.h"
#include "petkit_session.h"
#include "petkit_store.h"

namespace phicore::petkit::ipc {

// Everything one adapter instance owns: the shared device registry, the
// entity binder and a session plus coordinator per account. Created at
// bootstrap, destroyed at shutdown.
class ApplicationContext
{
public:
    ApplicationContext(HttpTransport *transport, KeyValueStore *store);
    ~ApplicationContext();

    ApplicationContext(const ApplicationContext &) = delete;
    ApplicationContext &operator=(const ApplicationContext &) = delete;

    // Loads or creates the session, runs the first refresh and starts the
    // timer. Nothing is kept when authentication fails.
    bool addAccount(const AccountConfig &config, QString *error = nullptr);
    int setup(const QList<AccountConfig> &configs);

    void stop();
    void refreshAll();

    DeviceRegistry &registry() { return m_registry; }
    EntityBinder &binder() { return m_binder; }
    const ApiClient &api() const { return m_api; }

    QList<PollingCoordinator *> coordinators() const;
    PollingCoordinator *coordinator(const QString &name) const;
    SessionManager *session(const QString &accountId) const;

    // True when the last tick of every account fetched a roster.
    bool isHealthy() const;

private:
    struct Account {
        std::unique_ptr<SessionManager> session;
        std::unique_ptr<PollingCoordinator> coordinator;
    };

    ApiClient m_api;
    KeyValueStore *m_store = nullptr;
    TickGate m_gate;
    DeviceRegistry m_registry;
    EntityBinder m_binder;
    std::vector<Account> m_accounts;
};

} // namespace phicore::petkit::ipc
