#include "petkit_context.h"

#include "petkit_log.h"

namespace phicore::petkit::ipc {

ApplicationContext::ApplicationContext(HttpTransport *transport, KeyValueStore *store)
    : m_api(transport)
    , m_store(store)
{
}

ApplicationContext::~ApplicationContext()
{
    stop();
}

bool ApplicationContext::addAccount(const AccountConfig &config, QString *error)
{
    if (!config.hasCredentials()) {
        if (error)
            *error = QStringLiteral("Account %1 has neither password nor token").arg(config.accountId());
        return false;
    }
    if (session(config.accountId())) {
        if (error)
            *error = QStringLiteral("Account %1 is configured twice").arg(config.accountId());
        return false;
    }

    Account account;
    account.session = std::make_unique<SessionManager>(config, &m_api, m_store);

    const LoginResult auth = account.session->loadOrLogin();
    if (!auth.ok) {
        qCWarning(petkitLog).noquote() << "Petkit account" << config.accountId() << "not started:" << auth.error;
        if (error)
            *error = auth.error;
        return false;
    }

    account.coordinator = std::make_unique<PollingCoordinator>(account.session.get(), &m_registry, &m_binder, &m_gate);
    PollingCoordinator *coordinator = account.coordinator.get();
    m_accounts.push_back(std::move(account));

    coordinator->start();
    qCInfo(petkitLog) << "Started" << coordinator->name() << "with" << m_registry.size() << "known devices";

    if (error)
        error->clear();
    return true;
}

int ApplicationContext::setup(const QList<AccountConfig> &configs)
{
    int started = 0;
    for (const AccountConfig &config : configs) {
        QString error;
        if (addAccount(config, &error))
            ++started;
        else
            qCWarning(petkitLog).noquote() << "Skipping Petkit account" << config.accountId() << ":" << error;
    }
    return started;
}

void ApplicationContext::stop()
{
    for (Account &account : m_accounts) {
        if (account.coordinator)
            account.coordinator->stop();
    }
}

void ApplicationContext::refreshAll()
{
    for (Account &account : m_accounts) {
        if (account.coordinator)
            account.coordinator->refresh();
    }
}

QList<PollingCoordinator *> ApplicationContext::coordinators() const
{
    QList<PollingCoordinator *> out;
    for (const Account &account : m_accounts)
        out.append(account.coordinator.get());
    return out;
}

PollingCoordinator *ApplicationContext::coordinator(const QString &name) const
{
    for (const Account &account : m_accounts) {
        if (account.coordinator && account.coordinator->name() == name)
            return account.coordinator.get();
    }
    return nullptr;
}

SessionManager *ApplicationContext::session(const QString &accountId) const
{
    for (const Account &account : m_accounts) {
        if (account.session && account.session->config().accountId() == accountId)
            return account.session.get();
    }
    return nullptr;
}

bool ApplicationContext::isHealthy() const
{
    if (m_accounts.empty())
        return false;
    for (const Account &account : m_accounts) {
        if (!account.coordinator || !account.coordinator->lastReport().fetched)
            return false;
    }
    return true;
}

} // namespace phicore::petkit::ipc
