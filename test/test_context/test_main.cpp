#include <unity.h>

#include <QCoreApplication>

#include "fake_transport.h"
#include "memory_store.h"
#include "petkit_context.h"

using namespace phicore::petkit::ipc;
using phicore::petkit::ipc::test::FakeTransport;
using phicore::petkit::ipc::test::MemoryStore;
using phicore::petkit::ipc::test::rosterEntry;
using phicore::petkit::ipc::test::rosterReply;

namespace {

AccountConfig tokenAccount(const QString &username)
{
    AccountConfig cfg;
    cfg.username = username;
    cfg.token = QStringLiteral("tok-") + username;
    return cfg;
}

QJsonObject feeder(int id)
{
    return rosterEntry(QStringLiteral("D4"), QJsonObject{{QStringLiteral("id"), id}, {QStringLiteral("state"), 1}});
}

} // namespace

void setUp() {}
void tearDown() {}

void test_accounts_share_one_registry()
{
    FakeTransport transport;
    MemoryStore store;
    transport.enqueueJson(rosterReply({feeder(100)}));
    transport.enqueueJson(rosterReply({feeder(100), feeder(200)}));

    ApplicationContext context(&transport, &store);
    int registered = 0;
    for (EntityDomain domain : supportedDomains()) {
        context.binder().setRegistrationHandler(domain, [&registered](const QList<Entity *> &entities) {
            registered += static_cast<int>(entities.size());
        });
    }

    TEST_ASSERT_EQUAL_INT(2, context.setup({tokenAccount(QStringLiteral("a")), tokenAccount(QStringLiteral("b"))}));
    TEST_ASSERT_EQUAL_INT(2, context.coordinators().size());
    TEST_ASSERT_EQUAL_INT(2, context.registry().size());
    TEST_ASSERT_EQUAL_INT(8, registered);
    TEST_ASSERT_NOT_NULL(context.coordinator(QStringLiteral("petkit-b-devices")));
    TEST_ASSERT_NOT_NULL(context.session(QStringLiteral("a")));
    TEST_ASSERT_TRUE(context.isHealthy());
    TEST_ASSERT_TRUE(context.coordinators().at(0)->isTimerActive());

    context.stop();
    TEST_ASSERT_FALSE(context.coordinators().at(0)->isTimerActive());
    TEST_ASSERT_FALSE(context.coordinators().at(1)->isTimerActive());
}

void test_duplicate_account_is_rejected()
{
    FakeTransport transport;
    MemoryStore store;
    transport.enqueueJson(rosterReply({feeder(100)}));
    ApplicationContext context(&transport, &store);

    TEST_ASSERT_TRUE(context.addAccount(tokenAccount(QStringLiteral("a"))));
    QString error;
    TEST_ASSERT_FALSE(context.addAccount(tokenAccount(QStringLiteral("a")), &error));
    TEST_ASSERT_FALSE(error.isEmpty());
    TEST_ASSERT_EQUAL_INT(1, context.coordinators().size());
    TEST_ASSERT_EQUAL_INT(1, transport.requestCount());
}

void test_failed_login_does_not_start_account()
{
    FakeTransport transport;
    MemoryStore store;
    transport.enqueueJson(test::errorReply(1, QStringLiteral("wrong password")));
    ApplicationContext context(&transport, &store);

    AccountConfig cfg;
    cfg.username = QStringLiteral("a");
    cfg.password = QStringLiteral("pw");
    QString error;
    TEST_ASSERT_FALSE(context.addAccount(cfg, &error));
    TEST_ASSERT_FALSE(error.isEmpty());
    TEST_ASSERT_EQUAL_INT(0, context.coordinators().size());
    TEST_ASSERT_FALSE(context.isHealthy());
}

void test_account_without_credentials_is_rejected()
{
    FakeTransport transport;
    MemoryStore store;
    ApplicationContext context(&transport, &store);

    AccountConfig cfg;
    cfg.username = QStringLiteral("a");
    TEST_ASSERT_EQUAL_INT(0, context.setup({cfg}));
    TEST_ASSERT_EQUAL_INT(0, transport.requestCount());
}

void test_refresh_all_marks_unhealthy_on_failure()
{
    FakeTransport transport;
    MemoryStore store;
    transport.enqueueJson(rosterReply({feeder(100)}));
    ApplicationContext context(&transport, &store);
    TEST_ASSERT_TRUE(context.addAccount(tokenAccount(QStringLiteral("a"))));
    TEST_ASSERT_TRUE(context.isHealthy());

    transport.enqueueFailure(QStringLiteral("Request timed out"));
    context.refreshAll();
    TEST_ASSERT_FALSE(context.isHealthy());
    TEST_ASSERT_EQUAL_INT(1, context.registry().size());
}

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);

    UNITY_BEGIN();
    RUN_TEST(test_accounts_share_one_registry);
    RUN_TEST(test_duplicate_account_is_rejected);
    RUN_TEST(test_failed_login_does_not_start_account);
    RUN_TEST(test_account_without_credentials_is_rejected);
    RUN_TEST(test_refresh_all_marks_unhealthy_on_failure);
    return UNITY_END();
}
