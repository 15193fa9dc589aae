#include <unity.h>

#include <QJsonArray>
#include <QJsonObject>

#include "petkit_config.h"

using namespace phicore::petkit::ipc;

void setUp() {}
void tearDown() {}

void test_plain_password_is_md5_hex()
{
    TEST_ASSERT_EQUAL_STRING("5f4dcc3b5aa765d61d8327deb882cf99", qPrintable(hashPassword(QStringLiteral("password"))));
}

void test_hashed_password_is_kept()
{
    const QString digest = hashPassword(QStringLiteral("secret"));
    TEST_ASSERT_EQUAL_INT(kPasswordHashLength, digest.size());
    TEST_ASSERT_EQUAL_STRING(qPrintable(digest), qPrintable(hashPassword(digest)));
}

void test_top_level_account_uses_defaults()
{
    const QJsonObject meta{
        {QStringLiteral("username"), QStringLiteral("alice@example.com")},
        {QStringLiteral("password"), QStringLiteral("pw")},
    };

    const QList<AccountConfig> accounts = parseAccountConfigs(meta);
    TEST_ASSERT_EQUAL_INT(1, accounts.size());
    const AccountConfig &cfg = accounts.constFirst();
    TEST_ASSERT_EQUAL_STRING("alice@example.com", qPrintable(cfg.username));
    TEST_ASSERT_EQUAL_STRING(kDefaultApiBase, qPrintable(cfg.apiBase));
    TEST_ASSERT_EQUAL_INT(kDefaultPollIntervalMs, cfg.pollIntervalMs);
    TEST_ASSERT_EQUAL_INT(kDefaultTimeoutMs, cfg.timeoutMs);
    TEST_ASSERT_EQUAL_STRING("alice@example.com", qPrintable(cfg.accountId()));
}

void test_accounts_array_inherits_tuning_not_credentials()
{
    const QJsonObject meta{
        {QStringLiteral("apiBase"), QStringLiteral("http://api.petkit.com/latest/")},
        {QStringLiteral("pollIntervalMs"), 60000},
        {QStringLiteral("accounts"), QJsonArray{
            QJsonObject{{QStringLiteral("username"), QStringLiteral("a")},
                        {QStringLiteral("password"), QStringLiteral("pa")},
                        {QStringLiteral("uid"), 42}},
            QJsonObject{{QStringLiteral("username"), QStringLiteral("b")}},
            QJsonObject{{QStringLiteral("username"), QStringLiteral("c")},
                        {QStringLiteral("token"), QStringLiteral("tok")},
                        {QStringLiteral("timeoutMs"), 5000}},
        }},
    };

    const QList<AccountConfig> accounts = parseAccountConfigs(meta);
    TEST_ASSERT_EQUAL_INT(2, accounts.size());
    TEST_ASSERT_EQUAL_STRING("42", qPrintable(accounts.at(0).accountId()));
    TEST_ASSERT_EQUAL_STRING("http://api.petkit.com/latest/", qPrintable(accounts.at(0).apiBase));
    TEST_ASSERT_EQUAL_INT(60000, accounts.at(0).pollIntervalMs);
    TEST_ASSERT_EQUAL_STRING("c", qPrintable(accounts.at(1).username));
    TEST_ASSERT_TRUE(accounts.at(1).password.isEmpty());
    TEST_ASSERT_EQUAL_INT(5000, accounts.at(1).timeoutMs);
}

void test_intervals_are_clamped()
{
    const QJsonObject meta{
        {QStringLiteral("username"), QStringLiteral("a")},
        {QStringLiteral("password"), QStringLiteral("pw")},
        {QStringLiteral("pollIntervalMs"), 5},
        {QStringLiteral("timeoutMs"), 999999},
    };

    const AccountConfig cfg = parseAccountConfigs(meta).constFirst();
    TEST_ASSERT_EQUAL_INT(10000, cfg.pollIntervalMs);
    TEST_ASSERT_EQUAL_INT(120000, cfg.timeoutMs);
}

void test_meta_without_credentials_has_no_accounts()
{
    const QJsonObject meta{{QStringLiteral("username"), QStringLiteral("a")}};
    TEST_ASSERT_EQUAL_INT(0, parseAccountConfigs(meta).size());
}

void test_storage_dir_override()
{
    const QJsonObject meta{{QStringLiteral("storageDir"), QStringLiteral("/var/lib/petkit")}};
    TEST_ASSERT_EQUAL_STRING("/var/lib/petkit", qPrintable(storageDirectory(meta)));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_plain_password_is_md5_hex);
    RUN_TEST(test_hashed_password_is_kept);
    RUN_TEST(test_top_level_account_uses_defaults);
    RUN_TEST(test_accounts_array_inherits_tuning_not_credentials);
    RUN_TEST(test_intervals_are_clamped);
    RUN_TEST(test_meta_without_credentials_has_no_accounts);
    RUN_TEST(test_storage_dir_override);
    return UNITY_END();
}
