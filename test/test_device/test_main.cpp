#include <unity.h>

#include <cmath>
#include <limits>

#include <QDate>
#include <QUrlQuery>

#include "fake_transport.h"
#include "memory_store.h"
#include "petkit_device.h"
#include "petkit_session.h"

using namespace phicore::petkit::ipc;
using phicore::petkit::ipc::test::FakeTransport;
using phicore::petkit::ipc::test::MemoryStore;

namespace {

QJsonObject feederData(int state, int food, int desiccant)
{
    return QJsonObject{
        {QStringLiteral("id"), 100},
        {QStringLiteral("name"), QStringLiteral("Kitchen")},
        {QStringLiteral("type"), QStringLiteral("FeederMini")},
        {QStringLiteral("state"), state},
        {QStringLiteral("desc"), QStringLiteral("ok")},
        {QStringLiteral("status"), QJsonObject{{QStringLiteral("food"), food},
                                               {QStringLiteral("desiccantLeftDays"), desiccant}}},
    };
}

AccountConfig account()
{
    AccountConfig cfg;
    cfg.username = QStringLiteral("alice");
    cfg.token = QStringLiteral("tok");
    return cfg;
}

} // namespace

void setUp() {}
void tearDown() {}

void test_state_labels()
{
    TEST_ASSERT_EQUAL_STRING("online", qPrintable(Device::stateLabel(1)));
    TEST_ASSERT_EQUAL_STRING("offline", qPrintable(Device::stateLabel(2)));
    TEST_ASSERT_EQUAL_STRING("feeding", qPrintable(Device::stateLabel(3)));
    TEST_ASSERT_EQUAL_STRING("mate_ota", qPrintable(Device::stateLabel(4)));
    TEST_ASSERT_EQUAL_STRING("device_error", qPrintable(Device::stateLabel(5)));
    TEST_ASSERT_EQUAL_STRING("battery_mode", qPrintable(Device::stateLabel(6)));
    TEST_ASSERT_TRUE(Device::stateLabel(9).isEmpty());
}

void test_identity_is_derived_from_data()
{
    Device device(QStringLiteral("100"), feederData(1, 0, 20), nullptr);
    TEST_ASSERT_EQUAL_STRING("feedermini", qPrintable(device.deviceType()));
    TEST_ASSERT_EQUAL_STRING("feedermini_100", qPrintable(device.deviceKey()));
    TEST_ASSERT_EQUAL_STRING("Kitchen", qPrintable(device.deviceName()));
}

void test_unknown_state_code_is_passed_through()
{
    Device device(QStringLiteral("100"), feederData(9, 0, 20), nullptr);
    TEST_ASSERT_EQUAL_STRING("9", qPrintable(device.state().toString()));

    Device known(QStringLiteral("100"), feederData(2, 0, 20), nullptr);
    TEST_ASSERT_EQUAL_STRING("offline", qPrintable(known.state().toString()));
}

void test_missing_status_defaults_to_zero()
{
    Device device(QStringLiteral("7"), QJsonObject{{QStringLiteral("type"), QStringLiteral("d4")}}, nullptr);
    TEST_ASSERT_EQUAL_INT(0, device.desiccantLeftDays());
    TEST_ASSERT_EQUAL_INT(0, device.foodStatus());
    TEST_ASSERT_EQUAL_INT(0, device.stateCode().toInt());
    TEST_ASSERT_FALSE(device.isFeeding());
}

void test_food_state_description()
{
    Device normal(QStringLiteral("100"), feederData(1, 0, 20), nullptr);
    TEST_ASSERT_TRUE(normal.foodPresent());
    TEST_ASSERT_EQUAL_STRING("normal", qPrintable(normal.foodStateAttributes().value(QStringLiteral("desc")).toString()));

    Device low(QStringLiteral("100"), feederData(1, 1, 20), nullptr);
    TEST_ASSERT_FALSE(low.foodPresent());
    TEST_ASSERT_EQUAL_STRING("few", qPrintable(low.foodStateAttributes().value(QStringLiteral("desc")).toString()));
    TEST_ASSERT_EQUAL_INT(1, low.foodStateAttributes().value(QStringLiteral("state")).toInt());
}

void test_feeding_follows_state_code()
{
    Device device(QStringLiteral("100"), feederData(3, 0, 20), nullptr);
    TEST_ASSERT_TRUE(device.isFeeding());
    device.updateData(feederData(1, 0, 20));
    TEST_ASSERT_FALSE(device.isFeeding());
}

void test_capabilities_per_domain()
{
    Device device(QStringLiteral("100"), feederData(1, 1, 12), nullptr);

    const CapabilityList &sensors = device.capabilities(EntityDomain::Sensor);
    TEST_ASSERT_EQUAL_INT(2, sensors.size());
    TEST_ASSERT_EQUAL_STRING("state", qPrintable(sensors.at(0).name));
    TEST_ASSERT_EQUAL_STRING("online", qPrintable(sensors.at(0).value().toString()));
    TEST_ASSERT_EQUAL_STRING("desiccant", qPrintable(sensors.at(1).name));
    TEST_ASSERT_EQUAL_STRING("days", qPrintable(sensors.at(1).unit));
    TEST_ASSERT_EQUAL_INT(12, sensors.at(1).value().toInt());

    const CapabilityList &binary = device.capabilities(EntityDomain::BinarySensor);
    TEST_ASSERT_EQUAL_INT(1, binary.size());
    TEST_ASSERT_EQUAL_STRING("food_state", qPrintable(binary.at(0).name));
    TEST_ASSERT_TRUE(binary.at(0).value().toBool());

    const CapabilityList &switches = device.capabilities(EntityDomain::Switch);
    TEST_ASSERT_EQUAL_INT(1, switches.size());
    TEST_ASSERT_EQUAL_STRING("feeding", qPrintable(switches.at(0).name));
    TEST_ASSERT_TRUE(static_cast<bool>(switches.at(0).action));
}

void test_listeners_run_on_update_and_can_leave()
{
    Device device(QStringLiteral("100"), feederData(1, 0, 20), nullptr);
    int calls = 0;
    const Device::ListenerId id = device.subscribe([&calls]() { ++calls; });
    TEST_ASSERT_EQUAL_INT(1, device.listenerCount());

    device.updateData(feederData(2, 0, 20));
    TEST_ASSERT_EQUAL_INT(1, calls);
    TEST_ASSERT_EQUAL_STRING("offline", qPrintable(device.state().toString()));

    TEST_ASSERT_TRUE(device.unsubscribe(id));
    TEST_ASSERT_FALSE(device.unsubscribe(id));
    device.updateData(feederData(1, 0, 20));
    TEST_ASSERT_EQUAL_INT(1, calls);
}

void test_feed_endpoint_per_type()
{
    TEST_ASSERT_EQUAL_STRING("feedermini/save_dailyfeed", qPrintable(Device::feedEndpoint(QStringLiteral("feedermini"))));
    TEST_ASSERT_EQUAL_STRING("d3/saveDailyFeed", qPrintable(Device::feedEndpoint(QStringLiteral("d3"))));
    TEST_ASSERT_EQUAL_STRING("d4/saveDailyFeed", qPrintable(Device::feedEndpoint(QStringLiteral("D4"))));
    TEST_ASSERT_EQUAL_STRING("feeder/save_dailyfeed", qPrintable(Device::feedEndpoint(QStringLiteral("feeder"))));
}

void test_feed_amount_rounds_half_to_even()
{
    TEST_ASSERT_EQUAL_INT(15, static_cast<int>(Device::feedAmountParam(1.5)));
    TEST_ASSERT_EQUAL_INT(10, static_cast<int>(Device::feedAmountParam(1.0)));
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(Device::feedAmountParam(0.25)));
}

void test_feed_amount_rejects_non_finite_and_huge_values()
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    TEST_ASSERT_FALSE(Device::isValidFeedAmount(nan));
    TEST_ASSERT_FALSE(Device::isValidFeedAmount(inf));
    TEST_ASSERT_FALSE(Device::isValidFeedAmount(-inf));
    TEST_ASSERT_FALSE(Device::isValidFeedAmount(1e30));
    TEST_ASSERT_FALSE(Device::isValidFeedAmount(0.0));
    TEST_ASSERT_TRUE(Device::isValidFeedAmount(kMaxFeedAmount));

    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(Device::feedAmountParam(nan)));
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(Device::feedAmountParam(-inf)));
    TEST_ASSERT_EQUAL_INT(1000, static_cast<int>(Device::feedAmountParam(inf)));
    TEST_ASSERT_EQUAL_INT(1000, static_cast<int>(Device::feedAmountParam(1e30)));
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(Device::feedAmountParam(-3.0)));
}

void test_feed_now_with_invalid_amount_sends_nothing()
{
    FakeTransport transport;
    MemoryStore store;
    ApiClient api(&transport);
    SessionManager session(account(), &api, &store);
    TEST_ASSERT_TRUE(session.loadOrLogin().ok);

    Device device(QStringLiteral("100"), feederData(1, 0, 20), &session);
    const ApiResult nan = device.feedNow(std::nan(""));
    const ApiResult huge = device.capabilities(EntityDomain::Switch).at(0).action(
        QVariantMap{{QStringLiteral("amount"), 1e30}});

    TEST_ASSERT_FALSE(nan.ok);
    TEST_ASSERT_FALSE(nan.error.isEmpty());
    TEST_ASSERT_FALSE(huge.ok);
    TEST_ASSERT_EQUAL_INT(0, transport.requestCount());
}

void test_feed_now_sends_daily_feed_request()
{
    FakeTransport transport;
    transport.enqueueJson(QJsonObject{{QStringLiteral("result"), QStringLiteral("success")}});
    MemoryStore store;
    ApiClient api(&transport);
    SessionManager session(account(), &api, &store);
    TEST_ASSERT_TRUE(session.loadOrLogin().ok);

    Device device(QStringLiteral("100"), feederData(1, 0, 20), &session);
    const ApiResult rsp = device.feedNow(1.5);
    TEST_ASSERT_TRUE(rsp.ok);

    const HttpRequest &request = transport.lastRequest();
    const QUrlQuery query(request.url);
    TEST_ASSERT_EQUAL_STRING("GET", request.method.constData());
    TEST_ASSERT_TRUE(request.url.path().endsWith(QStringLiteral("/feedermini/save_dailyfeed")));
    TEST_ASSERT_EQUAL_STRING("100", qPrintable(query.queryItemValue(QStringLiteral("deviceId"))));
    TEST_ASSERT_EQUAL_STRING("-1", qPrintable(query.queryItemValue(QStringLiteral("time"))));
    TEST_ASSERT_EQUAL_STRING("15", qPrintable(query.queryItemValue(QStringLiteral("amount"))));
    TEST_ASSERT_EQUAL_STRING(qPrintable(QDate::currentDate().toString(QStringLiteral("yyyyMMdd"))),
                             qPrintable(query.queryItemValue(QStringLiteral("day"))));
    TEST_ASSERT_EQUAL_STRING("tok", request.header("X-Session").constData());
}

void test_feed_action_defaults_to_one_portion()
{
    FakeTransport transport;
    transport.enqueueJson(QJsonObject{});
    MemoryStore store;
    ApiClient api(&transport);
    SessionManager session(account(), &api, &store);
    TEST_ASSERT_TRUE(session.loadOrLogin().ok);

    QJsonObject data = feederData(1, 0, 20);
    data.insert(QStringLiteral("type"), QStringLiteral("d4"));
    Device device(QStringLiteral("100"), data, &session);

    device.capabilities(EntityDomain::Switch).at(0).action(QVariantMap());
    const QUrlQuery query(transport.lastRequest().url);
    TEST_ASSERT_TRUE(transport.lastRequest().url.path().endsWith(QStringLiteral("/d4/saveDailyFeed")));
    TEST_ASSERT_EQUAL_STRING("10", qPrintable(query.queryItemValue(QStringLiteral("amount"))));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_state_labels);
    RUN_TEST(test_identity_is_derived_from_data);
    RUN_TEST(test_unknown_state_code_is_passed_through);
    RUN_TEST(test_missing_status_defaults_to_zero);
    RUN_TEST(test_food_state_description);
    RUN_TEST(test_feeding_follows_state_code);
    RUN_TEST(test_capabilities_per_domain);
    RUN_TEST(test_listeners_run_on_update_and_can_leave);
    RUN_TEST(test_feed_endpoint_per_type);
    RUN_TEST(test_feed_amount_rounds_half_to_even);
    RUN_TEST(test_feed_amount_rejects_non_finite_and_huge_values);
    RUN_TEST(test_feed_now_with_invalid_amount_sends_nothing);
    RUN_TEST(test_feed_now_sends_daily_feed_request);
    RUN_TEST(test_feed_action_defaults_to_one_portion);
    return UNITY_END();
}
