#include <chrono>
#include <core/exception.h>
#include <core/model/device.h>
#include <core/util/time.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace devmon::core;
using namespace std::chrono_literals;

TEST(DeviceTest, Defaults) {
    auto before = time::Now();
    Device device("r1", "10.0.0.1");
    auto after = time::Now();

    EXPECT_EQ(device.name(), "r1");
    EXPECT_EQ(device.ip_address(), "10.0.0.1");
    EXPECT_EQ(device.port(), 80);
    EXPECT_EQ(device.timeout_seconds(), 5);
    EXPECT_TRUE(device.enabled());
    EXPECT_EQ(device.is_online(), OnlineStatus::kUnknown);
    EXPECT_FALSE(device.last_checked().has_value());
    EXPECT_GE(device.created_at(), before);
    EXPECT_LE(device.created_at(), after);
}

TEST(DeviceTest, ConstructorNormalizesAndValidates) {
    Device device(" r1 ", " 10.0.0.1 ", 22, 300);
    EXPECT_EQ(device.name(), "r1");
    EXPECT_EQ(device.ip_address(), "10.0.0.1");

    EXPECT_THROW(Device("", "10.0.0.1"), ValidationError);
    EXPECT_THROW(Device("r1", "10.0.0.256"), ValidationError);
    EXPECT_THROW(Device("r1", "10.0.0.1", 0), ValidationError);
    EXPECT_THROW(Device("r1", "10.0.0.1", 80, 301), ValidationError);
}

TEST(DeviceTest, MarkChecked) {
    Device device("r1", "10.0.0.1");
    auto when = time::Now();

    device.MarkChecked(true, when);
    EXPECT_EQ(device.is_online(), OnlineStatus::kOnline);
    EXPECT_EQ(device.last_checked(), when);

    device.MarkChecked(false, when + 1s);
    EXPECT_EQ(device.is_online(), OnlineStatus::kOffline);
    EXPECT_EQ(device.last_checked(), when + 1s);
}

TEST(DeviceTest, JsonShape) {
    Device device("r1", "10.0.0.1", 8080, 10, false);
    auto j = device.ToJson();

    EXPECT_EQ(j["name"], "r1");
    EXPECT_EQ(j["ip_address"], "10.0.0.1");
    EXPECT_EQ(j["port"], 8080);
    EXPECT_EQ(j["timeout"], 10);
    EXPECT_EQ(j["enabled"], false);
    EXPECT_TRUE(j["created_at"].is_string());
    EXPECT_TRUE(j["last_checked"].is_null());
    EXPECT_TRUE(j["is_online"].is_null());
    EXPECT_EQ(j.size(), 8u);
}

TEST(DeviceTest, StatusSurvivesJsonInEveryState) {
    Device unknown("r1", "10.0.0.1");
    Device online("r2", "10.0.0.2", 443);
    online.MarkChecked(true);
    Device offline("r3", "10.0.0.3", 22, 1);
    offline.MarkChecked(false);

    for (const auto& device : {unknown, online, offline}) {
        auto restored = Device::FromJson(nlohmann::json::parse(device.ToJson().dump()));
        EXPECT_EQ(restored, device);
    }
    EXPECT_EQ(online.ToJson()["is_online"], true);
    EXPECT_EQ(offline.ToJson()["is_online"], false);
}

TEST(DeviceTest, ReadsRecordWithoutZoneOrFraction) {
    auto j = nlohmann::json::parse(R"({
        "name": "r1",
        "ip_address": "10.0.0.1",
        "port": 80,
        "timeout": 5,
        "enabled": true,
        "created_at": "2024-05-01T10:20:30.123456",
        "last_checked": "2024-05-01T10:25:00",
        "is_online": false
    })");
    auto device = Device::FromJson(j);

    EXPECT_EQ(time::ToIsoString(device.created_at()), "2024-05-01T10:20:30.123456Z");
    ASSERT_TRUE(device.last_checked().has_value());
    EXPECT_EQ(time::ToIsoString(*device.last_checked()), "2024-05-01T10:25:00.000000Z");
    EXPECT_EQ(device.is_online(), OnlineStatus::kOffline);
}

TEST(DeviceTest, AcceptsTimeoutSecondsAlias) {
    auto j = nlohmann::json{{"name", "r1"}, {"ip_address", "10.0.0.1"}, {"timeout_seconds", 7}};
    EXPECT_EQ(Device::FromJson(j).timeout_seconds(), 7);
}

TEST(DeviceTest, FromJsonRejectsBadRecords) {
    EXPECT_THROW(Device::FromJson(nlohmann::json{{"name", "r1"}}), nlohmann::json::exception);
    EXPECT_THROW(Device::FromJson(
                     nlohmann::json{{"name", "r1"}, {"ip_address", "10.0.0.1"}, {"port", 70000}}),
                 ValidationError);
    EXPECT_THROW(Device::FromJson(nlohmann::json{{"name", "r1"},
                                                 {"ip_address", "10.0.0.1"},
                                                 {"created_at", "yesterday"}}),
                 ValidationError);
}

TEST(DeviceTest, FromJsonRejectsNonIntegerNumbers) {
    auto base = nlohmann::json{{"name", "r1"}, {"ip_address", "10.0.0.1"}};

    auto fractional_port = base;
    fractional_port["port"] = 80.9;
    EXPECT_THROW(Device::FromJson(fractional_port), ValidationError);

    auto fractional_timeout = base;
    fractional_timeout["timeout"] = 5.5;
    EXPECT_THROW(Device::FromJson(fractional_timeout), ValidationError);

    auto string_port = base;
    string_port["port"] = "80";
    EXPECT_THROW(Device::FromJson(string_port), ValidationError);

    EXPECT_EQ(ReadInteger(base, "port", 80), 80);
}

TEST(DeviceTest, StreamOutput) {
    Device device("r1", "10.0.0.1");
    device.MarkChecked(true);
    std::ostringstream os;
    os << device;
    EXPECT_EQ(os.str(), "Device (name=r1, ip_address=10.0.0.1, status=Online)");
}

TEST(TimeTest, IsoStringKeepsMicroseconds) {
    auto tp = time::FromIsoString("2026-10-18T21:04:05.123456Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(time::ToIsoString(*tp), "2026-10-18T21:04:05.123456Z");
    EXPECT_FALSE(time::FromIsoString("2026-10-18 21:04:05").has_value());
    EXPECT_FALSE(time::FromIsoString("2026-10-18T21:04:05+02:00").has_value());
}
