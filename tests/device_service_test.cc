#include "test_support.h"
#include <atomic>
#include <chrono>
#include <core/service/device_service.h>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace devmon::core;
using namespace std::chrono_literals;
using devmon::testing::LoopbackListener;
using devmon::testing::TempDir;

class DeviceServiceTest : public ::testing::Test {
protected:
    TempDir dir_;
    DeviceRepository repository_{dir_ / "devices.json"};
    ProbeOptions options_{
        .fallback_ports = {},
        .ping_timeout = 1s,
    };

    static const Device* find(const std::vector<Device>& devices, const std::string& name) {
        for (const auto& device : devices) {
            if (device.name() == name) {
                return &device;
            }
        }
        return nullptr;
    }
};

TEST_F(DeviceServiceTest, LoadsStoredDevicesOnConstruction) {
    ASSERT_TRUE(repository_.AddDevice(Device("r1", "10.0.0.1")));
    ASSERT_TRUE(repository_.AddDevice(Device("r2", "10.0.0.2")));

    DeviceService service(repository_, options_);
    EXPECT_EQ(service.GetAllDevices().size(), 2u);
}

TEST_F(DeviceServiceTest, AddDevice) {
    DeviceService service(repository_, options_);
    EXPECT_TRUE(service.AddDevice("r1", "10.0.0.1", 22, 3));

    auto devices = service.GetAllDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].port(), 22);
    EXPECT_EQ(devices[0].timeout_seconds(), 3);
    EXPECT_EQ(repository_.LoadAll(), devices);
}

TEST_F(DeviceServiceTest, AddRejectsDuplicateAfterTrim) {
    DeviceService service(repository_, options_);
    ASSERT_TRUE(service.AddDevice("r1", "10.0.0.1"));
    EXPECT_FALSE(service.AddDevice(" r1 ", "10.0.0.2"));
    EXPECT_EQ(service.GetAllDevices().size(), 1u);
}

TEST_F(DeviceServiceTest, AddRejectsInvalidInput) {
    DeviceService service(repository_, options_);
    EXPECT_FALSE(service.AddDevice("", "10.0.0.1"));
    EXPECT_FALSE(service.AddDevice("r1", "10.0.0.256"));
    EXPECT_FALSE(service.AddDevice("r1", "10.0.0.1", 0));
    EXPECT_FALSE(service.AddDevice("r1", "10.0.0.1", 80, 0));
    EXPECT_TRUE(service.GetAllDevices().empty());
    EXPECT_TRUE(repository_.LoadAll().empty());
}

TEST_F(DeviceServiceTest, RemoveDevice) {
    DeviceService service(repository_, options_);
    ASSERT_TRUE(service.AddDevice("r1", "10.0.0.1"));
    EXPECT_FALSE(service.RemoveDevice("r2"));
    EXPECT_TRUE(service.RemoveDevice("r1"));
    EXPECT_TRUE(service.GetAllDevices().empty());
}

TEST_F(DeviceServiceTest, EnableAndDisable) {
    DeviceService service(repository_, options_);
    ASSERT_TRUE(service.AddDevice("r1", "10.0.0.1"));

    EXPECT_TRUE(service.DisableDevice("r1"));
    EXPECT_FALSE(service.GetAllDevices()[0].enabled());
    EXPECT_FALSE(repository_.GetDevice("r1")->enabled());

    EXPECT_TRUE(service.EnableDevice("r1"));
    EXPECT_TRUE(service.GetAllDevices()[0].enabled());

    EXPECT_FALSE(service.EnableDevice("missing"));
}

TEST_F(DeviceServiceTest, CheckAllSkipsDisabledDevices) {
    std::vector<std::unique_ptr<LoopbackListener>> listeners;
    DeviceService service(repository_, options_);
    for (int i = 0; i < 5; ++i) {
        listeners.push_back(std::make_unique<LoopbackListener>());
        ASSERT_TRUE(service.AddDevice("on" + std::to_string(i), "127.0.0.1", listeners.back()->port(), 2));
    }
    for (int i = 0; i < 3; ++i) {
        auto name = "off" + std::to_string(i);
        ASSERT_TRUE(service.AddDevice(name, "127.0.0.1", listeners[0]->port(), 2));
        ASSERT_TRUE(service.DisableDevice(name));
    }

    service.CheckAllDevices();

    auto devices = service.GetAllDevices();
    ASSERT_EQ(devices.size(), 8u);
    for (int i = 0; i < 5; ++i) {
        auto device = find(devices, "on" + std::to_string(i));
        ASSERT_NE(device, nullptr);
        EXPECT_EQ(device->is_online(), OnlineStatus::kOnline);
        EXPECT_TRUE(device->last_checked().has_value());
    }
    for (int i = 0; i < 3; ++i) {
        auto device = find(devices, "off" + std::to_string(i));
        ASSERT_NE(device, nullptr);
        EXPECT_EQ(device->is_online(), OnlineStatus::kUnknown);
        EXPECT_FALSE(device->last_checked().has_value());
    }
}

TEST_F(DeviceServiceTest, CheckAllProbesConcurrently) {
    DeviceService service(repository_, options_);
    constexpr int kDevices = 10;
    for (int i = 0; i < kDevices; ++i) {
        ASSERT_TRUE(service.AddDevice("d" + std::to_string(i), "10.0.0." + std::to_string(i + 1)));
    }

    std::atomic<int> calls{0};
    service.prober().SetTcpConnectFunc([&calls](const std::string&, std::uint16_t, std::chrono::seconds) {
        ++calls;
        std::this_thread::sleep_for(300ms);
        return true;
    });

    auto start = std::chrono::steady_clock::now();
    service.CheckAllDevices();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(calls.load(), kDevices);
    EXPECT_LT(elapsed, 2s);
    for (const auto& device : service.GetAllDevices()) {
        EXPECT_EQ(device.is_online(), OnlineStatus::kOnline);
    }
}

TEST_F(DeviceServiceTest, FailingProbeDoesNotAbortOthers) {
    DeviceService service(repository_, options_);
    ASSERT_TRUE(service.AddDevice("bad", "10.0.0.1", 1001));
    ASSERT_TRUE(service.AddDevice("good1", "10.0.0.2", 1002));
    ASSERT_TRUE(service.AddDevice("good2", "10.0.0.3", 1003));

    service.prober().SetTcpConnectFunc([](const std::string&, std::uint16_t port, std::chrono::seconds) -> bool {
        if (port == 1001) {
            throw std::runtime_error("probe failure");
        }
        return true;
    });
    service.CheckAllDevices();

    auto devices = service.GetAllDevices();
    EXPECT_EQ(find(devices, "bad")->is_online(), OnlineStatus::kOffline);
    EXPECT_EQ(find(devices, "good1")->is_online(), OnlineStatus::kOnline);
    EXPECT_EQ(find(devices, "good2")->is_online(), OnlineStatus::kOnline);
}

TEST_F(DeviceServiceTest, CheckAllWithNoDevices) {
    DeviceService service(repository_, options_);
    service.CheckAllDevices();
    EXPECT_TRUE(service.GetAllDevices().empty());
}

TEST_F(DeviceServiceTest, CheckSingleDevice) {
    LoopbackListener listener;
    DeviceService service(repository_, options_);
    ASSERT_TRUE(service.AddDevice("r1", "127.0.0.1", listener.port(), 1));

    auto device = service.GetAllDevices()[0];
    EXPECT_TRUE(service.CheckDeviceStatus(device));
    EXPECT_EQ(repository_.GetDevice("r1")->is_online(), OnlineStatus::kOnline);
}
