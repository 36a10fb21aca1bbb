#include "test_support.h"
#include <core/storage/device_repository.h>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>
#include <vector>

using namespace devmon::core;
using devmon::testing::TempDir;

class DeviceRepositoryTest : public ::testing::Test {
protected:
    TempDir dir_;
    std::filesystem::path path_ = dir_ / "devices.json";

    void writeFile(const std::string& content) {
        std::ofstream ofs(path_);
        ofs << content;
    }

    std::string readFile() {
        std::ifstream ifs(path_);
        std::stringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }
};

TEST_F(DeviceRepositoryTest, CreatesParentDirectory) {
    auto nested = dir_ / "a" / "b" / "devices.json";
    DeviceRepository repository(nested);
    EXPECT_TRUE(std::filesystem::is_directory(nested.parent_path()));
    EXPECT_TRUE(repository.LoadAll().empty());
}

TEST_F(DeviceRepositoryTest, MissingFileLoadsEmpty) {
    DeviceRepository repository(path_);
    EXPECT_TRUE(repository.LoadAll().empty());
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(DeviceRepositoryTest, CorruptFileLoadsEmpty) {
    writeFile("[{\"name\": \"r1\", ");
    DeviceRepository repository(path_);
    EXPECT_TRUE(repository.LoadAll().empty());
}

TEST_F(DeviceRepositoryTest, NonArrayLoadsEmpty) {
    writeFile(R"({"name": "r1", "ip_address": "10.0.0.1"})");
    DeviceRepository repository(path_);
    EXPECT_TRUE(repository.LoadAll().empty());
}

TEST_F(DeviceRepositoryTest, InvalidRecordLoadsEmpty) {
    writeFile(R"([{"name": "r1", "ip_address": "10.0.0.1"},
                  {"name": "r2", "ip_address": "10.0.0.999"}])");
    DeviceRepository repository(path_);
    EXPECT_TRUE(repository.LoadAll().empty());
}

TEST_F(DeviceRepositoryTest, SaveThenLoad) {
    DeviceRepository repository(path_);
    Device r1("r1", "10.0.0.1");
    Device r2("r2", "10.0.0.2", 22, 3, false);
    r2.MarkChecked(false);

    ASSERT_TRUE(repository.SaveAll({r1, r2}));
    auto loaded = repository.LoadAll();
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0], r1);
    EXPECT_EQ(loaded[1], r2);

    EXPECT_FALSE(std::filesystem::exists(dir_ / "devices.json.tmp"));
    auto content = readFile();
    EXPECT_NE(content.find("\n  {"), std::string::npos);
    EXPECT_TRUE(nlohmann::json::parse(content).is_array());
}

TEST_F(DeviceRepositoryTest, SaveEmptyCollection) {
    DeviceRepository repository(path_);
    ASSERT_TRUE(repository.SaveAll({}));
    EXPECT_EQ(nlohmann::json::parse(readFile()), nlohmann::json::array());
}

TEST_F(DeviceRepositoryTest, FailedSaveLeavesNoTemporaryFile) {
    std::filesystem::create_directories(path_);
    DeviceRepository repository(path_);
    EXPECT_FALSE(repository.SaveAll({Device("r1", "10.0.0.1")}));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "devices.json.tmp"));
    EXPECT_TRUE(std::filesystem::is_directory(path_));
}

TEST_F(DeviceRepositoryTest, AddRejectsDuplicateName) {
    DeviceRepository repository(path_);
    ASSERT_TRUE(repository.AddDevice(Device("r1", "10.0.0.1")));
    EXPECT_FALSE(repository.AddDevice(Device("r1", "10.0.0.9", 443)));

    auto loaded = repository.LoadAll();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].ip_address(), "10.0.0.1");
}

TEST_F(DeviceRepositoryTest, RemoveAbsentLeavesFileUntouched) {
    DeviceRepository repository(path_);
    ASSERT_TRUE(repository.AddDevice(Device("r1", "10.0.0.1")));
    auto before = readFile();

    EXPECT_FALSE(repository.RemoveDevice("r2"));
    EXPECT_EQ(readFile(), before);
}

TEST_F(DeviceRepositoryTest, RemovePresent) {
    DeviceRepository repository(path_);
    ASSERT_TRUE(repository.AddDevice(Device("r1", "10.0.0.1")));
    ASSERT_TRUE(repository.AddDevice(Device("r2", "10.0.0.2")));

    EXPECT_TRUE(repository.RemoveDevice("r1"));
    auto loaded = repository.LoadAll();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].name(), "r2");
    EXPECT_FALSE(repository.GetDevice("r1").has_value());
}

TEST_F(DeviceRepositoryTest, UpdateReplacesByName) {
    DeviceRepository repository(path_);
    Device r1("r1", "10.0.0.1");
    EXPECT_FALSE(repository.UpdateDevice(r1));
    ASSERT_TRUE(repository.AddDevice(r1));

    r1.MarkChecked(true);
    r1.SetEnabled(false);
    ASSERT_TRUE(repository.UpdateDevice(r1));

    auto stored = repository.GetDevice("r1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, r1);
    EXPECT_EQ(stored->is_online(), OnlineStatus::kOnline);
    EXPECT_FALSE(stored->enabled());
}

TEST_F(DeviceRepositoryTest, AddRemoveAddSequence) {
    {
        DeviceRepository repository(path_);
        EXPECT_TRUE(repository.AddDevice(Device("r1", "10.0.0.1")));
        EXPECT_FALSE(repository.AddDevice(Device("r1", "10.0.0.1")));
        EXPECT_TRUE(repository.RemoveDevice("r1"));
        EXPECT_FALSE(repository.RemoveDevice("r1"));
        EXPECT_TRUE(repository.AddDevice(Device("r1", "10.0.0.2")));
    }

    DeviceRepository reopened(path_);
    auto loaded = reopened.LoadAll();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].ip_address(), "10.0.0.2");
}

TEST_F(DeviceRepositoryTest, ConcurrentAddsAreNotLost) {
    DeviceRepository repository(path_);
    constexpr int kThreads = 8;
    constexpr int kPerThread = 5;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&repository, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                auto name = "d" + std::to_string(t) + "_" + std::to_string(i);
                EXPECT_TRUE(repository.AddDevice(Device(name, "10.0.0.1")));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(repository.LoadAll().size(), static_cast<std::size_t>(kThreads * kPerThread));
}
