#include "runtime/runtime.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>

#include "mocks/mock_device_client.hpp"

namespace fs = std::filesystem;
using namespace firetv;
using namespace firetv::tests;
using namespace testing;

class RuntimeTest : public Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "firetv_runtime_test";
        fs::create_directories(temp_dir);

        config.http.bind = "127.0.0.1";
        config.http.port = 9998;
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::unique_ptr<runtime::Runtime> make_runtime() {
        return std::make_unique<runtime::Runtime>(config, std::make_unique<NiceMock<MockDeviceClient>>());
    }

    fs::path temp_dir;
    runtime::RuntimeConfig config;
};

TEST_F(RuntimeTest, RegistersConfiguredDevices) {
    config.devices.entries.push_back({"living-room", "192.168.1.20:5555"});
    config.devices.default_host = "192.168.1.30:5555";
    auto rt = make_runtime();

    std::string error;
    ASSERT_TRUE(rt->initialize(error)) << error;

    auto hosts = rt->get_registry().hosts();
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts.at("living-room"), "192.168.1.20:5555");
    EXPECT_EQ(hosts.at("default"), "192.168.1.30:5555");

    rt->shutdown();
}

TEST_F(RuntimeTest, LoadsDeviceStore) {
    std::string store_path = (temp_dir / "devices.yaml").string();
    {
        std::ofstream file(store_path);
        file << "devices:\n  bedroom: 192.168.1.21:5555\n";
    }
    config.devices.store = store_path;
    auto rt = make_runtime();

    std::string error;
    ASSERT_TRUE(rt->initialize(error)) << error;
    EXPECT_TRUE(rt->get_registry().has_device("bedroom"));

    // Devices added at runtime are written back
    ASSERT_TRUE(rt->get_registry().add("kitchen", "192.168.1.22:5555").success);
    registry::DeviceStore store(store_path);
    std::map<std::string, std::string> saved;
    ASSERT_TRUE(store.load(saved, error)) << error;
    EXPECT_EQ(saved.size(), 2u);
    EXPECT_EQ(saved.at("kitchen"), "192.168.1.22:5555");

    rt->shutdown();
}

TEST_F(RuntimeTest, InvalidEntryFailsInitialization) {
    config.devices.entries.push_back({"bad id", "192.168.1.20:5555"});
    auto rt = make_runtime();

    std::string error;
    EXPECT_FALSE(rt->initialize(error));
    EXPECT_THAT(error, HasSubstr("bad id"));
}
