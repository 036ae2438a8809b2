#include "registry/device_registry.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "device/shell_commands.hpp"
#include "device/state_classifier.hpp"
#include "mocks/mock_device_client.hpp"

using namespace firetv;
using namespace firetv::tests;
using namespace testing;

using registry::DeviceRegistry;
using registry::ErrorKind;
using registry::RegistryOptions;
using device::AppState;
using device::DeviceState;

/**
 * @brief Registry backed by a mocked debug client
 *
 * The mock answers the combined state query with device_output and the
 * process listing with ps_output; every other shell command succeeds.
 */
class DeviceRegistryTest : public Test {
protected:
    void SetUp() override {
        RegistryOptions options;
        options.busy_timeout_ms = 200;
        options.state_ttl_ms = 0;
        registry = std::make_unique<DeviceRegistry>(client, classifier, options);

        ON_CALL(client, connect(_, _, _)).WillByDefault(ConnectSucceeds());
        ON_CALL(client, shell(_, _, _, _))
            .WillByDefault([this](const device::ConnectionHandle &, const std::string &command, std::string &output,
                                  std::string &) {
                if (command == device::commands::state_query()) {
                    output = device_output;
                } else if (command == device::commands::running_apps_query()) {
                    output = ps_output;
                } else {
                    output.clear();
                }
                return true;
            });
    }

    void set_device(const std::string &screen, const std::string &focus, const std::string &media) {
        device_output = state_query_output(screen, focus, media);
    }

    NiceMock<MockDeviceClient> client;
    device::StateClassifier classifier;
    std::unique_ptr<DeviceRegistry> registry;

    std::string device_output = state_query_output(kScreenOn, kFocusLauncher, kMediaNone);
    std::string ps_output;
};

//=============================================================================
// add
//=============================================================================

TEST_F(DeviceRegistryTest, AddRegistersDevice) {
    auto result = registry->add("living-room", "192.168.1.20:5555");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.error, ErrorKind::NONE);
    ASSERT_TRUE(registry->has_device("living-room"));

    auto device = registry->get_device_copy("living-room");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->host, "192.168.1.20:5555");
    EXPECT_EQ(device->state, DeviceState::DISCONNECTED);
}

TEST_F(DeviceRegistryTest, AddDoesNotConnect) {
    EXPECT_CALL(client, connect(_, _, _)).Times(0);
    EXPECT_CALL(client, shell(_, _, _, _)).Times(0);

    EXPECT_TRUE(registry->add("tv", "10.0.0.5:5555").success);
}

TEST_F(DeviceRegistryTest, AddRejectsInvalidIdentifier) {
    auto result = registry->add("living room!", "192.168.1.20:5555");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::INVALID_IDENTIFIER);
    EXPECT_EQ(registry->device_count(), 0u);
}

TEST_F(DeviceRegistryTest, AddRejectsEmptyIdentifier) {
    auto result = registry->add("", "192.168.1.20:5555");

    EXPECT_EQ(result.error, ErrorKind::INVALID_IDENTIFIER);
    EXPECT_EQ(registry->device_count(), 0u);
}

TEST_F(DeviceRegistryTest, AddRejectsHostWithoutPort) {
    auto result = registry->add("tv", "192.168.1.20");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::INVALID_HOST);
    EXPECT_FALSE(registry->has_device("tv"));
}

TEST_F(DeviceRegistryTest, InvalidAddLeavesExistingEntry) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_FALSE(registry->add("tv", "10.0.0.6:abc").success);
    EXPECT_EQ(registry->hosts().at("tv"), "10.0.0.5:5555");
}

TEST_F(DeviceRegistryTest, AddSameDeviceTwiceIsIdempotent) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_EQ(registry->device_count(), 1u);
    EXPECT_EQ(registry->hosts().at("tv"), "10.0.0.5:5555");
}

TEST_F(DeviceRegistryTest, AddReplacesHost) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);
    ASSERT_TRUE(registry->add("tv", "10.0.0.9:5555").success);

    EXPECT_EQ(registry->device_count(), 1u);
    EXPECT_EQ(registry->hosts().at("tv"), "10.0.0.9:5555");
}

TEST_F(DeviceRegistryTest, ReplacedDeviceReconnectsToNewHost) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);
    ASSERT_TRUE(registry->connect("tv").success);

    ASSERT_TRUE(registry->add("tv", "10.0.0.9:5555").success);

    EXPECT_CALL(client, connect("10.0.0.9:5555", _, _)).Times(1);
    EXPECT_TRUE(registry->state("tv").success);
}

//=============================================================================
// Unknown devices
//=============================================================================

TEST_F(DeviceRegistryTest, UnknownDeviceIsReportedByEveryOperation) {
    EXPECT_CALL(client, connect(_, _, _)).Times(0);

    EXPECT_EQ(registry->state("missing").error, ErrorKind::UNKNOWN_DEVICE);
    EXPECT_EQ(registry->connect("missing").error, ErrorKind::UNKNOWN_DEVICE);
    EXPECT_EQ(registry->action("missing", "home").error, ErrorKind::UNKNOWN_DEVICE);
    EXPECT_EQ(registry->apps_running("missing").error, ErrorKind::UNKNOWN_DEVICE);
    EXPECT_EQ(registry->app_state("missing", "com.netflix.ninja").error, ErrorKind::UNKNOWN_DEVICE);
    EXPECT_EQ(registry->app_start("missing", "com.netflix.ninja").error, ErrorKind::UNKNOWN_DEVICE);
    EXPECT_EQ(registry->app_stop("missing", "com.netflix.ninja").error, ErrorKind::UNKNOWN_DEVICE);
}

TEST_F(DeviceRegistryTest, UnknownDeviceCheckedBeforeAction) {
    auto result = registry->action("missing", "not_an_action");
    EXPECT_EQ(result.error, ErrorKind::UNKNOWN_DEVICE);
}

//=============================================================================
// connect / state
//=============================================================================

TEST_F(DeviceRegistryTest, ConnectClassifiesDevice) {
    set_device(kScreenOn, kFocusNetflix, kMediaPlaying);
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    auto result = registry->connect("tv");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.state, DeviceState::PLAY);
}

TEST_F(DeviceRegistryTest, ConnectAlwaysReconnects) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, connect("10.0.0.5:5555", _, _)).Times(2);
    EXPECT_TRUE(registry->connect("tv").success);
    EXPECT_TRUE(registry->connect("tv").success);
}

TEST_F(DeviceRegistryTest, ConnectToUnreachableDeviceReportsDisconnected) {
    ON_CALL(client, connect(_, _, _)).WillByDefault(ConnectFails("failed to connect to 10.0.0.5:5555"));
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    auto result = registry->connect("tv");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::CONNECTION_ERROR);
    EXPECT_EQ(result.state, DeviceState::DISCONNECTED);
    EXPECT_EQ(result.error_message, "failed to connect to 10.0.0.5:5555");
}

TEST_F(DeviceRegistryTest, StateOfUnreachableDeviceIsDisconnected) {
    ON_CALL(client, connect(_, _, _)).WillByDefault(ConnectFails("unable to connect"));
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    auto result = registry->state("tv");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.state, DeviceState::DISCONNECTED);
}

TEST_F(DeviceRegistryTest, StateConnectsOnFirstUse) {
    set_device(kScreenOn, kFocusNetflix, kMediaPaused);
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, connect("10.0.0.5:5555", _, _)).Times(1);
    EXPECT_EQ(registry->state("tv").state, DeviceState::PAUSE);
    EXPECT_EQ(registry->state("tv").state, DeviceState::PAUSE);
}

TEST_F(DeviceRegistryTest, StateFollowsDevice) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    set_device(kScreenOff, kFocusLauncher, kMediaNone);
    EXPECT_EQ(registry->state("tv").state, DeviceState::OFF);

    set_device(kScreenOn, kFocusLauncher, kMediaNone);
    EXPECT_EQ(registry->state("tv").state, DeviceState::IDLE);

    set_device(kScreenOn, kFocusNetflix, kMediaNone);
    EXPECT_EQ(registry->state("tv").state, DeviceState::STANDBY);

    set_device(kScreenOn, kFocusNetflix, kMediaPlaying);
    EXPECT_EQ(registry->state("tv").state, DeviceState::PLAY);
}

TEST_F(DeviceRegistryTest, StateIsCachedWithinTtl) {
    RegistryOptions options;
    options.state_ttl_ms = 60000;
    DeviceRegistry cached(client, classifier, options);
    ASSERT_TRUE(cached.add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, shell(_, device::commands::state_query(), _, _)).Times(1);
    EXPECT_EQ(cached.state("tv").state, DeviceState::IDLE);
    EXPECT_EQ(cached.state("tv").state, DeviceState::IDLE);
}

TEST_F(DeviceRegistryTest, TruncatedStateOutputIsDisconnected) {
    device_output = std::string(kScreenOn) + device::commands::kSectionMarker + "\n";
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_EQ(registry->state("tv").state, DeviceState::DISCONNECTED);
}

TEST_F(DeviceRegistryTest, FailedShellDropsConnection) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);
    ASSERT_TRUE(registry->connect("tv").success);

    EXPECT_CALL(client, shell(_, _, _, _))
        .WillOnce([](const device::ConnectionHandle &, const std::string &, std::string &, std::string &error) {
            error = "error: device offline";
            return false;
        })
        .WillRepeatedly(DoDefault());

    EXPECT_EQ(registry->state("tv").state, DeviceState::DISCONNECTED);

    // Next request reconnects
    EXPECT_CALL(client, connect("10.0.0.5:5555", _, _)).Times(1);
    EXPECT_EQ(registry->state("tv").state, DeviceState::IDLE);
}

//=============================================================================
// action
//=============================================================================

TEST_F(DeviceRegistryTest, UnknownActionIsRejectedWithoutTouchingDevice) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, connect(_, _, _)).Times(0);
    EXPECT_CALL(client, shell(_, _, _, _)).Times(0);

    auto result = registry->action("tv", "self_destruct");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::UNKNOWN_ACTION);
}

TEST_F(DeviceRegistryTest, VolumeUpSendsKeyEventOnce) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, shell(_, _, _, _)).Times(AnyNumber());
    EXPECT_CALL(client, shell(_, "input keyevent 24", _, _)).Times(1);

    EXPECT_TRUE(registry->action("tv", "volume_up").success);
}

TEST_F(DeviceRegistryTest, MediaActionsDoNotQueryState) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, shell(_, device::commands::state_query(), _, _)).Times(0);
    EXPECT_CALL(client, shell(_, "input keyevent 85", _, _)).Times(1);

    EXPECT_TRUE(registry->action("tv", "media_play_pause").success);
}

TEST_F(DeviceRegistryTest, TurnOnSendsPowerWhenOff) {
    set_device(kScreenOff, kFocusLauncher, kMediaNone);
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, shell(_, _, _, _)).Times(AnyNumber());
    EXPECT_CALL(client, shell(_, "input keyevent 26", _, _)).Times(1);

    EXPECT_TRUE(registry->action("tv", "turn_on").success);
}

TEST_F(DeviceRegistryTest, TurnOnIsNoOpWhenAlreadyOn) {
    set_device(kScreenOn, kFocusLauncher, kMediaNone);
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, shell(_, _, _, _)).Times(AnyNumber());
    EXPECT_CALL(client, shell(_, "input keyevent 26", _, _)).Times(0);

    auto result = registry->action("tv", "turn_on");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.state, DeviceState::IDLE);
}

TEST_F(DeviceRegistryTest, TurnOffSendsPowerWhenOn) {
    set_device(kScreenOn, kFocusNetflix, kMediaPlaying);
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, shell(_, _, _, _)).Times(AnyNumber());
    EXPECT_CALL(client, shell(_, "input keyevent 26", _, _)).Times(1);

    EXPECT_TRUE(registry->action("tv", "turn_off").success);
}

TEST_F(DeviceRegistryTest, TurnOffIsNoOpWhenOff) {
    set_device(kScreenOff, kFocusLauncher, kMediaNone);
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, shell(_, _, _, _)).Times(AnyNumber());
    EXPECT_CALL(client, shell(_, "input keyevent 26", _, _)).Times(0);

    EXPECT_TRUE(registry->action("tv", "turn_off").success);
}

TEST_F(DeviceRegistryTest, ActionOnUnreachableDeviceIsConnectionError) {
    ON_CALL(client, connect(_, _, _)).WillByDefault(ConnectFails("unable to connect"));
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, shell(_, _, _, _)).Times(0);

    auto result = registry->action("tv", "home");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::CONNECTION_ERROR);
    EXPECT_EQ(result.state, DeviceState::DISCONNECTED);
}

//=============================================================================
// list
//=============================================================================

TEST_F(DeviceRegistryTest, ListIsEmptyWithoutDevices) { EXPECT_TRUE(registry->list().empty()); }

TEST_F(DeviceRegistryTest, ListReportsEveryDeviceSortedById) {
    ON_CALL(client, connect("10.0.0.9:5555", _, _)).WillByDefault(ConnectFails("unable to connect"));
    set_device(kScreenOn, kFocusNetflix, kMediaPlaying);
    ASSERT_TRUE(registry->add("office", "10.0.0.9:5555").success);
    ASSERT_TRUE(registry->add("bedroom", "10.0.0.5:5555").success);

    auto devices = registry->list();

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].device_id, "bedroom");
    EXPECT_EQ(devices[0].host, "10.0.0.5:5555");
    EXPECT_EQ(devices[0].state, DeviceState::PLAY);
    EXPECT_EQ(devices[1].device_id, "office");
    EXPECT_EQ(devices[1].state, DeviceState::DISCONNECTED);
}

//=============================================================================
// apps
//=============================================================================

TEST_F(DeviceRegistryTest, AppsRunningParsesProcessList) {
    ps_output =
        "u0_a12    2210  312   1026400 81236 SyS_epoll_ 00000000 S com.amazon.tv.launcher\n"
        "u0_a57    4120  312   1100012 99120 SyS_epoll_ 00000000 S com.netflix.ninja\n"
        "u0_a57    4188  312   990012  45120 SyS_epoll_ 00000000 S com.netflix.ninja:service\n";
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    auto result = registry->apps_running("tv");

    ASSERT_TRUE(result.success);
    EXPECT_THAT(result.running_apps, ElementsAre("com.amazon.tv.launcher", "com.netflix.ninja"));
}

TEST_F(DeviceRegistryTest, AppStateOnWhenFocused) {
    set_device(kScreenOn, kFocusNetflix, kMediaPlaying);
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    auto result = registry->app_state("tv", "com.netflix.ninja");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.app_state, AppState::ON);
}

TEST_F(DeviceRegistryTest, AppStateOffWhenAnotherAppFocused) {
    set_device(kScreenOn, kFocusLauncher, kMediaNone);
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_EQ(registry->app_state("tv", "com.netflix.ninja").app_state, AppState::OFF);
}

TEST_F(DeviceRegistryTest, AppStateOffWhenScreenOff) {
    set_device(kScreenOff, kFocusNetflix, kMediaNone);
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_EQ(registry->app_state("tv", "com.netflix.ninja").app_state, AppState::OFF);
}

TEST_F(DeviceRegistryTest, AppStartLaunchesApp) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, shell(_, "monkey -p com.netflix.ninja -c android.intent.category.LAUNCHER 1", _, _))
        .Times(1);

    EXPECT_TRUE(registry->app_start("tv", "com.netflix.ninja").success);
}

TEST_F(DeviceRegistryTest, AppStopForceStopsApp) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, shell(_, "am force-stop com.netflix.ninja", _, _)).Times(1);

    EXPECT_TRUE(registry->app_stop("tv", "com.netflix.ninja").success);
}

TEST_F(DeviceRegistryTest, AppOperationsRejectInvalidAppId) {
    ASSERT_TRUE(registry->add("tv", "10.0.0.5:5555").success);

    EXPECT_CALL(client, shell(_, _, _, _)).Times(0);

    EXPECT_EQ(registry->app_start("tv", "com.evil;reboot").error, ErrorKind::INVALID_APP_ID);
    EXPECT_EQ(registry->app_stop("tv", "1app").error, ErrorKind::INVALID_APP_ID);
    EXPECT_EQ(registry->app_state("tv", "x").error, ErrorKind::INVALID_APP_ID);
}

TEST_F(DeviceRegistryTest, ErrorKindNames) {
    EXPECT_STREQ(registry::error_kind_to_string(ErrorKind::BUSY), "BUSY");
    EXPECT_STREQ(registry::error_kind_to_string(ErrorKind::UNKNOWN_ACTION), "UNKNOWN_ACTION");
}
