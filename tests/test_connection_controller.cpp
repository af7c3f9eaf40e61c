// =============================================================================
// Unit tests for ConnectionController (src/connection_controller.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <unistd.h>
#include "connection_controller.hpp"
#include "test_fakes.hpp"

using namespace autolink;
using namespace autolink::testing;

namespace {

std::string historyPathForCurrentTest() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    return ::testing::TempDir() + "autolink_controller_" + info->name() + "_" +
           std::to_string(::getpid()) + ".json";
}

ProcessOutput okOutput(const std::string& out = {}) {
    ProcessOutput p;
    p.exit_code = 0;
    p.out = out;
    return p;
}

} // namespace

class ConnectionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::remove(path_.c_str());
        ASSERT_TRUE(sessions_.init());
        controller_.attach();
    }
    void TearDown() override {
        sessions_.teardown();
        std::remove(path_.c_str());
    }

    std::vector<NetworkInterface> interfaces_;
    std::string adb_devices_;
    std::string path_ = historyPathForCurrentTest();

    std::shared_ptr<FakePortProber> prober_ = std::make_shared<FakePortProber>();
    SessionManager sessions_{std::chrono::milliseconds(60000), prober_};
    FakeRegistry registry_;
    RecordingNotifier notifier_;
    ScriptedPrompter prompter_;
    AddressHistoryStore history_{path_};
    LanConnectionResolver lan_{registry_, notifier_, prompter_, 7347, 1000};
    AdbConnectionEstablisher adb_{sessions_, registry_, notifier_,
        [this](const std::vector<std::string>& args) -> Result<ProcessOutput> {
            if (!args.empty() && args[0] == "devices") return Ok(okOutput(adb_devices_));
            return Ok(okOutput());
        }};
    ConnectionController controller_{sessions_, registry_, history_, lan_, adb_, notifier_, prompter_,
                                     [this] { return interfaces_; }};
};

// ---------------------------------------------------------------------------
// ipv4Of
// ---------------------------------------------------------------------------
TEST(ConnectionControllerHelpersTest, Ipv4Of) {
    EXPECT_EQ(ConnectionController::ipv4Of("::ffff:192.168.1.5"), "192.168.1.5");
    EXPECT_EQ(ConnectionController::ipv4Of("192.168.1.5"), "192.168.1.5");
    EXPECT_EQ(ConnectionController::ipv4Of("fe80::1"), "fe80::1");
}

// ---------------------------------------------------------------------------
// Registry events
// ---------------------------------------------------------------------------
TEST_F(ConnectionControllerTest, LanAttachRecordsHistoryAndSet) {
    DeviceSession s;
    s.device_id = "10.0.0.2:7347";
    s.host = "::ffff:10.0.0.2";
    s.type = SessionType::ServerOverLan;
    s.display_name = "Pixel 7";
    registry_.addSession(s);

    EXPECT_TRUE(sessions_.hasLanHost("10.0.0.2"));
    auto records = history_.list();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].ip, "10.0.0.2");
    ASSERT_EQ(notifier_.infos.size(), 1u);
    EXPECT_EQ(notifier_.infos[0], "AutoJs6 device attached: Pixel 7");
}

TEST_F(ConnectionControllerTest, AdbAttachUsesSerialAndSkipsLoopbackHistory) {
    DeviceSession s;
    s.device_id = "R58M12345";
    s.host = "127.0.0.1";
    s.adb_device_id = "R58M12345";
    s.type = SessionType::ServerOverAdb;
    registry_.addSession(s);

    EXPECT_TRUE(sessions_.hasAdbDevice("R58M12345"));
    EXPECT_FALSE(sessions_.hasLanHost("127.0.0.1"));
    EXPECT_TRUE(history_.list().empty());
}

TEST_F(ConnectionControllerTest, DetachLeavesBothSets) {
    DeviceSession s;
    s.device_id = "10.0.0.2:7347";
    s.host = "10.0.0.2";
    s.type = SessionType::ServerOverLan;
    registry_.addSession(s);
    ASSERT_TRUE(sessions_.hasLanHost("10.0.0.2"));

    registry_.dropSession(s);
    EXPECT_FALSE(sessions_.hasLanHost("10.0.0.2"));
    EXPECT_EQ(notifier_.infos.back(), "AutoJs6 device detached: 10.0.0.2:7347");
}

// ---------------------------------------------------------------------------
// Home menu -> LAN history picker
// ---------------------------------------------------------------------------
TEST_F(ConnectionControllerTest, HistoryPickerListsRecordsAndClearEntry) {
    ASSERT_TRUE(history_.replace({"10.0.0.2|1700000000000", "10.0.0.3"}).is_ok());
    prompter_.pushPick(ConnectionController::MENU_SERVER_LAN);
    prompter_.pushDismiss();

    ASSERT_TRUE(controller_.connect().is_ok());

    ASSERT_EQ(prompter_.requests.size(), 2u);
    EXPECT_EQ(prompter_.requests[0].items.size(), 3u);
    const auto& items = prompter_.requests[1].items;
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].label, "[ Record ] - 10.0.0.2");
    EXPECT_EQ(items[0].detail.rfind("Last connected: ", 0), 0u);
    EXPECT_EQ(items[1].label, "[ Record ] - 10.0.0.3");
    EXPECT_TRUE(items[1].detail.empty());
    EXPECT_EQ(items[2].label, ConnectionController::CLEAR_RECORDS);
    EXPECT_TRUE(prompter_.requests[1].allow_free_text);
    EXPECT_TRUE(registry_.requests.empty());
}

TEST_F(ConnectionControllerTest, EmptyHistoryHasNoClearEntry) {
    prompter_.pushPick(ConnectionController::MENU_SERVER_LAN);
    ASSERT_TRUE(controller_.connect().is_ok());
    ASSERT_EQ(prompter_.requests.size(), 2u);
    EXPECT_TRUE(prompter_.requests[1].items.empty());
}

TEST_F(ConnectionControllerTest, PickerPurgesBlacklistedFirst) {
    {
        std::ofstream out(path_);
        out << R"({"autojs6.devices": ["127.0.0.1|1", "10.0.0.2|2"]})";
    }
    ASSERT_TRUE(controller_.connectLan().is_ok());
    ASSERT_EQ(prompter_.requests.size(), 1u);
    EXPECT_EQ(prompter_.requests[0].items.size(), 2u);  // one record + clear
    EXPECT_EQ(history_.list().size(), 1u);
}

TEST_F(ConnectionControllerTest, PickedRecordConnectsAndIsRecorded) {
    ASSERT_TRUE(history_.replace({"10.0.0.2|1", "10.0.0.3|2"}).is_ok());
    prompter_.pushPick("[ Record ] - 10.0.0.3");

    ASSERT_TRUE(controller_.connectLan().is_ok());
    ASSERT_EQ(registry_.requests.size(), 1u);
    EXPECT_EQ(registry_.requests[0].host, "10.0.0.3");
    EXPECT_EQ(history_.list()[0].ip, "10.0.0.3");
}

TEST_F(ConnectionControllerTest, ClearRecordsAfterConfirmation) {
    ASSERT_TRUE(history_.replace({"10.0.0.2|1", "10.0.0.3|2"}).is_ok());
    prompter_.pushPick(ConnectionController::CLEAR_RECORDS);
    prompter_.confirms.push_back(true);

    ASSERT_TRUE(controller_.connectLan().is_ok());
    EXPECT_TRUE(history_.list().empty());
    ASSERT_EQ(notifier_.infos.size(), 1u);
    EXPECT_EQ(notifier_.infos[0], "Cleared 2 record(s)");
}

TEST_F(ConnectionControllerTest, ClearDeclinedKeepsRecords) {
    ASSERT_TRUE(history_.replace({"10.0.0.2|1"}).is_ok());
    prompter_.confirms.push_back(false);

    auto r = controller_.clearHistory();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), 0u);
    EXPECT_EQ(history_.list().size(), 1u);
}

// ---------------------------------------------------------------------------
// Local address hint
// ---------------------------------------------------------------------------
TEST_F(ConnectionControllerTest, LocalHintWithoutInterfaces) {
    auto r = controller_.showLocalAddress();
    ASSERT_TRUE(r.is_err());
    ASSERT_EQ(notifier_.errors.size(), 1u);
    EXPECT_EQ(notifier_.errors[0].message, "No usable LAN IP address found");
}

TEST_F(ConnectionControllerTest, LocalHintShowsPickedAddress) {
    interfaces_ = {{"eth0", "192.168.1.10", "aa:bb:cc:dd:ee:ff"}, {"wlan0", "10.0.0.5", ""}};
    prompter_.pushPick(ConnectionController::MENU_CLIENT_LAN);
    prompter_.pushPick("wlan0");

    ASSERT_TRUE(controller_.connect().is_ok());
    ASSERT_EQ(prompter_.requests.size(), 2u);
    EXPECT_EQ(prompter_.requests[1].items[0].detail, "192.168.1.10 | aa:bb:cc:dd:ee:ff");
    ASSERT_EQ(notifier_.infos.size(), 1u);
    EXPECT_EQ(notifier_.infos[0], "Enable client mode in the AutoJs6 side drawer and connect to 10.0.0.5");
}

// ---------------------------------------------------------------------------
// ADB device picker
// ---------------------------------------------------------------------------
TEST_F(ConnectionControllerTest, AdbWithoutDevicesReportsError) {
    auto r = controller_.connectAdb();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::NoDeviceConnected);
    EXPECT_EQ(notifier_.errors.size(), 1u);
}

TEST_F(ConnectionControllerTest, AdbPickConnectsThroughForward) {
    adb_devices_ = "List of devices attached\nABC123 device product:panther model:Pixel_7\n";
    prompter_.pushPick("Unknown Pixel_7 (ABC123)");

    ASSERT_TRUE(controller_.connectAdb().is_ok());
    ASSERT_EQ(prompter_.requests.size(), 1u);
    EXPECT_EQ(prompter_.requests[0].items[0].detail, "Model: Pixel_7, Product: panther");
    ASSERT_EQ(registry_.requests.size(), 1u);
    EXPECT_EQ(registry_.requests[0].type, SessionType::ServerOverAdb);
    EXPECT_TRUE(sessions_.hasAdbDevice("ABC123"));
}
