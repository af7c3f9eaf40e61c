// =============================================================================
// Unit tests for ScriptActions (src/script_actions.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <unistd.h>
#include "command_dispatcher.hpp"
#include "script_actions.hpp"
#include "test_fakes.hpp"

using namespace autolink;
using namespace autolink::testing;

class ScriptActionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        script_ = ::testing::TempDir() + "autolink_script_" + info->name() + "_" +
                  std::to_string(::getpid()) + ".js";
        std::ofstream out(script_);
        out << "toast('hello');\n";
    }
    void TearDown() override { std::remove(script_.c_str()); }

    DeviceSession connectDevice(const std::string& id) {
        DeviceSession s;
        s.device_id = id;
        s.display_name = "Pixel (" + id + ")";
        s.host = "10.0.0.2";
        s.type = SessionType::ServerOverLan;
        registry_.addSession(s);
        return s;
    }

    std::string script_;
    FakeRegistry registry_;
    RecordingNotifier notifier_;
    ScriptedPrompter prompter_;
    ScriptActions actions_{registry_, notifier_, prompter_};
};

// ---------------------------------------------------------------------------
// run / save
// ---------------------------------------------------------------------------
TEST_F(ScriptActionsTest, RunWithoutDevicesFails) {
    auto r = actions_.run(script_);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::NoDeviceConnected);
    ASSERT_EQ(notifier_.errors.size(), 1u);
    EXPECT_EQ(notifier_.errors[0].message, ScriptActions::NO_DEVICE_MESSAGE);
    EXPECT_TRUE(registry_.sent.empty());
}

TEST_F(ScriptActionsTest, RunSendsScriptContent) {
    connectDevice("d1");
    ASSERT_TRUE(actions_.run(script_).is_ok());

    ASSERT_EQ(registry_.sent.size(), 1u);
    const auto& sent = registry_.sent[0];
    EXPECT_TRUE(sent.device_id.empty());
    EXPECT_EQ(sent.name, "run");
    EXPECT_EQ(sent.payload["id"], script_);
    EXPECT_EQ(sent.payload["name"], script_);
    EXPECT_EQ(sent.payload["script"], "toast('hello');\n");
}

TEST_F(ScriptActionsTest, RunWithoutPathFails) {
    connectDevice("d1");
    auto r = actions_.run();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::Io);
    EXPECT_TRUE(registry_.sent.empty());
}

TEST_F(ScriptActionsTest, RunMissingFileFails) {
    connectDevice("d1");
    auto r = actions_.run(script_ + ".missing");
    ASSERT_TRUE(r.is_err());
    ASSERT_EQ(notifier_.errors.size(), 1u);
    EXPECT_EQ(notifier_.errors[0].message.rfind("Cannot read ", 0), 0u);
}

TEST_F(ScriptActionsTest, SaveUsesSaveCommand) {
    connectDevice("d1");
    ASSERT_TRUE(actions_.save(script_).is_ok());
    ASSERT_EQ(registry_.sent.size(), 1u);
    EXPECT_EQ(registry_.sent[0].name, "save");
}

// ---------------------------------------------------------------------------
// Device picker variants
// ---------------------------------------------------------------------------
TEST_F(ScriptActionsTest, RunOnDeviceTargetsPickedSession) {
    connectDevice("d1");
    connectDevice("d2");
    prompter_.pushPick("Pixel (d2)");

    ASSERT_TRUE(actions_.runOnDevice(script_).is_ok());
    ASSERT_EQ(prompter_.requests.size(), 1u);
    EXPECT_EQ(prompter_.requests[0].items.size(), 2u);
    EXPECT_EQ(prompter_.requests[0].items[0].detail, "server-over-lan");
    ASSERT_EQ(registry_.sent.size(), 1u);
    EXPECT_EQ(registry_.sent[0].device_id, "d2");
    EXPECT_EQ(registry_.sent[0].name, "run");
}

TEST_F(ScriptActionsTest, SaveToDeviceDismissedSendsNothing) {
    connectDevice("d1");
    auto r = actions_.saveToDevice(script_);
    EXPECT_TRUE(r.is_err());
    EXPECT_TRUE(registry_.sent.empty());
}

TEST_F(ScriptActionsTest, RunOnDeviceWithoutDevices) {
    auto r = actions_.runOnDevice(script_);
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(prompter_.requests.empty());
    EXPECT_EQ(notifier_.errors.size(), 1u);
}

// ---------------------------------------------------------------------------
// stop / stopAll / rerun
// ---------------------------------------------------------------------------
TEST_F(ScriptActionsTest, StopSendsId) {
    connectDevice("d1");
    ASSERT_TRUE(actions_.stop(script_).is_ok());
    ASSERT_EQ(registry_.sent.size(), 1u);
    EXPECT_EQ(registry_.sent[0].name, "stop");
    EXPECT_EQ(registry_.sent[0].payload, nlohmann::json({{"id", script_}}));
}

TEST_F(ScriptActionsTest, StopAllBroadcasts) {
    ASSERT_TRUE(actions_.stopAll().is_ok());
    ASSERT_EQ(registry_.sent.size(), 1u);
    EXPECT_EQ(registry_.sent[0].name, "stopAll");
}

TEST_F(ScriptActionsTest, RerunStopsThenRuns) {
    connectDevice("d1");
    ASSERT_TRUE(actions_.rerun(script_).is_ok());
    ASSERT_EQ(registry_.sent.size(), 2u);
    EXPECT_EQ(registry_.sent[0].name, "stop");
    EXPECT_EQ(registry_.sent[1].name, "run");
}

// ---------------------------------------------------------------------------
// Projects
// ---------------------------------------------------------------------------
TEST_F(ScriptActionsTest, RunProjectWithoutDevicesFails) {
    auto r = actions_.runProject("/work/demo");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::NoDeviceConnected);
    EXPECT_EQ(notifier_.errors.size(), 1u);
}

TEST_F(ScriptActionsTest, RunProjectSendsFolder) {
    connectDevice("d1");
    ASSERT_TRUE(actions_.runProject("/work/demo").is_ok());
    ASSERT_EQ(registry_.sent.size(), 1u);
    EXPECT_EQ(registry_.sent[0].name, "run_project");
    EXPECT_EQ(registry_.sent[0].payload["id"], "/work/demo");
    EXPECT_EQ(registry_.sent[0].payload["folder"], "/work/demo");
}

TEST_F(ScriptActionsTest, SaveProjectDefaultsToWorkingDirectory) {
    connectDevice("d1");
    ASSERT_TRUE(actions_.saveProject().is_ok());
    ASSERT_EQ(registry_.sent.size(), 1u);
    EXPECT_EQ(registry_.sent[0].name, "save_project");
    EXPECT_FALSE(registry_.sent[0].payload["folder"].get<std::string>().empty());
}

// ---------------------------------------------------------------------------
// Session control
// ---------------------------------------------------------------------------
TEST_F(ScriptActionsTest, DisconnectAllClosesSessions) {
    connectDevice("d1");
    actions_.disconnectAll();
    EXPECT_EQ(registry_.disconnect_calls, 1);
    EXPECT_TRUE(registry_.sessions.empty());
    ASSERT_EQ(notifier_.infos.size(), 1u);
    EXPECT_EQ(notifier_.infos[0], "All AutoJs6 connections disconnected");
}

// ---------------------------------------------------------------------------
// Dispatcher wiring
// ---------------------------------------------------------------------------
TEST_F(ScriptActionsTest, RegisteredCommandsReachActions) {
    TaskScheduler scheduler;
    CommandDispatcher dispatcher(scheduler, notifier_);
    actions_.registerWith(dispatcher);
    connectDevice("d1");

    EXPECT_TRUE(dispatcher.hasHandler(CommandTag::Run));
    EXPECT_TRUE(dispatcher.hasHandler(CommandTag::RunProject));
    EXPECT_FALSE(dispatcher.hasHandler(CommandTag::Connect));
    EXPECT_FALSE(dispatcher.hasHandler(CommandTag::NewProject));

    ASSERT_TRUE(dispatcher.dispatch("run", {script_}).is_ok());
    ASSERT_TRUE(dispatcher.dispatch("stopAll").is_ok());
    ASSERT_TRUE(dispatcher.dispatch("viewDocument").is_ok());

    ASSERT_EQ(registry_.sent.size(), 2u);
    EXPECT_EQ(registry_.sent[0].name, "run");
    EXPECT_EQ(registry_.sent[1].name, "stopAll");
    EXPECT_EQ(notifier_.infos.back(), std::string("Documentation: ") + ScriptActions::DOCS_URL);
}

TEST_F(ScriptActionsTest, FailedActionIsNotADispatchError) {
    TaskScheduler scheduler;
    CommandDispatcher dispatcher(scheduler, notifier_);
    actions_.registerWith(dispatcher);

    EXPECT_TRUE(dispatcher.dispatch("run", {script_}).is_ok());
    EXPECT_EQ(notifier_.errors.size(), 1u);
    EXPECT_TRUE(registry_.sent.empty());
}
