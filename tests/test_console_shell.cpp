#include <gtest/gtest.h>
#include "console_shell.h"
#include "headless_simulator.h"
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace skyshare;

namespace {

class RecordingShell : public UiShell {
public:
    void invoke(const UiEvent& event) override { events.push_back(event); }
    bool exited() const override { return false; }

    bool saw(UiEventType type, const std::string& data) const {
        for (const auto& event : events) {
            if (event.type == type && event.data == data) return true;
        }
        return false;
    }

    std::vector<UiEvent> events;
};

}

class ConsoleShellTest : public ::testing::Test {
protected:
    void SetUp() override {
        controller_ = std::make_unique<SessionController>(events_, simulator_, Config(), "", "1.0");
        controller_->set_definitions_directory("no_such_definitions_directory");
    }

    bool run(const std::string& line) {
        return console_.handle_command(line, *controller_, simulator_);
    }

    ConsoleShell console_;
    RecordingShell events_;
    HeadlessSimulator simulator_;
    std::unique_ptr<SessionController> controller_;
};

TEST_F(ConsoleShellTest, RejectsMalformedCommands) {
    EXPECT_FALSE(run("fly"));
    EXPECT_FALSE(run("aircraft"));
    EXPECT_FALSE(run("host"));
    EXPECT_FALSE(run("host alice 25071 teleport"));
    EXPECT_FALSE(run("host alice 70000"));
    EXPECT_FALSE(run("join alice 127.0.0.1"));
    EXPECT_FALSE(run("join alice bad!host 25071"));
    EXPECT_FALSE(run("joinid alice"));
    EXPECT_FALSE(run("give"));
    EXPECT_FALSE(run("observe bob maybe"));

    // Blank lines are ignored
    EXPECT_TRUE(run(""));
    EXPECT_TRUE(run("help"));
}

TEST_F(ConsoleShellTest, HostWithoutAircraftReachesController) {
    ASSERT_TRUE(run("host alice 0"));
    controller_->tick();
    EXPECT_TRUE(events_.saw(UiEventType::ServerFail, "Select an aircraft config first!"));
}

TEST_F(ConsoleShellTest, MissingAircraftFileIsReported) {
    ASSERT_TRUE(run("aircraft missing.json"));
    ASSERT_TRUE(run("host alice 0 cloud"));
    controller_->tick();

    EXPECT_FALSE(controller_->has_session());
    EXPECT_TRUE(events_.saw(UiEventType::Error,
                            "Error loading definition files. Check the log for more information."));
}

TEST_F(ConsoleShellTest, StateCommandFeedsSimulator) {
    ASSERT_TRUE(run("state gear down"));
    std::string expected = "gear down";
    EXPECT_EQ(simulator_.get_all_current(), std::vector<uint8_t>(expected.begin(), expected.end()));
}

TEST_F(ConsoleShellTest, StartupListsConfig) {
    ASSERT_TRUE(run("disconnect"));
    controller_->post(app_messages::Startup{});
    controller_->tick();

    ASSERT_FALSE(events_.events.empty());
    EXPECT_EQ(events_.events.back().type, UiEventType::Config);
    EXPECT_NE(events_.events.back().data.find("\"update_rate\": 30"), std::string::npos);
}

TEST_F(ConsoleShellTest, ReadCommandsStopsAtQuit) {
    std::istringstream input("state one\nquit\nstate two\n");
    console_.read_commands(input, *controller_, simulator_);

    EXPECT_TRUE(console_.exited());
    std::string expected = "one";
    EXPECT_EQ(simulator_.get_all_current(), std::vector<uint8_t>(expected.begin(), expected.end()));
}

TEST_F(ConsoleShellTest, ReadCommandsExitsAtEndOfInput) {
    std::istringstream input("help\n");
    console_.read_commands(input, *controller_, simulator_);
    EXPECT_TRUE(console_.exited());
}

TEST(UiEventNames, MatchShellProtocol) {
    EXPECT_STREQ(ui_event_name(UiEventType::GainControl), "control");
    EXPECT_STREQ(ui_event_name(UiEventType::LoseControl), "lostcontrol");
    EXPECT_STREQ(ui_event_name(UiEventType::ServerStarted), "server");
}
