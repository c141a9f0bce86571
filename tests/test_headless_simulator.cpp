#include <gtest/gtest.h>
#include "headless_simulator.h"
#include "fs.h"
#include <string>
#include <vector>

using namespace skyshare;

namespace {

std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

SyncPermission master() {
    SyncPermission permission;
    permission.is_master = true;
    return permission;
}

}

TEST(HeadlessSimulatorTest, AcceptsJsonObjectDefinitions) {
    HeadlessSimulator simulator;
    std::string error;
    ASSERT_TRUE(simulator.load_config_from_bytes(bytes_of(R"({"aircraft": "c172"})"), error)) << error;
    EXPECT_EQ(simulator.get_definition_bytes(), bytes_of(R"({"aircraft": "c172"})"));
}

TEST(HeadlessSimulatorTest, RejectsBrokenDefinitions) {
    HeadlessSimulator simulator;
    std::string error;
    EXPECT_FALSE(simulator.load_config_from_bytes(bytes_of("[1, 2]"), error));
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(simulator.load_config_from_bytes(bytes_of("{ broken"), error));
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(simulator.load_config("no_such_definition.json", error));
    EXPECT_NE(error.find("Could not read"), std::string::npos);

    EXPECT_TRUE(simulator.get_definition_bytes().empty());
}

TEST(HeadlessSimulatorTest, LoadsDefinitionFromFile) {
    const std::string path = "test_headless_definition.json";
    ASSERT_TRUE(create_file(path, std::string("{}")));

    HeadlessSimulator simulator;
    std::string error;
    EXPECT_TRUE(simulator.load_config(path, error)) << error;
    EXPECT_EQ(simulator.get_definition_bytes(), bytes_of("{}"));

    delete_file(path);
}

TEST(HeadlessSimulatorTest, OnlyMasterSendsLocalChangesOnce) {
    HeadlessSimulator simulator;
    ASSERT_TRUE(simulator.connect());
    simulator.set_state(bytes_of("gear down"));

    EXPECT_TRUE(simulator.get_need_sync(SyncPermission()).reliable.empty());

    PendingChanges changes = simulator.get_need_sync(master());
    EXPECT_EQ(changes.reliable, bytes_of("gear down"));
    EXPECT_TRUE(changes.unreliable.empty());

    EXPECT_TRUE(simulator.get_need_sync(master()).reliable.empty());
}

TEST(HeadlessSimulatorTest, ClearSyncDropsPendingChange) {
    HeadlessSimulator simulator;
    simulator.set_state(bytes_of("flaps 10"));
    simulator.clear_sync();
    EXPECT_TRUE(simulator.get_need_sync(master()).reliable.empty());
    EXPECT_EQ(simulator.get_all_current(), bytes_of("flaps 10"));
}

TEST(HeadlessSimulatorTest, ReceivedStateIsAdoptedWithoutEcho) {
    HeadlessSimulator simulator;
    simulator.set_state(bytes_of("local"));

    std::string error;
    ASSERT_TRUE(simulator.on_receive_data(bytes_of("remote"), 12.5, master(), false, error));
    EXPECT_EQ(simulator.get_all_current(), bytes_of("remote"));
    EXPECT_TRUE(simulator.get_need_sync(master()).reliable.empty());
}
