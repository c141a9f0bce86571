#include <gtest/gtest.h>
#include "client_registry.h"
#include <random>
#include <string>
#include <vector>

using namespace skyshare;

class ClientRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.add_client("host");
        registry_.set_server("host", true);
        registry_.add_client("alice");
        registry_.add_client("bob");
    }

    size_t controller_count(const std::vector<std::string>& names) const {
        size_t count = 0;
        for (const auto& name : names) {
            if (registry_.client_has_control(name)) count++;
        }
        return count;
    }

    ClientRegistry registry_;
};

TEST_F(ClientRegistryTest, AddAndRemove) {
    EXPECT_EQ(registry_.get_number_clients(), 3u);

    registry_.add_client("alice");
    EXPECT_EQ(registry_.get_number_clients(), 3u);

    registry_.remove_client("alice");
    EXPECT_EQ(registry_.get_number_clients(), 2u);

    // Removing an unknown name is a no-op
    registry_.remove_client("nobody");
    EXPECT_EQ(registry_.get_number_clients(), 2u);
}

TEST_F(ClientRegistryTest, Flags) {
    EXPECT_TRUE(registry_.client_is_server("host"));
    EXPECT_FALSE(registry_.client_is_server("alice"));

    registry_.set_observer("alice", true);
    EXPECT_TRUE(registry_.is_observer("alice"));
    EXPECT_FALSE(registry_.is_observer("bob"));

    registry_.set_observer("alice", false);
    EXPECT_FALSE(registry_.is_observer("alice"));

    // Unknown names have no flags and are not created
    registry_.set_observer("nobody", true);
    EXPECT_FALSE(registry_.is_observer("nobody"));
    EXPECT_EQ(registry_.get_number_clients(), 3u);
}

TEST_F(ClientRegistryTest, SingleController) {
    EXPECT_FALSE(registry_.get_client_in_control().has_value());

    registry_.set_client_control("alice");
    EXPECT_TRUE(registry_.client_has_control("alice"));
    EXPECT_EQ(registry_.get_client_in_control().value(), "alice");

    registry_.set_client_control("bob");
    EXPECT_FALSE(registry_.client_has_control("alice"));
    EXPECT_TRUE(registry_.client_has_control("bob"));

    registry_.set_no_control();
    EXPECT_FALSE(registry_.get_client_in_control().has_value());
}

TEST_F(ClientRegistryTest, SettingControlTwiceIsIdempotent) {
    registry_.set_client_control("bob");
    registry_.set_client_control("bob");

    EXPECT_TRUE(registry_.client_has_control("bob"));
    EXPECT_EQ(controller_count({"host", "alice", "bob"}), 1u);
}

TEST_F(ClientRegistryTest, UnknownControllerClearsControl) {
    registry_.set_client_control("alice");
    registry_.set_client_control("nobody");

    EXPECT_FALSE(registry_.get_client_in_control().has_value());
}

TEST_F(ClientRegistryTest, RemovingControllerClearsControl) {
    registry_.set_client_control("alice");
    registry_.remove_client("alice");

    EXPECT_FALSE(registry_.client_has_control("alice"));
    EXPECT_FALSE(registry_.get_client_in_control().has_value());

    // Rejoining does not bring control back
    registry_.add_client("alice");
    EXPECT_FALSE(registry_.client_has_control("alice"));
}

TEST_F(ClientRegistryTest, Reset) {
    registry_.set_client_control("bob");
    registry_.reset();

    EXPECT_EQ(registry_.get_number_clients(), 0u);
    EXPECT_FALSE(registry_.get_client_in_control().has_value());
    EXPECT_FALSE(registry_.client_is_server("host"));
}

TEST_F(ClientRegistryTest, AtMostOneControllerUnderRandomJoinsAndLeaves) {
    const std::vector<std::string> names = {"host", "alice", "bob", "carol", "dave"};
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> pick_name(0, static_cast<int>(names.size()) - 1);
    std::uniform_int_distribution<int> pick_action(0, 3);

    for (int step = 0; step < 5000; ++step) {
        const std::string& name = names[pick_name(rng)];
        switch (pick_action(rng)) {
            case 0: registry_.add_client(name); break;
            case 1: registry_.remove_client(name); break;
            case 2: registry_.set_client_control(name); break;
            case 3: registry_.set_no_control(); break;
        }

        ASSERT_LE(controller_count(names), 1u) << "step " << step;
        auto in_control = registry_.get_client_in_control();
        if (in_control) {
            ASSERT_TRUE(registry_.client_has_control(*in_control));
        }
    }
}
