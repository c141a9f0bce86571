#include <gtest/gtest.h>
#include "client.h"
#include "rendezvous.h"
#include "server.h"
#include "socket.h"
#include "test_utils.h"
#include <memory>
#include <string>

using namespace skyshare;
using skyshare::testing_utils::SessionRecorder;
using skyshare::testing_utils::wait_for_condition;

class HolePunchTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().set_log_level(LogLevel::DEBUG);
        ASSERT_TRUE(init_socket_library());

        TransportConfig config;
        config.idle_timeout_ms = 1000;
        std::string error;
        ASSERT_TRUE(rendezvous_.start("127.0.0.1", 0, error, config)) << error;
    }

    void TearDown() override {
        rendezvous_.stop();
        cleanup_socket_library();
    }

    SessionSettings make_settings(const std::string& name, uint16_t rendezvous_port) {
        SessionSettings settings;
        settings.name = name;
        settings.version = "1.0";
        settings.conn_timeout_ms = 1000;
        settings.bind_host = "127.0.0.1";
        settings.rendezvous_host = "127.0.0.1";
        settings.rendezvous_host_v6 = "::1";
        settings.rendezvous_port = rendezvous_port;
        return settings;
    }

    SessionSettings make_settings(const std::string& name) {
        return make_settings(name, rendezvous_.get_local_port());
    }

    // Host through the rendezvous server and wait for the session id
    std::unique_ptr<Server> host_session(SessionRecorder*& recorder_out) {
        auto server = std::make_unique<Server>(make_settings("host"));
        StartResult result = server->start_with_hole_punching(false);
        EXPECT_TRUE(result.success) << result.error_message;
        host_recorder_ = std::make_unique<SessionRecorder>(*server);
        recorder_out = host_recorder_.get();
        EXPECT_TRUE(wait_for_condition([&] {
            return host_recorder_->count_payloads<payloads::HostingReceived>() == 1;
        }, 3000));
        return server;
    }

    RendezvousServer rendezvous_;
    std::unique_ptr<SessionRecorder> host_recorder_;
};

TEST_F(HolePunchTest, HostReceivesSessionId) {
    SessionRecorder* host = nullptr;
    auto server = host_session(host);

    std::string session_id = server->get_session_id();
    EXPECT_EQ(session_id.size(), SESSION_ID_LENGTH);
    EXPECT_EQ(host->count_events<events::ConnectionEstablished>(), 1u);
    EXPECT_EQ(rendezvous_.get_session_count(), 1u);
}

TEST_F(HolePunchTest, SessionIdsAreNotReused) {
    SessionRecorder* first_recorder = nullptr;
    auto first = host_session(first_recorder);
    std::string first_id = first->get_session_id();

    SessionRecorder* second_recorder = nullptr;
    auto second = host_session(second_recorder);

    EXPECT_NE(second->get_session_id(), first_id);
    EXPECT_EQ(rendezvous_.get_session_count(), 2u);
}

TEST_F(HolePunchTest, JoinerConnectsThroughRendezvous) {
    SessionRecorder* host = nullptr;
    auto server = host_session(host);
    std::string session_id = server->get_session_id();
    ASSERT_FALSE(session_id.empty());

    Client client(make_settings("alice"));
    ASSERT_TRUE(client.start_with_hole_punch(session_id, false).success);
    SessionRecorder alice(client);

    ASSERT_TRUE(wait_for_condition([&] { return alice.count_events<events::ConnectionEstablished>() == 1; }, 3000));
    ASSERT_TRUE(wait_for_condition([&] { return host->count_payloads<payloads::PlayerJoined>() == 1; }, 3000));

    EXPECT_EQ(host->payloads<payloads::PlayerJoined>()[0].name, "alice");
    EXPECT_EQ(client.get_session_id(), session_id);
    EXPECT_EQ(alice.lost_reason(), "");

    // Live traffic flows host -> joiner once ready
    client.send_ready();
    ASSERT_TRUE(wait_for_condition([&] { return host->count_payloads<payloads::Ready>() == 1; }));
    server->update({1, 2}, false);
    ASSERT_TRUE(wait_for_condition([&] { return alice.count_payloads<payloads::Update>() == 1; }));
}

TEST_F(HolePunchTest, UnknownSessionTimesOut) {
    Client client(make_settings("alice"));
    ASSERT_TRUE(client.start_with_hole_punch("NOPE42", false).success);
    SessionRecorder alice(client);

    ASSERT_TRUE(wait_for_condition([&] { return !alice.lost_reason().empty(); }, 3000));
    EXPECT_EQ(alice.lost_reason(), "Could not connect to session.");
    EXPECT_EQ(alice.count_events<events::UnablePunchthrough>(), 0u);
}

TEST_F(HolePunchTest, HostingFailsWithoutRendezvous) {
    // Silent endpoint standing in for an unreachable rendezvous server
    socket_t sink = create_udp_socket_v4("127.0.0.1", 0);
    ASSERT_TRUE(is_valid_socket(sink));
    uint16_t sink_port = static_cast<uint16_t>(get_ephemeral_port(sink));

    Server server(make_settings("host", sink_port));
    ASSERT_TRUE(server.start_with_hole_punching(false).success);
    SessionRecorder host(server);

    ASSERT_TRUE(wait_for_condition([&] { return host.count_events<events::SessionIdFetchFailed>() == 1; }, 3000));
    EXPECT_TRUE(server.should_stop());
    EXPECT_EQ(host.count_events<events::ConnectionEstablished>(), 0u);
    EXPECT_EQ(host.count_events<events::ConnectionLost>(), 0u);

    close_socket(sink);
}

TEST_F(HolePunchTest, NoRendezvousConfigured) {
    SessionSettings settings = make_settings("host");
    settings.rendezvous_host.clear();

    Server server(settings);
    StartResult result = server.start_with_hole_punching(false);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
}

TEST_F(HolePunchTest, RelayHosting) {
    Client client(make_settings("host"));
    ASSERT_TRUE(client.start_with_relay(false).success);
    SessionRecorder relay_host(client);

    ASSERT_TRUE(wait_for_condition([&] { return relay_host.count_events<events::ConnectionEstablished>() == 1; }, 3000));
    EXPECT_TRUE(client.is_host());
    EXPECT_EQ(client.get_session_id().size(), SESSION_ID_LENGTH);
    EXPECT_EQ(client.get_connected_count(), 0);
}

TEST_F(HolePunchTest, DepartedHostReleasesSessionId) {
    SessionRecorder* host = nullptr;
    auto server = host_session(host);
    ASSERT_EQ(rendezvous_.get_session_count(), 1u);

    server.reset();
    host_recorder_.reset();

    EXPECT_TRUE(wait_for_condition([&] { return rendezvous_.get_session_count() == 0; }, 3000));
}
