#include <gtest/gtest.h>
#include "client.h"
#include "server.h"
#include "socket.h"
#include "test_utils.h"
#include <memory>
#include <string>

using namespace skyshare;
using skyshare::testing_utils::SessionRecorder;
using skyshare::testing_utils::wait_for_condition;

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().set_log_level(LogLevel::DEBUG);
        ASSERT_TRUE(init_socket_library());
    }

    void TearDown() override {
        cleanup_socket_library();
    }

    SessionSettings make_settings(const std::string& name, const std::string& version = "1.0") {
        SessionSettings settings;
        settings.name = name;
        settings.version = version;
        settings.conn_timeout_ms = 1000;
        settings.bind_host = "127.0.0.1";
        return settings;
    }

    std::unique_ptr<Server> start_host() {
        auto server = std::make_unique<Server>(make_settings("host"));
        StartResult result = server->start(false, 0);
        EXPECT_TRUE(result.success) << result.error_message;
        return server;
    }

    std::unique_ptr<Client> join(const Server& server, const std::string& name, const std::string& version = "1.0") {
        auto client = std::make_unique<Client>(make_settings(name, version));
        StartResult result = client->start("127.0.0.1", server.get_local_port());
        EXPECT_TRUE(result.success) << result.error_message;
        return client;
    }

    bool has_joined(SessionRecorder& recorder, const std::string& name) {
        for (const auto& joined : recorder.payloads<payloads::PlayerJoined>()) {
            if (joined.name == name) return true;
        }
        return false;
    }
};

TEST_F(SessionTest, HostStartsAndIsInControl) {
    auto server = start_host();
    SessionRecorder host(*server);

    EXPECT_NE(server->get_local_port(), 0);
    EXPECT_TRUE(server->is_host());
    EXPECT_TRUE(wait_for_condition([&] { return host.count_events<events::ConnectionEstablished>() == 1; }));
    EXPECT_EQ(server->get_session_id(), "");
    EXPECT_EQ(server->get_connected_count(), 0);
}

TEST_F(SessionTest, StartingTwiceFails) {
    auto server = start_host();
    EXPECT_FALSE(server->start(false, 0).success);
}

TEST_F(SessionTest, ClientRejectsInvalidAddress) {
    Client client(make_settings("alice"));
    StartResult result = client.start("not an ip", 1234);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
}

TEST_F(SessionTest, DirectConnection) {
    auto server = start_host();
    SessionRecorder host(*server);

    auto client = join(*server, "alice");
    SessionRecorder alice(*client);

    ASSERT_TRUE(wait_for_condition([&] { return alice.count_events<events::ConnectionEstablished>() == 1; }));
    ASSERT_TRUE(wait_for_condition([&] { return has_joined(host, "alice"); }));
    ASSERT_TRUE(wait_for_condition([&] { return has_joined(alice, "host"); }));

    auto roster = alice.payloads<payloads::PlayerJoined>();
    ASSERT_EQ(roster.size(), 1u);
    EXPECT_TRUE(roster[0].is_server);
    EXPECT_TRUE(roster[0].in_control);
    EXPECT_FALSE(roster[0].is_observer);

    auto joined = host.payloads<payloads::PlayerJoined>();
    ASSERT_EQ(joined.size(), 1u);
    EXPECT_TRUE(joined[0].is_observer);
    EXPECT_FALSE(joined[0].in_control);

    EXPECT_FALSE(client->is_host());
    EXPECT_EQ(client->get_connected_count(), 1);
    EXPECT_EQ(server->get_connected_count(), 1);
    EXPECT_EQ(alice.lost_reason(), "");
}

TEST_F(SessionTest, DuplicateNameIsRejected) {
    auto server = start_host();
    SessionRecorder host(*server);

    auto first = join(*server, "alice");
    ASSERT_TRUE(wait_for_condition([&] { return has_joined(host, "alice"); }));

    auto second = join(*server, "alice");
    SessionRecorder duplicate(*second);
    ASSERT_TRUE(wait_for_condition([&] { return !duplicate.lost_reason().empty(); }, 3000));
    EXPECT_EQ(duplicate.lost_reason(), "alice already in use!");

    // The host's name is taken as well
    auto third = join(*server, "host");
    SessionRecorder impostor(*third);
    ASSERT_TRUE(wait_for_condition([&] { return !impostor.lost_reason().empty(); }, 3000));
    EXPECT_EQ(impostor.lost_reason(), "host already in use!");

    EXPECT_EQ(host.count_payloads<payloads::PlayerJoined>(), 1u);
    EXPECT_EQ(server->get_connected_count(), 1);
}

TEST_F(SessionTest, VersionMismatchIsRejected) {
    auto server = start_host();
    SessionRecorder host(*server);

    auto client = join(*server, "alice", "0.9");
    SessionRecorder alice(*client);

    ASSERT_TRUE(wait_for_condition([&] { return !alice.lost_reason().empty(); }, 3000));
    EXPECT_EQ(alice.lost_reason(), "Server has mismatching version 1.0");
    EXPECT_EQ(host.count_payloads<payloads::PlayerJoined>(), 0u);
    EXPECT_TRUE(client->should_stop());
}

TEST_F(SessionTest, UpdatesOnlyReachReadyPeers) {
    auto server = start_host();
    SessionRecorder host(*server);
    auto client = join(*server, "alice");
    SessionRecorder alice(*client);
    ASSERT_TRUE(wait_for_condition([&] { return has_joined(host, "alice"); }));

    server->update({1, 2, 3}, false);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(alice.count_payloads<payloads::Update>(), 0u);

    client->send_ready();
    ASSERT_TRUE(wait_for_condition([&] { return host.count_payloads<payloads::Ready>() == 1; }));

    server->update({4, 5, 6}, false);
    ASSERT_TRUE(wait_for_condition([&] { return alice.count_payloads<payloads::Update>() == 1; }));

    auto updates = alice.payloads<payloads::Update>();
    EXPECT_EQ(updates[0].data, (std::vector<uint8_t>{4, 5, 6}));
    EXPECT_EQ(updates[0].from, "host");
    EXPECT_FALSE(updates[0].is_unreliable);
    EXPECT_GT(updates[0].time, 0.0);
}

TEST_F(SessionTest, ClientUpdatesReachHost) {
    auto server = start_host();
    SessionRecorder host(*server);
    auto client = join(*server, "alice");
    SessionRecorder alice(*client);
    ASSERT_TRUE(wait_for_condition([&] { return alice.count_events<events::ConnectionEstablished>() == 1; }));

    client->update({7, 7}, true);
    ASSERT_TRUE(wait_for_condition([&] { return host.count_payloads<payloads::Update>() >= 1; }));

    auto updates = host.payloads<payloads::Update>();
    EXPECT_EQ(updates[0].from, "alice");
    EXPECT_TRUE(updates[0].is_unreliable);
}

TEST_F(SessionTest, DefinitionsAreTargeted) {
    auto server = start_host();
    SessionRecorder host(*server);
    auto alice_client = join(*server, "alice");
    SessionRecorder alice(*alice_client);
    ASSERT_TRUE(wait_for_condition([&] { return has_joined(host, "alice"); }));
    auto bob_client = join(*server, "bob");
    SessionRecorder bob(*bob_client);
    ASSERT_TRUE(wait_for_condition([&] { return has_joined(host, "bob"); }));

    std::vector<uint8_t> definition(3000, 'd');
    server->send_definitions(definition, "bob");

    ASSERT_TRUE(wait_for_condition([&] { return bob.count_payloads<payloads::AircraftDefinition>() == 1; }));
    EXPECT_EQ(bob.payloads<payloads::AircraftDefinition>()[0].bytes, definition);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(alice.count_payloads<payloads::AircraftDefinition>(), 0u);
}

TEST_F(SessionTest, OversizedDefinitionEndsHostSession) {
    auto server = start_host();
    SessionRecorder host(*server);
    auto client = join(*server, "alice");
    SessionRecorder alice(*client);
    ASSERT_TRUE(wait_for_condition([&] { return has_joined(host, "alice"); }));

    // More than max_fragments * max_fragment_size
    std::vector<uint8_t> definition(300 * 1024, 'd');
    server->send_definitions(definition, "alice");

    ASSERT_TRUE(wait_for_condition([&] { return !host.lost_reason().empty(); }));
    EXPECT_NE(host.lost_reason().find("Could not send AircraftDefinition of "), std::string::npos);
    EXPECT_NE(host.lost_reason().find("to alice"), std::string::npos);
    EXPECT_EQ(host.count_events<events::ConnectionLost>(), 1u);

    ASSERT_TRUE(wait_for_condition([&] { return !alice.lost_reason().empty(); }, 4000));
    EXPECT_EQ(alice.count_payloads<payloads::AircraftDefinition>(), 0u);
}

TEST_F(SessionTest, OversizedDefinitionEndsClientSession) {
    auto server = start_host();
    SessionRecorder host(*server);
    auto client = join(*server, "alice");
    SessionRecorder alice(*client);
    ASSERT_TRUE(wait_for_condition([&] { return alice.count_events<events::ConnectionEstablished>() == 1; }));

    std::vector<uint8_t> definition(300 * 1024, 'd');
    client->send_definitions(definition, "");

    ASSERT_TRUE(wait_for_condition([&] { return !alice.lost_reason().empty(); }));
    EXPECT_NE(alice.lost_reason().find("Could not send AircraftDefinition of "), std::string::npos);
    EXPECT_EQ(host.count_payloads<payloads::AircraftDefinition>(), 0u);
}

TEST_F(SessionTest, RosterAndControlAreSharedWithNewPeers) {
    auto server = start_host();
    SessionRecorder host(*server);
    auto alice_client = join(*server, "alice");
    SessionRecorder alice(*alice_client);
    ASSERT_TRUE(wait_for_condition([&] { return has_joined(host, "alice"); }));

    // Alice takes control from the host; the announcement loops back to her
    alice_client->take_control("host");
    ASSERT_TRUE(wait_for_condition([&] { return alice.count_payloads<payloads::TransferControl>() == 1; }));
    ASSERT_TRUE(wait_for_condition([&] { return host.count_payloads<payloads::TransferControl>() == 1; }));
    EXPECT_EQ(host.payloads<payloads::TransferControl>()[0].to, "alice");

    auto bob_client = join(*server, "bob");
    SessionRecorder bob(*bob_client);
    ASSERT_TRUE(wait_for_condition([&] { return bob.count_payloads<payloads::PlayerJoined>() == 2; }));

    for (const auto& joined : bob.payloads<payloads::PlayerJoined>()) {
        if (joined.name == "host") {
            EXPECT_TRUE(joined.is_server);
            EXPECT_FALSE(joined.in_control);
        } else {
            EXPECT_EQ(joined.name, "alice");
            EXPECT_FALSE(joined.is_server);
            EXPECT_TRUE(joined.in_control);
        }
    }

    // Existing peers hear about the newcomer
    ASSERT_TRUE(wait_for_condition([&] { return has_joined(alice, "bob"); }));

    // Bob's Ready goes to the controlling peer
    bob_client->send_ready();
    ASSERT_TRUE(wait_for_condition([&] { return alice.count_payloads<payloads::Ready>() == 1; }));
}

TEST_F(SessionTest, ObserverChangesAreRelayed) {
    auto server = start_host();
    SessionRecorder host(*server);
    auto alice_client = join(*server, "alice");
    SessionRecorder alice(*alice_client);
    ASSERT_TRUE(wait_for_condition([&] { return has_joined(host, "alice"); }));

    server->set_observer("alice", false);

    // Loopback to the host plus delivery to alice
    ASSERT_TRUE(wait_for_condition([&] { return host.count_payloads<payloads::SetObserver>() == 1; }));
    ASSERT_TRUE(wait_for_condition([&] { return alice.count_payloads<payloads::SetObserver>() == 1; }));

    auto change = alice.payloads<payloads::SetObserver>()[0];
    EXPECT_EQ(change.from, "host");
    EXPECT_EQ(change.to, "alice");
    EXPECT_FALSE(change.is_observer);
}

TEST_F(SessionTest, DepartedPeerIsAnnounced) {
    auto server = start_host();
    SessionRecorder host(*server);
    auto alice_client = join(*server, "alice");
    ASSERT_TRUE(wait_for_condition([&] { return has_joined(host, "alice"); }));
    auto bob_client = join(*server, "bob");
    SessionRecorder bob(*bob_client);
    ASSERT_TRUE(wait_for_condition([&] { return has_joined(host, "bob"); }));

    alice_client->stop("Stopped.");
    alice_client.reset();

    ASSERT_TRUE(wait_for_condition([&] { return host.count_payloads<payloads::PlayerLeft>() == 1; }, 4000));
    EXPECT_EQ(host.payloads<payloads::PlayerLeft>()[0].name, "alice");
    ASSERT_TRUE(wait_for_condition([&] { return bob.count_payloads<payloads::PlayerLeft>() == 1; }));
    EXPECT_EQ(server->get_connected_count(), 1);
}

TEST_F(SessionTest, ClientNoticesHostGone) {
    auto server = start_host();
    auto client = join(*server, "alice");
    SessionRecorder alice(*client);
    ASSERT_TRUE(wait_for_condition([&] { return alice.count_events<events::ConnectionEstablished>() == 1; }));

    server.reset();

    ASSERT_TRUE(wait_for_condition([&] { return !alice.lost_reason().empty(); }, 4000));
    EXPECT_EQ(alice.lost_reason(), "No message received from server.");
    EXPECT_EQ(alice.count_events<events::ConnectionLost>(), 1u);
}

TEST_F(SessionTest, StopEmitsConnectionLostOnce) {
    auto server = start_host();
    SessionRecorder host(*server);

    server->stop("Stopped.");
    server->stop("Again.");

    ASSERT_TRUE(wait_for_condition([&] { return host.count_events<events::ConnectionLost>() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(host.count_events<events::ConnectionLost>(), 1u);
    EXPECT_EQ(host.lost_reason(), "Stopped.");
}

TEST_F(SessionTest, SessionIdMismatchNeverConnects) {
    // A host that answers with the wrong session id
    Transport fake_host;
    std::string error;
    ASSERT_TRUE(fake_host.bind("127.0.0.1", 0, TransportConfig(), error)) << error;

    Client client(make_settings("alice"));
    ASSERT_TRUE(client.start("127.0.0.1", fake_host.local_port()).success);
    SessionRecorder alice(client);

    bool answered = false;
    ASSERT_TRUE(wait_for_condition([&] {
        fake_host.manual_poll(Transport::Clock::now());
        TransportEvent event;
        while (fake_host.next_event(event)) {
            DecodeResult decoded = decode_payload(event.payload);
            if (decoded.success && std::holds_alternative<payloads::Handshake>(decoded.payload) && !answered) {
                fake_host.send(event.address, encode_payload(payloads::Handshake{"other"}), Channel::Unreliable);
                answered = true;
            }
        }
        return !alice.lost_reason().empty();
    }, 3000));

    std::string reason = alice.lost_reason();
    EXPECT_EQ(reason, "Handshake verification failed! Expected , got other");
    EXPECT_NE(reason.find("other"), std::string::npos);
    EXPECT_EQ(alice.count_events<events::ConnectionEstablished>(), 0u);
}

TEST_F(SessionTest, UnreachableHostGivesUpAfterRetries) {
    // Swallows everything without answering
    socket_t sink = create_udp_socket_v4("127.0.0.1", 0);
    ASSERT_TRUE(is_valid_socket(sink));
    ASSERT_TRUE(set_socket_nonblocking(sink));
    uint16_t sink_port = static_cast<uint16_t>(get_ephemeral_port(sink));

    Client client(make_settings("alice"));
    ASSERT_TRUE(client.start("127.0.0.1", sink_port).success);
    SessionRecorder alice(client);

    size_t datagrams = 0;
    auto drain_sink = [&] {
        SocketAddress from;
        while (!receive_udp_data(sink, 2048, from).empty()) {
            datagrams++;
        }
    };

    ASSERT_TRUE(wait_for_condition([&] {
        drain_sink();
        return alice.count_events<events::UnablePunchthrough>() == 1;
    }, (MAX_PUNCH_RETRIES + 2) * HANDSHAKE_RETRY_INTERVAL_MS));
    EXPECT_TRUE(client.should_stop());

    drain_sink();
    size_t sent_before = datagrams;
    EXPECT_GE(sent_before, static_cast<size_t>(MAX_PUNCH_RETRIES));
    EXPECT_LE(sent_before, static_cast<size_t>(MAX_PUNCH_RETRIES + 1));

    // Stopped sessions stay silent
    std::this_thread::sleep_for(std::chrono::milliseconds(HANDSHAKE_RETRY_INTERVAL_MS + 500));
    drain_sink();
    EXPECT_EQ(datagrams, sent_before);
    EXPECT_EQ(alice.count_events<events::UnablePunchthrough>(), 1u);
    EXPECT_EQ(alice.count_events<events::ConnectionLost>(), 0u);

    close_socket(sink);
}
