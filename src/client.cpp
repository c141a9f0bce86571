#include "client.h"
#include "log_macros.h"
#include "network_utils.h"

namespace skyshare {

Client::Client(const SessionSettings& settings)
    : TransferClient(settings), is_host_(false), started_(false), local_port_(0) {
}

Client::~Client() {
    shutdown_worker();
}

uint16_t Client::get_connected_count() const {
    // A relay host counts the peers the relay announced, a joiner only has its host
    return is_host_ ? cached_peer_count() : 1;
}

//=============================================================================
// Start
//=============================================================================

StartResult Client::start(const std::string& ip, uint16_t port) {
    if (started_) {
        return StartResult::failure("Client already started");
    }

    if (!network_utils::is_valid_ipv4(ip) && !network_utils::is_valid_ipv6(ip)) {
        return StartResult::failure("Invalid IP address " + ip);
    }
    SocketAddress host(network_utils::normalize_ip(ip), port);

    auto transport = std::make_unique<Transport>();
    std::string error;
    if (!bind_transport(*transport, host.is_ipv6(), 0, error)) {
        return StartResult::failure(error);
    }

    // Empty session id: no rendezvous, confirm directly
    if (!send_payload(*transport, payloads::Handshake{""}, host)) {
        return StartResult::failure("Could not send handshake to " + host.to_string());
    }

    LOG_CLIENT_INFO("Connecting directly to " << host.to_string());
    return begin(std::move(transport), "", std::nullopt, host);
}

StartResult Client::start_with_hole_punch(const std::string& session_id, bool is_ipv6) {
    if (started_) {
        return StartResult::failure("Client already started");
    }

    SocketAddress rendezvous;
    std::string error;
    if (!resolve_rendezvous(is_ipv6, rendezvous, error)) {
        return StartResult::failure(error);
    }

    auto transport = std::make_unique<Transport>();
    if (!bind_transport(*transport, is_ipv6, 0, error)) {
        return StartResult::failure(error);
    }

    // Ask the rendezvous server for the host of this session
    if (!send_payload(*transport, payloads::Handshake{session_id}, rendezvous)) {
        return StartResult::failure("Could not send handshake to " + rendezvous.to_string());
    }

    LOG_CLIENT_INFO("Requesting session " << session_id << " from " << rendezvous.to_string());
    return begin(std::move(transport), session_id, rendezvous, std::nullopt);
}

StartResult Client::start_with_relay(bool is_ipv6) {
    if (started_) {
        return StartResult::failure("Client already started");
    }

    SocketAddress relay;
    std::string error;
    if (!resolve_rendezvous(is_ipv6, relay, error)) {
        return StartResult::failure(error);
    }

    auto transport = std::make_unique<Transport>();
    if (!bind_transport(*transport, is_ipv6, 0, error)) {
        return StartResult::failure(error);
    }

    if (!send_payload(*transport, payloads::RequestHosting{}, relay)) {
        return StartResult::failure("Could not request hosting from " + relay.to_string());
    }

    is_host_ = true;
    session_.awaiting_hosting = true;

    LOG_CLIENT_INFO("Requesting hosting from relay " << relay.to_string());
    return begin(std::move(transport), "", relay, std::nullopt);
}

StartResult Client::begin(std::unique_ptr<Transport> transport, const std::string& session_id,
                          std::optional<SocketAddress> rendezvous, std::optional<SocketAddress> peer) {
    local_port_ = transport->local_port();
    set_session_id(session_id);

    session_.transport = std::move(transport);
    session_.session_id = session_id;
    session_.rendezvous = rendezvous;
    session_.peer = peer;
    session_.started = Clock::now();

    started_ = true;
    launch("client-session");
    return StartResult::ok();
}

//=============================================================================
// Worker loop
//=============================================================================

void Client::iterate(Clock::time_point now) {
    Transport& transport = *session_.transport;
    transport.manual_poll(now);

    TransportEvent event;
    while (transport.next_event(event)) {
        if (event.type == TransportEventType::ConnectionClosed) {
            bool is_rendezvous = session_.rendezvous && *session_.rendezvous == event.address;
            bool is_peer = session_.peer && *session_.peer == event.address;
            if (!is_rendezvous || is_peer) {
                stop_from_worker("No message received from server.");
            } else {
                LOG_CLIENT_DEBUG("Rendezvous connection closed");
            }
            continue;
        }

        DecodeResult decoded = decode_payload(event.payload);
        if (!decoded.success) {
            LOG_CLIENT_WARN("Dropping undecodable message from " << event.address.to_string() << ": "
                            << decoded.error_message);
            continue;
        }
        handle_message(event.address, decoded.payload);
    }

    if (!should_stop() && session_.rendezvous && !session_.peer &&
        now - session_.started >= std::chrono::milliseconds(settings().conn_timeout_ms)) {
        if (session_.awaiting_hosting) {
            LOG_CLIENT_ERROR("Relay did not answer the hosting request");
            set_stop_flag();
            push_inbound(Event(events::SessionIdFetchFailed{}));
        } else {
            stop_from_worker("Could not connect to session.");
        }
    }

    if (!should_stop()) {
        handle_retry(now);
    }
    handle_app_messages();
    maybe_push_metrics(transport, now);

    if (!should_stop()) {
        return;
    }
    // Flush what the last iteration queued (InitHandshake, acks)
    transport.manual_poll(now);
}

void Client::handle_message(const SocketAddress& from, const Payload& payload) {
    if (const auto* version = std::get_if<payloads::InvalidVersion>(&payload)) {
        stop_from_worker("Server has mismatching version " + version->server_version);
    } else if (std::holds_alternative<payloads::InvalidName>(payload)) {
        stop_from_worker(settings().name + " already in use!");
    } else if (const auto* handshake = std::get_if<payloads::Handshake>(&payload)) {
        handle_handshake(from, *handshake);
    } else if (const auto* attempt = std::get_if<payloads::AttemptConnection>(&payload)) {
        if (!session_.rendezvous || *session_.rendezvous != from) {
            LOG_CLIENT_WARN("Ignoring peer announcement from " << from.to_string());
            return;
        }
        LOG_CLIENT_INFO("Rendezvous announced host " << attempt->peer.to_string());
        session_.peer = attempt->peer;
    } else if (const auto* hosting = std::get_if<payloads::HostingReceived>(&payload)) {
        if (session_.awaiting_hosting && session_.rendezvous && *session_.rendezvous == from) {
            session_.awaiting_hosting = false;
            session_.session_id = hosting->session_id;
            session_.peer = from;
            session_.connected = true;
            LOG_CLIENT_INFO("Hosting through relay with session id " << hosting->session_id);
            push_inbound(Event(events::ConnectionEstablished{}));
        }
    }

    push_inbound(payload);
}

void Client::handle_handshake(const SocketAddress& from, const payloads::Handshake& handshake) {
    if (session_.connected) {
        return;
    }

    if (handshake.session_id != session_.session_id) {
        stop_from_worker("Handshake verification failed! Expected " + session_.session_id + ", got " +
                         handshake.session_id);
        return;
    }

    // The host may answer before the rendezvous announcement reached us
    if (!session_.peer) {
        session_.peer = from;
    }
    session_.connected = true;

    send_payload(*session_.transport, payloads::InitHandshake{settings().name, settings().version}, from);

    LOG_CLIENT_INFO("Established connection with " << from.to_string() << " on '" << handshake.session_id << "'");
    push_inbound(Event(events::ConnectionEstablished{}));
}

void Client::handle_retry(Clock::time_point now) {
    if (session_.connected || !session_.peer) {
        return;
    }

    if (session_.last_retry &&
        now - *session_.last_retry < std::chrono::milliseconds(HANDSHAKE_RETRY_INTERVAL_MS)) {
        return;
    }

    send_payload(*session_.transport, payloads::Handshake{session_.session_id}, *session_.peer);
    session_.last_retry = now;
    session_.retries++;

    LOG_CLIENT_INFO("Sent handshake to " << session_.peer->to_string() << ". Retry #" << session_.retries);

    if (session_.retries >= MAX_PUNCH_RETRIES) {
        LOG_CLIENT_WARN("No handshake answer from " << session_.peer->to_string() << ", giving up");
        if (set_stop_flag()) {
            push_inbound(Event(events::UnablePunchthrough{}));
        }
    }
}

void Client::handle_app_messages() {
    OutboundMessage message;
    while (pop_outbound(message)) {
        if (should_stop()) {
            continue;
        }
        if (!session_.peer) {
            LOG_CLIENT_DEBUG("No peer yet, dropping " << payload_type_name(message.payload));
            continue;
        }
        std::vector<uint8_t> bytes = encode_payload(message.payload);
        send_or_stop(*session_.transport, message.payload, bytes, *session_.peer, session_.peer->to_string());
    }
}

} // namespace skyshare
