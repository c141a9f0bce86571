#include "server.h"
#include "log_macros.h"

namespace skyshare {

Server::Server(const SessionSettings& settings)
    : TransferClient(settings), started_(false), local_port_(0) {
}

Server::~Server() {
    shutdown_worker();
}

//=============================================================================
// Start
//=============================================================================

StartResult Server::start(bool is_ipv6, uint16_t port) {
    if (started_) {
        return StartResult::failure("Server already started");
    }

    auto transport = std::make_unique<Transport>();
    std::string error;
    if (!bind_transport(*transport, is_ipv6, port, error)) {
        return StartResult::failure(error);
    }

    session_.hosting = true;
    push_inbound(Event(events::ConnectionEstablished{}));

    LOG_SERVER_INFO("Hosting on port " << transport->local_port());
    return begin(std::move(transport), std::nullopt);
}

StartResult Server::start_with_hole_punching(bool is_ipv6) {
    if (started_) {
        return StartResult::failure("Server already started");
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

    if (!send_payload(*transport, payloads::RequestHosting{}, rendezvous)) {
        return StartResult::failure("Could not request a session id from " + rendezvous.to_string());
    }

    LOG_SERVER_INFO("Requesting a session id from " << rendezvous.to_string());
    return begin(std::move(transport), rendezvous);
}

StartResult Server::begin(std::unique_ptr<Transport> transport, std::optional<SocketAddress> rendezvous) {
    local_port_ = transport->local_port();

    session_.transport = std::move(transport);
    session_.rendezvous = rendezvous;
    session_.started = Clock::now();
    session_.in_control = settings().name;

    started_ = true;
    launch("server-session");
    return StartResult::ok();
}

//=============================================================================
// Worker loop
//=============================================================================

void Server::iterate(Clock::time_point now) {
    Transport& transport = *session_.transport;
    transport.manual_poll(now);

    TransportEvent event;
    while (transport.next_event(event)) {
        if (event.type == TransportEventType::ConnectionClosed) {
            handle_connection_closed(event.address);
            continue;
        }

        DecodeResult decoded = decode_payload(event.payload);
        if (!decoded.success) {
            LOG_SERVER_WARN("Dropping undecodable message from " << event.address.to_string() << ": "
                            << decoded.error_message);
            continue;
        }

        if (session_.rendezvous && *session_.rendezvous == event.address) {
            handle_rendezvous_message(decoded.payload);
        } else {
            handle_message(event.address, decoded.payload);
        }
    }

    if (!session_.hosting && session_.rendezvous &&
        now - session_.started >= std::chrono::milliseconds(settings().conn_timeout_ms)) {
        LOG_SERVER_ERROR("Rendezvous server did not hand out a session id");
        if (set_stop_flag()) {
            push_inbound(Event(events::SessionIdFetchFailed{}));
        }
    }

    if (!should_stop()) {
        handle_punching(now);
    }
    handle_app_messages();
    maybe_push_metrics(transport, now);

    if (should_stop()) {
        transport.manual_poll(now);
    }
}

void Server::handle_rendezvous_message(const Payload& payload) {
    if (const auto* hosting = std::get_if<payloads::HostingReceived>(&payload)) {
        if (session_.hosting) {
            return;
        }
        session_.hosting = true;
        session_.session_id = hosting->session_id;
        LOG_SERVER_INFO("Hosting session " << hosting->session_id);
        push_inbound(Event(events::ConnectionEstablished{}));
        push_inbound(payload);
    } else if (const auto* attempt = std::get_if<payloads::AttemptConnection>(&payload)) {
        if (session_.peers.count(attempt->peer)) {
            return;
        }
        LOG_SERVER_INFO("Punching towards " << attempt->peer.to_string());
        session_.punching[attempt->peer] = PunchTarget();
    } else {
        LOG_SERVER_DEBUG("Ignoring " << payload_type_name(payload) << " from the rendezvous server");
    }
}

void Server::handle_message(const SocketAddress& from, const Payload& payload) {
    if (std::holds_alternative<payloads::Handshake>(payload)) {
        // Always answer so the joiner can verify the session id
        send_to(payloads::Handshake{session_.session_id}, from);

        if (session_.punching.erase(from) > 0) {
            LOG_SERVER_INFO("Hole punched to " << from.to_string());
            if (session_.rendezvous) {
                send_to(payloads::PeerEstablished{}, *session_.rendezvous);
            }
        }
        return;
    }

    if (const auto* init = std::get_if<payloads::InitHandshake>(&payload)) {
        handle_init_handshake(from, *init);
        return;
    }

    auto it = session_.peers.find(from);
    if (it == session_.peers.end()) {
        LOG_SERVER_DEBUG("Ignoring " << payload_type_name(payload) << " from unknown peer " << from.to_string());
        return;
    }
    handle_peer_message(from, it->second, payload);
}

void Server::handle_init_handshake(const SocketAddress& from, const payloads::InitHandshake& init) {
    if (session_.peers.count(from)) {
        return;
    }

    if (init.version != settings().version) {
        LOG_SERVER_WARN(init.name << " runs version " << init.version << ", expected " << settings().version);
        send_to(payloads::InvalidVersion{settings().version}, from);
        return;
    }

    if (name_in_use(init.name)) {
        LOG_SERVER_WARN("Rejecting " << from.to_string() << ": name " << init.name << " already in use");
        send_to(payloads::InvalidName{}, from);
        return;
    }

    // Roster for the joiner: the host first, then every accepted peer
    payloads::PlayerJoined host;
    host.name = settings().name;
    host.in_control = session_.in_control == settings().name;
    host.is_observer = false;
    host.is_server = true;
    send_to(host, from);

    for (const auto& entry : session_.peers) {
        payloads::PlayerJoined existing;
        existing.name = entry.second.name;
        existing.in_control = session_.in_control == entry.second.name;
        existing.is_observer = entry.second.is_observer;
        existing.is_server = false;
        send_to(existing, from);
    }

    payloads::PlayerJoined joined;
    joined.name = init.name;
    joined.in_control = false;
    joined.is_observer = true;
    joined.is_server = false;
    broadcast(joined, &from, false);

    PeerState state;
    state.name = init.name;
    session_.peers[from] = state;

    LOG_SERVER_INFO(init.name << " joined from " << from.to_string() << " (" << session_.peers.size() << " peers)");
    push_inbound(Payload(joined));
}

void Server::handle_peer_message(const SocketAddress& from, PeerState& peer, const Payload& payload) {
    if (const auto* update = std::get_if<payloads::Update>(&payload)) {
        payloads::Update relayed = *update;
        relayed.from = peer.name;
        broadcast(relayed, &from, true);
        push_inbound(Payload(relayed));
    } else if (std::holds_alternative<payloads::TransferControl>(payload) ||
               std::holds_alternative<payloads::SetObserver>(payload)) {
        apply_control_state(payload);
        broadcast(payload, &from, false);
        push_inbound(payload);
    } else if (std::holds_alternative<payloads::Ready>(payload)) {
        peer.ready = true;
        LOG_SERVER_INFO(peer.name << " is ready");
        push_inbound(payload);

        // The controlling peer owns the state the newcomer needs
        if (session_.in_control != settings().name) {
            for (const auto& entry : session_.peers) {
                if (entry.second.name == session_.in_control && entry.first != from) {
                    send_to(payload, entry.first);
                }
            }
        }
    } else {
        LOG_SERVER_DEBUG("Ignoring " << payload_type_name(payload) << " from " << peer.name);
    }
}

void Server::handle_connection_closed(const SocketAddress& address) {
    if (session_.rendezvous && *session_.rendezvous == address) {
        LOG_SERVER_WARN("Lost contact with the rendezvous server");
        return;
    }

    session_.punching.erase(address);

    auto it = session_.peers.find(address);
    if (it == session_.peers.end()) {
        return;
    }

    std::string name = it->second.name;
    session_.peers.erase(it);

    LOG_SERVER_INFO(name << " lost connection");
    payloads::PlayerLeft left{name};
    broadcast(left, nullptr, false);
    push_inbound(Payload(left));
}

void Server::handle_punching(Clock::time_point now) {
    for (auto it = session_.punching.begin(); it != session_.punching.end();) {
        PunchTarget& target = it->second;
        if (target.last_attempt &&
            now - *target.last_attempt < std::chrono::milliseconds(HANDSHAKE_RETRY_INTERVAL_MS)) {
            ++it;
            continue;
        }

        send_to(payloads::Handshake{session_.session_id}, it->first);
        target.last_attempt = now;
        target.retries++;

        if (target.retries >= MAX_PUNCH_RETRIES) {
            LOG_SERVER_WARN("Giving up punching towards " << it->first.to_string());
            it = session_.punching.erase(it);
        } else {
            ++it;
        }
    }
}

void Server::handle_app_messages() {
    OutboundMessage message;
    while (pop_outbound(message)) {
        if (should_stop()) {
            continue;
        }

        apply_control_state(message.payload);

        if (message.target.empty()) {
            bool ready_only = std::holds_alternative<payloads::Update>(message.payload);
            broadcast(message.payload, nullptr, ready_only);
            continue;
        }

        bool delivered = false;
        for (const auto& entry : session_.peers) {
            if (entry.second.name == message.target) {
                send_to(message.payload, entry.first);
                delivered = true;
                break;
            }
        }
        if (!delivered) {
            LOG_SERVER_WARN("No peer named " << message.target << ", dropping " << payload_type_name(message.payload));
        }
    }
}

//=============================================================================
// Helpers
//=============================================================================

void Server::apply_control_state(const Payload& payload) {
    if (const auto* transfer = std::get_if<payloads::TransferControl>(&payload)) {
        session_.in_control = transfer->to;
    } else if (const auto* observer = std::get_if<payloads::SetObserver>(&payload)) {
        for (auto& entry : session_.peers) {
            if (entry.second.name == observer->to) {
                entry.second.is_observer = observer->is_observer;
            }
        }
    }
}

bool Server::name_in_use(const std::string& name) const {
    if (name == settings().name) {
        return true;
    }
    for (const auto& entry : session_.peers) {
        if (entry.second.name == name) {
            return true;
        }
    }
    return false;
}

void Server::send_to(const Payload& payload, const SocketAddress& to) {
    send_or_stop(*session_.transport, payload, encode_payload(payload), to, peer_label(to));
}

std::string Server::peer_label(const SocketAddress& address) const {
    auto it = session_.peers.find(address);
    if (it == session_.peers.end() || it->second.name.empty()) {
        return address.to_string();
    }
    return it->second.name;
}

void Server::broadcast(const Payload& payload, const SocketAddress* except, bool ready_only) {
    std::vector<uint8_t> bytes = encode_payload(payload);
    for (const auto& entry : session_.peers) {
        if (should_stop()) {
            return;
        }
        if (except && entry.first == *except) {
            continue;
        }
        if (ready_only && !entry.second.ready) {
            continue;
        }
        send_or_stop(*session_.transport, payload, bytes, entry.first, peer_label(entry.first));
    }
}

} // namespace skyshare
