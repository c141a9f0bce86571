#include "rendezvous.h"
#include "logger.h"

#define LOG_RENDEZVOUS_DEBUG(message) LOG_DEBUG("rendezvous", message)
#define LOG_RENDEZVOUS_INFO(message)  LOG_INFO("rendezvous", message)
#define LOG_RENDEZVOUS_WARN(message)  LOG_WARN("rendezvous", message)
#define LOG_RENDEZVOUS_ERROR(message) LOG_ERROR("rendezvous", message)

namespace skyshare {

namespace {
const int RENDEZVOUS_LOOP_MS = 10;
const char SESSION_ID_ALPHABET[] = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
}

RendezvousServer::RendezvousServer()
    : running_(false), local_port_(0), rng_(std::random_device{}()) {
}

RendezvousServer::~RendezvousServer() {
    stop();
}

bool RendezvousServer::start(const std::string& bind_host, uint16_t port, std::string& error_out,
                             const TransportConfig& config) {
    if (running_.load() || is_shutdown_requested()) {
        error_out = "Rendezvous server already started";
        return false;
    }

    if (!transport_.bind(bind_host, port, config, error_out)) {
        LOG_RENDEZVOUS_ERROR("Could not bind " << bind_host << ":" << port << ": " << error_out);
        return false;
    }
    local_port_ = transport_.local_port();

    running_.store(true);
    add_managed_thread(std::thread(&RendezvousServer::worker_loop, this), "rendezvous");

    LOG_RENDEZVOUS_INFO("Listening on " << bind_host << ":" << local_port_);
    return true;
}

void RendezvousServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    shutdown_all_threads();
    join_all_active_threads();
    transport_.close();

    std::lock_guard<std::mutex> lock(hosts_mutex_);
    hosts_.clear();
    LOG_RENDEZVOUS_INFO("Stopped");
}

size_t RendezvousServer::get_session_count() const {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    return hosts_.size();
}

//=============================================================================
// Worker
//=============================================================================

void RendezvousServer::worker_loop() {
    while (running_.load()) {
        transport_.manual_poll(Transport::Clock::now());

        TransportEvent event;
        while (transport_.next_event(event)) {
            if (event.type == TransportEventType::ConnectionClosed) {
                handle_connection_closed(event.address);
                continue;
            }

            DecodeResult decoded = decode_payload(event.payload);
            if (!decoded.success) {
                LOG_RENDEZVOUS_WARN("Dropping undecodable message from " << event.address.to_string() << ": "
                                    << decoded.error_message);
                continue;
            }
            handle_message(event.address, decoded.payload);
        }

        std::unique_lock<std::mutex> lock(shutdown_mutex_);
        shutdown_cv_.wait_for(lock, std::chrono::milliseconds(RENDEZVOUS_LOOP_MS),
                              [this] { return !running_.load() || is_shutdown_requested(); });
    }

    // Let queued answers leave before the socket closes
    transport_.manual_poll(Transport::Clock::now());
}

void RendezvousServer::handle_message(const SocketAddress& from, const Payload& payload) {
    if (std::holds_alternative<payloads::RequestHosting>(payload)) {
        std::string session_id;
        {
            std::lock_guard<std::mutex> lock(hosts_mutex_);
            // A host asking again gets a new id; the old one stops resolving
            for (auto it = hosts_.begin(); it != hosts_.end();) {
                if (it->second == from) {
                    it = hosts_.erase(it);
                } else {
                    ++it;
                }
            }
            do {
                session_id = generate_session_id();
            } while (hosts_.count(session_id));
            hosts_[session_id] = from;
        }

        LOG_RENDEZVOUS_INFO("Session " << session_id << " hosted by " << from.to_string());
        send_to(payloads::HostingReceived{session_id}, from);
        return;
    }

    if (const auto* handshake = std::get_if<payloads::Handshake>(&payload)) {
        SocketAddress host;
        {
            std::lock_guard<std::mutex> lock(hosts_mutex_);
            auto it = hosts_.find(handshake->session_id);
            if (it == hosts_.end()) {
                LOG_RENDEZVOUS_WARN(from.to_string() << " asked for unknown session '" << handshake->session_id << "'");
                return;
            }
            host = it->second;
        }

        if (host == from) {
            return;
        }

        LOG_RENDEZVOUS_INFO("Introducing " << from.to_string() << " to " << host.to_string()
                            << " for session " << handshake->session_id);
        send_to(payloads::AttemptConnection{from}, host);
        send_to(payloads::AttemptConnection{host}, from);
        return;
    }

    if (std::holds_alternative<payloads::PeerEstablished>(payload)) {
        LOG_RENDEZVOUS_DEBUG(from.to_string() << " reports a punched connection");
        return;
    }

    if (std::holds_alternative<payloads::Heartbeat>(payload)) {
        return;
    }

    LOG_RENDEZVOUS_DEBUG("Ignoring " << payload_type_name(payload) << " from " << from.to_string());
}

void RendezvousServer::handle_connection_closed(const SocketAddress& address) {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    for (auto it = hosts_.begin(); it != hosts_.end();) {
        if (it->second == address) {
            LOG_RENDEZVOUS_INFO("Session " << it->first << " closed, host " << address.to_string() << " went away");
            it = hosts_.erase(it);
        } else {
            ++it;
        }
    }
}

void RendezvousServer::send_to(const Payload& payload, const SocketAddress& to) {
    transport_.send(to, encode_payload(payload), channel_for(payload));
}

std::string RendezvousServer::generate_session_id() {
    std::uniform_int_distribution<size_t> pick(0, sizeof(SESSION_ID_ALPHABET) - 2);
    std::string id;
    for (size_t i = 0; i < SESSION_ID_LENGTH; ++i) {
        id += SESSION_ID_ALPHABET[pick(rng_)];
    }
    return id;
}

} // namespace skyshare
