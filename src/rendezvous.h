#pragma once

#include "messages.h"
#include "threadmanager.h"
#include "transport.h"
#include <atomic>
#include <map>
#include <mutex>
#include <random>
#include <string>

namespace skyshare {

// Length of the session ids handed out to hosts
const size_t SESSION_ID_LENGTH = 6;

/**
 * Introduces joiners to hosts for hole punching.
 *
 * A host sends RequestHosting and receives a fresh session id. A joiner sends
 * Handshake{session_id}; both sides then receive AttemptConnection with the
 * other's public address and punch towards each other. A host whose
 * connection times out loses its session id.
 */
class RendezvousServer : public ThreadManager {
public:
    RendezvousServer();
    ~RendezvousServer() override;

    /**
     * Bind and start the worker. A server runs at most once.
     * @param bind_host Local address, "::" for dual stack
     * @param port Local port, 0 for an ephemeral one
     * @param error_out Bind error
     */
    bool start(const std::string& bind_host, uint16_t port, std::string& error_out,
               const TransportConfig& config = TransportConfig());

    void stop();

    bool is_running() const { return running_.load(); }
    uint16_t get_local_port() const { return local_port_; }

    /**
     * Number of hosts currently registered.
     */
    size_t get_session_count() const;

private:
    void worker_loop();
    void handle_message(const SocketAddress& from, const Payload& payload);
    void handle_connection_closed(const SocketAddress& address);
    void send_to(const Payload& payload, const SocketAddress& to);
    std::string generate_session_id();

    Transport transport_;
    std::atomic<bool> running_;
    uint16_t local_port_;

    std::map<std::string, SocketAddress> hosts_;   // session id -> host
    mutable std::mutex hosts_mutex_;

    std::mt19937 rng_;
};

} // namespace skyshare
