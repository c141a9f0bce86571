#pragma once

#include "transfer_client.h"
#include <map>
#include <memory>
#include <optional>

namespace skyshare {

/**
 * Hosting side of a session. Accepts peers after validating their version
 * and name, relays peer traffic between them and keeps track of who is in
 * control. The host itself starts in control.
 */
class Server : public TransferClient {
public:
    explicit Server(const SessionSettings& settings);
    ~Server() override;

    /**
     * Host directly on a local port.
     * @param is_ipv6 Bind a dual stack IPv6 socket
     * @param port Local port, 0 for an ephemeral one
     */
    StartResult start(bool is_ipv6, uint16_t port);

    /**
     * Register with the rendezvous server, which hands out the session id
     * joiners use to find us.
     */
    StartResult start_with_hole_punching(bool is_ipv6);

    bool is_host() const override { return true; }
    uint16_t get_connected_count() const override { return cached_peer_count(); }

    /**
     * Local port of the session socket, 0 before start.
     */
    uint16_t get_local_port() const { return local_port_; }

protected:
    void iterate(Clock::time_point now) override;

private:
    struct PeerState {
        std::string name;
        bool ready = false;
        bool is_observer = true;
    };

    struct PunchTarget {
        int retries = 0;
        std::optional<Clock::time_point> last_attempt;
    };

    // Worker owned state
    struct Session {
        std::unique_ptr<Transport> transport;
        std::string session_id;
        std::optional<SocketAddress> rendezvous;
        bool hosting = false;
        Clock::time_point started;
        std::map<SocketAddress, PeerState> peers;
        std::map<SocketAddress, PunchTarget> punching;
        std::string in_control;
    };

    StartResult begin(std::unique_ptr<Transport> transport, std::optional<SocketAddress> rendezvous);

    void handle_rendezvous_message(const Payload& payload);
    void handle_message(const SocketAddress& from, const Payload& payload);
    void handle_init_handshake(const SocketAddress& from, const payloads::InitHandshake& init);
    void handle_peer_message(const SocketAddress& from, PeerState& peer, const Payload& payload);
    void handle_connection_closed(const SocketAddress& address);
    void handle_punching(Clock::time_point now);
    void handle_app_messages();

    void apply_control_state(const Payload& payload);
    bool name_in_use(const std::string& name) const;
    void send_to(const Payload& payload, const SocketAddress& to);
    void broadcast(const Payload& payload, const SocketAddress* except, bool ready_only);
    std::string peer_label(const SocketAddress& address) const;

    Session session_;
    bool started_;
    uint16_t local_port_;
};

} // namespace skyshare
