#pragma once

#include "transfer_client.h"
#include <memory>
#include <optional>

namespace skyshare {

/**
 * Joining side of a session (or the hosting side when hosting through a relay).
 *
 * Connection strategies:
 *  - start(): direct connection to a known address, confirmed with an empty session id
 *  - start_with_hole_punch(): ask the rendezvous server for the host behind
 *    `session_id` and punch towards the address it announces
 *  - start_with_relay(): host a session through the relay, which forwards
 *    every peer's traffic to us
 */
class Client : public TransferClient {
public:
    explicit Client(const SessionSettings& settings);
    ~Client() override;

    /**
     * Connect directly to a host.
     * @param ip Numeric IPv4 or IPv6 address of the host
     * @param port Host port
     */
    StartResult start(const std::string& ip, uint16_t port);

    /**
     * Connect to the host registered under `session_id` at the rendezvous server.
     */
    StartResult start_with_hole_punch(const std::string& session_id, bool is_ipv6);

    /**
     * Host a session through the relay server.
     */
    StartResult start_with_relay(bool is_ipv6);

    bool is_host() const override { return is_host_; }
    uint16_t get_connected_count() const override;

    /**
     * Local port of the session socket, 0 before start.
     */
    uint16_t get_local_port() const { return local_port_; }

protected:
    void iterate(Clock::time_point now) override;

private:
    // Worker owned state
    struct Session {
        std::unique_ptr<Transport> transport;
        std::string session_id;
        bool connected = false;
        std::optional<SocketAddress> peer;
        std::optional<SocketAddress> rendezvous;
        bool awaiting_hosting = false;   // relay hosting: waiting for HostingReceived
        Clock::time_point started;
        std::optional<Clock::time_point> last_retry;
        int retries = 0;
    };

    StartResult begin(std::unique_ptr<Transport> transport, const std::string& session_id,
                      std::optional<SocketAddress> rendezvous, std::optional<SocketAddress> peer);

    void handle_message(const SocketAddress& from, const Payload& payload);
    void handle_handshake(const SocketAddress& from, const payloads::Handshake& handshake);
    void handle_retry(Clock::time_point now);
    void handle_app_messages();

    Session session_;
    bool is_host_;
    bool started_;
    uint16_t local_port_;
};

} // namespace skyshare
