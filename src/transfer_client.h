#pragma once

#include "messages.h"
#include "message_queue.h"
#include "threadmanager.h"
#include "transport.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace skyshare {

// Session timing
const int LOOP_SLEEP_TIME_MS = 10;
const int HANDSHAKE_RETRY_INTERVAL_MS = 1000;
const int MAX_PUNCH_RETRIES = 5;
const int METRICS_INTERVAL_MS = 1000;

/**
 * Session lifecycle notifications surfaced to the application next to payloads.
 */
namespace events {

struct ConnectionEstablished {};

struct ConnectionLost {
    std::string reason;
};

struct UnablePunchthrough {};

struct SessionIdFetchFailed {};

struct Metrics {
    NetworkMetrics metrics;
};

} // namespace events

using Event = std::variant<
    events::ConnectionEstablished,
    events::ConnectionLost,
    events::UnablePunchthrough,
    events::SessionIdFetchFailed,
    events::Metrics>;

/**
 * What a session hands to the application: a peer payload or a lifecycle event.
 */
using ReceiveMessage = std::variant<Payload, Event>;

/**
 * What the application hands to a session. An empty target means every peer.
 */
struct OutboundMessage {
    Payload payload;
    std::string target;
};

/**
 * Result of starting a session
 */
struct StartResult {
    bool success = false;
    std::string error_message;

    static StartResult ok() { return StartResult{true, ""}; }
    static StartResult failure(const std::string& message) { return StartResult{false, message}; }
};

/**
 * Parameters shared by every session kind.
 */
struct SessionSettings {
    std::string name;                 // our player name
    std::string version;              // protocol/application version sent in InitHandshake
    int conn_timeout_ms = 5000;       // rendezvous wait bound and transport idle timeout
    std::string rendezvous_host;      // rendezvous (and relay) server, IPv4
    std::string rendezvous_host_v6;   // rendezvous (and relay) server, IPv6
    uint16_t rendezvous_port = 0;
    std::string bind_host;            // local address, empty for any
    TransportConfig transport;        // idle_timeout_ms is overridden by conn_timeout_ms
};

/**
 * Uniform contract of a transfer session, implemented by Client and Server.
 *
 * A session owns one worker thread that drives the transport. The application
 * talks to it only through two queues and the stop flag: every call below
 * returns immediately and results are observed through get_next_message().
 */
class TransferClient : public ThreadManager {
public:
    explicit TransferClient(const SessionSettings& settings);
    ~TransferClient() override;

    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    /**
     * Send simulator state to every peer.
     * @param data Opaque state blob
     * @param is_unreliable true for high rate state on the best effort channel
     */
    void update(const std::vector<uint8_t>& data, bool is_unreliable);

    /**
     * Announce that `target` is now in control. Also delivered to our own queue.
     */
    void transfer_control(const std::string& target);

    /**
     * Take control from `from`, the peer currently in control. Also delivered to our own queue.
     */
    void take_control(const std::string& from);

    /**
     * Change the observer flag of `target`. Also delivered to our own queue.
     */
    void set_observer(const std::string& target, bool is_observer);

    /**
     * Tell the host we are ready to receive state.
     */
    void send_ready();

    /**
     * Ship the aircraft definition blob to one peer.
     */
    void send_definitions(const std::vector<uint8_t>& bytes, const std::string& target);

    /**
     * Pop the next inbound message without waiting.
     * @return false if nothing is pending
     */
    bool get_next_message(ReceiveMessage& out);

    virtual bool is_host() const = 0;
    virtual uint16_t get_connected_count() const = 0;

    /**
     * Session id of this session; empty for direct connections or before the
     * rendezvous server handed one out.
     */
    std::string get_session_id() const { return session_id_; }

    const std::string& get_server_name() const { return settings_.name; }

    /**
     * Terminate the session. Emits ConnectionLost(reason) unless the session
     * already stopped.
     */
    void stop(const std::string& reason);

    bool should_stop() const { return should_stop_.load(); }

protected:
    using Clock = Transport::Clock;

    /**
     * One worker iteration: poll, dispatch, retry, flush outbound messages.
     */
    virtual void iterate(Clock::time_point now) = 0;

    /**
     * Start the worker thread; the session must be fully set up.
     */
    void launch(const std::string& thread_name);

    /**
     * Stop and join the worker. Derived destructors call this before their
     * members go away.
     */
    void shutdown_worker();

    /**
     * Bind a transport for this session.
     */
    bool bind_transport(Transport& transport, bool is_ipv6, int port, std::string& error_out) const;

    /**
     * Resolve the configured rendezvous server for the given address family.
     */
    bool resolve_rendezvous(bool is_ipv6, SocketAddress& out, std::string& error_out) const;

    /**
     * Encode and queue a payload on its channel.
     */
    bool send_payload(Transport& transport, const Payload& payload, const SocketAddress& to) const;

    /**
     * Queue already encoded bytes of a payload from the worker. A reliable payload the transport
     * refuses ends the session with a reason naming the payload, its size and the recipient;
     * a refused unreliable payload is dropped.
     * @return true if the transport accepted the bytes
     */
    bool send_or_stop(Transport& transport, const Payload& payload, const std::vector<uint8_t>& bytes,
                      const SocketAddress& to, const std::string& recipient);

    /**
     * Emit a Metrics event once per METRICS_INTERVAL_MS.
     */
    void maybe_push_metrics(const Transport& transport, Clock::time_point now);

    // Worker side termination: sets the stop flag; only the first call emits ConnectionLost
    void stop_from_worker(const std::string& reason);

    // Set the stop flag without emitting anything
    bool set_stop_flag();

    void push_inbound(ReceiveMessage message) { inbound_.push(std::move(message)); }
    bool pop_outbound(OutboundMessage& out) { return outbound_.try_pop(out); }

    void set_session_id(const std::string& session_id) { session_id_ = session_id; }

    const SessionSettings& settings() const { return settings_; }
    uint16_t cached_peer_count() const { return peer_count_; }

private:
    void worker_loop();
    void queue_outbound(Payload payload, const std::string& target);
    void observe_inbound(const ReceiveMessage& message);

    SessionSettings settings_;
    std::atomic<bool> should_stop_;
    MessageQueue<ReceiveMessage> inbound_;
    MessageQueue<OutboundMessage> outbound_;
    Clock::time_point last_metrics_;

    // Application thread only
    std::string session_id_;
    uint16_t peer_count_;
};

} // namespace skyshare
