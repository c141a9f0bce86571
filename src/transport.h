#pragma once

#include "socket.h"
#include "messages.h"
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace skyshare {

/**
 * Transport tuning. All intervals are in milliseconds.
 */
struct TransportConfig {
    int idle_timeout_ms;          // silence after which a connection is closed
    int heartbeat_interval_ms;    // keep-alive cadence on quiet connections
    int resend_interval_ms;       // retransmission cadence of unacked reliable packets
    size_t max_fragment_size;     // payload bytes per datagram
    size_t max_fragments;         // fragments per reliable message, at most 255
    uint16_t receive_window;      // reliable packets buffered ahead of the next expected one

    TransportConfig()
        : idle_timeout_ms(5000), heartbeat_interval_ms(500), resend_interval_ms(100),
          max_fragment_size(1024), max_fragments(255), receive_window(1024) {}
};

/**
 * Transport statistics, cumulative since bind.
 */
struct NetworkMetrics {
    uint64_t sent_packets = 0;
    uint64_t received_packets = 0;
    uint64_t sent_bytes = 0;
    uint64_t received_bytes = 0;
    uint64_t resent_packets = 0;
    uint64_t pending_reliable = 0;   // reliable packets waiting for an ack
};

enum class TransportEventType {
    Packet,             // a complete message arrived
    ConnectionClosed    // an established connection went silent
};

struct TransportEvent {
    TransportEventType type;
    SocketAddress address;
    std::vector<uint8_t> payload;
    Channel channel;

    TransportEvent() : type(TransportEventType::Packet), channel(Channel::Reliable) {}
};

/**
 * Datagram transport with a best-effort and a reliable-ordered channel
 * per remote address, on top of one non-blocking UDP socket.
 *
 * Datagram layout (big endian): magic u16 0x534B, kind u8, then
 *   kind 0 (unreliable): payload
 *   kind 1 (reliable):   seq u16, fragment index u8, fragment count u8, payload
 *   kind 2 (ack):        seq u16
 *   kind 3 (heartbeat):  nothing
 *
 * Not thread safe: a transport is driven by a single owner, which calls
 * send(), manual_poll() and next_event().
 */
class Transport {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr uint16_t MAGIC = 0x534B;

    Transport();
    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    /**
     * Bind the socket. An IPv6 host ("::" or an IPv6 literal) produces a
     * dual stack socket that also reaches IPv4 peers.
     * @param host Local numeric address, "0.0.0.0" / "::" for any
     * @param port Local port, 0 for an ephemeral port
     * @param config Timeouts and fragmentation limits
     * @param error_out Description of the failure (invalid address, port in use)
     * @return true if the socket is bound
     */
    bool bind(const std::string& host, int port, const TransportConfig& config, std::string& error_out);

    /**
     * Close the socket and forget every connection.
     */
    void close();

    bool is_bound() const { return is_valid_socket(socket_); }
    bool is_ipv6() const { return ipv6_; }
    uint16_t local_port() const;

    /**
     * Queue a message for `to`; it leaves the socket on the next manual_poll().
     * @return false if the payload does not fit the channel (unreliable
     *         payloads are limited to one fragment) or the socket is not bound
     */
    bool send(const SocketAddress& to, const std::vector<uint8_t>& payload, Channel channel);

    /**
     * Drain the socket, process acks, retransmit, send heartbeats, expire
     * idle connections and flush queued datagrams. Never blocks.
     */
    void manual_poll(Clock::time_point now);

    /**
     * Pop the next event produced by manual_poll().
     * @return false when no event is pending (read timeout)
     */
    bool next_event(TransportEvent& out);

    NetworkMetrics get_metrics() const;
    size_t get_connection_count() const { return connections_.size(); }

private:
    enum PacketKind : uint8_t {
        KIND_UNRELIABLE = 0,
        KIND_RELIABLE = 1,
        KIND_ACK = 2,
        KIND_HEARTBEAT = 3
    };

    struct PendingReliable {
        std::vector<uint8_t> datagram;
        Clock::time_point last_sent;
        bool sent = false;
    };

    struct ReceivedFragment {
        uint8_t index = 0;
        uint8_t count = 0;
        std::vector<uint8_t> payload;
    };

    struct Connection {
        uint16_t next_send_seq = 0;
        uint16_t next_expected_seq = 0;
        std::map<uint16_t, PendingReliable> unacked;
        std::map<uint16_t, ReceivedFragment> out_of_order;
        std::vector<uint8_t> reassembly;
        uint8_t reassembly_next_index = 0;
        Clock::time_point created;
        Clock::time_point last_received;
        Clock::time_point last_sent;
        bool has_received = false;
    };

    Connection& get_connection(const SocketAddress& address, Clock::time_point now);
    void handle_datagram(const SocketAddress& from, const uint8_t* data, size_t size, Clock::time_point now);
    void handle_reliable(const SocketAddress& from, Connection& conn, uint16_t seq,
                         ReceivedFragment fragment);
    void deliver_fragment(const SocketAddress& from, Connection& conn, ReceivedFragment& fragment);
    void send_control(const SocketAddress& to, PacketKind kind, uint16_t seq);
    void send_raw(const SocketAddress& to, const std::vector<uint8_t>& datagram, Connection& conn,
                  Clock::time_point now);

    static std::vector<uint8_t> make_header(PacketKind kind);
    static void write_u16(std::vector<uint8_t>& out, uint16_t value);
    static uint16_t read_u16(const uint8_t* in, size_t offset);

    socket_t socket_;
    bool ipv6_;
    TransportConfig config_;
    std::map<SocketAddress, Connection> connections_;
    std::deque<std::pair<SocketAddress, std::vector<uint8_t>>> send_queue_;
    std::deque<TransportEvent> events_;
    NetworkMetrics metrics_;
    std::vector<uint8_t> receive_buffer_;   // reused by every manual_poll
};

/**
 * Wrap-around comparison of 16-bit sequence numbers: true if s1 is newer than s2.
 */
inline bool sequence_greater_than(uint16_t s1, uint16_t s2) {
    return ((s1 > s2) && (s1 - s2 <= 32768)) ||
           ((s1 < s2) && (s2 - s1 > 32768));
}

inline bool sequence_less_than(uint16_t s1, uint16_t s2) {
    return sequence_greater_than(s2, s1);
}

} // namespace skyshare
