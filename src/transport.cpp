#include "transport.h"
#include "network_utils.h"
#include "logger.h"
#include <algorithm>

// Transport module logging macros
#define LOG_TRANSPORT_DEBUG(message) LOG_DEBUG("transport", message)
#define LOG_TRANSPORT_INFO(message)  LOG_INFO("transport", message)
#define LOG_TRANSPORT_WARN(message)  LOG_WARN("transport", message)
#define LOG_TRANSPORT_ERROR(message) LOG_ERROR("transport", message)

namespace skyshare {

namespace {

const size_t MAX_DATAGRAM_SIZE = 65536;
const int MAX_DATAGRAMS_PER_POLL = 4096;
const size_t BASE_HEADER_SIZE = 3;
const size_t RELIABLE_HEADER_SIZE = 7;
const size_t ACK_SIZE = 5;

bool elapsed_at_least(Transport::Clock::time_point now, Transport::Clock::time_point since, int ms) {
    return now - since >= std::chrono::milliseconds(ms);
}

} // namespace

Transport::Transport() : socket_(INVALID_SOCKET_VALUE), ipv6_(false), receive_buffer_(MAX_DATAGRAM_SIZE) {
}

Transport::~Transport() {
    close();
}

//=============================================================================
// Lifecycle
//=============================================================================

bool Transport::bind(const std::string& host, int port, const TransportConfig& config, std::string& error_out) {
    if (is_bound()) {
        error_out = "Transport is already bound";
        return false;
    }

    if (config.max_fragments == 0 || config.max_fragments > 255 || config.max_fragment_size == 0) {
        error_out = "Invalid fragmentation settings";
        return false;
    }

    std::string bind_host = host;
    bool ipv6 = false;
    if (bind_host.empty() || bind_host == "0.0.0.0") {
        bind_host.clear();
    } else if (bind_host == "::") {
        bind_host.clear();
        ipv6 = true;
    } else if (network_utils::is_valid_ipv6(bind_host)) {
        ipv6 = true;
    } else if (!network_utils::is_valid_ipv4(bind_host)) {
        error_out = "Invalid bind address " + host;
        LOG_TRANSPORT_ERROR(error_out);
        return false;
    }

    socket_t sock = ipv6 ? create_udp_socket_v6(bind_host, port, &error_out)
                         : create_udp_socket_v4(bind_host, port, &error_out);
    if (!is_valid_socket(sock)) {
        return false;
    }

    if (!set_socket_nonblocking(sock)) {
        error_out = "Failed to set socket to non-blocking mode";
        close_socket(sock);
        return false;
    }

    socket_ = sock;
    ipv6_ = ipv6;
    config_ = config;
    metrics_ = NetworkMetrics();

    LOG_TRANSPORT_INFO("Listening on " << (ipv6_ ? "[::]" : "0.0.0.0") << ":" << local_port());
    return true;
}

void Transport::close() {
    if (is_bound()) {
        close_socket(socket_);
        socket_ = INVALID_SOCKET_VALUE;
    }
    connections_.clear();
    send_queue_.clear();
    events_.clear();
}

uint16_t Transport::local_port() const {
    if (!is_bound()) {
        return 0;
    }
    return static_cast<uint16_t>(get_ephemeral_port(socket_));
}

//=============================================================================
// Sending
//=============================================================================

bool Transport::send(const SocketAddress& to, const std::vector<uint8_t>& payload, Channel channel) {
    if (!is_bound()) {
        LOG_TRANSPORT_WARN("Dropping message to " << to.to_string() << ": socket is not bound");
        return false;
    }

    if (channel == Channel::Unreliable) {
        if (payload.size() > config_.max_fragment_size) {
            LOG_TRANSPORT_WARN("Unreliable payload of " << payload.size() << " bytes exceeds the fragment size "
                               << config_.max_fragment_size);
            return false;
        }
        std::vector<uint8_t> datagram = make_header(KIND_UNRELIABLE);
        datagram.insert(datagram.end(), payload.begin(), payload.end());
        send_queue_.emplace_back(to, std::move(datagram));
        return true;
    }

    size_t fragment_count = payload.empty() ? 1
        : (payload.size() + config_.max_fragment_size - 1) / config_.max_fragment_size;
    if (fragment_count > config_.max_fragments) {
        LOG_TRANSPORT_WARN("Reliable payload of " << payload.size() << " bytes needs " << fragment_count
                           << " fragments, limit is " << config_.max_fragments);
        return false;
    }

    Connection& conn = get_connection(to, Clock::now());
    for (size_t index = 0; index < fragment_count; ++index) {
        size_t begin = index * config_.max_fragment_size;
        size_t end = std::min(payload.size(), begin + config_.max_fragment_size);

        uint16_t seq = conn.next_send_seq++;
        std::vector<uint8_t> datagram = make_header(KIND_RELIABLE);
        write_u16(datagram, seq);
        datagram.push_back(static_cast<uint8_t>(index));
        datagram.push_back(static_cast<uint8_t>(fragment_count));
        datagram.insert(datagram.end(), payload.begin() + begin, payload.begin() + end);

        PendingReliable pending;
        pending.datagram = std::move(datagram);
        conn.unacked[seq] = std::move(pending);
    }
    return true;
}

void Transport::send_control(const SocketAddress& to, PacketKind kind, uint16_t seq) {
    std::vector<uint8_t> datagram = make_header(kind);
    if (kind == KIND_ACK) {
        write_u16(datagram, seq);
    }
    send_queue_.emplace_back(to, std::move(datagram));
}

void Transport::send_raw(const SocketAddress& to, const std::vector<uint8_t>& datagram, Connection& conn,
                         Clock::time_point now) {
    int sent = send_udp_data(socket_, datagram, to);
    if (sent < 0) {
        LOG_TRANSPORT_DEBUG("Send to " << to.to_string() << " failed");
        return;
    }
    metrics_.sent_packets++;
    metrics_.sent_bytes += static_cast<uint64_t>(sent);
    conn.last_sent = now;
}

//=============================================================================
// Polling
//=============================================================================

void Transport::manual_poll(Clock::time_point now) {
    if (!is_bound()) {
        return;
    }

    for (int i = 0; i < MAX_DATAGRAMS_PER_POLL; ++i) {
        SocketAddress from;
        int received = receive_udp_data(socket_, receive_buffer_, from);
        if (received <= 0) {
            break;
        }
        handle_datagram(from, receive_buffer_.data(), static_cast<size_t>(received), now);
    }

    // First transmissions and retransmissions of reliable packets
    for (auto& entry : connections_) {
        Connection& conn = entry.second;
        for (auto& pending : conn.unacked) {
            PendingReliable& packet = pending.second;
            if (packet.sent && !elapsed_at_least(now, packet.last_sent, config_.resend_interval_ms)) {
                continue;
            }
            if (packet.sent) {
                metrics_.resent_packets++;
            }
            send_raw(entry.first, packet.datagram, conn, now);
            packet.sent = true;
            packet.last_sent = now;
        }
    }

    while (!send_queue_.empty()) {
        auto item = std::move(send_queue_.front());
        send_queue_.pop_front();
        send_raw(item.first, item.second, get_connection(item.first, now), now);
    }

    for (auto& entry : connections_) {
        Connection& conn = entry.second;
        if (conn.has_received && elapsed_at_least(now, conn.last_sent, config_.heartbeat_interval_ms)) {
            send_raw(entry.first, make_header(KIND_HEARTBEAT), conn, now);
        }
    }

    for (auto it = connections_.begin(); it != connections_.end();) {
        const Connection& conn = it->second;
        Clock::time_point reference = conn.has_received ? conn.last_received : conn.created;
        if (!elapsed_at_least(now, reference, config_.idle_timeout_ms)) {
            ++it;
            continue;
        }

        if (conn.has_received) {
            LOG_TRANSPORT_INFO("Connection to " << it->first.to_string() << " timed out");
            TransportEvent event;
            event.type = TransportEventType::ConnectionClosed;
            event.address = it->first;
            events_.push_back(std::move(event));
        } else {
            LOG_TRANSPORT_DEBUG("Dropping unanswered connection to " << it->first.to_string());
        }
        it = connections_.erase(it);
    }
}

bool Transport::next_event(TransportEvent& out) {
    if (events_.empty()) {
        return false;
    }
    out = std::move(events_.front());
    events_.pop_front();
    return true;
}

NetworkMetrics Transport::get_metrics() const {
    NetworkMetrics metrics = metrics_;
    metrics.pending_reliable = 0;
    for (const auto& entry : connections_) {
        metrics.pending_reliable += entry.second.unacked.size();
    }
    return metrics;
}

//=============================================================================
// Receiving
//=============================================================================

Transport::Connection& Transport::get_connection(const SocketAddress& address, Clock::time_point now) {
    auto it = connections_.find(address);
    if (it != connections_.end()) {
        return it->second;
    }

    Connection conn;
    conn.created = now;
    conn.last_sent = now;
    conn.last_received = now;
    LOG_TRANSPORT_DEBUG("New connection with " << address.to_string());
    return connections_.emplace(address, std::move(conn)).first->second;
}

void Transport::handle_datagram(const SocketAddress& from, const uint8_t* data, size_t size,
                                Clock::time_point now) {
    if (size < BASE_HEADER_SIZE || read_u16(data, 0) != MAGIC) {
        LOG_TRANSPORT_DEBUG("Ignoring foreign datagram of " << size << " bytes from " << from.to_string());
        return;
    }

    Connection& conn = get_connection(from, now);
    conn.has_received = true;
    conn.last_received = now;
    metrics_.received_packets++;
    metrics_.received_bytes += size;

    uint8_t kind = data[2];
    switch (kind) {
        case KIND_UNRELIABLE: {
            TransportEvent event;
            event.type = TransportEventType::Packet;
            event.address = from;
            event.channel = Channel::Unreliable;
            event.payload.assign(data + BASE_HEADER_SIZE, data + size);
            events_.push_back(std::move(event));
            break;
        }
        case KIND_RELIABLE: {
            if (size < RELIABLE_HEADER_SIZE) {
                LOG_TRANSPORT_DEBUG("Truncated reliable datagram from " << from.to_string());
                return;
            }
            ReceivedFragment fragment;
            uint16_t seq = read_u16(data, 3);
            fragment.index = data[5];
            fragment.count = data[6];
            if (fragment.count == 0 || fragment.index >= fragment.count) {
                LOG_TRANSPORT_DEBUG("Invalid fragment header from " << from.to_string());
                return;
            }
            fragment.payload.assign(data + RELIABLE_HEADER_SIZE, data + size);
            handle_reliable(from, conn, seq, std::move(fragment));
            break;
        }
        case KIND_ACK: {
            if (size < ACK_SIZE) {
                return;
            }
            conn.unacked.erase(read_u16(data, 3));
            break;
        }
        case KIND_HEARTBEAT:
            break;
        default:
            LOG_TRANSPORT_DEBUG("Unknown datagram kind " << static_cast<int>(kind) << " from " << from.to_string());
            break;
    }
}

void Transport::handle_reliable(const SocketAddress& from, Connection& conn, uint16_t seq,
                                ReceivedFragment fragment) {
    if (seq == conn.next_expected_seq) {
        send_control(from, KIND_ACK, seq);
        deliver_fragment(from, conn, fragment);
        conn.next_expected_seq++;

        auto it = conn.out_of_order.find(conn.next_expected_seq);
        while (it != conn.out_of_order.end()) {
            deliver_fragment(from, conn, it->second);
            conn.out_of_order.erase(it);
            conn.next_expected_seq++;
            it = conn.out_of_order.find(conn.next_expected_seq);
        }
        return;
    }

    if (sequence_less_than(seq, conn.next_expected_seq)) {
        // Already delivered, the ack was lost
        send_control(from, KIND_ACK, seq);
        return;
    }

    uint16_t distance = static_cast<uint16_t>(seq - conn.next_expected_seq);
    if (distance >= config_.receive_window) {
        // Not acked: the sender retransmits once the window has moved
        return;
    }

    send_control(from, KIND_ACK, seq);
    conn.out_of_order.emplace(seq, std::move(fragment));
}

void Transport::deliver_fragment(const SocketAddress& from, Connection& conn, ReceivedFragment& fragment) {
    if (fragment.index != conn.reassembly_next_index) {
        LOG_TRANSPORT_WARN("Fragment " << static_cast<int>(fragment.index) << " out of sequence from "
                           << from.to_string() << ", discarding partial message");
        conn.reassembly.clear();
        conn.reassembly_next_index = 0;
        if (fragment.index != 0) {
            return;
        }
    }

    conn.reassembly.insert(conn.reassembly.end(), fragment.payload.begin(), fragment.payload.end());
    conn.reassembly_next_index++;

    if (fragment.index + 1 == fragment.count) {
        TransportEvent event;
        event.type = TransportEventType::Packet;
        event.address = from;
        event.channel = Channel::Reliable;
        event.payload = std::move(conn.reassembly);
        events_.push_back(std::move(event));

        conn.reassembly.clear();
        conn.reassembly_next_index = 0;
    }
}

//=============================================================================
// Encoding helpers
//=============================================================================

std::vector<uint8_t> Transport::make_header(PacketKind kind) {
    std::vector<uint8_t> out;
    write_u16(out, MAGIC);
    out.push_back(static_cast<uint8_t>(kind));
    return out;
}

void Transport::write_u16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint16_t Transport::read_u16(const uint8_t* in, size_t offset) {
    return static_cast<uint16_t>((in[offset] << 8) | in[offset + 1]);
}

} // namespace skyshare
