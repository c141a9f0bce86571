#include "transfer_client.h"
#include "network_utils.h"
#include "logger.h"

#define LOG_SESSION_DEBUG(message) LOG_DEBUG("session", message)
#define LOG_SESSION_INFO(message)  LOG_INFO("session", message)
#define LOG_SESSION_WARN(message)  LOG_WARN("session", message)
#define LOG_SESSION_ERROR(message) LOG_ERROR("session", message)

namespace skyshare {

TransferClient::TransferClient(const SessionSettings& settings)
    : settings_(settings), should_stop_(false), peer_count_(0) {
    settings_.transport.idle_timeout_ms = settings_.conn_timeout_ms;
}

TransferClient::~TransferClient() {
    shutdown_worker();
}

//=============================================================================
// Application side
//=============================================================================

void TransferClient::update(const std::vector<uint8_t>& data, bool is_unreliable) {
    payloads::Update update;
    update.data = data;
    update.from = settings_.name;
    update.is_unreliable = is_unreliable;
    update.time = unix_time_now();
    queue_outbound(std::move(update), "");
}

void TransferClient::transfer_control(const std::string& target) {
    payloads::TransferControl message{settings_.name, target};
    push_inbound(Payload(message));
    queue_outbound(message, "");
}

void TransferClient::take_control(const std::string& from) {
    payloads::TransferControl message{from, settings_.name};
    push_inbound(Payload(message));
    queue_outbound(message, "");
}

void TransferClient::set_observer(const std::string& target, bool is_observer) {
    payloads::SetObserver message{settings_.name, target, is_observer};
    push_inbound(Payload(message));
    queue_outbound(message, "");
}

void TransferClient::send_ready() {
    queue_outbound(payloads::Ready{}, "");
}

void TransferClient::send_definitions(const std::vector<uint8_t>& bytes, const std::string& target) {
    queue_outbound(payloads::AircraftDefinition{bytes}, target);
}

bool TransferClient::get_next_message(ReceiveMessage& out) {
    if (!inbound_.try_pop(out)) {
        return false;
    }
    observe_inbound(out);
    return true;
}

void TransferClient::stop(const std::string& reason) {
    if (!set_stop_flag()) {
        LOG_SESSION_DEBUG("Session already stopped, ignoring stop: " << reason);
        return;
    }
    LOG_SESSION_INFO("Stopping session: " << reason);
    push_inbound(Event(events::ConnectionLost{reason}));
}

void TransferClient::queue_outbound(Payload payload, const std::string& target) {
    OutboundMessage message;
    message.payload = std::move(payload);
    message.target = target;
    outbound_.push(std::move(message));
}

void TransferClient::observe_inbound(const ReceiveMessage& message) {
    const Payload* payload = std::get_if<Payload>(&message);
    if (!payload) {
        return;
    }

    if (const auto* hosting = std::get_if<payloads::HostingReceived>(payload)) {
        session_id_ = hosting->session_id;
    } else if (const auto* joined = std::get_if<payloads::PlayerJoined>(payload)) {
        if (!joined->is_server) {
            peer_count_++;
        }
    } else if (std::holds_alternative<payloads::PlayerLeft>(*payload)) {
        if (peer_count_ > 0) {
            peer_count_--;
        }
    }
}

//=============================================================================
// Worker side
//=============================================================================

void TransferClient::launch(const std::string& thread_name) {
    last_metrics_ = Clock::now();
    add_managed_thread(std::thread(&TransferClient::worker_loop, this), thread_name);
}

void TransferClient::shutdown_worker() {
    set_stop_flag();
    shutdown_all_threads();
    join_all_active_threads();
}

void TransferClient::worker_loop() {
    LOG_SESSION_DEBUG("Worker for " << settings_.name << " started");

    while (true) {
        try {
            iterate(Clock::now());
        } catch (const std::exception& e) {
            LOG_SESSION_ERROR("Session worker failed: " << e.what());
            stop_from_worker(std::string("Internal error: ") + e.what());
        }

        if (should_stop()) {
            break;
        }

        std::unique_lock<std::mutex> lock(shutdown_mutex_);
        shutdown_cv_.wait_for(lock, std::chrono::milliseconds(LOOP_SLEEP_TIME_MS),
                              [this] { return should_stop(); });
    }

    LOG_SESSION_DEBUG("Worker for " << settings_.name << " finished");
}

bool TransferClient::set_stop_flag() {
    bool expected = false;
    bool first = should_stop_.compare_exchange_strong(expected, true);
    if (first) {
        notify_shutdown();
    }
    return first;
}

void TransferClient::stop_from_worker(const std::string& reason) {
    if (set_stop_flag()) {
        LOG_SESSION_INFO("Session terminated: " << reason);
        push_inbound(Event(events::ConnectionLost{reason}));
    }
}

bool TransferClient::bind_transport(Transport& transport, bool is_ipv6, int port, std::string& error_out) const {
    std::string host = settings_.bind_host;
    if (host.empty()) {
        host = is_ipv6 ? "::" : "0.0.0.0";
    }
    return transport.bind(host, port, settings_.transport, error_out);
}

bool TransferClient::resolve_rendezvous(bool is_ipv6, SocketAddress& out, std::string& error_out) const {
    const std::string& host = is_ipv6 ? settings_.rendezvous_host_v6 : settings_.rendezvous_host;
    if (host.empty() || settings_.rendezvous_port == 0) {
        error_out = "No rendezvous server configured";
        return false;
    }

    std::string ip = network_utils::resolve(host, is_ipv6);
    if (ip.empty()) {
        error_out = "Could not resolve rendezvous server " + host;
        return false;
    }

    out = SocketAddress(network_utils::normalize_ip(ip), settings_.rendezvous_port);
    return true;
}

bool TransferClient::send_payload(Transport& transport, const Payload& payload, const SocketAddress& to) const {
    return transport.send(to, encode_payload(payload), channel_for(payload));
}

bool TransferClient::send_or_stop(Transport& transport, const Payload& payload, const std::vector<uint8_t>& bytes,
                                  const SocketAddress& to, const std::string& recipient) {
    Channel channel = channel_for(payload);
    if (transport.send(to, bytes, channel)) {
        return true;
    }
    if (channel == Channel::Unreliable) {
        LOG_SESSION_DEBUG("Dropped " << payload_type_name(payload) << " to " << recipient);
        return false;
    }
    stop_from_worker(std::string("Could not send ") + payload_type_name(payload) + " of " +
                     std::to_string(bytes.size()) + " bytes to " + recipient);
    return false;
}

void TransferClient::maybe_push_metrics(const Transport& transport, Clock::time_point now) {
    if (now - last_metrics_ < std::chrono::milliseconds(METRICS_INTERVAL_MS)) {
        return;
    }
    last_metrics_ = now;
    push_inbound(Event(events::Metrics{transport.get_metrics()}));
}

} // namespace skyshare
