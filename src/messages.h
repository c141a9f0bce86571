#pragma once

#include "socket.h"
#include <string>
#include <vector>
#include <variant>
#include <cstdint>

namespace skyshare {

/**
 * Wire messages exchanged between peers and with the rendezvous server.
 * Every message is self-describing: it carries its own type tag on the wire.
 */
namespace payloads {

struct Handshake {
    std::string session_id;   // "" confirms a direct connection
};

struct InitHandshake {
    std::string name;
    std::string version;
};

struct AttemptConnection {
    SocketAddress peer;
};

struct PeerEstablished {};

struct InvalidVersion {
    std::string server_version;
};

struct InvalidName {};

struct RequestHosting {};

struct HostingReceived {
    std::string session_id;
};

struct PlayerJoined {
    std::string name;
    bool in_control = false;
    bool is_observer = false;
    bool is_server = false;
};

struct PlayerLeft {
    std::string name;
};

/**
 * Opaque simulator state. `time` is seconds since the unix epoch at the
 * sender, used by the consumer to discard stale unreliable updates.
 */
struct Update {
    std::vector<uint8_t> data;
    std::string from;
    bool is_unreliable = false;
    double time = 0.0;
};

struct TransferControl {
    std::string from;
    std::string to;
};

struct SetObserver {
    std::string from;
    std::string to;
    bool is_observer = false;
};

struct SetHost {};

struct AircraftDefinition {
    std::vector<uint8_t> bytes;
};

struct Ready {};

struct Heartbeat {};

inline bool operator==(const Handshake& a, const Handshake& b) { return a.session_id == b.session_id; }
inline bool operator==(const InitHandshake& a, const InitHandshake& b) { return a.name == b.name && a.version == b.version; }
inline bool operator==(const AttemptConnection& a, const AttemptConnection& b) { return a.peer == b.peer; }
inline bool operator==(const PeerEstablished&, const PeerEstablished&) { return true; }
inline bool operator==(const InvalidVersion& a, const InvalidVersion& b) { return a.server_version == b.server_version; }
inline bool operator==(const InvalidName&, const InvalidName&) { return true; }
inline bool operator==(const RequestHosting&, const RequestHosting&) { return true; }
inline bool operator==(const HostingReceived& a, const HostingReceived& b) { return a.session_id == b.session_id; }
inline bool operator==(const PlayerJoined& a, const PlayerJoined& b) {
    return a.name == b.name && a.in_control == b.in_control &&
           a.is_observer == b.is_observer && a.is_server == b.is_server;
}
inline bool operator==(const PlayerLeft& a, const PlayerLeft& b) { return a.name == b.name; }
inline bool operator==(const Update& a, const Update& b) {
    return a.data == b.data && a.from == b.from && a.is_unreliable == b.is_unreliable && a.time == b.time;
}
inline bool operator==(const TransferControl& a, const TransferControl& b) { return a.from == b.from && a.to == b.to; }
inline bool operator==(const SetObserver& a, const SetObserver& b) {
    return a.from == b.from && a.to == b.to && a.is_observer == b.is_observer;
}
inline bool operator==(const SetHost&, const SetHost&) { return true; }
inline bool operator==(const AircraftDefinition& a, const AircraftDefinition& b) { return a.bytes == b.bytes; }
inline bool operator==(const Ready&, const Ready&) { return true; }
inline bool operator==(const Heartbeat&, const Heartbeat&) { return true; }

} // namespace payloads

using Payload = std::variant<
    payloads::Handshake,
    payloads::InitHandshake,
    payloads::AttemptConnection,
    payloads::PeerEstablished,
    payloads::InvalidVersion,
    payloads::InvalidName,
    payloads::RequestHosting,
    payloads::HostingReceived,
    payloads::PlayerJoined,
    payloads::PlayerLeft,
    payloads::Update,
    payloads::TransferControl,
    payloads::SetObserver,
    payloads::SetHost,
    payloads::AircraftDefinition,
    payloads::Ready,
    payloads::Heartbeat>;

/**
 * Logical delivery channel of a message on the transport.
 */
enum class Channel {
    Reliable,     // acknowledged, retransmitted, ordered per sender
    Unreliable    // best effort, may be dropped or reordered
};

/**
 * Result of decoding a datagram payload.
 */
struct DecodeResult {
    bool success;
    Payload payload;
    std::string error_message;

    DecodeResult() : success(false) {}
};

/**
 * Encode a message into its canonical MessagePack form.
 * Encoding the decoded form of any encoder output yields the same bytes.
 */
std::vector<uint8_t> encode_payload(const Payload& payload);

/**
 * Decode a MessagePack message. Unknown keys are ignored; an unknown type,
 * malformed bytes or a missing / mistyped field produce an error result.
 * Never throws.
 */
DecodeResult decode_payload(const std::vector<uint8_t>& bytes);

/**
 * Channel a message travels on: unreliable updates, handshakes and
 * heartbeats are best effort, everything else is reliable.
 */
Channel channel_for(const Payload& payload);

/**
 * Wire type tag of a message ("Handshake", "Update", ...).
 */
const char* payload_type_name(const Payload& payload);

/**
 * Seconds since the unix epoch, as carried in Update::time.
 */
double unix_time_now();

} // namespace skyshare
