#include "messages.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <map>

#define LOG_MESSAGES_DEBUG(message) LOG_DEBUG("messages", message)
#define LOG_MESSAGES_WARN(message)  LOG_WARN("messages", message)

namespace skyshare {

using nlohmann::json;

namespace {

//=============================================================================
// Encoding
//=============================================================================

json binary_value(const std::vector<uint8_t>& bytes) {
    return json::binary(bytes);
}

struct PayloadEncoder {
    json& obj;

    void operator()(const payloads::Handshake& p) const {
        obj["session_id"] = p.session_id;
    }
    void operator()(const payloads::InitHandshake& p) const {
        obj["name"] = p.name;
        obj["version"] = p.version;
    }
    void operator()(const payloads::AttemptConnection& p) const {
        obj["peer"] = p.peer.to_string();
    }
    void operator()(const payloads::PeerEstablished&) const {}
    void operator()(const payloads::InvalidVersion& p) const {
        obj["server_version"] = p.server_version;
    }
    void operator()(const payloads::InvalidName&) const {}
    void operator()(const payloads::RequestHosting&) const {}
    void operator()(const payloads::HostingReceived& p) const {
        obj["session_id"] = p.session_id;
    }
    void operator()(const payloads::PlayerJoined& p) const {
        obj["name"] = p.name;
        obj["in_control"] = p.in_control;
        obj["is_observer"] = p.is_observer;
        obj["is_server"] = p.is_server;
    }
    void operator()(const payloads::PlayerLeft& p) const {
        obj["name"] = p.name;
    }
    void operator()(const payloads::Update& p) const {
        obj["data"] = binary_value(p.data);
        obj["from"] = p.from;
        obj["is_unreliable"] = p.is_unreliable;
        obj["time"] = p.time;
    }
    void operator()(const payloads::TransferControl& p) const {
        obj["from"] = p.from;
        obj["to"] = p.to;
    }
    void operator()(const payloads::SetObserver& p) const {
        obj["from"] = p.from;
        obj["to"] = p.to;
        obj["is_observer"] = p.is_observer;
    }
    void operator()(const payloads::SetHost&) const {}
    void operator()(const payloads::AircraftDefinition& p) const {
        obj["bytes"] = binary_value(p.bytes);
    }
    void operator()(const payloads::Ready&) const {}
    void operator()(const payloads::Heartbeat&) const {}
};

struct TypeNamer {
    const char* operator()(const payloads::Handshake&) const { return "Handshake"; }
    const char* operator()(const payloads::InitHandshake&) const { return "InitHandshake"; }
    const char* operator()(const payloads::AttemptConnection&) const { return "AttemptConnection"; }
    const char* operator()(const payloads::PeerEstablished&) const { return "PeerEstablished"; }
    const char* operator()(const payloads::InvalidVersion&) const { return "InvalidVersion"; }
    const char* operator()(const payloads::InvalidName&) const { return "InvalidName"; }
    const char* operator()(const payloads::RequestHosting&) const { return "RequestHosting"; }
    const char* operator()(const payloads::HostingReceived&) const { return "HostingReceived"; }
    const char* operator()(const payloads::PlayerJoined&) const { return "PlayerJoined"; }
    const char* operator()(const payloads::PlayerLeft&) const { return "PlayerLeft"; }
    const char* operator()(const payloads::Update&) const { return "Update"; }
    const char* operator()(const payloads::TransferControl&) const { return "TransferControl"; }
    const char* operator()(const payloads::SetObserver&) const { return "SetObserver"; }
    const char* operator()(const payloads::SetHost&) const { return "SetHost"; }
    const char* operator()(const payloads::AircraftDefinition&) const { return "AircraftDefinition"; }
    const char* operator()(const payloads::Ready&) const { return "Ready"; }
    const char* operator()(const payloads::Heartbeat&) const { return "Heartbeat"; }
};

//=============================================================================
// Decoding
//=============================================================================

// Field readers return false and fill `error` when a field is missing or mistyped
bool read_string(const json& obj, const char* key, std::string& out, std::string& error) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        error = std::string("missing or invalid string field '") + key + "'";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_bool(const json& obj, const char* key, bool& out, std::string& error) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_boolean()) {
        error = std::string("missing or invalid bool field '") + key + "'";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool read_double(const json& obj, const char* key, double& out, std::string& error) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        error = std::string("missing or invalid number field '") + key + "'";
        return false;
    }
    out = it->get<double>();
    return true;
}

bool read_bytes(const json& obj, const char* key, std::vector<uint8_t>& out, std::string& error) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_binary()) {
        error = std::string("missing or invalid binary field '") + key + "'";
        return false;
    }
    const auto& bin = it->get_binary();
    out.assign(bin.begin(), bin.end());
    return true;
}

using Decoder = std::function<bool(const json&, Payload&, std::string&)>;

const std::map<std::string, Decoder>& decoders() {
    static const std::map<std::string, Decoder> table = {
        {"Handshake", [](const json& obj, Payload& out, std::string& error) {
            payloads::Handshake p;
            if (!read_string(obj, "session_id", p.session_id, error)) return false;
            out = p;
            return true;
        }},
        {"InitHandshake", [](const json& obj, Payload& out, std::string& error) {
            payloads::InitHandshake p;
            if (!read_string(obj, "name", p.name, error) ||
                !read_string(obj, "version", p.version, error)) return false;
            out = p;
            return true;
        }},
        {"AttemptConnection", [](const json& obj, Payload& out, std::string& error) {
            payloads::AttemptConnection p;
            std::string peer;
            if (!read_string(obj, "peer", peer, error)) return false;
            if (!SocketAddress::parse(peer, p.peer)) {
                error = "invalid peer address '" + peer + "'";
                return false;
            }
            out = p;
            return true;
        }},
        {"PeerEstablished", [](const json&, Payload& out, std::string&) {
            out = payloads::PeerEstablished{};
            return true;
        }},
        {"InvalidVersion", [](const json& obj, Payload& out, std::string& error) {
            payloads::InvalidVersion p;
            if (!read_string(obj, "server_version", p.server_version, error)) return false;
            out = p;
            return true;
        }},
        {"InvalidName", [](const json&, Payload& out, std::string&) {
            out = payloads::InvalidName{};
            return true;
        }},
        {"RequestHosting", [](const json&, Payload& out, std::string&) {
            out = payloads::RequestHosting{};
            return true;
        }},
        {"HostingReceived", [](const json& obj, Payload& out, std::string& error) {
            payloads::HostingReceived p;
            if (!read_string(obj, "session_id", p.session_id, error)) return false;
            out = p;
            return true;
        }},
        {"PlayerJoined", [](const json& obj, Payload& out, std::string& error) {
            payloads::PlayerJoined p;
            if (!read_string(obj, "name", p.name, error) ||
                !read_bool(obj, "in_control", p.in_control, error) ||
                !read_bool(obj, "is_observer", p.is_observer, error) ||
                !read_bool(obj, "is_server", p.is_server, error)) return false;
            out = p;
            return true;
        }},
        {"PlayerLeft", [](const json& obj, Payload& out, std::string& error) {
            payloads::PlayerLeft p;
            if (!read_string(obj, "name", p.name, error)) return false;
            out = p;
            return true;
        }},
        {"Update", [](const json& obj, Payload& out, std::string& error) {
            payloads::Update p;
            if (!read_bytes(obj, "data", p.data, error) ||
                !read_string(obj, "from", p.from, error) ||
                !read_bool(obj, "is_unreliable", p.is_unreliable, error) ||
                !read_double(obj, "time", p.time, error)) return false;
            out = p;
            return true;
        }},
        {"TransferControl", [](const json& obj, Payload& out, std::string& error) {
            payloads::TransferControl p;
            if (!read_string(obj, "from", p.from, error) ||
                !read_string(obj, "to", p.to, error)) return false;
            out = p;
            return true;
        }},
        {"SetObserver", [](const json& obj, Payload& out, std::string& error) {
            payloads::SetObserver p;
            if (!read_string(obj, "from", p.from, error) ||
                !read_string(obj, "to", p.to, error) ||
                !read_bool(obj, "is_observer", p.is_observer, error)) return false;
            out = p;
            return true;
        }},
        {"SetHost", [](const json&, Payload& out, std::string&) {
            out = payloads::SetHost{};
            return true;
        }},
        {"AircraftDefinition", [](const json& obj, Payload& out, std::string& error) {
            payloads::AircraftDefinition p;
            if (!read_bytes(obj, "bytes", p.bytes, error)) return false;
            out = p;
            return true;
        }},
        {"Ready", [](const json&, Payload& out, std::string&) {
            out = payloads::Ready{};
            return true;
        }},
        {"Heartbeat", [](const json&, Payload& out, std::string&) {
            out = payloads::Heartbeat{};
            return true;
        }},
    };
    return table;
}

} // namespace

std::vector<uint8_t> encode_payload(const Payload& payload) {
    json obj = json::object();
    obj["type"] = payload_type_name(payload);
    std::visit(PayloadEncoder{obj}, payload);
    return json::to_msgpack(obj);
}

DecodeResult decode_payload(const std::vector<uint8_t>& bytes) {
    DecodeResult result;

    json obj;
    try {
        obj = json::from_msgpack(bytes);
    } catch (const json::exception& e) {
        result.error_message = std::string("malformed message: ") + e.what();
        return result;
    }

    if (!obj.is_object()) {
        result.error_message = "message is not an object";
        return result;
    }

    std::string type;
    if (!read_string(obj, "type", type, result.error_message)) {
        return result;
    }

    auto it = decoders().find(type);
    if (it == decoders().end()) {
        result.error_message = "unknown message type '" + type + "'";
        return result;
    }

    try {
        result.success = it->second(obj, result.payload, result.error_message);
    } catch (const json::exception& e) {
        result.success = false;
        result.error_message = std::string("invalid ") + type + " message: " + e.what();
    }

    if (!result.success) {
        LOG_MESSAGES_DEBUG("Rejected " << type << " message: " << result.error_message);
    }
    return result;
}

Channel channel_for(const Payload& payload) {
    if (const auto* update = std::get_if<payloads::Update>(&payload)) {
        return update->is_unreliable ? Channel::Unreliable : Channel::Reliable;
    }
    if (std::holds_alternative<payloads::Handshake>(payload) ||
        std::holds_alternative<payloads::Heartbeat>(payload)) {
        return Channel::Unreliable;
    }
    return Channel::Reliable;
}

const char* payload_type_name(const Payload& payload) {
    return std::visit(TypeNamer{}, payload);
}

double unix_time_now() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}

} // namespace skyshare
