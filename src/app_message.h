#pragma once

#include "config.h"
#include <cstdint>
#include <string>
#include <variant>

namespace skyshare {

enum class ConnectionMethod {
    Direct,         // known address and port
    CloudServer,    // rendezvous assisted hole punching
    Relay           // all traffic through the relay server
};

/**
 * Requests posted to the application loop by the shell and the simulator.
 */
namespace app_messages {

struct StartServer {
    std::string username;
    uint16_t port = 0;
    bool is_ipv6 = false;
    ConnectionMethod method = ConnectionMethod::Direct;
};

struct Connect {
    std::string session_id;
    std::string username;
    ConnectionMethod method = ConnectionMethod::Direct;
    std::string ip;         // numeric address, or empty when hostname is set
    std::string hostname;
    uint16_t port = 0;
    bool is_ipv6 = false;
};

struct Disconnect {};

struct TransferControl {
    std::string target;
};

struct SetObserver {
    std::string target;
    bool is_observer = false;
};

struct LoadAircraft {
    std::string config_file_name;
};

struct Startup {};

struct UpdateConfig {
    Config config;
};

// One shot request from the simulator to take control from whoever has it
struct ForceTakeControl {};

} // namespace app_messages

using AppMessage = std::variant<
    app_messages::StartServer,
    app_messages::Connect,
    app_messages::Disconnect,
    app_messages::TransferControl,
    app_messages::SetObserver,
    app_messages::LoadAircraft,
    app_messages::Startup,
    app_messages::UpdateConfig,
    app_messages::ForceTakeControl>;

} // namespace skyshare
