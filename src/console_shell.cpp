#include "console_shell.h"
#include "headless_simulator.h"
#include "logger.h"
#include "network_utils.h"
#include <iostream>
#include <sstream>

#define LOG_SHELL_INFO(message) LOG_INFO("shell", message)

namespace skyshare {

namespace {

bool parse_method(const std::string& text, ConnectionMethod& method_out) {
    if (text == "direct") {
        method_out = ConnectionMethod::Direct;
    } else if (text == "cloud") {
        method_out = ConnectionMethod::CloudServer;
    } else if (text == "relay") {
        method_out = ConnectionMethod::Relay;
    } else {
        return false;
    }
    return true;
}

}

void ConsoleShell::invoke(const UiEvent& event) {
    std::cout << "[" << ui_event_name(event.type) << "]";
    if (!event.data.empty()) {
        std::cout << " " << event.data;
    }
    std::cout << std::endl;
}

void ConsoleShell::print_help() {
    std::cout << "\nAvailable commands:\n";
    std::cout << "  help                                   - Show this help message\n";
    std::cout << "  aircraft <file>                        - Select an aircraft definition\n";
    std::cout << "  host <name> <port> [direct|cloud|relay] [v6]   - Host a session\n";
    std::cout << "  join <name> <ip|hostname> <port> [v6]  - Join a host directly\n";
    std::cout << "  joinid <name> <session_id> [v6]        - Join through the rendezvous server\n";
    std::cout << "  give <player>                          - Transfer control to a player\n";
    std::cout << "  take                                   - Take control from whoever has it\n";
    std::cout << "  observe <player> <on|off>              - Change a player's observer flag\n";
    std::cout << "  state <text>                           - Change the simulated aircraft state\n";
    std::cout << "  disconnect                             - Leave the session\n";
    std::cout << "  quit                                   - Exit the program\n";
}

bool ConsoleShell::handle_command(const std::string& line, SessionController& controller,
                                  HeadlessSimulator& simulator) {
    std::istringstream iss(line);
    std::string command;
    iss >> command;

    if (command.empty()) {
        return true;
    }

    if (command == "quit" || command == "exit") {
        LOG_SHELL_INFO("Shutting down...");
        request_exit();
    } else if (command == "help") {
        print_help();
    } else if (command == "aircraft") {
        app_messages::LoadAircraft request;
        iss >> request.config_file_name;
        if (request.config_file_name.empty()) {
            return false;
        }
        controller.post(request);
    } else if (command == "host") {
        app_messages::StartServer request;
        std::string method = "direct";
        std::string family;
        int port = 0;
        iss >> request.username >> port >> method >> family;
        if (request.username.empty() || port < 0 || port > 65535 || !parse_method(method, request.method)) {
            return false;
        }
        request.port = static_cast<uint16_t>(port);
        request.is_ipv6 = family == "v6";
        controller.post(request);
    } else if (command == "join") {
        app_messages::Connect request;
        std::string address;
        std::string family;
        int port = 0;
        iss >> request.username >> address >> port >> family;
        if (request.username.empty() || address.empty() || port <= 0 || port > 65535) {
            return false;
        }
        request.method = ConnectionMethod::Direct;
        request.is_ipv6 = family == "v6";
        request.port = static_cast<uint16_t>(port);
        if (network_utils::is_valid_ipv4(address) || network_utils::is_valid_ipv6(address)) {
            request.ip = address;
        } else if (network_utils::is_hostname(address)) {
            request.hostname = address;
        } else {
            return false;
        }
        controller.post(request);
    } else if (command == "joinid") {
        app_messages::Connect request;
        std::string family;
        iss >> request.username >> request.session_id >> family;
        if (request.username.empty() || request.session_id.empty()) {
            return false;
        }
        request.method = ConnectionMethod::CloudServer;
        request.is_ipv6 = family == "v6";
        controller.post(request);
    } else if (command == "give") {
        app_messages::TransferControl request;
        iss >> request.target;
        if (request.target.empty()) {
            return false;
        }
        controller.post(request);
    } else if (command == "take") {
        controller.post(app_messages::ForceTakeControl{});
    } else if (command == "observe") {
        app_messages::SetObserver request;
        std::string flag;
        iss >> request.target >> flag;
        if (request.target.empty() || (flag != "on" && flag != "off")) {
            return false;
        }
        request.is_observer = flag == "on";
        controller.post(request);
    } else if (command == "state") {
        std::string text;
        std::getline(iss, text);
        if (!text.empty() && text[0] == ' ') {
            text = text.substr(1);
        }
        simulator.set_state(std::vector<uint8_t>(text.begin(), text.end()));
    } else if (command == "disconnect") {
        controller.post(app_messages::Disconnect{});
    } else {
        return false;
    }
    return true;
}

void ConsoleShell::read_commands(std::istream& in, SessionController& controller, HeadlessSimulator& simulator) {
    std::string line;
    while (!exited() && std::getline(in, line)) {
        if (!handle_command(line, controller, simulator)) {
            std::cout << "Unknown or incomplete command: " << line << std::endl;
            std::cout << "Type 'help' for available commands." << std::endl;
        }
    }
    request_exit();
}

} // namespace skyshare
