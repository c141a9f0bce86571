#include "client_registry.h"

namespace skyshare {

void ClientRegistry::add_client(const std::string& name) {
    // Re-adding keeps the existing flags
    clients_.emplace(name, ClientInfo());
}

void ClientRegistry::remove_client(const std::string& name) {
    clients_.erase(name);
    if (in_control_ && *in_control_ == name) {
        in_control_.reset();
    }
}

void ClientRegistry::set_server(const std::string& name, bool is_server) {
    auto it = clients_.find(name);
    if (it != clients_.end()) {
        it->second.is_server = is_server;
    }
}

void ClientRegistry::set_observer(const std::string& name, bool is_observer) {
    auto it = clients_.find(name);
    if (it != clients_.end()) {
        it->second.is_observer = is_observer;
    }
}

bool ClientRegistry::is_observer(const std::string& name) const {
    auto it = clients_.find(name);
    return it != clients_.end() && it->second.is_observer;
}

bool ClientRegistry::client_is_server(const std::string& name) const {
    auto it = clients_.find(name);
    return it != clients_.end() && it->second.is_server;
}

bool ClientRegistry::client_has_control(const std::string& name) const {
    return in_control_ && *in_control_ == name;
}

void ClientRegistry::set_client_control(const std::string& name) {
    in_control_.reset();
    if (clients_.count(name)) {
        in_control_ = name;
    }
}

void ClientRegistry::set_no_control() {
    in_control_.reset();
}

std::optional<std::string> ClientRegistry::get_client_in_control() const {
    return in_control_;
}

void ClientRegistry::reset() {
    clients_.clear();
    in_control_.reset();
}

} // namespace skyshare
