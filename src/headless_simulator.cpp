#include "headless_simulator.h"
#include "fs.h"
#include "logger.h"
#include <nlohmann/json.hpp>

#define LOG_SIM_DEBUG(message) LOG_DEBUG("sim", message)
#define LOG_SIM_INFO(message)  LOG_INFO("sim", message)

namespace skyshare {

HeadlessSimulator::HeadlessSimulator() : connected_(false), state_changed_(false) {
}

bool HeadlessSimulator::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = true;
    LOG_SIM_INFO("Headless simulator ready");
    return true;
}

void HeadlessSimulator::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    state_changed_ = false;
}

bool HeadlessSimulator::poll() {
    return true;
}

bool HeadlessSimulator::load_config(const std::string& path, std::string& error_out) {
    std::vector<uint8_t> bytes;
    if (!read_file_binary_cpp(path, bytes)) {
        error_out = "Could not read " + path;
        return false;
    }
    return load_config_from_bytes(bytes, error_out);
}

bool HeadlessSimulator::load_config_from_bytes(const std::vector<uint8_t>& bytes, std::string& error_out) {
    // Definitions are JSON documents; their content is not interpreted here
    try {
        nlohmann::json definition = nlohmann::json::parse(bytes.begin(), bytes.end());
        if (!definition.is_object()) {
            error_out = "Aircraft definition is not a JSON object";
            return false;
        }
    } catch (const nlohmann::json::exception& e) {
        error_out = e.what();
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    definition_ = bytes;
    LOG_SIM_INFO("Loaded aircraft definition (" << bytes.size() << " bytes)");
    return true;
}

std::vector<uint8_t> HeadlessSimulator::get_definition_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return definition_;
}

bool HeadlessSimulator::on_receive_data(const std::vector<uint8_t>& data, double time,
                                        const SyncPermission& permission, bool interpolate,
                                        std::string& error_out) {
    (void)error_out;
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = data;
    state_changed_ = false;
    LOG_SIM_INFO("State from " << (permission.is_server ? "host" : "peer") << " at " << std::fixed << time
                 << (interpolate ? "" : " (applied immediately)") << ": "
                 << std::string(data.begin(), data.end()));
    return true;
}

std::vector<uint8_t> HeadlessSimulator::get_all_current() {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

PendingChanges HeadlessSimulator::get_need_sync(const SyncPermission& permission) {
    PendingChanges changes;
    std::lock_guard<std::mutex> lock(mutex_);
    if (permission.is_master && state_changed_) {
        changes.reliable = state_;
        state_changed_ = false;
    }
    return changes;
}

void HeadlessSimulator::clear_sync() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_changed_ = false;
}

void HeadlessSimulator::set_state(const std::vector<uint8_t>& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
    state_changed_ = true;
    LOG_SIM_DEBUG("Local state changed");
}

} // namespace skyshare
