#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace skyshare {

// Port the bundled rendezvous server listens on unless told otherwise
const uint16_t DEFAULT_RENDEZVOUS_PORT = 7340;

/**
 * User settings, persisted as pretty printed JSON.
 */
struct Config {
    std::string name;
    uint16_t port = 25071;
    std::string ip;
    static constexpr int MAX_CONN_TIMEOUT = 3600;
    int conn_timeout = 5;             // seconds, 1 to MAX_CONN_TIMEOUT
    uint16_t update_rate = 30;        // state updates per second
    std::string rendezvous_host = "127.0.0.1";
    std::string rendezvous_host_v6 = "::1";
    uint16_t rendezvous_port = DEFAULT_RENDEZVOUS_PORT;
    std::string log_level = "INFO";

    nlohmann::json to_json() const;

    /**
     * Read settings from JSON. Missing keys keep their defaults.
     * @param json Parsed settings object
     * @param config_out Receives the settings
     * @param error_out Reason on failure (not an object, mistyped or out of range value)
     * @return true on success
     */
    static bool from_json(const nlohmann::json& json, Config& config_out, std::string& error_out);

    std::string get_json_string() const { return to_json().dump(4); }

    /**
     * Load settings from a file.
     * @return false if the file is missing or unreadable; config_out is untouched then
     */
    static bool read_from_file(const std::string& path, Config& config_out, std::string& error_out);

    bool write_to_file(const std::string& path) const;

    /**
     * Seconds between two state updates.
     */
    double update_interval() const { return update_rate == 0 ? 1.0 : 1.0 / update_rate; }
};

/**
 * Load settings from `path`, falling back to defaults (which are written
 * back to `path`) when the file is missing or unreadable.
 */
Config load_or_create_config(const std::string& path);

} // namespace skyshare
