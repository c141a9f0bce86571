#include "config.h"
#include "fs.h"
#include "logger.h"

#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace skyshare {

nlohmann::json Config::to_json() const {
    nlohmann::json json;
    json["name"] = name;
    json["port"] = port;
    json["ip"] = ip;
    json["conn_timeout"] = conn_timeout;
    json["update_rate"] = update_rate;
    json["rendezvous_host"] = rendezvous_host;
    json["rendezvous_host_v6"] = rendezvous_host_v6;
    json["rendezvous_port"] = rendezvous_port;
    json["log_level"] = log_level;
    return json;
}

bool Config::from_json(const nlohmann::json& json, Config& config_out, std::string& error_out) {
    if (!json.is_object()) {
        error_out = "Configuration is not a JSON object";
        return false;
    }

    Config config;
    try {
        config.name = json.value("name", config.name);
        config.ip = json.value("ip", config.ip);
        config.conn_timeout = json.value("conn_timeout", config.conn_timeout);
        config.rendezvous_host = json.value("rendezvous_host", config.rendezvous_host);
        config.rendezvous_host_v6 = json.value("rendezvous_host_v6", config.rendezvous_host_v6);
        config.log_level = json.value("log_level", config.log_level);

        // Read ports wide so out of range values are reported instead of truncated
        int port = json.value("port", static_cast<int>(config.port));
        int update_rate = json.value("update_rate", static_cast<int>(config.update_rate));
        int rendezvous_port = json.value("rendezvous_port", static_cast<int>(config.rendezvous_port));

        if (port < 0 || port > 65535 || rendezvous_port < 0 || rendezvous_port > 65535) {
            error_out = "Port out of range";
            return false;
        }
        if (update_rate <= 0 || update_rate > 1000) {
            error_out = "update_rate must be between 1 and 1000";
            return false;
        }
        if (config.conn_timeout <= 0 || config.conn_timeout > Config::MAX_CONN_TIMEOUT) {
            error_out = "conn_timeout must be between 1 and " + std::to_string(Config::MAX_CONN_TIMEOUT) + " seconds";
            return false;
        }

        config.port = static_cast<uint16_t>(port);
        config.update_rate = static_cast<uint16_t>(update_rate);
        config.rendezvous_port = static_cast<uint16_t>(rendezvous_port);
    } catch (const nlohmann::json::exception& e) {
        error_out = e.what();
        return false;
    }

    LogLevel level;
    if (!parse_log_level(config.log_level, level)) {
        error_out = "Unknown log level " + config.log_level;
        return false;
    }

    config_out = config;
    return true;
}

bool Config::read_from_file(const std::string& path, Config& config_out, std::string& error_out) {
    if (!file_exists(path)) {
        error_out = "File " + path + " does not exist";
        return false;
    }

    std::string data = read_file_text_cpp(path);
    if (data.empty()) {
        error_out = "File " + path + " is empty or unreadable";
        return false;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(data);
    } catch (const nlohmann::json::exception& e) {
        error_out = std::string("Invalid JSON: ") + e.what();
        return false;
    }

    return from_json(json, config_out, error_out);
}

bool Config::write_to_file(const std::string& path) const {
    if (!create_file(path, get_json_string())) {
        LOG_CONFIG_ERROR("Could not write configuration file " << path);
        return false;
    }
    LOG_CONFIG_DEBUG("Saved configuration to " << path);
    return true;
}

Config load_or_create_config(const std::string& path) {
    Config config;
    std::string error;
    if (Config::read_from_file(path, config, error)) {
        LOG_CONFIG_INFO("Loaded configuration from " << path);
        return config;
    }

    LOG_CONFIG_WARN("Could not open config. Using default values. Reason: " << error);
    Config defaults;
    defaults.write_to_file(path);
    return defaults;
}

} // namespace skyshare
