#include "config.h"
#include "console_shell.h"
#include "headless_simulator.h"
#include "logger.h"
#include "session_controller.h"
#include "socket.h"
#include "version.h"
#include <iostream>
#include <string>
#include <thread>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

namespace {

const char* const LOG_FILENAME = "log.txt";
const char* const CONFIG_FILENAME = "config.json";

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "  --config <path>      Settings file (default: " << CONFIG_FILENAME << ")\n";
    std::cout << "  --definitions <dir>  Aircraft definition directory (default: definitions/aircraft)\n";
    std::cout << "  --log-file <path>    Log file (default: " << LOG_FILENAME << ")\n";
    std::cout << "  --log-level <level>  debug, info, warn or error (default: from settings)\n";
    std::cout << "  --version            Print version information and exit\n";
    std::cout << "  --help               Show this help message\n";
}

}

int main(int argc, char* argv[]) {
    std::string config_path = CONFIG_FILENAME;
    std::string log_path = LOG_FILENAME;
    std::string definitions_dir;
    std::string log_level_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            skyshare::version::print_version_info();
            return 0;
        } else if (arg == "--config" && has_value) {
            config_path = argv[++i];
        } else if (arg == "--definitions" && has_value) {
            definitions_dir = argv[++i];
        } else if (arg == "--log-file" && has_value) {
            log_path = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            log_level_override = argv[++i];
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    skyshare::Logger& logger = skyshare::Logger::getInstance();
    if (!logger.set_log_file(log_path)) {
        std::cerr << "Could not open log file " << log_path << ", logging to the console only\n";
    }

    skyshare::version::print_header();

    skyshare::Config config = skyshare::load_or_create_config(config_path);

    std::string level_name = log_level_override.empty() ? config.log_level : log_level_override;
    skyshare::LogLevel level;
    if (skyshare::parse_log_level(level_name, level)) {
        logger.set_log_level(level);
    } else {
        LOG_MAIN_WARN("Unknown log level " << level_name << ", keeping the default");
    }

    if (!skyshare::init_socket_library()) {
        LOG_MAIN_ERROR("Failed to initialize the socket library");
        return 1;
    }

    skyshare::ConsoleShell shell;
    skyshare::HeadlessSimulator simulator;
    skyshare::SessionController controller(shell, simulator, config, config_path, skyshare::version::STRING);
    if (!definitions_dir.empty()) {
        controller.set_definitions_directory(definitions_dir);
    }

    LOG_MAIN_INFO("SkyShare " << skyshare::version::STRING << " starting");
    controller.post(skyshare::app_messages::Startup{});

    skyshare::ConsoleShell::print_help();
    std::thread input_thread([&shell, &controller, &simulator]() {
        shell.read_commands(std::cin, controller, simulator);
    });

    controller.run();

    input_thread.join();
    skyshare::cleanup_socket_library();
    LOG_MAIN_INFO("SkyShare stopped. Goodbye!");
    return 0;
}
