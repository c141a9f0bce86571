#include "session_controller.h"
#include "client.h"
#include "fs.h"
#include "logger.h"
#include "network_utils.h"
#include "server.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>

#define LOG_NETWORK_DEBUG(message) LOG_DEBUG("network", message)
#define LOG_NETWORK_INFO(message)  LOG_INFO("network", message)
#define LOG_NETWORK_WARN(message)  LOG_WARN("network", message)
#define LOG_NETWORK_ERROR(message) LOG_ERROR("network", message)

#define LOG_CONTROL_INFO(message)  LOG_INFO("control", message)

#define LOG_DEFINITIONS_INFO(message)  LOG_INFO("definitions", message)
#define LOG_DEFINITIONS_ERROR(message) LOG_ERROR("definitions", message)

namespace skyshare {

namespace {

const char* const DEFAULT_DEFINITIONS_DIRECTORY = "definitions/aircraft";
const char* const DEFINITION_EXTENSION = ".json";

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}

SessionController::SessionController(UiShell& shell, SimulatorSync& simulator, const Config& config,
                                     const std::string& config_path, const std::string& version)
    : shell_(shell),
      simulator_(simulator),
      config_(config),
      config_path_(config_path),
      version_(version),
      definitions_directory_(DEFAULT_DEFINITIONS_DIRECTORY),
      observing_(false),
      need_update_(false),
      ready_to_process_data_(false),
      teardown_pending_(false),
      ready_delay_(READY_DELAY_MS),
      last_update_(Clock::now()) {
}

SessionController::~SessionController() {
    if (client_) {
        client_->stop("Shutting down.");
    }
}

void SessionController::post(AppMessage message) {
    requests_.push(std::move(message));
}

void SessionController::set_transfer_client(std::unique_ptr<TransferClient> client) {
    if (client_) {
        client_->stop("Replaced.");
    }
    client_ = std::move(client);
    teardown_pending_ = false;
}

//=============================================================================
// Application loop
//=============================================================================

void SessionController::run() {
    while (!shell_.exited()) {
        auto started = Clock::now();
        tick();

        auto elapsed = Clock::now() - started;
        if (elapsed < std::chrono::milliseconds(APP_TICK_MS)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(APP_TICK_MS) - elapsed);
        }
    }
}

void SessionController::tick() {
    if (client_) {
        if (!simulator_.poll()) {
            client_->stop("Sim closed.");
        }

        ReceiveMessage message;
        while (client_->get_next_message(message)) {
            handle_receive_message(message);
        }

        simulator_.step();
        step_ready_delay(Clock::now());
    }

    AppMessage request;
    while (requests_.try_pop(request)) {
        handle_app_message(request);
    }

    if (teardown_pending_) {
        teardown();
    }
}

void SessionController::step_ready_delay(Clock::time_point now) {
    if (!connection_time_ || now - *connection_time_ < ready_delay_) {
        return;
    }

    auto interval = std::chrono::duration<double>(config_.update_interval());
    bool can_update = now - last_update_ > interval;

    // The first pass only flips readiness so stale changes get cleared
    if (!observing_ && can_update && ready_to_process_data_) {
        write_update_data();
        last_update_ = now;
    }

    if (!ready_to_process_data_) {
        ready_to_process_data_ = true;
        simulator_.clear_sync();

        if (!client_->is_host()) {
            client_->send_ready();
        }
    }
}

void SessionController::write_update_data() {
    SyncPermission permission;
    permission.is_server = client_->is_host();
    permission.is_master = control_.has_control();
    permission.is_init = false;

    PendingChanges changes = simulator_.get_need_sync(permission);
    if (!changes.unreliable.empty()) {
        client_->update(changes.unreliable, true);
    }
    if (!changes.reliable.empty()) {
        client_->update(changes.reliable, false);
    }
}

void SessionController::teardown() {
    client_.reset();
    teardown_pending_ = false;
    ready_to_process_data_ = false;
    connection_time_.reset();
    simulator_.close();
}

//=============================================================================
// Session traffic
//=============================================================================

void SessionController::handle_receive_message(const ReceiveMessage& message) {
    if (const auto* payload = std::get_if<Payload>(&message)) {
        handle_payload(*payload);
    } else {
        handle_event(std::get<Event>(message));
    }
}

void SessionController::handle_payload(const Payload& payload) {
    std::visit(overloaded{
        [this](const payloads::Update& update) { handle_update(update); },
        [this](const payloads::TransferControl& transfer) { handle_transfer_control(transfer); },
        [this](const payloads::PlayerJoined& joined) { handle_player_joined(joined); },
        [this](const payloads::PlayerLeft& left) { handle_player_left(left); },
        [this](const payloads::SetObserver& observer) { handle_set_observer(observer); },
        [this](const payloads::AircraftDefinition& definition) { handle_aircraft_definition(definition); },
        [this](const payloads::Ready&) {
            if (control_.has_control()) {
                client_->update(simulator_.get_all_current(), false);
            }
        },
        [this](const payloads::SetHost&) { notify(UiEventType::SetHost); },
        [this](const payloads::HostingReceived&) { notify_server_started(); },
        // Handled inside the session
        [](const auto&) {}
    }, payload);
}

void SessionController::handle_update(const payloads::Update& update) {
    if (!update.is_unreliable) {
        LOG_NETWORK_DEBUG("Reliable update of " << update.data.size() << " bytes from " << update.from);
    }

    if (clients_.is_observer(update.from) || !ready_to_process_data_) {
        return;
    }

    SyncPermission permission;
    permission.is_server = clients_.client_is_server(update.from);
    permission.is_master = clients_.client_has_control(update.from);
    permission.is_init = true;

    std::string error;
    if (!simulator_.on_receive_data(update.data, update.time, permission, !need_update_, error)) {
        client_->stop(error);
    }
    // The first state after connecting is applied immediately, later ones interpolated
    need_update_ = false;
}

void SessionController::handle_transfer_control(const payloads::TransferControl& transfer) {
    simulator_.clear_sync();

    if (transfer.to == client_->get_server_name()) {
        LOG_CONTROL_INFO("Taking control from " << transfer.from);
        control_.take_control();
        notify(UiEventType::GainControl);
        clients_.set_no_control();
        return;
    }

    if (transfer.from == client_->get_server_name()) {
        notify(UiEventType::LoseControl);
        control_.lose_control();
    }
    LOG_CONTROL_INFO(transfer.to << " is now in control.");
    notify(UiEventType::SetInControl, transfer.to);
    clients_.set_client_control(transfer.to);
}

void SessionController::handle_player_joined(const payloads::PlayerJoined& joined) {
    LOG_NETWORK_INFO(joined.name << " connected. In control: " << joined.in_control << ", observing: "
                     << joined.is_observer << ", server: " << joined.is_server);

    notify(UiEventType::NewConnection, joined.name);
    clients_.add_client(joined.name);
    clients_.set_server(joined.name, joined.is_server);
    clients_.set_observer(joined.name, joined.is_observer);

    if (client_->is_host()) {
        notify_server_started();
        client_->send_definitions(simulator_.get_definition_bytes(), joined.name);
    } else {
        // Only joiners show the observing badge, the host shows its controls
        notify_observing(joined.name, joined.is_observer);
    }

    if (joined.in_control) {
        notify(UiEventType::SetInControl, joined.name);
        clients_.set_client_control(joined.name);
    }
}

void SessionController::handle_player_left(const payloads::PlayerLeft& left) {
    LOG_NETWORK_INFO(left.name << " lost connection.");

    bool had_control = clients_.client_has_control(left.name);
    clients_.remove_client(left.name);

    if (had_control) {
        clients_.set_no_control();
        if (client_->is_host()) {
            LOG_CONTROL_INFO(left.name << " had control, taking control back.");
            notify(UiEventType::GainControl);
            control_.take_control();
            client_->transfer_control(client_->get_server_name());
        }
    }

    notify(UiEventType::LostConnection, left.name);
    if (client_->is_host()) {
        notify_server_started();
    }
}

void SessionController::handle_set_observer(const payloads::SetObserver& observer) {
    if (observer.to == client_->get_server_name()) {
        LOG_CONTROL_INFO("Set to observing: " << observer.is_observer);
        observing_ = observer.is_observer;
        notify(observing_ ? UiEventType::Observing : UiEventType::StopObserving);

        if (!observing_) {
            simulator_.clear_sync();
        }
        return;
    }

    LOG_CONTROL_INFO(observer.to << " is observing: " << observer.is_observer);
    clients_.set_observer(observer.to, observer.is_observer);
    notify_observing(observer.to, observer.is_observer);
}

void SessionController::handle_aircraft_definition(const payloads::AircraftDefinition& definition) {
    std::string error;
    if (simulator_.load_config_from_bytes(definition.bytes, error)) {
        LOG_DEFINITIONS_INFO("Loaded aircraft definition from the host (" << definition.bytes.size() << " bytes)");
    } else {
        LOG_DEFINITIONS_ERROR("Could not load the definition sent by the host: " << error);
    }
    // Start the countdown to Ready either way
    connection_time_ = Clock::now();
}

void SessionController::handle_event(const Event& event) {
    std::visit(overloaded{
        [this](const events::ConnectionEstablished&) {
            if (client_->is_host()) {
                notify_server_started();
                control_.take_control();
                notify(UiEventType::GainControl);
                connection_time_ = Clock::now();
            } else {
                notify(UiEventType::Connected);
                notify(UiEventType::LoseControl);
                control_.lose_control();
                observing_ = true;
            }
            need_update_ = true;
        },
        [this](const events::ConnectionLost& lost) {
            LOG_NETWORK_INFO("Server/Client stopped. Reason: " << lost.reason);
            control_.take_control();
            clients_.reset();
            observing_ = false;
            teardown_pending_ = true;
            notify(UiEventType::ClientFail, lost.reason);
        },
        [this](const events::UnablePunchthrough&) {
            control_.take_control();
            clients_.reset();
            observing_ = false;
            teardown_pending_ = true;
            notify(UiEventType::ClientFail, "Could not connect to host! Please port forward or use 'Request Hosting'!");
        },
        [this](const events::SessionIdFetchFailed&) {
            control_.take_control();
            clients_.reset();
            observing_ = false;
            teardown_pending_ = true;
            notify(UiEventType::ServerFail, "Could not connect to Cloud Server to fetch session ID.");
        },
        [this](const events::Metrics& metrics) {
            nlohmann::json json;
            json["sent_packets"] = metrics.metrics.sent_packets;
            json["received_packets"] = metrics.metrics.received_packets;
            json["sent_bytes"] = metrics.metrics.sent_bytes;
            json["received_bytes"] = metrics.metrics.received_bytes;
            json["resent_packets"] = metrics.metrics.resent_packets;
            json["pending_reliable"] = metrics.metrics.pending_reliable;
            notify(UiEventType::Network, json.dump());
        }
    }, event);
}

//=============================================================================
// Application requests
//=============================================================================

void SessionController::handle_app_message(const AppMessage& message) {
    std::visit(overloaded{
        [this](const app_messages::StartServer& request) { start_server(request); },
        [this](const app_messages::Connect& request) { connect(request); },
        [this](const app_messages::Disconnect&) {
            LOG_NETWORK_INFO("Request to disconnect.");
            if (client_) {
                client_->stop("Stopped.");
            }
        },
        [this](const app_messages::TransferControl& request) {
            if (client_) {
                LOG_CONTROL_INFO("Giving control to " << request.target);
                // Comes back through our own queue as a TransferControl payload
                client_->transfer_control(request.target);
            }
        },
        [this](const app_messages::SetObserver& request) {
            clients_.set_observer(request.target, request.is_observer);
            if (client_) {
                LOG_CONTROL_INFO("Setting " << request.target << " as observer: " << request.is_observer);
                client_->set_observer(request.target, request.is_observer);
            }
        },
        [this](const app_messages::LoadAircraft& request) {
            LOG_DEFINITIONS_INFO(request.config_file_name << " aircraft config selected.");
            config_to_load_ = request.config_file_name;
        },
        [this](const app_messages::Startup&) { startup(); },
        [this](const app_messages::UpdateConfig& request) {
            Config validated;
            std::string error;
            if (!Config::from_json(request.config.to_json(), validated, error)) {
                LOG_NETWORK_WARN("Ignoring configuration update: " << error);
                return;
            }
            config_ = validated;
            LogLevel level;
            if (parse_log_level(config_.log_level, level)) {
                Logger::getInstance().set_log_level(level);
            }
            write_configuration();
        },
        [this](const app_messages::ForceTakeControl&) { force_take_control(); }
    }, message);
}

void SessionController::start_server(const app_messages::StartServer& request) {
    if (client_) {
        notify(UiEventType::ServerFail, "A session is already running.");
        return;
    }

    bool connected = connect_to_sim();

    if (config_to_load_.empty()) {
        notify(UiEventType::ServerFail, "Select an aircraft config first!");
        return;
    }
    if (!load_definitions()) {
        notify(UiEventType::Error, "Error loading definition files. Check the log for more information.");
        return;
    }
    if (!connected) {
        return;
    }

    notify(UiEventType::Attempt);

    SessionSettings settings = make_settings(request.username);
    std::unique_ptr<TransferClient> session;
    StartResult result;

    if (request.method == ConnectionMethod::Relay) {
        auto client = std::make_unique<Client>(settings);
        result = client->start_with_relay(request.is_ipv6);
        session = std::move(client);
    } else {
        auto server = std::make_unique<Server>(settings);
        if (request.method == ConnectionMethod::CloudServer) {
            result = server->start_with_hole_punching(request.is_ipv6);
        } else {
            result = server->start(request.is_ipv6, request.port);
        }
        session = std::move(server);
    }

    if (result.success) {
        client_ = std::move(session);
        LOG_NETWORK_INFO("Hosting started");
    } else {
        LOG_NETWORK_ERROR("Could not start server! Reason: " << result.error_message);
        notify(UiEventType::ServerFail, result.error_message);
    }

    config_.port = request.port;
    config_.name = request.username;
    write_configuration();
}

void SessionController::connect(const app_messages::Connect& request) {
    if (client_) {
        notify(UiEventType::ClientFail, "A session is already running.");
        return;
    }

    if (!connect_to_sim()) {
        return;
    }

    notify(UiEventType::Attempt);

    auto client = std::make_unique<Client>(make_settings(request.username));
    StartResult result;

    if (request.method == ConnectionMethod::Direct) {
        std::string ip = request.ip;
        if (ip.empty()) {
            ip = network_utils::resolve(request.hostname, request.is_ipv6);
        }

        if (ip.empty()) {
            result = StartResult::failure("Could not resolve " + request.hostname);
        } else if (request.port == 0) {
            result = StartResult::failure("No port given");
        } else {
            result = client->start(ip, request.port);
        }
    } else {
        // Joining through the relay uses the rendezvous flow as well
        result = client->start_with_hole_punch(request.session_id, request.is_ipv6);
    }

    if (result.success) {
        LOG_NETWORK_INFO("Client started.");
        client_ = std::move(client);
    } else {
        std::string reason = "Could not start client! Reason: " + result.error_message;
        LOG_NETWORK_ERROR(reason);
        notify(UiEventType::ClientFail, reason);
    }

    config_.name = request.username;
    config_.ip = request.ip;
    write_configuration();
}

void SessionController::startup() {
    std::vector<DirectoryEntry> entries;
    if (list_directory(definitions_directory_.c_str(), entries)) {
        size_t found = 0;
        for (const auto& entry : entries) {
            if (!entry.is_directory && get_file_extension(entry.name.c_str()) == DEFINITION_EXTENSION) {
                notify(UiEventType::AddAircraft, entry.name);
                found++;
            }
        }
        LOG_DEFINITIONS_INFO("Found " << found << " configuration file(s).");
    } else {
        LOG_DEFINITIONS_ERROR("Could not list " << definitions_directory_);
    }

    notify(UiEventType::Config, config_.get_json_string());
}

void SessionController::force_take_control() {
    if (!client_ || control_.has_control() || observing_) {
        return;
    }

    auto in_control = clients_.get_client_in_control();
    if (in_control) {
        // Comes back through our own queue as a TransferControl payload
        client_->take_control(*in_control);
    }
}

//=============================================================================
// Helpers
//=============================================================================

bool SessionController::connect_to_sim() {
    if (simulator_.connect()) {
        LOG_NETWORK_INFO("Connected to the simulator.");
        return true;
    }
    notify(UiEventType::Error, "Could not connect to the simulator! Is the sim running?");
    return false;
}

bool SessionController::load_definitions() {
    std::string path = combine_paths(definitions_directory_, config_to_load_);

    std::string error;
    if (!simulator_.load_config(path, error)) {
        LOG_DEFINITIONS_ERROR("Could not load configuration file " << config_to_load_ << ": " << error);
        // Keeps a session from starting on a broken definition
        config_to_load_.clear();
        return false;
    }

    LOG_DEFINITIONS_INFO(config_to_load_ << " loaded successfully.");
    return true;
}

SessionSettings SessionController::make_settings(const std::string& username) const {
    SessionSettings settings;
    settings.name = username;
    settings.version = version_;
    int64_t timeout_seconds = std::min<int64_t>(std::max(config_.conn_timeout, 1), Config::MAX_CONN_TIMEOUT);
    settings.conn_timeout_ms = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(timeout_seconds)).count());
    settings.rendezvous_host = config_.rendezvous_host;
    settings.rendezvous_host_v6 = config_.rendezvous_host_v6;
    settings.rendezvous_port = config_.rendezvous_port;
    return settings;
}

void SessionController::write_configuration() {
    if (config_path_.empty()) {
        return;
    }
    if (!config_.write_to_file(config_path_)) {
        LOG_NETWORK_ERROR("Could not write configuration file " << config_path_);
    }
}

void SessionController::notify(UiEventType type, const std::string& data) {
    shell_.invoke(UiEvent{type, data});
}

void SessionController::notify_server_started() {
    nlohmann::json json;
    json["clients"] = clients_.get_number_clients();
    json["session_id"] = client_ ? client_->get_session_id() : std::string();
    notify(UiEventType::ServerStarted, json.dump());
}

void SessionController::notify_observing(const std::string& name, bool is_observer) {
    notify(is_observer ? UiEventType::SetObserving : UiEventType::SetNotObserving, name);
}

} // namespace skyshare
