#pragma once

#include "app_message.h"
#include "client_registry.h"
#include "config.h"
#include "control.h"
#include "message_queue.h"
#include "sim_sync.h"
#include "transfer_client.h"
#include "ui_shell.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace skyshare {

// Application loop period
const int APP_TICK_MS = 10;
// Wait after loading the aircraft definition before live state is exchanged
const int READY_DELAY_MS = 3000;

/**
 * The application loop. Owns at most one transfer session and keeps the
 * shell, the simulator and the session's view of who is in control consistent.
 *
 * Everything except post() runs on the thread calling tick() / run().
 */
class SessionController {
public:
    /**
     * @param shell Receives user visible state changes
     * @param simulator Simulator collaborator
     * @param config Initial settings
     * @param config_path Where settings changes are saved, empty to never save
     * @param version Application version sent in InitHandshake
     */
    SessionController(UiShell& shell, SimulatorSync& simulator, const Config& config,
                      const std::string& config_path, const std::string& version);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /**
     * Queue a request for the next tick. Safe to call from any thread.
     */
    void post(AppMessage message);

    /**
     * One iteration: drain the session, advance the simulator, handle requests.
     */
    void tick();

    /**
     * Tick every APP_TICK_MS until the shell exits.
     */
    void run();

    /**
     * Adopt an already started session, replacing the current one.
     */
    void set_transfer_client(std::unique_ptr<TransferClient> client);

    void set_ready_delay(std::chrono::milliseconds delay) { ready_delay_ = delay; }
    void set_definitions_directory(const std::string& directory) { definitions_directory_ = directory; }

    bool has_session() const { return client_ != nullptr; }
    bool has_control() const { return control_.has_control(); }
    bool is_observing() const { return observing_; }
    bool is_ready_to_process_data() const { return ready_to_process_data_; }
    const ClientRegistry& get_clients() const { return clients_; }
    const Config& get_config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    // Session traffic
    void handle_receive_message(const ReceiveMessage& message);
    void handle_payload(const Payload& payload);
    void handle_event(const Event& event);
    void handle_update(const payloads::Update& update);
    void handle_transfer_control(const payloads::TransferControl& transfer);
    void handle_player_joined(const payloads::PlayerJoined& joined);
    void handle_player_left(const payloads::PlayerLeft& left);
    void handle_set_observer(const payloads::SetObserver& observer);
    void handle_aircraft_definition(const payloads::AircraftDefinition& definition);

    // Application requests
    void handle_app_message(const AppMessage& message);
    void start_server(const app_messages::StartServer& request);
    void connect(const app_messages::Connect& request);
    void startup();
    void force_take_control();

    void step_ready_delay(Clock::time_point now);
    void write_update_data();
    bool connect_to_sim();
    bool load_definitions();
    SessionSettings make_settings(const std::string& username) const;
    void write_configuration();
    void teardown();

    // Shell notifications
    void notify(UiEventType type, const std::string& data = std::string());
    void notify_server_started();
    void notify_observing(const std::string& name, bool is_observer);

    UiShell& shell_;
    SimulatorSync& simulator_;
    Config config_;
    std::string config_path_;
    std::string version_;
    std::string definitions_directory_;

    std::unique_ptr<TransferClient> client_;
    MessageQueue<AppMessage> requests_;

    ClientRegistry clients_;
    Control control_;
    bool observing_;
    bool need_update_;
    bool ready_to_process_data_;
    bool teardown_pending_;
    std::string config_to_load_;

    std::optional<Clock::time_point> connection_time_;
    std::chrono::milliseconds ready_delay_;
    Clock::time_point last_update_;
};

} // namespace skyshare
