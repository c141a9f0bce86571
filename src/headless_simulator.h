#pragma once

#include "sim_sync.h"
#include <mutex>
#include <string>
#include <vector>

namespace skyshare {

/**
 * Simulator stand-in for the CLI. The aircraft "state" is a single opaque
 * blob set from the console; received state is logged and adopted.
 */
class HeadlessSimulator : public SimulatorSync {
public:
    HeadlessSimulator();

    bool connect() override;
    void close() override;
    bool poll() override;

    bool load_config(const std::string& path, std::string& error_out) override;
    bool load_config_from_bytes(const std::vector<uint8_t>& bytes, std::string& error_out) override;
    std::vector<uint8_t> get_definition_bytes() const override;

    bool on_receive_data(const std::vector<uint8_t>& data, double time, const SyncPermission& permission,
                         bool interpolate, std::string& error_out) override;
    std::vector<uint8_t> get_all_current() override;
    PendingChanges get_need_sync(const SyncPermission& permission) override;
    void clear_sync() override;
    void step() override {}

    /**
     * Change the local state; it is sent on the next update if we are in control.
     */
    void set_state(const std::vector<uint8_t>& state);

private:
    mutable std::mutex mutex_;
    bool connected_;
    std::vector<uint8_t> definition_;
    std::vector<uint8_t> state_;
    bool state_changed_;
};

} // namespace skyshare
