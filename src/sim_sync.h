#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace skyshare {

/**
 * Who produced the state handed to or requested from the simulator.
 */
struct SyncPermission {
    bool is_server = false;   // the state comes from / goes to the host
    bool is_master = false;   // the sender is in control
    bool is_init = false;     // full state applied on arrival, not a live delta
};

/**
 * State the simulator changed since the last call, split by channel.
 * An empty blob means nothing to send on that channel.
 */
struct PendingChanges {
    std::vector<uint8_t> unreliable;
    std::vector<uint8_t> reliable;
};

/**
 * Simulator side collaborator. Maps aircraft variables to opaque blobs; the
 * session layer never looks inside them.
 */
class SimulatorSync {
public:
    virtual ~SimulatorSync() = default;

    /**
     * Open the link to the simulator.
     * @return false if the simulator is not running
     */
    virtual bool connect() = 0;
    virtual void close() = 0;

    /**
     * Drain simulator notifications.
     * @return false once the simulator quit
     */
    virtual bool poll() = 0;

    /**
     * Load an aircraft definition file from disk.
     */
    virtual bool load_config(const std::string& path, std::string& error_out) = 0;

    /**
     * Load an aircraft definition shipped by the host.
     */
    virtual bool load_config_from_bytes(const std::vector<uint8_t>& bytes, std::string& error_out) = 0;

    /**
     * Raw bytes of the loaded definition, shipped to joining peers.
     */
    virtual std::vector<uint8_t> get_definition_bytes() const = 0;

    /**
     * Apply state received from a peer.
     * @param interpolate false to apply immediately (first state after connecting)
     * @return false on a fatal mapping error, with the reason in error_out
     */
    virtual bool on_receive_data(const std::vector<uint8_t>& data, double time, const SyncPermission& permission,
                                 bool interpolate, std::string& error_out) = 0;

    /**
     * Full current state, pushed to a peer that became ready.
     */
    virtual std::vector<uint8_t> get_all_current() = 0;

    virtual PendingChanges get_need_sync(const SyncPermission& permission) = 0;

    /**
     * Forget buffered changes.
     */
    virtual void clear_sync() = 0;

    /**
     * Advance time dependent work once per application tick.
     */
    virtual void step() = 0;
};

} // namespace skyshare
