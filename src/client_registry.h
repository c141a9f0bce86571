#pragma once

#include <map>
#include <optional>
#include <string>

namespace skyshare {

/**
 * Bookkeeping of every player in the session as seen by the application:
 * who is the host, who observes and who is in control.
 *
 * At most one entry holds control at any time.
 */
class ClientRegistry {
public:
    void add_client(const std::string& name);

    /**
     * Forget a player. Removing the controller leaves nobody in control.
     */
    void remove_client(const std::string& name);

    void set_server(const std::string& name, bool is_server);
    void set_observer(const std::string& name, bool is_observer);

    /**
     * Unknown names are not observers.
     */
    bool is_observer(const std::string& name) const;
    bool client_is_server(const std::string& name) const;
    bool client_has_control(const std::string& name) const;

    /**
     * Make `name` the only controller. Clears any current controller first.
     * Unknown names are ignored, leaving nobody in control.
     */
    void set_client_control(const std::string& name);
    void set_no_control();

    /**
     * @return name of the player in control, if any
     */
    std::optional<std::string> get_client_in_control() const;

    size_t get_number_clients() const { return clients_.size(); }

    void reset();

private:
    struct ClientInfo {
        bool is_server = false;
        bool is_observer = false;
    };

    std::map<std::string, ClientInfo> clients_;
    std::optional<std::string> in_control_;
};

} // namespace skyshare
