#pragma once

#include <string>

namespace skyshare {

/**
 * User visible state changes. The wire name of each is given by ui_event_name().
 */
enum class UiEventType {
    Error,
    Attempt,
    Connected,
    ServerFail,
    ClientFail,
    GainControl,
    LoseControl,
    ServerStarted,
    NewConnection,
    LostConnection,
    Observing,
    StopObserving,
    SetObserving,
    SetNotObserving,
    SetInControl,
    SetHost,
    AddAircraft,
    Config,
    Network
};

struct UiEvent {
    UiEventType type;
    std::string data;   // plain text or a JSON document, depending on type
};

const char* ui_event_name(UiEventType type);

/**
 * Graphical (or console) front end.
 */
class UiShell {
public:
    virtual ~UiShell() = default;

    virtual void invoke(const UiEvent& event) = 0;

    /**
     * @return true once the user closed the shell
     */
    virtual bool exited() const = 0;
};

} // namespace skyshare
