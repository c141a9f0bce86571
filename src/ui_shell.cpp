#include "ui_shell.h"

namespace skyshare {

const char* ui_event_name(UiEventType type) {
    switch (type) {
        case UiEventType::Error: return "error";
        case UiEventType::Attempt: return "attempt";
        case UiEventType::Connected: return "connected";
        case UiEventType::ServerFail: return "server_fail";
        case UiEventType::ClientFail: return "client_fail";
        case UiEventType::GainControl: return "control";
        case UiEventType::LoseControl: return "lostcontrol";
        case UiEventType::ServerStarted: return "server";
        case UiEventType::NewConnection: return "newconnection";
        case UiEventType::LostConnection: return "lostconnection";
        case UiEventType::Observing: return "observing";
        case UiEventType::StopObserving: return "stop_observing";
        case UiEventType::SetObserving: return "set_observing";
        case UiEventType::SetNotObserving: return "set_not_observing";
        case UiEventType::SetInControl: return "set_incontrol";
        case UiEventType::SetHost: return "set_host";
        case UiEventType::AddAircraft: return "add_aircraft";
        case UiEventType::Config: return "config";
        case UiEventType::Network: return "network";
    }
    return "unknown";
}

} // namespace skyshare
