#pragma once

namespace skyshare {

/**
 * Whether this instance drives the shared aircraft. Owned by the application loop.
 */
class Control {
public:
    Control() : has_control_(true) {}

    void take_control() { has_control_ = true; }
    void lose_control() { has_control_ = false; }
    bool has_control() const { return has_control_; }

private:
    bool has_control_;
};

} // namespace skyshare
