#pragma once

#include "session_controller.h"
#include "ui_shell.h"
#include <atomic>
#include <istream>
#include <string>

namespace skyshare {

class HeadlessSimulator;

/**
 * Line based stand-in for the graphical shell. Prints every UiEvent and turns
 * typed commands into AppMessages for the controller.
 */
class ConsoleShell : public UiShell {
public:
    ConsoleShell() : exited_(false) {}

    void invoke(const UiEvent& event) override;
    bool exited() const override { return exited_.load(); }

    void request_exit() { exited_.store(true); }

    /**
     * Read commands from `in` until "quit" or end of input.
     */
    void read_commands(std::istream& in, SessionController& controller, HeadlessSimulator& simulator);

    /**
     * Handle one command line.
     * @return false if the line was not understood
     */
    bool handle_command(const std::string& line, SessionController& controller, HeadlessSimulator& simulator);

    static void print_help();

private:
    std::atomic<bool> exited_;
};

} // namespace skyshare
