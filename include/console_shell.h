// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#pragma once

#include "peripherals/twi_display.h"

#include <iosfwd>
#include <string>

namespace twidisplay {

// Text command front end for a TwiDisplay.
// Every command prints one result line ("OK", a value, or an error) to the
// output stream; driver errors never escape processCommand().
class ConsoleShell {
public:
    ConsoleShell(peripherals::TwiDisplay& display, std::ostream& out);

    void printWelcome() const;
    void printHelp() const;

    // Returns false when the command asks the shell to stop
    bool processCommand(const std::string& command);

private:
    void dispatch(const std::string& cmd, std::istream& args);
    void printAvailableCommands() const;

    peripherals::TwiDisplay& display_;
    std::ostream& out_;
};

} // namespace twidisplay
