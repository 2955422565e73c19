// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#include "console_shell.h"
#include "logger.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>
#include <sstream>
#include <vector>

namespace twidisplay {

using peripherals::BusError;
using peripherals::InvalidInputError;
using peripherals::Mode;
using peripherals::TempUnit;

namespace {

// Accepts decimal or 0x-prefixed hex
std::optional<long> parseNumber(const std::string& text, long minValue, long maxValue) {
    if (text.empty()) return std::nullopt;
    try {
        const bool hex = text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
        size_t used = 0;
        long value = std::stol(text, &used, hex ? 16 : 10);
        if (used != text.size() || value < minValue || value > maxValue) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

ConsoleShell::ConsoleShell(peripherals::TwiDisplay& display, std::ostream& out)
    : display_(display), out_(out) {}

void ConsoleShell::printWelcome() const {
    out_ << "TWI 7-segment display console (device address 0x"
         << std::hex << static_cast<int>(display_.address()) << std::dec << ")\n"
         << "Type 'help' for available commands\n";
}

void ConsoleShell::printHelp() const {
    out_ << "Commands:\n"
         << "  clear                   Clear the display\n"
         << "  address                 Show the device address on the display\n"
         << "  brightness <0-255>      Set brightness\n"
         << "  mode rotate|scroll      Set text mode\n"
         << "  digit <0-9>             Send a digit at the cursor\n"
         << "  pos <1-4> <0-9>         Show a digit at a position\n"
         << "  number <0-9999>         Show a four-digit number\n"
         << "  temp <t> [C|F]          Show a temperature\n"
         << "  humidity <h>            Show relative humidity\n"
         << "  time <hh> <mm> [dot]    Show time\n"
         << "  text <string>           Send text at the cursor\n"
         << "  dots <mask>             Set decimal points\n"
         << "  setaddr <0-127>         Reprogram the device address\n"
         << "  firmware                Read firmware revision\n"
         << "  digits                  Read number of digits\n"
         << "  raw <byte>...           Send raw bytes as one write\n"
         << "  help                    This text\n"
         << "  quit                    Leave\n";
}

void ConsoleShell::printAvailableCommands() const {
    out_ << "Available commands: clear, address, brightness, mode, digit, pos, number, "
            "temp, humidity, time, text, dots, setaddr, firmware, digits, raw, help, quit\n";
}

bool ConsoleShell::processCommand(const std::string& command) {
    std::istringstream iss(command);
    std::string cmd;
    iss >> cmd;
    cmd = toLower(cmd);

    if (cmd.empty()) {
        return true;
    }
    if (cmd == "quit" || cmd == "exit") {
        return false;
    }

    try {
        dispatch(cmd, iss);
    } catch (const InvalidInputError& e) {
        out_ << "Invalid input: " << e.what() << "\n";
    } catch (const BusError& e) {
        LOG_ERROR("Command '{}' failed: {}", command, e.what());
        out_ << "Bus error: " << e.what() << "\n";
    }
    return true;
}

void ConsoleShell::dispatch(const std::string& cmd, std::istream& args) {
    std::string a;
    std::string b;
    std::string c;

    if (cmd == "help") {
        printHelp();
        return;
    }
    if (cmd == "clear") {
        display_.clearDisplay();
    } else if (cmd == "address") {
        display_.displayAddress();
    } else if (cmd == "brightness") {
        args >> a;
        auto level = parseNumber(a, 0, 255);
        if (!level) {
            out_ << "Usage: brightness <0-255>\n";
            return;
        }
        display_.setBrightness(static_cast<uint8_t>(*level));
    } else if (cmd == "mode") {
        args >> a;
        a = toLower(a);
        if (a == "rotate") {
            display_.setMode(Mode::Rotate);
        } else if (a == "scroll") {
            display_.setMode(Mode::Scroll);
        } else {
            out_ << "Usage: mode rotate|scroll\n";
            return;
        }
    } else if (cmd == "digit") {
        args >> a;
        auto digit = parseNumber(a, 0, 255);
        if (!digit) {
            out_ << "Usage: digit <0-9>\n";
            return;
        }
        display_.sendDigit(static_cast<uint8_t>(*digit));
    } else if (cmd == "pos") {
        args >> a >> b;
        auto position = parseNumber(a, 0, 255);
        auto digit = parseNumber(b, 0, 255);
        if (!position || !digit) {
            out_ << "Usage: pos <1-4> <0-9>\n";
            return;
        }
        display_.displayDigit(static_cast<uint8_t>(*position), static_cast<uint8_t>(*digit));
    } else if (cmd == "number") {
        args >> a;
        auto number = parseNumber(a, 0, 65535);
        if (!number) {
            out_ << "Usage: number <0-9999>\n";
            return;
        }
        display_.displayNumber(static_cast<uint16_t>(*number));
    } else if (cmd == "temp") {
        args >> a >> b;
        auto temperature = parseNumber(a, -32768, 32767);
        b = toLower(b);
        if (!temperature || !(b.empty() || b == "c" || b == "f")) {
            out_ << "Usage: temp <t> [C|F]\n";
            return;
        }
        display_.displayTemperature(static_cast<int16_t>(*temperature),
                                    b == "f" ? TempUnit::Fahrenheit : TempUnit::Celsius);
    } else if (cmd == "humidity") {
        args >> a;
        auto humidity = parseNumber(a, -32768, 32767);
        if (!humidity) {
            out_ << "Usage: humidity <h>\n";
            return;
        }
        display_.displayHumidity(static_cast<int16_t>(*humidity));
    } else if (cmd == "time") {
        args >> a >> b >> c;
        auto hours = parseNumber(a, 0, 255);
        auto minutes = parseNumber(b, 0, 255);
        if (!hours || !minutes || !(c.empty() || toLower(c) == "dot")) {
            out_ << "Usage: time <hh> <mm> [dot]\n";
            return;
        }
        display_.displayTime(static_cast<uint8_t>(*hours), static_cast<uint8_t>(*minutes),
                             !c.empty());
    } else if (cmd == "text") {
        std::getline(args >> std::ws, a);
        if (a.empty()) {
            out_ << "Usage: text <string>\n";
            return;
        }
        display_.sendText(a);
    } else if (cmd == "dots") {
        args >> a;
        auto mask = parseNumber(a, 0, 255);
        if (!mask) {
            out_ << "Usage: dots <mask>\n";
            return;
        }
        display_.setDots(static_cast<uint8_t>(*mask));
    } else if (cmd == "setaddr") {
        args >> a;
        auto address = parseNumber(a, 0, 255);
        if (!address) {
            out_ << "Usage: setaddr <0-127>\n";
            return;
        }
        display_.setAddress(static_cast<uint8_t>(*address));
    } else if (cmd == "firmware") {
        out_ << "Firmware revision: " << static_cast<int>(display_.getFirmwareRevision()) << "\n";
        return;
    } else if (cmd == "digits") {
        out_ << "Digits: " << static_cast<int>(display_.getDigitCount()) << "\n";
        return;
    } else if (cmd == "raw") {
        std::vector<uint8_t> bytes;
        while (args >> a) {
            auto value = parseNumber(a, 0, 255);
            if (!value) {
                out_ << "Invalid byte: " << a << "\n";
                return;
            }
            bytes.push_back(static_cast<uint8_t>(*value));
        }
        if (bytes.empty()) {
            out_ << "Usage: raw <byte>...\n";
            return;
        }
        display_.rawWrite(bytes);
    } else {
        out_ << "Unknown command: " << cmd << "\n";
        printAvailableCommands();
        return;
    }
    out_ << "OK\n";
}

} // namespace twidisplay
