// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace twidisplay::peripherals {

// Command opcodes understood by the TWI 7-segment display controller.
// Bytes below 0x80 written without an opcode are shown as characters.
enum class Command : uint8_t {
    Brightness       = 0x80,
    SetAddress       = 0x81,
    Clear            = 0x82,
    Mode             = 0x83,
    Dots             = 0x85,
    Position         = 0x89,
    FirmwareRevision = 0x8A,
    DigitCount       = 0x8B,
    ShowAddress      = 0x90
};

// Number of parameter bytes following the opcode
constexpr size_t commandArity(Command command) {
    switch (command) {
        case Command::Clear:
        case Command::FirmwareRevision:
        case Command::DigitCount:
        case Command::ShowAddress:
            return 0;
        case Command::Brightness:
        case Command::SetAddress:
        case Command::Mode:
        case Command::Dots:
            return 1;
        case Command::Position:
            return 2;
    }
    return 0;
}

// Lowest reserved opcode; bare bytes sent without a command stay below it
constexpr uint8_t FIRST_OPCODE = 0x80;

const char* commandName(Command command);

// Opcode followed by its parameters. Throws std::logic_error when the
// parameter count does not match commandArity().
std::vector<uint8_t> encodeCommand(Command command, std::initializer_list<uint8_t> params = {});

enum class Mode : uint8_t {
    Rotate = 0,
    Scroll = 1
};

enum class TempUnit {
    Celsius,
    Fahrenheit
};

} // namespace twidisplay::peripherals
