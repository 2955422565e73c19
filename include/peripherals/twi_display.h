// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#pragma once

#include "hardware/i2c_bus.h"
#include "hardware/hardware_config.h"
#include "peripherals/twi_display_protocol.h"

#include <cstdint>
#include <exception>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace twidisplay::peripherals {

// Argument rejected before any bus traffic
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

// The bus transport failed; the transport's own exception is kept as cause()
class BusError : public std::runtime_error {
public:
    BusError(const std::string& what, std::exception_ptr cause)
        : std::runtime_error(what), cause_(std::move(cause)) {}

    const std::exception_ptr& cause() const noexcept { return cause_; }

private:
    std::exception_ptr cause_;
};

/**
 * @brief Client for the Akafugu TWIDisplay 4-digit 7-segment controller
 *
 * Owns the bus transport and talks to a single device address. Every public
 * operation validates its arguments first and then issues one or more
 * complete commands through rawWrite(); a failing write aborts the operation
 * without undoing earlier writes.
 *
 * Positions passed to displayDigit()/displayChar() are numbered 1-4 from the
 * left; the controller itself addresses slots 0-3.
 *
 * Not thread-safe: one owner, one thread.
 */
class TwiDisplay {
public:
    static constexpr uint8_t DEFAULT_ADDRESS = hardware::config::twi_display::DEFAULT_ADDRESS;

    TwiDisplay(std::unique_ptr<hardware::II2cBus> bus, uint8_t address);

    TwiDisplay(TwiDisplay&&) noexcept = default;
    TwiDisplay& operator=(TwiDisplay&&) noexcept = default;
    TwiDisplay(const TwiDisplay&) = delete;
    TwiDisplay& operator=(const TwiDisplay&) = delete;

    // Consume the client and hand the bus back to the caller
    static std::unique_ptr<hardware::II2cBus> destroy(TwiDisplay display);

    uint8_t address() const { return address_; }

    // Send bytes as one write to the device address
    void rawWrite(const std::vector<uint8_t>& bytes);

    void clearDisplay();
    void displayAddress();
    void setBrightness(uint8_t level);
    void setMode(Mode mode);
    void setDots(uint8_t mask);

    // Reprogram the controller's own address (0-127). This client keeps
    // talking to the address it was created with.
    void setAddress(uint8_t newAddress);

    void sendDigit(uint8_t digit);
    void displayDigit(uint8_t position, uint8_t digit);
    void displayNumber(uint16_t number);

    // Characters must be below 0x80; higher bytes are command opcodes
    void sendChar(char ch);
    void displayChar(uint8_t position, char ch);
    // All-or-nothing validation: one bad character rejects the whole text
    void sendText(std::string_view text);

    // hh.mm with an optional dot after the hours
    void displayTime(uint8_t hours, uint8_t minutes, bool dot);

    void displayTemperature(int16_t temperature, TempUnit unit);
    void displayHumidity(int16_t humidity);

    // Values below low / above high show -LO- / -HI-. Thresholds are clamped
    // to the displayable range (-99..99 for temperature, 0..100 for humidity);
    // a missing threshold means the range limit.
    void displayTemperature(int16_t temperature, TempUnit unit,
                            std::optional<int16_t> low, std::optional<int16_t> high);
    void displayHumidity(int16_t humidity,
                         std::optional<int16_t> low, std::optional<int16_t> high);

    uint8_t getFirmwareRevision();
    uint8_t getDigitCount();

private:
    void sendCommand(Command command, std::initializer_list<uint8_t> params = {});
    void writeSlot(uint8_t slot, uint8_t value);
    void writeGlyphs(std::string_view glyphs);
    bool writeOutOfBand(int16_t value, int16_t low, int16_t high);
    uint8_t query(Command command);
    hardware::II2cBus& bus() const;

    std::unique_ptr<hardware::II2cBus> bus_;
    uint8_t address_;
};

} // namespace twidisplay::peripherals
