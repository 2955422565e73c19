// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#include "peripherals/twi_display.h"
#include "logger.h"

#include <algorithm>
#include <cstdlib>

namespace twidisplay::peripherals {

namespace cfg = hardware::config::twi_display;

const char* commandName(Command command) {
    switch (command) {
        case Command::Brightness: return "Brightness";
        case Command::SetAddress: return "SetAddress";
        case Command::Clear: return "Clear";
        case Command::Mode: return "Mode";
        case Command::Dots: return "Dots";
        case Command::Position: return "Position";
        case Command::FirmwareRevision: return "FirmwareRevision";
        case Command::DigitCount: return "DigitCount";
        case Command::ShowAddress: return "ShowAddress";
    }
    return "Unknown";
}

std::vector<uint8_t> encodeCommand(Command command, std::initializer_list<uint8_t> params) {
    if (params.size() != commandArity(command)) {
        throw std::logic_error(std::string("wrong parameter count for ") + commandName(command) +
                               ": expected " + std::to_string(commandArity(command)) +
                               ", got " + std::to_string(params.size()));
    }

    std::vector<uint8_t> frame;
    frame.reserve(params.size() + 1);
    frame.push_back(static_cast<uint8_t>(command));
    frame.insert(frame.end(), params.begin(), params.end());
    return frame;
}

namespace {

void checkDigit(uint8_t digit) {
    if (digit > cfg::MAX_DIGIT) {
        throw InvalidInputError("digit out of range 0-9: " + std::to_string(digit));
    }
}

// Bare bytes at or above the opcode range would be taken as commands
void checkPlainChar(char ch) {
    if (static_cast<uint8_t>(ch) >= FIRST_OPCODE) {
        throw InvalidInputError("character collides with command opcodes: " +
                                std::to_string(static_cast<uint8_t>(ch)));
    }
}

// Caller-facing positions are 1-based
uint8_t positionToSlot(uint8_t position) {
    if (position < 1 || position > cfg::DIGIT_COUNT) {
        throw InvalidInputError("position out of range 1-4: " + std::to_string(position));
    }
    return static_cast<uint8_t>(position - 1);
}

struct Thresholds {
    int16_t low;
    int16_t high;
};

// Caller thresholds narrow the displayable range, never widen it
Thresholds clampThresholds(std::optional<int16_t> low, std::optional<int16_t> high,
                           int16_t minValue, int16_t maxValue) {
    Thresholds band{std::max(low.value_or(minValue), minValue),
                    std::min(high.value_or(maxValue), maxValue)};
    if (band.low > band.high) {
        throw InvalidInputError("low threshold " + std::to_string(band.low) +
                                " above high threshold " + std::to_string(band.high));
    }
    return band;
}

} // namespace

TwiDisplay::TwiDisplay(std::unique_ptr<hardware::II2cBus> bus, uint8_t address)
    : bus_(std::move(bus)), address_(address) {}

std::unique_ptr<hardware::II2cBus> TwiDisplay::destroy(TwiDisplay display) {
    LOG_PERIPH_DEBUG("Releasing bus of display at 0x{:02x}", display.address_);
    return std::move(display.bus_);
}

hardware::II2cBus& TwiDisplay::bus() const {
    if (!bus_) {
        throw std::logic_error("TwiDisplay: bus has been released");
    }
    return *bus_;
}

void TwiDisplay::rawWrite(const std::vector<uint8_t>& bytes) {
    auto& transport = bus();
    try {
        transport.write(address_, bytes);
    } catch (const std::exception& e) {
        LOG_PERIPH_ERROR("Write of {} byte(s) to display 0x{:02x} failed: {}",
                         bytes.size(), address_, e.what());
        throw BusError(std::string("TwiDisplay: bus write failed: ") + e.what(),
                       std::current_exception());
    }
}

void TwiDisplay::sendCommand(Command command, std::initializer_list<uint8_t> params) {
    const auto frame = encodeCommand(command, params);

    LOG_PERIPH_DEBUG("Display 0x{:02x}: {} ({} param byte(s))",
                     address_, commandName(command), params.size());
    rawWrite(frame);
}

void TwiDisplay::writeSlot(uint8_t slot, uint8_t value) {
    sendCommand(Command::Position, {slot, value});
}

void TwiDisplay::writeGlyphs(std::string_view glyphs) {
    uint8_t slot = 0;
    for (char glyph : glyphs) {
        writeSlot(slot++, static_cast<uint8_t>(glyph));
    }
}

void TwiDisplay::clearDisplay() {
    sendCommand(Command::Clear);
}

void TwiDisplay::displayAddress() {
    sendCommand(Command::ShowAddress);
}

void TwiDisplay::setBrightness(uint8_t level) {
    sendCommand(Command::Brightness, {level});
}

void TwiDisplay::setMode(Mode mode) {
    switch (mode) {
        case Mode::Rotate:
            sendCommand(Command::Mode, {0});
            break;
        case Mode::Scroll:
            sendCommand(Command::Mode, {1});
            break;
    }
}

void TwiDisplay::setDots(uint8_t mask) {
    sendCommand(Command::Dots, {mask});
}

void TwiDisplay::setAddress(uint8_t newAddress) {
    if (newAddress > hardware::config::i2c::MAX_ADDRESS) {
        throw InvalidInputError("address out of range 0-127: " + std::to_string(newAddress));
    }
    sendCommand(Command::SetAddress, {newAddress});
    LOG_PERIPH_INFO("Display 0x{:02x} reprogrammed to address 0x{:02x}", address_, newAddress);
}

void TwiDisplay::sendDigit(uint8_t digit) {
    checkDigit(digit);
    rawWrite({digit});
}

void TwiDisplay::displayDigit(uint8_t position, uint8_t digit) {
    const uint8_t slot = positionToSlot(position);
    checkDigit(digit);
    writeSlot(slot, digit);
}

void TwiDisplay::displayNumber(uint16_t number) {
    if (number > cfg::MAX_NUMBER) {
        throw InvalidInputError("number out of range 0-9999: " + std::to_string(number));
    }

    // No leading-zero suppression: 42 is shown as 0042
    const uint8_t digits[cfg::DIGIT_COUNT] = {
        static_cast<uint8_t>(number / 1000),
        static_cast<uint8_t>((number / 100) % 10),
        static_cast<uint8_t>((number / 10) % 10),
        static_cast<uint8_t>(number % 10)
    };

    for (uint8_t i = 0; i < cfg::DIGIT_COUNT; ++i) {
        displayDigit(static_cast<uint8_t>(i + 1), digits[i]);
    }
}

void TwiDisplay::sendChar(char ch) {
    checkPlainChar(ch);
    rawWrite({static_cast<uint8_t>(ch)});
}

void TwiDisplay::displayChar(uint8_t position, char ch) {
    writeSlot(positionToSlot(position), static_cast<uint8_t>(ch));
}

void TwiDisplay::sendText(std::string_view text) {
    // Reject the whole string before anything is sent
    for (char ch : text) {
        checkPlainChar(ch);
    }
    for (char ch : text) {
        rawWrite({static_cast<uint8_t>(ch)});
    }
}

void TwiDisplay::displayTime(uint8_t hours, uint8_t minutes, bool dot) {
    if (hours > 23 || minutes > 59) {
        throw InvalidInputError("time out of range: " + std::to_string(hours) + ":" +
                                std::to_string(minutes));
    }
    displayNumber(static_cast<uint16_t>(hours * 100 + minutes));
    setDots(dot ? cfg::DOT2 : cfg::DOTS_OFF);
}

bool TwiDisplay::writeOutOfBand(int16_t value, int16_t low, int16_t high) {
    if (value < low) {
        writeGlyphs("-LO-");
        return true;
    }
    if (value > high) {
        writeGlyphs("-HI-");
        return true;
    }
    return false;
}

void TwiDisplay::displayTemperature(int16_t temperature, TempUnit unit) {
    displayTemperature(temperature, unit, std::nullopt, std::nullopt);
}

void TwiDisplay::displayTemperature(int16_t temperature, TempUnit unit,
                                    std::optional<int16_t> low, std::optional<int16_t> high) {
    const Thresholds band = clampThresholds(low, high, cfg::TEMPERATURE_MIN, cfg::TEMPERATURE_MAX);
    if (writeOutOfBand(temperature, band.low, band.high)) {
        return;
    }

    const int magnitude = std::abs(temperature);
    const uint8_t tens = static_cast<uint8_t>(magnitude / 10);

    writeSlot(0, static_cast<uint8_t>(temperature < 0 ? '-' : ' '));
    // Only a zero tens digit is blanked; the units digit is always shown
    writeSlot(1, tens == 0 ? static_cast<uint8_t>(' ') : tens);
    writeSlot(2, static_cast<uint8_t>(magnitude % 10));
    writeSlot(3, static_cast<uint8_t>(unit == TempUnit::Fahrenheit ? 'F' : 'C'));
}

void TwiDisplay::displayHumidity(int16_t humidity) {
    displayHumidity(humidity, std::nullopt, std::nullopt);
}

void TwiDisplay::displayHumidity(int16_t humidity,
                                 std::optional<int16_t> low, std::optional<int16_t> high) {
    const Thresholds band = clampThresholds(low, high, cfg::HUMIDITY_MIN, cfg::HUMIDITY_MAX);
    if (writeOutOfBand(humidity, band.low, band.high)) {
        return;
    }

    const uint8_t hundreds = static_cast<uint8_t>(humidity / 100);
    const uint8_t tens = static_cast<uint8_t>((humidity % 100) / 10);

    writeSlot(0, hundreds == 0 ? static_cast<uint8_t>(' ') : hundreds);
    writeSlot(1, (hundreds == 0 && tens == 0) ? static_cast<uint8_t>(' ') : tens);
    writeSlot(2, static_cast<uint8_t>(humidity % 10));
    writeSlot(3, static_cast<uint8_t>('H'));
}

uint8_t TwiDisplay::query(Command command) {
    auto& transport = bus();
    const std::vector<uint8_t> request{static_cast<uint8_t>(command)};
    std::vector<uint8_t> reply;
    try {
        reply = transport.writeRead(address_, request, 1);
    } catch (const std::exception& e) {
        LOG_PERIPH_ERROR("{} query to display 0x{:02x} failed: {}",
                         commandName(command), address_, e.what());
        throw BusError(std::string("TwiDisplay: bus read failed: ") + e.what(),
                       std::current_exception());
    }
    if (reply.size() != 1) {
        throw BusError("TwiDisplay: short read for " + std::string(commandName(command)),
                       nullptr);
    }
    LOG_PERIPH_DEBUG("Display 0x{:02x}: {} = {}", address_, commandName(command), reply[0]);
    return reply[0];
}

uint8_t TwiDisplay::getFirmwareRevision() {
    return query(Command::FirmwareRevision);
}

uint8_t TwiDisplay::getDigitCount() {
    return query(Command::DigitCount);
}

} // namespace twidisplay::peripherals
