// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#pragma once

/**
 * Hardware Configuration
 *
 * Compile-time constants for the I2C adapter and the TWI 7-segment display
 * controller. Values that differ per installation can be overridden by the
 * console tool through environment variables (see main.cpp).
 */

#include <cstdint>

namespace twidisplay::hardware::config {

// Common I2C configuration
namespace i2c {
    constexpr const char* DEVICE = "/dev/i2c-1";
    constexpr uint8_t MAX_ADDRESS = 0x7F;     // 7-bit addressing
}

// TWI 4-digit 7-segment display controller
namespace twi_display {
    constexpr uint8_t DEFAULT_ADDRESS = 0x12;
    constexpr uint8_t DIGIT_COUNT = 4;
    constexpr uint8_t MAX_DIGIT = 9;
    constexpr uint16_t MAX_NUMBER = 9999;
    constexpr uint8_t DOT2 = 0b0000'0100;     // Dot after the second digit (hh.mm)
    constexpr uint8_t DOTS_OFF = 0x00;

    // Values outside these ranges are shown as the -LO- / -HI- sentinels
    constexpr int16_t TEMPERATURE_MIN = -99;
    constexpr int16_t TEMPERATURE_MAX = 99;
    constexpr int16_t HUMIDITY_MIN = 0;
    constexpr int16_t HUMIDITY_MAX = 100;
}

} // namespace twidisplay::hardware::config
