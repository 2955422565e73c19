// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace twidisplay::hardware {

// Byte-level I2C transport used by peripheral drivers.
// Implementations report failures by throwing; the exception type is
// transport-defined.
class II2cBus {
public:
    virtual ~II2cBus() = default;

    // Single write transaction to a 7-bit device address
    virtual void write(uint8_t address, const std::vector<uint8_t>& data) = 0;

    // Write followed by a read of readLength bytes (repeated start)
    virtual std::vector<uint8_t> writeRead(uint8_t address,
                                           const std::vector<uint8_t>& data,
                                           size_t readLength) = 0;
};

} // namespace twidisplay::hardware
