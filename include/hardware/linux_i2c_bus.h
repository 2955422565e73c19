// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#pragma once

#include "hardware/i2c_bus.h"

#include <cstdint>
#include <string>
#include <vector>

namespace twidisplay::hardware {

// I2C transport over Linux i2c-dev (/dev/i2c-N).
// Every transaction is issued with I2C_RDWR so the target address travels
// with the message instead of being bound to the file descriptor.
class LinuxI2cBus : public II2cBus {
public:
    explicit LinuxI2cBus(std::string i2cDev);
    ~LinuxI2cBus() override;

    LinuxI2cBus(const LinuxI2cBus&) = delete;
    LinuxI2cBus& operator=(const LinuxI2cBus&) = delete;

    void open();
    void close();
    bool isOpen() const { return fd_ >= 0; }
    const std::string& device() const { return dev_; }

    void write(uint8_t address, const std::vector<uint8_t>& data) override;
    std::vector<uint8_t> writeRead(uint8_t address,
                                   const std::vector<uint8_t>& data,
                                   size_t readLength) override;

private:
    void ensureOpen() const;

    std::string dev_;
    int fd_{-1};
};

} // namespace twidisplay::hardware
