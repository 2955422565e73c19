// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#include "hardware/linux_i2c_bus.h"
#include "logger.h"

#include <cerrno>
#include <cstring>
#include <limits>
#include <stdexcept>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <linux/i2c.h>
#include <linux/i2c-dev.h>

namespace twidisplay::hardware {

namespace {
constexpr uint8_t MAX_7BIT_ADDRESS = 0x7F;

std::runtime_error sysErr(const char* what) {
    return std::runtime_error(std::string(what) + ": " + std::strerror(errno));
}

constexpr size_t MAX_MESSAGE_LENGTH = std::numeric_limits<__u16>::max();

void checkLength(size_t length, const char* what) {
    if (length > MAX_MESSAGE_LENGTH) {
        throw std::invalid_argument(std::string("i2c ") + what + " too long: " +
                                    std::to_string(length) + " bytes");
    }
}

void checkAddress(uint8_t address) {
    if (address > MAX_7BIT_ADDRESS) {
        throw std::invalid_argument("i2c address out of 7-bit range: " + std::to_string(address));
    }
}
} // namespace

LinuxI2cBus::LinuxI2cBus(std::string i2cDev)
    : dev_(std::move(i2cDev)) {}

LinuxI2cBus::~LinuxI2cBus() {
    close();
}

void LinuxI2cBus::open() {
    if (fd_ >= 0) return;

    fd_ = ::open(dev_.c_str(), O_RDWR | O_CLOEXEC);
    if (fd_ < 0) {
        auto err = sysErr("open(i2c)");
        LOG_BUS_ERROR("Failed to open {}: {}", dev_, err.what());
        throw err;
    }

    unsigned long funcs = 0;
    if (::ioctl(fd_, I2C_FUNCS, &funcs) < 0 || (funcs & I2C_FUNC_I2C) == 0) {
        int saved = errno;
        ::close(fd_);
        fd_ = -1;
        errno = saved != 0 ? saved : EOPNOTSUPP;
        auto err = sysErr("ioctl(I2C_FUNCS)");
        LOG_BUS_ERROR("Adapter {} does not support plain I2C transfers: {}", dev_, err.what());
        throw err;
    }

    LOG_BUS_INFO("Opened I2C adapter {}", dev_);
}

void LinuxI2cBus::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
        LOG_BUS_INFO("Closed I2C adapter {}", dev_);
    }
}

void LinuxI2cBus::ensureOpen() const {
    if (fd_ < 0) throw std::runtime_error("LinuxI2cBus: bus is not open");
}

void LinuxI2cBus::write(uint8_t address, const std::vector<uint8_t>& data) {
    checkAddress(address);
    checkLength(data.size(), "write");
    ensureOpen();

    i2c_msg msg{};
    msg.addr = address;
    msg.flags = 0;
    msg.len = static_cast<__u16>(data.size());
    msg.buf = const_cast<__u8*>(data.data());

    i2c_rdwr_ioctl_data xfer{};
    xfer.msgs = &msg;
    xfer.nmsgs = 1;

    if (::ioctl(fd_, I2C_RDWR, &xfer) < 0) {
        auto err = sysErr("i2c write");
        LOG_BUS_ERROR("Write of {} byte(s) to 0x{:02x} on {} failed: {}",
                      data.size(), address, dev_, err.what());
        throw err;
    }
}

std::vector<uint8_t> LinuxI2cBus::writeRead(uint8_t address,
                                            const std::vector<uint8_t>& data,
                                            size_t readLength) {
    checkAddress(address);
    checkLength(data.size(), "write");
    checkLength(readLength, "read");
    ensureOpen();

    std::vector<uint8_t> result(readLength, 0);

    i2c_msg msgs[2]{};
    msgs[0].addr = address;
    msgs[0].flags = 0;
    msgs[0].len = static_cast<__u16>(data.size());
    msgs[0].buf = const_cast<__u8*>(data.data());
    msgs[1].addr = address;
    msgs[1].flags = I2C_M_RD;
    msgs[1].len = static_cast<__u16>(result.size());
    msgs[1].buf = result.data();

    i2c_rdwr_ioctl_data xfer{};
    xfer.msgs = msgs;
    xfer.nmsgs = 2;

    if (::ioctl(fd_, I2C_RDWR, &xfer) < 0) {
        auto err = sysErr("i2c write/read");
        LOG_BUS_ERROR("Write/read at 0x{:02x} on {} failed: {}", address, dev_, err.what());
        throw err;
    }
    return result;
}

} // namespace twidisplay::hardware
