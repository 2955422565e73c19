// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#include "config.h"
#include "console_shell.h"
#include "hardware/hardware_config.h"
#include "hardware/linux_i2c_bus.h"
#include "logger.h"
#include "peripherals/twi_display.h"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <signal.h>

using namespace twidisplay;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

namespace {

// SA_RESTART is left out so a blocking read on stdin returns on SIGINT
void installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

uint8_t resolveAddress() {
    const char* env = std::getenv("TWIDISPLAY_I2C_ADDRESS");
    if (!env || *env == '\0') {
        return peripherals::TwiDisplay::DEFAULT_ADDRESS;
    }
    char* end = nullptr;
    long value = std::strtol(env, &end, 0);
    if (*end != '\0' || value < 0 || value > hardware::config::i2c::MAX_ADDRESS) {
        throw std::invalid_argument(std::string("TWIDISPLAY_I2C_ADDRESS is not a 7-bit address: ") + env);
    }
    return static_cast<uint8_t>(value);
}

std::string resolveDevice() {
    const char* env = std::getenv("TWIDISPLAY_I2C_DEVICE");
    return (env && *env != '\0') ? std::string(env) : std::string(hardware::config::i2c::DEVICE);
}

} // namespace

int main(int argc, char* argv[]) {
    installSignalHandlers();

    const std::string configPath = argc > 1 ? argv[1] : LOGGING_CONFIG_PATH;
    if (!Logger::initialize(configPath)) {
        std::cerr << "Failed to initialize logging" << std::endl;
    }

    int rc = 0;
    try {
        const std::string device = resolveDevice();
        const uint8_t address = resolveAddress();

        auto bus = std::make_unique<hardware::LinuxI2cBus>(device);
        bus->open();
        LOG_INFO("Using display at 0x{:02x} on {}", address, device);

        peripherals::TwiDisplay display(std::move(bus), address);
        ConsoleShell shell(display, std::cout);
        shell.printWelcome();

        std::string command;
        while (g_running) {
            std::cout << "\ntwidisplay> " << std::flush;
            if (!std::getline(std::cin, command)) {
                break;
            }
            if (!shell.processCommand(command)) {
                break;
            }
        }

        // Take the bus back from the driver and close it explicitly
        auto released = peripherals::TwiDisplay::destroy(std::move(display));
        static_cast<hardware::LinuxI2cBus&>(*released).close();
        LOG_INFO("Shutdown complete");

    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        rc = 1;
    }

    Logger::shutdown();
    return rc;
}
