// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace twidisplay {

/**
 * @brief Logging facade for the driver and the console tool
 *
 * Loggers are registered by category name ("twidisplay", "Peripherals",
 * "Bus"). Library code may log before initialize() is called; in that case
 * getLogger() hands out the spdlog default logger.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system from a JSON configuration file
     * @param configPath Path to the file, tried as given and then next to the executable
     * @return true if initialization was successful, false otherwise
     */
    static bool initialize(const std::string& configPath = "config/logging.json");

    /**
     * @brief Initialize the logging system with the built-in configuration
     * @param consoleOutput Also log to a colored stdout sink
     * @return true if initialization was successful, false otherwise
     */
    static bool initializeDefault(bool consoleOutput = false);

    /**
     * @brief Flush and drop all loggers
     */
    static void shutdown();

    /**
     * @brief Get a logger by category name
     * @return The registered logger, or the default logger if not found
     */
    static std::shared_ptr<spdlog::logger> getLogger(const std::string& name = "twidisplay");

    static void setLevel(spdlog::level::level_enum level);

    static bool isInitialized();

private:
    static bool initialized_;
    static std::string configPath_;

    static bool loadConfig(const std::string& configPath);
};

// Convenience macros for different logger categories
#define LOG_PERIPHERALS() twidisplay::Logger::getLogger("Peripherals")
#define LOG_BUS() twidisplay::Logger::getLogger("Bus")
#define LOG_MAIN() twidisplay::Logger::getLogger("twidisplay")

#define LOG_PERIPH_DEBUG(...) LOG_PERIPHERALS()->debug(__VA_ARGS__)
#define LOG_PERIPH_INFO(...) LOG_PERIPHERALS()->info(__VA_ARGS__)
#define LOG_PERIPH_WARN(...) LOG_PERIPHERALS()->warn(__VA_ARGS__)
#define LOG_PERIPH_ERROR(...) LOG_PERIPHERALS()->error(__VA_ARGS__)

#define LOG_BUS_DEBUG(...) LOG_BUS()->debug(__VA_ARGS__)
#define LOG_BUS_INFO(...) LOG_BUS()->info(__VA_ARGS__)
#define LOG_BUS_WARN(...) LOG_BUS()->warn(__VA_ARGS__)
#define LOG_BUS_ERROR(...) LOG_BUS()->error(__VA_ARGS__)

#define LOG_DEBUG(...) LOG_MAIN()->debug(__VA_ARGS__)
#define LOG_INFO(...) LOG_MAIN()->info(__VA_ARGS__)
#define LOG_WARN(...) LOG_MAIN()->warn(__VA_ARGS__)
#define LOG_ERROR(...) LOG_MAIN()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) LOG_MAIN()->critical(__VA_ARGS__)

} // namespace twidisplay
