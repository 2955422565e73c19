// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#include "logger.h"
#include "config.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <vector>

#include <unistd.h>
#include <limits.h>

namespace twidisplay {

bool Logger::initialized_ = false;
std::string Logger::configPath_;

namespace {
    constexpr const char* MAIN_LOGGER = "twidisplay";
    constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%t] [%n] [%l] %v";

    // Return full path to the running executable, or empty path on failure.
    std::filesystem::path getExecutablePath() {
        std::vector<char> buf(PATH_MAX);
        ssize_t len = readlink("/proc/self/exe", buf.data(), buf.size());
        if (len <= 0 || static_cast<size_t>(len) >= buf.size()) return {};
        return std::filesystem::path(std::string(buf.data(), static_cast<size_t>(len)));
    }

    // "10MB" / "512KB" / plain bytes
    size_t parseSize(const std::string& text) {
        if (text.size() >= 2) {
            const std::string suffix = text.substr(text.size() - 2);
            const std::string number = text.substr(0, text.size() - 2);
            if (suffix == "MB") return static_cast<size_t>(std::stoul(number)) * 1024 * 1024;
            if (suffix == "KB") return static_cast<size_t>(std::stoul(number)) * 1024;
        }
        return static_cast<size_t>(std::stoul(text));
    }

    void registerLogger(const std::string& name,
                        const std::vector<spdlog::sink_ptr>& sinks,
                        spdlog::level::level_enum level,
                        bool async) {
        std::shared_ptr<spdlog::logger> logger;
        if (async) {
            logger = std::make_shared<spdlog::async_logger>(
                name, sinks.begin(), sinks.end(),
                spdlog::thread_pool(), spdlog::async_overflow_policy::block);
        } else {
            logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        }
        logger->set_level(level);
        // getLogger() may have created a console fallback under the same name
        spdlog::drop(name);
        spdlog::register_logger(logger);
    }
} // namespace

bool Logger::initialize(const std::string& configPath) {
    if (initialized_) {
        return true;
    }

    configPath_ = configPath;

    if (loadConfig(configPath)) {
        initialized_ = true;
        spdlog::info("Logging system initialized from config file: {}", configPath);
        return true;
    }

    std::cout << "[Logger] Failed to load config from " << configPath
              << ", using default configuration" << std::endl;
    return initializeDefault();
}

bool Logger::initializeDefault(bool consoleOutput) {
    if (initialized_) {
        return true;
    }

    try {
        std::filesystem::create_directories(LOG_DIR);

        spdlog::init_thread_pool(8192, 1);

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            LOG_DIR + "/twidisplay.log", 1024 * 1024 * 5, 3);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern(FILE_PATTERN);

        std::vector<spdlog::sink_ptr> sinks{file_sink};

        if (consoleOutput) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::warn);
            console_sink->set_pattern("[%l] %v");
            sinks.push_back(console_sink);
        }

        registerLogger(MAIN_LOGGER, sinks, spdlog::level::debug, true);
        registerLogger("Peripherals", sinks, spdlog::level::debug, true);
        registerLogger("Bus", sinks, spdlog::level::info, true);

        spdlog::set_default_logger(spdlog::get(MAIN_LOGGER));
        spdlog::set_level(spdlog::level::debug);

        initialized_ = true;
        spdlog::info("Logging system initialized with default configuration");
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Logger] Failed to initialize logging system: " << e.what() << std::endl;
        return false;
    }
}

void Logger::shutdown() {
    if (initialized_) {
        spdlog::info("Shutting down logging system");
        spdlog::shutdown();
        initialized_ = false;
    }
}

std::shared_ptr<spdlog::logger> Logger::getLogger(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::default_logger();
        if (!logger) {
            logger = spdlog::stdout_color_mt(name);
        }
    }
    return logger;
}

void Logger::setLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) {
        logger->set_level(level);
    });
}

bool Logger::isInitialized() {
    return initialized_;
}

bool Logger::loadConfig(const std::string& configPath) {
    try {
        std::filesystem::path cfgPath(configPath);
        std::ifstream configFile(cfgPath);

        if (!configFile.is_open() && cfgPath.is_relative()) {
            std::filesystem::path exePath = getExecutablePath();
            if (!exePath.empty()) {
                configFile.open(exePath.parent_path() / cfgPath);
            }
        }

        if (!configFile.is_open()) {
            return false;
        }

        nlohmann::json config;
        configFile >> config;

        const nlohmann::json asyncConfig = config.value("async", nlohmann::json::object());
        bool asyncEnabled = asyncConfig.value("enabled", true);
        if (asyncEnabled) {
            size_t queueSize = asyncConfig.value("queue_size", 8192);
            size_t threadCount = asyncConfig.value("thread_count", 1);
            spdlog::init_thread_pool(queueSize, threadCount);
        }

        std::vector<spdlog::sink_ptr> sinks;

        for (const auto& sinkConfig : config["sinks"]) {
            std::string type = sinkConfig["type"];

            spdlog::sink_ptr sink;

            if (type == "stdout_color") {
                sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            } else if (type == "rotating_file") {
                std::filesystem::path filename = sinkConfig["filename"].get<std::string>();
                if (filename.has_parent_path()) {
                    std::filesystem::create_directories(filename.parent_path());
                }
                size_t maxSize = parseSize(sinkConfig.value("max_size", "5MB"));
                int maxFiles = sinkConfig.value("max_files", 3);
                sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    filename.string(), maxSize, maxFiles);
            } else {
                std::cerr << "[Logger] Unknown sink type '" << type << "' ignored" << std::endl;
            }

            if (sink) {
                sink->set_level(spdlog::level::from_str(sinkConfig.value("level", "info")));
                if (sinkConfig.contains("pattern")) {
                    sink->set_pattern(sinkConfig["pattern"].get<std::string>());
                }
                sinks.push_back(sink);
            }
        }

        for (const auto& loggerConfig : config["loggers"]) {
            registerLogger(loggerConfig["name"].get<std::string>(), sinks,
                           spdlog::level::from_str(loggerConfig.value("level", "info")),
                           asyncEnabled);
        }

        if (config.contains("global_level")) {
            spdlog::set_level(spdlog::level::from_str(config["global_level"].get<std::string>()));
        }

        if (auto mainLogger = spdlog::get(MAIN_LOGGER)) {
            spdlog::set_default_logger(mainLogger);
        }

        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Logger] Error loading config: " << e.what() << std::endl;
        return false;
    }
}

} // namespace twidisplay
