/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "Logger.hpp"
#include <vector>
#include <filesystem>
#include <iostream>

namespace sorting_arm {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
bool Logger::s_initialized = false;

namespace {

spdlog::level::level_enum parseLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace

void Logger::init(const std::string& log_file,
                  const std::string& level,
                  size_t max_size,
                  size_t max_files,
                  bool console) {
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);
    }

    try {
        std::filesystem::path log_path(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, max_size, max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log file sink unavailable (" << log_file << "): " << ex.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Cannot create log directory: " << ex.what() << std::endl;
    }

    s_logger = std::make_shared<spdlog::logger>("sorting_core", sinks.begin(), sinks.end());
    s_logger->set_level(parseLevel(level));

    // Flush on warn or above
    s_logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(s_logger);
    s_initialized = true;
}

void Logger::reset() {
    if (s_logger) {
        s_logger->flush();
    }
    s_logger.reset();
    s_initialized = false;
}

void Logger::setLevel(const std::string& level) {
    get()->set_level(parseLevel(level));
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!s_initialized) {
        init(); // Initialize with defaults
    }
    return s_logger;
}

} // namespace sorting_arm
