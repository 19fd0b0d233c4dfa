/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace sorting_arm {

class Logger {
public:
    /**
     * Initialize the logging system
     * @param log_file Path to log file
     * @param level Log level (trace, debug, info, warn, error)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     * @param console Also log to a colored stdout sink
     */
    static void init(const std::string& log_file = "logs/sorting_arm.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5,
                     bool console = true);

    /**
     * Drop the current logger so that init() can be called again
     * with settings read from the configuration file.
     */
    static void reset();

    /**
     * Change the level of an initialized logger
     */
    static void setLevel(const std::string& level);

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace sorting_arm

// Convenience macros
#define LOG_TRACE(...) ::sorting_arm::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::sorting_arm::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::sorting_arm::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::sorting_arm::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::sorting_arm::Logger::get()->error(__VA_ARGS__)
