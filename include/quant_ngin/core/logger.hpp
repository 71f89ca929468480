// include/quant_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "quant_ngin/core/config_base.hpp"

namespace quant_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Per-day state machine detail
    DEBUG,    // Risk events, provider attempts
    INFO,     // Run lifecycle and headline metrics
    WARNING,  // Advisory conditions (fundamental filter, excluded symbols)
    ERR,      // Failed runs
    FATAL     // Unrecoverable application errors
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,
    FILE,
    BOTH
};

std::string level_to_string(LogLevel level);
std::string log_destination_to_string(LogDestination dest);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"quant_ngin"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{20 * 1024 * 1024};  // Rotate after 20MB
    size_t max_files{5};                     // Files kept in log_directory

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe process-wide logger
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    /**
     * @brief Log a message with specified level
     */
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag messages from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void open_log_file();
    void rotate_log_files();
    void prune_old_files();
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::string session_timestamp_;
    int part_number_{1};
    static thread_local std::string current_component_;
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Sharpe: " << sharpe)
 */
#define LOG(level, message)                                                    \
    do {                                                                       \
        if (level >= ::quant_ngin::Logger::instance().get_min_level()) {       \
            std::ostringstream os_;                                            \
            os_ << message;                                                    \
            ::quant_ngin::Logger::instance().log(level, os_.str());            \
        }                                                                      \
    } while (0)

#define TRACE(message) LOG(::quant_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::quant_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::quant_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::quant_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::quant_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::quant_ngin::LogLevel::FATAL, message)

}  // namespace quant_ngin
