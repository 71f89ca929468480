// src/core/logger.cpp

#include "quant_ngin/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <vector>
#include "quant_ngin/core/time_utils.hpp"

namespace quant_ngin {

thread_local std::string Logger::current_component_;

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
    }
}

std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
        default:
            return "UNKNOWN";
    }
}

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = log_destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level")) {
        const auto level = j.at("min_level").get<std::string>();
        if (level == "TRACE")
            min_level = LogLevel::TRACE;
        else if (level == "DEBUG")
            min_level = LogLevel::DEBUG;
        else if (level == "INFO")
            min_level = LogLevel::INFO;
        else if (level == "WARNING")
            min_level = LogLevel::WARNING;
        else if (level == "ERROR")
            min_level = LogLevel::ERR;
        else if (level == "FATAL")
            min_level = LogLevel::FATAL;
    }
    if (j.contains("destination")) {
        const auto dest = j.at("destination").get<std::string>();
        if (dest == "CONSOLE")
            destination = LogDestination::CONSOLE;
        else if (dest == "FILE")
            destination = LogDestination::FILE;
        else if (dest == "BOTH")
            destination = LogDestination::BOTH;
    }
    if (j.contains("log_directory"))
        log_directory = j.at("log_directory").get<std::string>();
    if (j.contains("filename_prefix"))
        filename_prefix = j.at("filename_prefix").get<std::string>();
    if (j.contains("include_timestamp"))
        include_timestamp = j.at("include_timestamp").get<bool>();
    if (j.contains("include_level"))
        include_level = j.at("include_level").get<bool>();
    if (j.contains("max_file_size"))
        max_file_size = j.at("max_file_size").get<size_t>();
    if (j.contains("max_files"))
        max_files = j.at("max_files").get<size_t>();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::reset_for_tests() {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig();
    logger.session_timestamp_.clear();
    logger.part_number_ = 1;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        std::error_code ec;
        std::filesystem::create_directories(config_.log_directory, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + config_.log_directory +
                                     " - " + ec.message());
        }

        prune_old_files();
        session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        part_number_ = 1;
        open_log_file();

        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file in " + config_.log_directory);
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    const std::string formatted = format_message(level, message);

    if (config_.destination == LogDestination::CONSOLE ||
        config_.destination == LogDestination::BOTH) {
        std::cout << formatted << std::endl;
    }

    if ((config_.destination == LogDestination::FILE ||
         config_.destination == LogDestination::BOTH) &&
        log_file_.is_open()) {
        log_file_ << formatted << std::endl;
        if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
            rotate_log_files();
        }
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S") << " ";
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }
    ss << message;
    return ss.str();
}

void Logger::open_log_file() {
    // prefix_YYYYMMDD_HHMMSS_partN.log
    std::filesystem::path path =
        std::filesystem::path(config_.log_directory) /
        (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
         std::to_string(part_number_) + ".log");
    log_file_.open(path, std::ios::app);
}

void Logger::prune_old_files() {
    std::error_code ec;
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(config_.log_directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });
    while (!files.empty() && files.size() >= config_.max_files) {
        std::filesystem::remove(files.front(), ec);
        files.erase(files.begin());
    }
}

void Logger::rotate_log_files() {
    log_file_.close();
    prune_old_files();
    ++part_number_;
    open_log_file();
}

}  // namespace quant_ngin
