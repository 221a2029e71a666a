// include/trade_store/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "trade_store/core/config_base.hpp"
#include "trade_store/core/error.hpp"

namespace trade_store {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,     // connection lifecycle, schema changes
    WARNING,  // rejected writes (constraint violations)
    ERR,      // engine failures
    FATAL
};

enum class LogDestination {
    CONSOLE,  // std::cout
    FILE,     // rotated files under log_directory
    BOTH
};

std::string level_to_string(LogLevel level);
Result<LogLevel> level_from_string(const std::string& name);

std::string log_destination_to_string(LogDestination dest);
Result<LogDestination> log_destination_from_string(const std::string& name);

/**
 * @brief Logger settings, the "logging" section of a store config
 *
 * Files are named <filename_prefix>_<YYYYMMDD_HHMMSS>_part<N>.log. A new part
 * starts once the current one reaches max_file_size bytes; at most max_files
 * files are kept in log_directory, oldest removed first.
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"trade_store"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};
    size_t max_files{10};

    std::string config_name() const override {
        return "LoggerConfig";
    }
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief Process-wide, thread-safe logger
 *
 * Messages carry the component registered on the calling thread, so a store
 * used from pool worker threads tags its lines through ComponentScope.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Apply config and open the first log file when writing to FILE or BOTH
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    static void reset_for_tests() {
        std::lock_guard<std::mutex> lock(instance().mutex_);
        instance().initialized_ = false;
        if (instance().log_file_.is_open()) {
            instance().log_file_.close();
        }
        instance().current_session_timestamp_.clear();
        instance().current_part_number_ = 1;
    }

    void log(LogLevel level, const std::string& message);

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    static void register_component(const std::string& component) {
        current_component_ = component;
    }

    static const std::string& current_component() {
        return current_component_;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::filesystem::path next_log_path() const;
    void open_log_file();
    void prune_log_files();
    void rotate_log_files();
    std::string format_message(LogLevel level, const std::string& message);

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string current_session_timestamp_;  // YYYYMMDD_HHMMSS
    int current_part_number_{1};
};

/**
 * @brief Tags the calling thread's log lines for the lifetime of the scope
 */
class ComponentScope {
public:
    explicit ComponentScope(const std::string& component)
        : previous_(Logger::current_component()) {
        Logger::register_component(component);
    }

    ~ComponentScope() {
        Logger::register_component(previous_);
    }

    ComponentScope(const ComponentScope&) = delete;
    ComponentScope& operator=(const ComponentScope&) = delete;

private:
    std::string previous_;
};

/**
 * Usage: LOG(LogLevel::INFO, "Inserted " << rows.size() << " bars")
 */
#define LOG(level, message)                                \
    do {                                                   \
        if (level >= Logger::instance().get_min_level()) { \
            std::ostringstream os;                         \
            os << message;                                 \
            Logger::instance().log(level, os.str());       \
        }                                                  \
    } while (0)

#define TRACE(message) LOG(LogLevel::TRACE, message)
#define DEBUG(message) LOG(LogLevel::DEBUG, message)
#define INFO(message) LOG(LogLevel::INFO, message)
#define WARN(message) LOG(LogLevel::WARNING, message)
#define ERROR(message) LOG(LogLevel::ERR, message)
#define FATAL(message) LOG(LogLevel::FATAL, message)
}  // namespace trade_store
