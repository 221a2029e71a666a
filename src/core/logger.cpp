// src/core/logger.cpp

#include "trade_store/core/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>
#include "trade_store/core/time_utils.hpp"

namespace trade_store {

thread_local std::string Logger::current_component_;

namespace {

const std::pair<LogLevel, const char*> LEVEL_NAMES[] = {
    {LogLevel::TRACE, "TRACE"}, {LogLevel::DEBUG, "DEBUG"}, {LogLevel::INFO, "INFO"},
    {LogLevel::WARNING, "WARNING"}, {LogLevel::ERR, "ERROR"}, {LogLevel::FATAL, "FATAL"}};

const std::pair<LogDestination, const char*> DESTINATION_NAMES[] = {
    {LogDestination::CONSOLE, "CONSOLE"},
    {LogDestination::FILE, "FILE"},
    {LogDestination::BOTH, "BOTH"}};

bool writes_console(LogDestination destination) {
    return destination == LogDestination::CONSOLE || destination == LogDestination::BOTH;
}

bool writes_file(LogDestination destination) {
    return destination == LogDestination::FILE || destination == LogDestination::BOTH;
}

}  // namespace

std::string level_to_string(LogLevel level) {
    for (const auto& [value, name] : LEVEL_NAMES) {
        if (value == level) {
            return name;
        }
    }
    return "UNKNOWN";
}

Result<LogLevel> level_from_string(const std::string& name) {
    for (const auto& [value, level_name] : LEVEL_NAMES) {
        if (name == level_name) {
            return Result<LogLevel>(value);
        }
    }
    return make_error<LogLevel>(ErrorCode::INVALID_ARGUMENT, "Unknown log level: " + name,
                                "LoggerConfig");
}

std::string log_destination_to_string(LogDestination dest) {
    for (const auto& [value, name] : DESTINATION_NAMES) {
        if (value == dest) {
            return name;
        }
    }
    return "UNKNOWN";
}

Result<LogDestination> log_destination_from_string(const std::string& name) {
    for (const auto& [value, destination_name] : DESTINATION_NAMES) {
        if (name == destination_name) {
            return Result<LogDestination>(value);
        }
    }
    return make_error<LogDestination>(ErrorCode::INVALID_ARGUMENT,
                                      "Unknown log destination: " + name, "LoggerConfig");
}

// ============================================================================
// LoggerConfig
// ============================================================================

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
        auto level = level_from_string(j.at("min_level").get<std::string>());
        if (level.is_error()) {
            throw std::invalid_argument(level.error()->what());
        }
        min_level = level.value();
    }
    if (j.contains("destination")) {
        auto dest = log_destination_from_string(j.at("destination").get<std::string>());
        if (dest.is_error()) {
            throw std::invalid_argument(dest.error()->what());
        }
        destination = dest.value();
    }
    read_field(j, "log_directory", log_directory);
    read_field(j, "filename_prefix", filename_prefix);
    read_field(j, "include_timestamp", include_timestamp);
    read_field(j, "include_level", include_level);
    read_field(j, "max_file_size", max_file_size);
    read_field(j, "max_files", max_files);
}

Result<void> LoggerConfig::validate() const {
    if (max_files == 0 || max_file_size == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_files and max_file_size must be positive", config_name());
    }
    if (writes_file(destination) && (log_directory.empty() || filename_prefix.empty())) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "file logging needs log_directory and filename_prefix",
                                config_name());
    }
    return Result<void>();
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (writes_file(config_.destination)) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::absolute(config_.log_directory), ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory " + config_.log_directory +
                                     ": " + ec.message());
        }

        current_session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        current_part_number_ = 1;
        open_log_file();
        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file " + next_log_path().string());
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

    std::string line = format_message(level, message);
    if (writes_console(config_.destination)) {
        std::cout << line << std::endl;
    }
    if (writes_file(config_.destination) && log_file_.is_open()) {
        log_file_ << line << std::endl;
        if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
            rotate_log_files();
        }
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) {
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

std::filesystem::path Logger::next_log_path() const {
    return std::filesystem::absolute(config_.log_directory) /
           (config_.filename_prefix + "_" + current_session_timestamp_ + "_part" +
            std::to_string(current_part_number_) + ".log");
}

// Call with mutex_ held
void Logger::open_log_file() {
    prune_log_files();
    log_file_.open(next_log_path(), std::ios::app);
}

// Leaves room for one more file, so the directory never exceeds max_files
void Logger::prune_log_files() {
    std::filesystem::path dir = std::filesystem::absolute(config_.log_directory);
    std::error_code ec;
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    size_t excess = files.size() + 1 > config_.max_files ? files.size() + 1 - config_.max_files : 0;
    for (size_t i = 0; i < excess && i < files.size(); ++i) {
        std::filesystem::remove(files[i], ec);
    }
}

// Call with mutex_ held
void Logger::rotate_log_files() {
    log_file_.close();
    current_part_number_++;
    open_log_file();
}

}  // namespace trade_store
