// logger.hpp
#pragma once
#include <atomic>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Err = 3 };

// "debug", "info", "warn"/"warning", "error" in any case.
std::optional<LogLevel> parse_log_level(std::string text);

struct LogSettings {
    std::string file_path = "logs/relay.log";
    LogLevel level = LogLevel::Info;
    std::uint64_t max_size_bytes = 10ull * 1024 * 1024; // 10MB
    int rotate_count = 5;
    std::string service_name = "rendezvous_relay";
};

// One JSON object per line, rotated by size. Falls back to stderr when the
// file can't be opened.
class Logger {
public:
    static Logger& instance();

    // instance() is usable before init(); it then initializes from the environment on first write
    void init(const LogSettings& settings);

    void log(LogLevel log_level, const std::string& log_message, const nlohmann::json& extra = nlohmann::json());

    void debug(const std::string& log_message, const nlohmann::json& extra = nlohmann::json());
    void info(const std::string& log_message, const nlohmann::json& extra = nlohmann::json());
    void warn(const std::string& log_message, const nlohmann::json& extra = nlohmann::json());
    void error(const std::string& log_message, const nlohmann::json& extra = nlohmann::json());

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void init_locked(const LogSettings& settings);
    std::string level_to_string(LogLevel log_level) const;
    std::string timestamp_iso() const;
    void rotate_if_needed_locked();

    std::mutex file_mutex_;
    std::ofstream log_file_stream_;
    LogSettings settings_;
    std::atomic<LogLevel> log_level_;
    bool is_initialized_;
};
