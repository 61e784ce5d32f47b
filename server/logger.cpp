// logger.cpp
#include "logger.hpp"
#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

std::optional<LogLevel> parse_log_level(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    if (text == "warn" || text == "warning") return LogLevel::Warn;
    if (text == "error") return LogLevel::Err;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : log_level_(LogLevel::Info), is_initialized_(false) {
    // stream stays closed until init or first write
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (log_file_stream_.is_open()) log_file_stream_.close();
}

void Logger::init(const LogSettings& settings) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    init_locked(settings);
}

void Logger::init_locked(const LogSettings& settings) {
    settings_ = settings;
    log_level_ = settings.level;

    fs::path dir = fs::path(settings_.file_path).parent_path();
    std::error_code ec;
    if (!dir.empty() && !fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) std::fprintf(stderr, "logger: cannot create %s: %s\n", dir.string().c_str(), ec.message().c_str());
    }

    if (log_file_stream_.is_open()) log_file_stream_.close();
    log_file_stream_.open(settings_.file_path, std::ios::app);
    is_initialized_ = true;
}

std::string Logger::level_to_string(LogLevel log_level) const {
    switch (log_level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Err:   return "error";
    }
    return "info";
}

std::string Logger::timestamp_iso() const {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::time_t current_time = system_clock::to_time_t(now);
    std::tm tm;
    gmtime_r(&current_time, &tm);
    std::ostringstream time_stream;
    time_stream << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    time_stream << '.' << std::setw(3) << std::setfill('0') << ms.count() << "Z";
    return time_stream.str();
}

void Logger::rotate_if_needed_locked() {
    if (!log_file_stream_.is_open()) {
        log_file_stream_.open(settings_.file_path, std::ios::app);
        if (!log_file_stream_.is_open()) return;
    }

    std::error_code ec;
    auto sz = fs::file_size(settings_.file_path, ec);
    if (ec || sz < settings_.max_size_bytes) return;

    log_file_stream_.close();

    // file -> file.1, file.1 -> file.2, ... keeping rotate_count files
    const std::string& base = settings_.file_path;
    for (int i = settings_.rotate_count - 1; i >= 0; --i) {
        fs::path src = (i == 0) ? fs::path(base) : fs::path(base + "." + std::to_string(i));
        fs::path dst = fs::path(base + "." + std::to_string(i + 1));
        if (fs::exists(src, ec)) {
            if (fs::exists(dst, ec)) fs::remove(dst, ec);
            fs::rename(src, dst, ec);
        }
    }

    log_file_stream_.open(base, std::ios::app);
}

void Logger::log(LogLevel log_level, const std::string& log_message, const nlohmann::json& extra) {
    if (static_cast<int>(log_level) < static_cast<int>(log_level_.load())) return;

    std::lock_guard<std::mutex> lock(file_mutex_);
    if (!is_initialized_) {
        init_locked(load_log_settings(std::getenv));
        if (static_cast<int>(log_level) < static_cast<int>(log_level_.load())) return;
    }

    rotate_if_needed_locked();

    nlohmann::json log_entry;
    log_entry["timestamp"] = timestamp_iso();
    log_entry["log_level"] = level_to_string(log_level);
    log_entry["service"] = settings_.service_name;
    log_entry["thread_id"] = std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    log_entry["log_message"] = log_message;
    if (!extra.is_null()) log_entry["extra"] = extra;

    const std::string line = log_entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (log_file_stream_.is_open()) {
        log_file_stream_ << line << "\n";
        log_file_stream_.flush();
    } else {
        std::fprintf(stderr, "%s\n", line.c_str());
    }
}

void Logger::debug(const std::string& log_message, const nlohmann::json& extra) { log(LogLevel::Debug, log_message, extra); }
void Logger::info(const std::string& log_message, const nlohmann::json& extra)  { log(LogLevel::Info,  log_message, extra); }
void Logger::warn(const std::string& log_message, const nlohmann::json& extra)  { log(LogLevel::Warn,  log_message, extra); }
void Logger::error(const std::string& log_message, const nlohmann::json& extra) { log(LogLevel::Err,   log_message, extra); }
