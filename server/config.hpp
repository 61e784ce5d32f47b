// config.hpp
#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "logger.hpp"

// Returns the variable's value or nullptr; std::getenv in production.
using EnvLookup = std::function<const char*(const char*)>;

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Optional keys of the "welcome" message sent on connect.
struct WelcomeSettings {
    std::optional<std::string> current_version; // out-of-date clients warn
    std::optional<std::string> motd;            // displayed, then continue
    std::optional<std::string> error;           // displayed, then clients give up

    nlohmann::json to_json() const;
};

struct ServerConfig {
    unsigned short port = 4000;
    std::size_t thread_count = 0; // 0: one per hardware thread
    bool log_requests = false;
    WelcomeSettings welcome;
    LogSettings log;

    // malformed optional values that fell back to defaults, for logging once the logger is up
    std::vector<std::string> warnings;

    std::size_t effective_thread_count() const;
};

// LOG_FILE, LOG_LEVEL, LOG_MAX_SIZE, LOG_ROTATE_COUNT, SERVICE_NAME.
LogSettings load_log_settings(const EnvLookup& env, std::vector<std::string>* warnings = nullptr);

// Port from argv[1] or RELAY_PORT, the rest from RELAY_* and LOG_* variables.
// Throws ConfigError for an unusable port.
ServerConfig load_config(int argc, const char* const* argv, const EnvLookup& env);
