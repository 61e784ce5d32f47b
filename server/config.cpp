// config.cpp
#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <thread>

namespace {

std::optional<std::string> env_string(const EnvLookup& env, const char* name) {
    const char* value = env(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

template <typename T>
T env_number(const EnvLookup& env, const char* name, T fallback, std::vector<std::string>* warnings) {
    auto text = env_string(env, name);
    if (!text) return fallback;
    try {
        std::size_t used = 0;
        unsigned long long parsed = std::stoull(*text, &used);
        if (used == text->size() && (*text)[0] != '-') return static_cast<T>(parsed);
    } catch (const std::exception&) {
        // reported below
    }
    if (warnings) warnings->push_back(std::string(name) + "='" + *text + "' is not a number, using default");
    return fallback;
}

bool env_flag(const EnvLookup& env, const char* name) {
    auto text = env_string(env, name);
    if (!text) return false;
    std::string lowered = *text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

unsigned short parse_port(const std::string& text) {
    std::size_t used = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &used);
    } catch (const std::exception&) {
        throw ConfigError("invalid port '" + text + "'");
    }
    if (used != text.size() || value == 0 || value > 65535) {
        throw ConfigError("invalid port '" + text + "'");
    }
    return static_cast<unsigned short>(value);
}

} // namespace

nlohmann::json WelcomeSettings::to_json() const {
    nlohmann::json welcome = nlohmann::json::object();
    if (current_version) welcome["currentVersion"] = *current_version;
    if (motd) welcome["motd"] = *motd;
    if (error) welcome["error"] = *error;
    return welcome;
}

std::size_t ServerConfig::effective_thread_count() const {
    if (thread_count) return thread_count;
    std::size_t hardware = std::thread::hardware_concurrency();
    return hardware ? hardware : 2;
}

LogSettings load_log_settings(const EnvLookup& env, std::vector<std::string>* warnings) {
    LogSettings settings;
    if (auto file = env_string(env, "LOG_FILE")) settings.file_path = *file;
    if (auto level = env_string(env, "LOG_LEVEL")) {
        if (auto parsed = parse_log_level(*level)) {
            settings.level = *parsed;
        } else if (warnings) {
            warnings->push_back("LOG_LEVEL='" + *level + "' is not a log level, using info");
        }
    }
    settings.max_size_bytes = env_number<std::uint64_t>(env, "LOG_MAX_SIZE", settings.max_size_bytes, warnings);
    settings.rotate_count = env_number<int>(env, "LOG_ROTATE_COUNT", settings.rotate_count, warnings);
    if (auto service = env_string(env, "SERVICE_NAME")) settings.service_name = *service;
    return settings;
}

ServerConfig load_config(int argc, const char* const* argv, const EnvLookup& env) {
    ServerConfig config;

    if (argc > 1) {
        config.port = parse_port(argv[1]);
    } else if (auto port = env_string(env, "RELAY_PORT")) {
        config.port = parse_port(*port);
    }

    config.thread_count = env_number<std::size_t>(env, "RELAY_THREADS", 0, &config.warnings);
    config.log_requests = env_flag(env, "RELAY_LOG_REQUESTS");

    config.welcome.current_version = env_string(env, "RELAY_CURRENT_VERSION");
    config.welcome.motd = env_string(env, "RELAY_MOTD");
    config.welcome.error = env_string(env, "RELAY_WELCOME_ERROR");

    config.log = load_log_settings(env, &config.warnings);
    return config;
}
