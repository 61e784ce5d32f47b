#include <gtest/gtest.h>
#include <map>
#include "config.hpp"

namespace {

struct FakeEnv {
    std::map<std::string, std::string> vars;

    EnvLookup lookup() const {
        return [this](const char* name) -> const char* {
            auto it = vars.find(name);
            return it == vars.end() ? nullptr : it->second.c_str();
        };
    }
};

} // namespace

TEST(ConfigTest, Defaults) {
    FakeEnv env;
    const char* argv[] = {"relay_server"};
    ServerConfig config = load_config(1, argv, env.lookup());
    EXPECT_EQ(config.port, 4000);
    EXPECT_FALSE(config.log_requests);
    EXPECT_EQ(config.log.file_path, "logs/relay.log");
    EXPECT_EQ(config.log.level, LogLevel::Info);
    EXPECT_EQ(config.log.rotate_count, 5);
    EXPECT_EQ(config.log.service_name, "rendezvous_relay");
    EXPECT_EQ(config.welcome.to_json(), nlohmann::json::object());
    EXPECT_TRUE(config.warnings.empty());
    EXPECT_GE(config.effective_thread_count(), 1u);
}

TEST(ConfigTest, CommandLinePortWins) {
    FakeEnv env;
    env.vars["RELAY_PORT"] = "5000";
    const char* with_arg[] = {"relay_server", "6000"};
    EXPECT_EQ(load_config(2, with_arg, env.lookup()).port, 6000);

    const char* without_arg[] = {"relay_server"};
    EXPECT_EQ(load_config(1, without_arg, env.lookup()).port, 5000);
}

TEST(ConfigTest, BadPortIsFatal) {
    FakeEnv env;
    for (const char* port : {"0", "70000", "12ab", "-1", "x"}) {
        const char* argv[] = {"relay_server", port};
        EXPECT_THROW(load_config(2, argv, env.lookup()), ConfigError) << port;
    }
}

TEST(ConfigTest, WelcomeSettings) {
    FakeEnv env;
    env.vars["RELAY_MOTD"] = "be nice";
    env.vars["RELAY_CURRENT_VERSION"] = "0.9.2";
    const char* argv[] = {"relay_server"};
    ServerConfig config = load_config(1, argv, env.lookup());

    nlohmann::json welcome = config.welcome.to_json();
    EXPECT_EQ(welcome["motd"], "be nice");
    EXPECT_EQ(welcome["currentVersion"], "0.9.2");
    EXPECT_FALSE(welcome.contains("error"));
}

TEST(ConfigTest, LoggingAndThreads) {
    FakeEnv env;
    env.vars["LOG_FILE"] = "/tmp/relay-test.log";
    env.vars["LOG_LEVEL"] = "DEBUG";
    env.vars["LOG_MAX_SIZE"] = "2048";
    env.vars["LOG_ROTATE_COUNT"] = "2";
    env.vars["SERVICE_NAME"] = "relay-eu";
    env.vars["RELAY_THREADS"] = "3";
    env.vars["RELAY_LOG_REQUESTS"] = "yes";
    const char* argv[] = {"relay_server"};
    ServerConfig config = load_config(1, argv, env.lookup());

    EXPECT_EQ(config.log.file_path, "/tmp/relay-test.log");
    EXPECT_EQ(config.log.level, LogLevel::Debug);
    EXPECT_EQ(config.log.max_size_bytes, 2048u);
    EXPECT_EQ(config.log.rotate_count, 2);
    EXPECT_EQ(config.log.service_name, "relay-eu");
    EXPECT_EQ(config.effective_thread_count(), 3u);
    EXPECT_TRUE(config.log_requests);
}

TEST(ConfigTest, MalformedValuesFallBackWithWarnings) {
    FakeEnv env;
    env.vars["LOG_LEVEL"] = "chatty";
    env.vars["LOG_MAX_SIZE"] = "big";
    env.vars["RELAY_THREADS"] = "-4";
    const char* argv[] = {"relay_server"};
    ServerConfig config = load_config(1, argv, env.lookup());

    EXPECT_EQ(config.log.level, LogLevel::Info);
    EXPECT_EQ(config.log.max_size_bytes, 10ull * 1024 * 1024);
    EXPECT_EQ(config.thread_count, 0u);
    EXPECT_EQ(config.warnings.size(), 3u);
}

TEST(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("Error"), LogLevel::Err);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}
