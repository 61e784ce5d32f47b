#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "config.hpp"
#include "logger.hpp"
#include "server.hpp"

int main(int argc, char** argv) {
    ServerConfig config;
    try {
        config = load_config(argc, argv, std::getenv);
    } catch (const ConfigError& ex) {
        std::fprintf(stderr, "relay_server: %s\nusage: %s [port]\n", ex.what(), argc > 0 ? argv[0] : "relay_server");
        return 2;
    }

    Logger::instance().init(config.log);
    Logger::instance().info("Logger initialized", { {"file", config.log.file_path} });
    for (const auto& warning : config.warnings) Logger::instance().warn("Configuration", { {"warning", warning} });

    try {
        boost::asio::io_context ioc;

        // keep run() from returning while there is nothing to do
        auto work_guard = boost::asio::make_work_guard(ioc);

        Server server(ioc, config);
        server.run_accept();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) return;
            Logger::instance().info("Signal received, shutting down", { {"signal", signal_number} });
            server.stop();
            work_guard.reset();
            ioc.stop();
        });

        const std::size_t thread_count = config.effective_thread_count();
        std::vector<std::thread> io_threads;
        for (std::size_t thread_index = 0; thread_index < thread_count; ++thread_index) {
            io_threads.emplace_back([&ioc, thread_index]() {
                try {
                    Logger::instance().debug("Thread started", { {"id", thread_index} });
                    ioc.run();
                    Logger::instance().debug("Thread exit normally", { {"id", thread_index} });
                } catch (const std::exception& ex) {
                    Logger::instance().error("Thread exception", { {"id", thread_index}, {"what", ex.what()} });
                }
            });
        }
        Logger::instance().info("Relay listening", { {"port", config.port}, {"thread_count", static_cast<uint64_t>(thread_count)} });

        for (auto& thread_obj : io_threads) thread_obj.join();
        Logger::instance().info("All threads joined, exiting");
    } catch (const std::exception& ex) {
        Logger::instance().error("Startup failed", { {"what", ex.what()} });
        std::fprintf(stderr, "relay_server: %s\n", ex.what());
        return 1;
    }

    return 0;
}
