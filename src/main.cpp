#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <termios.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "exported_metric.hpp"
#include "exporter_config.hpp"
#include "handlers/metrics_handler.hpp"
#include "logger.hpp"
#include "metric_spec.hpp"
#include "metrics.hpp"
#include "metrics_server.hpp"
#include "sampler.hpp"
#include "scheduler.hpp"
#include "shutdown_signal.hpp"
#include "tr064_client.hpp"

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

std::string prompt_line(const std::string& prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        throw fritz::ConfigError("No input available for: " + prompt);
    }
    return line;
}

// Reads a line with terminal echo disabled.
std::string prompt_password() {
    termios old_attrs{};
    bool is_tty = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &old_attrs) == 0;
    if (is_tty) {
        termios no_echo = old_attrs;
        no_echo.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &no_echo);
    }

    std::cout << "Password: " << std::flush;
    std::string password;
    bool ok = static_cast<bool>(std::getline(std::cin, password));

    if (is_tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_attrs);
        std::cout << "\n";
    }
    if (!ok) {
        throw fritz::ConfigError("No password available");
    }
    return password;
}

}

int main(int argc, char* argv[]) {
    using fritz::Logger;
    try {
        fritz::ExporterConfig config;

        // --- Environment, then CLI overrides ---
        try {
            fritz::apply_environment(config);
            fritz::apply_arguments(config, std::vector<std::string>(argv + 1, argv + argc));
        } catch (const fritz::ConfigError& e) {
            std::cerr << e.what() << "\n\n" << fritz::usage(argv[0]);
            return 1;
        }

        if (config.show_help) {
            std::cout << fritz::usage(argv[0]);
            return 0;
        }

        Logger::set_min_level(config.log_level);

        // --- Credentials not passed as options ---
        if (config.address.empty()) {
            config.address = prompt_line("Please enter the IP / address of the device: ");
        }
        if (config.username.empty()) {
            config.username = prompt_line("Please enter the username to connect to the device: ");
        }
        if (config.password.empty()) {
            config.password = prompt_password();
        }

        auto specs = fritz::load_metric_specs_file(config.metrics_file);
        Logger::log(Logger::Level::DEBUG, Logger::EventType::CONFIG, "Read configuration");

        fritz::Tr064Client client(config.address, config.device_port, config.username, config.password,
                                  std::chrono::seconds(config.request_timeout_sec));
        client.connect();

        auto& registry = fritz::MetricsRegistry::instance();
        auto metrics = fritz::build_monitored_metrics(specs, registry);

        fritz::ShutdownSignal shutdown;
        fritz::Sampler sampler(client);
        fritz::Pacer pacer(config.pacing);
        fritz::Scheduler scheduler(metrics, sampler, pacer, shutdown, registry);

        // --- Exposition server ---
        net::io_context ioc{config.thread_count};
        fritz::MetricsHandler handler(config, registry, metrics.size());

        auto server = std::make_shared<fritz::MetricsServer>(
            ioc,
            tcp::endpoint{net::ip::make_address(config.listen_address), config.listen_port},
            handler);
        server->run();
        Logger::log(Logger::Level::INFO, Logger::EventType::SCRAPE,
                    "Prometheus endpoint listening on " + config.listen_address + ":" +
                    std::to_string(config.listen_port));

        // Captured SIGINT and SIGTERM to stop polling between two metrics
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&shutdown, server](const boost::system::error_code& ec, int sig) {
                if (ec) return;
                Logger::log(Logger::Level::INFO, Logger::EventType::SHUTDOWN,
                            "Received signal " + std::to_string(sig) + ", initiating graceful shutdown");
                shutdown.request();
                server->stop();
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count);
        for (int i = 0; i < config.thread_count; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        auto stop_server = [&ioc, &threads] {
            ioc.stop();
            for (auto& t : threads) {
                t.join();
            }
        };

        try {
            scheduler.run();
        } catch (...) {
            stop_server();
            throw;
        }
        stop_server();

        return 0;

    } catch (const fritz::ConfigError& e) {
        Logger::log(Logger::Level::CRITICAL, Logger::EventType::CONFIG, e.what());
        return 1;
    } catch (const fritz::TransportError& e) {
        Logger::log(Logger::Level::CRITICAL, Logger::EventType::CONNECTION, e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::log(Logger::Level::CRITICAL, Logger::EventType::SHUTDOWN, std::string("Fatal error: ") + e.what());
        return 1;
    }
}
