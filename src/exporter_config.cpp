#include "exporter_config.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace fritz {

static uint16_t parse_port(const std::string& value, const std::string& what) {
    try {
        size_t pos = 0;
        int port = std::stoi(value, &pos);
        if (pos != value.size() || port <= 0 || port > 65535) {
            throw ConfigError("Invalid " + what + ": " + value);
        }
        return static_cast<uint16_t>(port);
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid " + what + ": " + value);
    }
}

static int parse_positive(const std::string& value, const std::string& what) {
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.size() || parsed <= 0) {
            throw ConfigError("Invalid " + what + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid " + what + ": " + value);
    }
}

static Logger::Level parse_log_level(const std::string& value) {
    Logger::Level level;
    if (!Logger::parse_level(value, level)) {
        throw ConfigError("Invalid log level: " + value + " (expected CRITICAL, ERROR, WARNING, INFO or DEBUG)");
    }
    return level;
}

void apply_environment(ExporterConfig& config) {
    if (const char* e = std::getenv("FRITZ_ADDRESS")) config.address = e;
    if (const char* e = std::getenv("FRITZ_USERNAME")) config.username = e;
    if (const char* e = std::getenv("FRITZ_PASSWORD")) config.password = e;
    if (const char* e = std::getenv("FRITZ_CONFIG")) config.metrics_file = e;
    if (const char* e = std::getenv("FRITZ_LOGLEVEL")) config.log_level = parse_log_level(e);
    if (const char* e = std::getenv("FRITZ_LISTEN_PORT")) config.listen_port = parse_port(e, "listen port");
}

void apply_arguments(ExporterConfig& config, const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            continue;
        }

        // Every other flag takes a value, either "--flag value" or "--flag=value"
        std::string flag = arg;
        std::string value;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            flag = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        } else {
            if (i + 1 >= args.size()) {
                throw ConfigError("Missing value for option " + arg);
            }
            value = args[++i];
        }

        if (flag == "--address") {
            config.address = value;
        } else if (flag == "--username") {
            config.username = value;
        } else if (flag == "--password") {
            config.password = value;
        } else if (flag == "--config") {
            config.metrics_file = value;
        } else if (flag == "--loglevel") {
            config.log_level = parse_log_level(value);
        } else if (flag == "--port") {
            config.listen_port = parse_port(value, "listen port");
        } else if (flag == "--listen") {
            config.listen_address = value;
        } else if (flag == "--device-port") {
            config.device_port = parse_port(value, "device port");
        } else if (flag == "--timeout") {
            config.request_timeout_sec = parse_positive(value, "request timeout");
        } else {
            throw ConfigError("Unknown option: " + flag);
        }
    }
}

std::string usage(const std::string& program) {
    std::stringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "Options:\n"
       << "  --address HOST      IP / hostname of the device to monitor\n"
       << "  --username USER     Username to log into the device\n"
       << "  --password PASS     Password to log into the device\n"
       << "  --config FILE       Path to the metrics definition file (default: metrics.json)\n"
       << "  --loglevel LEVEL    CRITICAL, ERROR, WARNING, INFO or DEBUG (default: WARNING)\n"
       << "  --port PORT         Port serving /metrics (default: 8000)\n"
       << "  --listen ADDR       Address serving /metrics (default: 0.0.0.0)\n"
       << "  --device-port PORT  TR-064 port of the device (default: 49000)\n"
       << "  --timeout SEC       Timeout of a single device request (default: 10)\n"
       << "  --help, -h          Show this help\n";
    return ss.str();
}

}
