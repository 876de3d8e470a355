#pragma once

#include <string>
#include <cstdint>
#include <vector>

#include "logger.hpp"

namespace fritz {

// Runtime settings of the exporter process.
struct ExporterConfig {
    // --- Device (TR-064) ---
    std::string address = "";       // Empty means prompt on the terminal
    uint16_t device_port = 49000;
    std::string username = "";
    std::string password = "";
    int request_timeout_sec = 10;

    // --- Metric definitions ---
    std::string metrics_file = "metrics.json";

    // --- Exposition server ---
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8000;
    int thread_count = 1;

    Logger::Level log_level = Logger::Level::WARNING;

    bool show_help = false;

    // --- Polling cadence ---
    // Each round pauses (base + uniform[0, jitter)) seconds in total, spread over all metrics.
    struct Pacing {
        int base_seconds = 10;
        int jitter_seconds = 10;
    } pacing;
};

// Applies FRITZ_* environment variable overrides.
void apply_environment(ExporterConfig& config);

// Applies command line flags. Throws ConfigError on an unknown flag or a bad value.
void apply_arguments(ExporterConfig& config, const std::vector<std::string>& args);

std::string usage(const std::string& program);

}
