#pragma once

#include <string>
#include <vector>
#include <boost/json.hpp>

namespace fritz {

enum class MetricKind {
    Gauge,
    Counter
};

std::string kind_to_string(MetricKind kind);

// One configured metric: which TR-064 action to call and which response field to export.
struct MetricSpec {
    std::string name;
    std::string service;
    std::string action;
    std::string param;
    MetricKind kind;

    // HELP text of the exported metric, recording where the value comes from.
    std::string documentation() const {
        return "Service: " + service + ", Action: " + action + ", Parameter: " + param;
    }
};

/**
 * Builds the ordered metric list from a JSON object keyed by metric name:
 *   { "<name>": { "service": ..., "action": ..., "param": ..., "type": "gauge" | "counter" } }
 * Throws ConfigError on a missing field, unknown type, invalid or duplicate name.
 */
std::vector<MetricSpec> load_metric_specs(const boost::json::object& definitions);

// Reads and parses a JSON definitions file. Throws ConfigError.
std::vector<MetricSpec> load_metric_specs_file(const std::string& path);

}
