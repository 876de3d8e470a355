#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "metric_spec.hpp"
#include "metrics.hpp"
#include "delta_reconciler.hpp"

namespace fritz {

struct GaugeExport {
    GaugeHandle gauge;

    double push(double value) {
        gauge.set(value);
        return value;
    }
};

// Owns the reconciliation state of one counter metric.
struct CounterExport {
    CounterHandle counter;
    ReconciliationState state;

    std::uint64_t push(std::uint64_t raw_value) {
        std::uint64_t increment = reconcile(state, raw_value);
        counter.increment(static_cast<double>(increment));
        return increment;
    }
};

using ExportedMetric = std::variant<GaugeExport, CounterExport>;

// A configured metric bound to its exported object.
struct MonitoredMetric {
    MetricSpec spec;
    ExportedMetric exported;
};

/**
 * Registers one gauge or counter per spec (HELP = spec documentation) and pairs them 1-1.
 * Throws ConfigError if a name collides with an already registered metric.
 */
std::vector<MonitoredMetric> build_monitored_metrics(const std::vector<MetricSpec>& specs,
                                                     MetricsRegistry& registry);

}
