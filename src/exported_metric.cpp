#include "exported_metric.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <stdexcept>

namespace fritz {

std::vector<MonitoredMetric> build_monitored_metrics(const std::vector<MetricSpec>& specs,
                                                     MetricsRegistry& registry) {
    std::vector<MonitoredMetric> metrics;
    metrics.reserve(specs.size());

    for (const auto& spec : specs) {
        try {
            if (spec.kind == MetricKind::Gauge) {
                metrics.push_back({spec, GaugeExport{registry.new_gauge(spec.name, spec.documentation())}});
            } else {
                metrics.push_back({spec, CounterExport{registry.new_counter(spec.name, spec.documentation()), {}}});
            }
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }

        Logger::log(Logger::Level::DEBUG, Logger::EventType::CONFIG,
                    "Added " + spec.name + " to the list of monitored metrics");
    }

    return metrics;
}

}
