#include "scheduler.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <stdexcept>
#include <string>

namespace fritz {

static CounterHandle register_sample_errors(MetricsRegistry& registry) {
    try {
        return registry.new_counter(Scheduler::SAMPLE_ERRORS_METRIC, "Number of failed metric samples");
    } catch (const std::invalid_argument&) {
        throw ConfigError(std::string("Metric name '") + Scheduler::SAMPLE_ERRORS_METRIC +
                          "' is reserved for the exporter itself");
    }
}

std::chrono::milliseconds Pacer::next_pause(size_t metric_count) {
    if (metric_count == 0) {
        return std::chrono::milliseconds(0);
    }

    int jitter = 0;
    if (pacing_.jitter_seconds > 0) {
        std::uniform_int_distribution<int> dist(0, pacing_.jitter_seconds - 1);
        jitter = dist(rng_);
    }

    auto round_ms = static_cast<long long>(pacing_.base_seconds + jitter) * 1000;
    return std::chrono::milliseconds(round_ms / static_cast<long long>(metric_count));
}

Scheduler::Scheduler(std::vector<MonitoredMetric>& metrics,
                     Sampler& sampler,
                     Pacer& pacer,
                     ShutdownSignal& shutdown,
                     MetricsRegistry& registry)
    : metrics_(metrics)
    , sampler_(sampler)
    , pacer_(pacer)
    , shutdown_(shutdown)
    , sample_errors_(register_sample_errors(registry))
{}

void Scheduler::run() {
    Logger::log(Logger::Level::INFO, Logger::EventType::SAMPLE,
                "Polling " + std::to_string(metrics_.size()) + " metrics");

    if (metrics_.empty()) {
        while (shutdown_.wait_for(std::chrono::seconds(1))) {
        }
    }

    while (!shutdown_.requested()) {
        if (!run_round()) {
            break;
        }
    }

    Logger::log(Logger::Level::INFO, Logger::EventType::SHUTDOWN,
                "Polling stopped after " + std::to_string(rounds_completed_) + " rounds");
}

bool Scheduler::run_round() {
    for (auto& metric : metrics_) {
        if (shutdown_.requested()) {
            return false;
        }

        try {
            double pushed = sampler_.poll(metric);
            if (metric.spec.kind == MetricKind::Gauge) {
                Logger::log(Logger::Level::INFO, Logger::EventType::EXPORT,
                            "Updated " + metric.spec.name + " to new value " + MetricsRegistry::format_value(pushed));
            } else {
                Logger::log(Logger::Level::INFO, Logger::EventType::EXPORT,
                            "Incremented " + metric.spec.name + " by " + MetricsRegistry::format_value(pushed));
            }
        } catch (const SampleError& e) {
            sample_errors_.increment();
            Logger::log(Logger::Level::WARNING, Logger::EventType::SAMPLE, e.what());
        }

        if (!shutdown_.wait_for(pacer_.next_pause(metrics_.size()))) {
            return false;
        }
    }

    ++rounds_completed_;
    return true;
}

}
