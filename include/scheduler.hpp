#pragma once

#include <chrono>
#include <cstdint>
#include <random>
#include <vector>

#include "exported_metric.hpp"
#include "exporter_config.hpp"
#include "metrics.hpp"
#include "sampler.hpp"
#include "shutdown_signal.hpp"

namespace fritz {

// Computes the jittered pause between two metrics. A full round of N metrics pauses
// (base + uniform[0, jitter)) seconds in total, which keeps the request rate
// independent of N and desynchronizes this poller from others hitting the same device.
class Pacer {
public:
    explicit Pacer(const ExporterConfig::Pacing& pacing)
        : pacing_(pacing), rng_(std::random_device{}()) {}

    Pacer(const ExporterConfig::Pacing& pacing, std::uint32_t seed)
        : pacing_(pacing), rng_(seed) {}

    std::chrono::milliseconds next_pause(size_t metric_count);

private:
    ExporterConfig::Pacing pacing_;
    std::mt19937 rng_;
};

// Drives the polling rounds. Runs on a single thread for the lifetime of the process.
class Scheduler {
public:
    static constexpr const char* SAMPLE_ERRORS_METRIC = "fritzbox_exporter_sample_errors_total";

    // Throws ConfigError if SAMPLE_ERRORS_METRIC is already registered.
    Scheduler(std::vector<MonitoredMetric>& metrics,
              Sampler& sampler,
              Pacer& pacer,
              ShutdownSignal& shutdown,
              MetricsRegistry& registry);

    // Polls until shutdown is requested.
    void run();

    /**
     * Polls every metric once in registry order, pausing after each.
     * A failing metric is logged and skipped; it is retried on the next round.
     * @return false if shutdown was requested during the round.
     */
    bool run_round();

    uint64_t rounds_completed() const { return rounds_completed_; }

private:
    std::vector<MonitoredMetric>& metrics_;
    Sampler& sampler_;
    Pacer& pacer_;
    ShutdownSignal& shutdown_;
    CounterHandle sample_errors_;
    uint64_t rounds_completed_ = 0;
};

}
