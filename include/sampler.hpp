#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "transport.hpp"
#include "metric_spec.hpp"
#include "exported_metric.hpp"

namespace fritz {

// One raw reading taken from the device, before any reconciliation.
struct Sample {
    std::string metric_name;
    std::string raw_value;
    std::chrono::system_clock::time_point timestamp;

    // Signed decimal value. Throws SampleError if the value is not numeric.
    double as_gauge() const;

    // Unsigned decimal value. Throws SampleError if the value is not a non-negative integer.
    std::uint64_t as_counter() const;
};

class Sampler {
public:
    explicit Sampler(Transport& transport);

    /**
     * Executes the spec's remote action and extracts its parameter.
     * Throws SampleError if the call fails or the parameter is absent.
     */
    Sample sample(const MetricSpec& spec);

    /**
     * Samples the metric and pushes the value into its exported object: gauges are
     * overwritten, counters are reconciled and incremented.
     * @return The value pushed (gauge value or counter increment).
     */
    double poll(MonitoredMetric& metric);

private:
    Transport& transport_;
};

}
