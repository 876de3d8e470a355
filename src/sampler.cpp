#include "sampler.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace fritz {

double Sample::as_gauge() const {
    std::string text = InputValidator::trim(raw_value);
    if (text.empty()) {
        throw SampleError(metric_name, "empty value");
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
        throw SampleError(metric_name, "non-numeric value '" + raw_value + "'");
    }
    return value;
}

std::uint64_t Sample::as_counter() const {
    std::string text = InputValidator::trim(raw_value);
    if (!InputValidator::is_decimal_integer(text, false)) {
        throw SampleError(metric_name, "counter value '" + raw_value + "' is not a non-negative integer");
    }

    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw SampleError(metric_name, "counter value '" + raw_value + "' exceeds 64 bits");
    }
}

Sampler::Sampler(Transport& transport)
    : transport_(transport)
{}

Sample Sampler::sample(const MetricSpec& spec) {
    ActionResponse response;
    try {
        response = transport_.call(spec.service, spec.action);
    } catch (const TransportError& e) {
        throw SampleError(spec.name, std::string("remote call ") + spec.service + "#" + spec.action +
                                     " failed: " + e.what());
    }

    auto it = response.find(spec.param);
    if (it == response.end()) {
        throw SampleError(spec.name, "parameter '" + spec.param + "' missing from " + spec.action + " response");
    }

    return Sample{spec.name, it->second, std::chrono::system_clock::now()};
}

namespace {

// Routes a sample to the exported primitive fixed at construction.
struct PushVisitor {
    const Sample& sample;

    double operator()(GaugeExport& gauge) const {
        return gauge.push(sample.as_gauge());
    }

    double operator()(CounterExport& counter) const {
        return static_cast<double>(counter.push(sample.as_counter()));
    }
};

}

double Sampler::poll(MonitoredMetric& metric) {
    Sample s = sample(metric.spec);
    return std::visit(PushVisitor{s}, metric.exported);
}

}
