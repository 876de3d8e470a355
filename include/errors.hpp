#pragma once

#include <stdexcept>
#include <string>

namespace fritz {

// Startup-time configuration failure. The exporter must not begin polling.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Connectivity, authentication or device-side failure of a remote call.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Per-metric, per-round sampling failure. Never fatal.
class SampleError : public std::runtime_error {
public:
    SampleError(const std::string& metric_name, const std::string& what)
        : std::runtime_error(metric_name + ": " + what)
        , metric_name_(metric_name)
    {}

    const std::string& metric_name() const { return metric_name_; }

private:
    std::string metric_name_;
};

}
