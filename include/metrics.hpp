#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace fritz {

class MetricsRegistry;

// Handle to a registered gauge. Overwrite semantics: last value wins.
class GaugeHandle {
public:
    GaugeHandle(MetricsRegistry& registry, std::string name)
        : registry_(&registry), name_(std::move(name)) {}

    void set(double value);
    double value() const;
    const std::string& name() const { return name_; }

private:
    MetricsRegistry* registry_;
    std::string name_;
};

// Handle to a registered counter. Additive semantics: never decreases.
class CounterHandle {
public:
    CounterHandle(MetricsRegistry& registry, std::string name)
        : registry_(&registry), name_(std::move(name)) {}

    // Throws std::invalid_argument for a negative amount.
    void increment(double amount = 1.0);
    double value() const;
    const std::string& name() const { return name_; }

private:
    MetricsRegistry* registry_;
    std::string name_;
};

// Metrics Registry backing the /metrics endpoint.
// Provides thread-safe counters and gauges that can be exported in Prometheus format.
class MetricsRegistry {
public:
    /**
     * Access the process-wide registry served by the exposition server.
     */
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    MetricsRegistry() = default;
    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    /**
     * Registers a gauge with its HELP text.
     * Throws std::invalid_argument if the name is already taken.
     */
    GaugeHandle new_gauge(const std::string& name, const std::string& help) {
        register_family(name, help, Type::GAUGE);
        return GaugeHandle(*this, name);
    }

    /**
     * Registers a counter with its HELP text.
     * Throws std::invalid_argument if the name, or its exposed <name>_total, is already taken.
     */
    CounterHandle new_counter(const std::string& name, const std::string& help) {
        register_family(name, help, Type::COUNTER);
        return CounterHandle(*this, name);
    }

    // Increment a cumulative counter (Only increases).
    void increment_counter(const std::string& name, double value = 1.0) {
        if (value < 0.0 || std::isnan(value)) {
            throw std::invalid_argument("Counters can only be incremented by non-negative amounts: " + name);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        lookup(name, Type::COUNTER).value += value;
    }

    // Sets a gauge to a specific instantaneous value.
    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        lookup(name, Type::GAUGE).value = value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(name, Type::GAUGE).value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(name, Type::COUNTER).value;
    }

    bool contains(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return families_.count(name) > 0;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return families_.size();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        families_.clear();
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     * A counter without a "_total" suffix is exposed with one appended.
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;

        for (const auto& [name, family] : families_) {
            std::string exposed = exposition_name(name, family.type);
            if (!family.help.empty()) {
                ss << "# HELP " << exposed << " " << escape_help(family.help) << "\n";
            }
            ss << "# TYPE " << exposed << " " << (family.type == Type::COUNTER ? "counter" : "gauge") << "\n";
            ss << exposed << " " << format_value(family.value) << "\n";
        }

        return ss.str();
    }

    // Integral values print without exponent so large byte counters stay readable.
    static std::string format_value(double value) {
        if (std::isnan(value)) return "NaN";
        if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";

        std::stringstream ss;
        if (std::floor(value) == value && std::fabs(value) < 9007199254740992.0) {
            ss << std::fixed << std::setprecision(0) << value;
        } else {
            ss << std::setprecision(17) << value;
        }
        return ss.str();
    }

private:
    enum class Type { COUNTER, GAUGE };

    struct Family {
        Type type;
        std::string help;
        double value = 0.0;
    };

    void register_family(const std::string& name, const std::string& help, Type type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string exposed = exposition_name(name, type);
        for (const auto& [other, family] : families_) {
            if (other == name || exposition_name(other, family.type) == exposed) {
                throw std::invalid_argument("Metric already registered: " + name);
            }
        }
        families_.emplace(name, Family{type, help, 0.0});
    }

    // Counters are scraped as <name>_total
    static std::string exposition_name(const std::string& name, Type type) {
        static const std::string suffix = "_total";
        if (type != Type::COUNTER ||
            (name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)) {
            return name;
        }
        return name + suffix;
    }

    // Caller holds mutex_
    Family& lookup(const std::string& name, Type type) {
        auto it = families_.find(name);
        if (it == families_.end() || it->second.type != type) {
            throw std::invalid_argument("Unknown " + std::string(type == Type::COUNTER ? "counter" : "gauge") + ": " + name);
        }
        return it->second;
    }

    static std::string escape_help(const std::string& help) {
        std::string out;
        out.reserve(help.size());
        for (char c : help) {
            if (c == '\\') out += "\\\\";
            else if (c == '\n') out += "\\n";
            else out += c;
        }
        return out;
    }

    std::map<std::string, Family> families_;
    std::mutex mutex_; // Scrape threads read while the scheduler writes
};

inline void GaugeHandle::set(double value) {
    registry_->set_gauge(name_, value);
}

inline double GaugeHandle::value() const {
    return registry_->get_gauge(name_);
}

inline void CounterHandle::increment(double amount) {
    registry_->increment_counter(name_, amount);
}

inline double CounterHandle::value() const {
    return registry_->get_counter(name_);
}

}
