#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <mutex>
#include <cctype>
#include <ctime>

namespace fritz {

// Process-wide structured logger for exporter events.
class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        CONFIG,
        CONNECTION,
        SAMPLE,
        RECONCILE,
        EXPORT,
        SCRAPE,
        SHUTDOWN
    };

    /**
     * Records an exporter event.
     * @param level Severity level of the event.
     * @param event The subsystem the event belongs to.
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& message = "") {
        if (!is_enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "]";

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        // Scheduler and scrape threads may log concurrently
        std::lock_guard<std::mutex> lock(output_mutex());
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    static void set_min_level(Level level) {
        min_level().store(static_cast<int>(level));
    }

    static Level get_min_level() {
        return static_cast<Level>(min_level().load());
    }

    static bool is_enabled(Level level) {
        return static_cast<int>(level) >= min_level().load();
    }

    /**
     * Parses a level name (case-insensitive). Accepts WARN/WARNING and CRIT/CRITICAL.
     * @return false if the name is not a known level.
     */
    static bool parse_level(const std::string& name, Level& out) {
        std::string upper;
        upper.reserve(name.size());
        for (char c : name) {
            upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }

        if (upper == "DEBUG") out = Level::DEBUG;
        else if (upper == "INFO") out = Level::INFO;
        else if (upper == "WARNING" || upper == "WARN") out = Level::WARNING;
        else if (upper == "ERROR") out = Level::ERROR;
        else if (upper == "CRITICAL" || upper == "CRIT") out = Level::CRITICAL;
        else return false;
        return true;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::CONFIG: return "CONFIG";
            case EventType::CONNECTION: return "CONNECTION";
            case EventType::SAMPLE: return "SAMPLE";
            case EventType::RECONCILE: return "RECONCILE";
            case EventType::EXPORT: return "EXPORT";
            case EventType::SCRAPE: return "SCRAPE";
            case EventType::SHUTDOWN: return "SHUTDOWN";
            default: return "UNKNOWN_EVENT";
        }
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static std::atomic<int>& min_level() {
        static std::atomic<int> level{static_cast<int>(Level::WARNING)};
        return level;
    }

    static std::mutex& output_mutex() {
        static std::mutex mutex;
        return mutex;
    }
};

}
