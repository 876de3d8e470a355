#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <boost/json.hpp>

namespace fritz {

// Validation helpers for configuration and device-supplied values.
class InputValidator {
public:
    // Checks a Prometheus metric name: [a-zA-Z_:][a-zA-Z0-9_:]*
    static bool is_valid_metric_name(const std::string& name) {
        if (name.empty()) return false;
        unsigned char first = static_cast<unsigned char>(name.front());
        if (!(std::isalpha(first) || first == '_' || first == ':')) return false;

        return std::all_of(name.begin() + 1, name.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':';
        });
    }

    // Checks for an optionally signed decimal integer, as TR-064 ui4/ui8/i4 values are encoded.
    static bool is_decimal_integer(const std::string& str, bool allow_sign = true) {
        if (str.empty()) return false;
        size_t start = 0;
        if (allow_sign && (str[0] == '-' || str[0] == '+')) {
            start = 1;
        }
        if (start == str.size()) return false;

        return std::all_of(str.begin() + start, str.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c));
        });
    }

    static std::string trim(const std::string& str) {
        auto begin = std::find_if_not(str.begin(), str.end(), [](char c) {
            return std::isspace(static_cast<unsigned char>(c));
        });
        auto end = std::find_if_not(str.rbegin(), str.rend(), [](char c) {
            return std::isspace(static_cast<unsigned char>(c));
        }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    static std::string to_lower(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return str;
    }

    /**
     * JSON parsing with recursion depth limits. Metric definitions are two levels deep.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 16;
        return boost::json::parse(input, {}, opt);
    }
};

}
