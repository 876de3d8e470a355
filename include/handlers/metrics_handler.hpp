#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "exporter_config.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace fritz {

class MetricsHandler {
public:
    MetricsHandler(const ExporterConfig& config, MetricsRegistry& registry, size_t monitored_count)
        : config_(config), registry_(registry), monitored_count_(monitored_count) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_metrics(unsigned version);
    http::response<http::string_body> handle_not_found(unsigned version);
    http::response<http::string_body> handle_method_not_allowed(unsigned version);

private:
    const ExporterConfig& config_;
    MetricsRegistry& registry_;
    size_t monitored_count_;

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("Content-Security-Policy", "default-src 'none'");
    }

    http::response<http::string_body> json_response(http::status status, unsigned version, const json::object& body);
};

} // namespace fritz
