#include "handlers/metrics_handler.hpp"

namespace fritz {

http::response<http::string_body> MetricsHandler::handle_health(unsigned version) {
    json::object response;
    response["status"] = "healthy";
    response["device"] = config_.address;
    response["monitored_metrics"] = static_cast<int64_t>(monitored_count_);

    return json_response(http::status::ok, version, response);
}

http::response<http::string_body> MetricsHandler::handle_metrics(unsigned version) {
    std::string body = registry_.collect_prometheus();

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4; charset=utf-8");
    res.body() = std::move(body);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> MetricsHandler::handle_not_found(unsigned version) {
    json::object response;
    response["error"] = "Not Found";
    return json_response(http::status::not_found, version, response);
}

http::response<http::string_body> MetricsHandler::handle_method_not_allowed(unsigned version) {
    json::object response;
    response["error"] = "Method Not Allowed";
    auto res = json_response(http::status::method_not_allowed, version, response);
    res.set(http::field::allow, "GET");
    return res;
}

http::response<http::string_body> MetricsHandler::json_response(http::status status, unsigned version,
                                                                const json::object& body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(body);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

} // namespace fritz
