#include "tr064_client.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include "logger.hpp"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <cctype>
#include <sstream>
#include <utility>

namespace pt = boost::property_tree;

namespace fritz {

namespace {

// Element name without namespace prefix ("s:Body" -> "Body")
std::string local_name(const std::string& name) {
    auto colon = name.rfind(':');
    return colon == std::string::npos ? name : name.substr(colon + 1);
}

bool is_element(const std::string& key) {
    return key != "<xmlattr>" && key != "<xmlcomment>";
}

const pt::ptree* find_child(const pt::ptree& node, const std::string& name) {
    for (const auto& child : node) {
        if (is_element(child.first) && local_name(child.first) == name) {
            return &child.second;
        }
    }
    return nullptr;
}

std::string child_text(const pt::ptree& node, const std::string& name) {
    const pt::ptree* child = find_child(node, name);
    return child ? InputValidator::trim(child->data()) : std::string();
}

pt::ptree parse_xml(const std::string& xml, const std::string& what) {
    pt::ptree tree;
    std::istringstream is(xml);
    try {
        pt::read_xml(is, tree, pt::xml_parser::trim_whitespace);
    } catch (const pt::xml_parser_error& e) {
        throw TransportError("Malformed " + what + ": " + e.what());
    }
    return tree;
}

void collect_services(const pt::ptree& device, std::map<std::string, ServiceInfo>& services) {
    if (const pt::ptree* list = find_child(device, "serviceList")) {
        for (const auto& entry : *list) {
            if (!is_element(entry.first) || local_name(entry.first) != "service") continue;

            ServiceInfo info;
            info.service_type = child_text(entry.second, "serviceType");
            info.service_id = child_text(entry.second, "serviceId");
            info.control_url = child_text(entry.second, "controlURL");
            if (info.service_id.empty() || info.control_url.empty()) continue;

            services.emplace(local_name(info.service_id), std::move(info));
        }
    }

    if (const pt::ptree* list = find_child(device, "deviceList")) {
        for (const auto& entry : *list) {
            if (is_element(entry.first) && local_name(entry.first) == "device") {
                collect_services(entry.second, services);
            }
        }
    }
}

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

}

Tr064Client::Tr064Client(std::string host, uint16_t port, std::string username, std::string password,
                         std::chrono::seconds timeout)
    : host_(std::move(host))
    , port_(port)
    , username_(username)
    , timeout_(timeout)
    , auth_(std::move(username), std::move(password))
{}

std::map<std::string, ServiceInfo> Tr064Client::parse_description(const std::string& xml) {
    pt::ptree tree = parse_xml(xml, "device description");

    const pt::ptree* root = find_child(tree, "root");
    const pt::ptree* device = root ? find_child(*root, "device") : nullptr;
    if (!device) {
        throw TransportError("Device description has no root device");
    }

    std::map<std::string, ServiceInfo> services;
    collect_services(*device, services);
    return services;
}

const ServiceInfo& Tr064Client::resolve_service(const std::map<std::string, ServiceInfo>& services,
                                                const std::string& name) {
    auto it = services.find(name);
    if (it == services.end() && !name.empty() && !std::isdigit(static_cast<unsigned char>(name.back()))) {
        it = services.find(name + "1");
    }
    if (it == services.end()) {
        throw TransportError("Device offers no service '" + name + "'");
    }
    return it->second;
}

std::string Tr064Client::build_envelope(const std::string& service_type, const std::string& action) {
    std::stringstream ss;
    ss << "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
       << "<s:Envelope s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\""
       << " xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
       << "<s:Body>"
       << "<u:" << xml_escape(action) << " xmlns:u=\"" << xml_escape(service_type) << "\">"
       << "</u:" << xml_escape(action) << ">"
       << "</s:Body>"
       << "</s:Envelope>";
    return ss.str();
}

ActionResponse Tr064Client::parse_action_response(const std::string& xml, const std::string& action) {
    pt::ptree tree = parse_xml(xml, action + " response");

    const pt::ptree* envelope = find_child(tree, "Envelope");
    const pt::ptree* body = envelope ? find_child(*envelope, "Body") : nullptr;
    if (!body) {
        throw TransportError(action + " response is not a SOAP envelope");
    }

    if (const pt::ptree* fault = find_child(*body, "Fault")) {
        std::string code;
        std::string description;
        if (const pt::ptree* detail = find_child(*fault, "detail")) {
            if (const pt::ptree* error = find_child(*detail, "UPnPError")) {
                code = child_text(*error, "errorCode");
                description = child_text(*error, "errorDescription");
            }
        }
        if (code.empty()) {
            throw TransportError(action + " failed: " + child_text(*fault, "faultstring"));
        }
        throw TransportError(action + " failed with UPnP error " + code + " (" + description + ")");
    }

    const pt::ptree* result = find_child(*body, action + "Response");
    if (!result) {
        throw TransportError("SOAP body carries no " + action + "Response");
    }

    ActionResponse response;
    for (const auto& argument : *result) {
        if (is_element(argument.first)) {
            response[local_name(argument.first)] = InputValidator::trim(argument.second.data());
        }
    }
    return response;
}

void Tr064Client::connect() {
    tcp::resolver resolver(ioc_);
    beast::error_code ec;
    endpoints_ = resolver.resolve(host_, std::to_string(port_), ec);
    if (ec) {
        throw TransportError("Cannot resolve " + host_ + ": " + ec.message());
    }

    http::request<http::string_body> req{http::verb::get, DESCRIPTION_PATH, 11};
    req.set(http::field::host, host_ + ":" + std::to_string(port_));
    req.set(http::field::user_agent, "fritzbox_exporter");

    auto res = send(req);
    if (res.result() != http::status::ok) {
        throw TransportError("Fetching " + std::string(DESCRIPTION_PATH) + " returned HTTP " +
                             std::to_string(res.result_int()));
    }

    services_ = parse_description(res.body());
    if (services_.empty()) {
        throw TransportError("Device at " + host_ + " does not describe any TR-064 service");
    }

    Logger::log(Logger::Level::INFO, Logger::EventType::CONNECTION,
                "Connected to " + host_ + ":" + std::to_string(port_) + ", " +
                std::to_string(services_.size()) + " services available");
}

ActionResponse Tr064Client::call(const std::string& service, const std::string& action) {
    if (services_.empty()) {
        throw TransportError("Not connected");
    }

    const ServiceInfo& info = resolve_service(services_, service);
    auto res = post_authenticated(info, action);

    // Faults come back as HTTP 500 with a SOAP body
    if (res.result() == http::status::ok || res.result() == http::status::internal_server_error) {
        return parse_action_response(res.body(), action);
    }
    throw TransportError(service + "#" + action + " returned HTTP " + std::to_string(res.result_int()));
}

http::response<http::string_body> Tr064Client::post_authenticated(const ServiceInfo& service,
                                                                  const std::string& action) {
    bool fresh_challenge = false;

    // At most: one unauthenticated probe (or stale nonce), one answer to a fresh challenge
    for (int attempt = 0; attempt < 3; ++attempt) {
        http::request<http::string_body> req{http::verb::post, service.control_url, 11};
        req.set(http::field::host, host_ + ":" + std::to_string(port_));
        req.set(http::field::user_agent, "fritzbox_exporter");
        req.set(http::field::content_type, "text/xml; charset=\"utf-8\"");
        req.set("SOAPACTION", "\"" + service.service_type + "#" + action + "\"");
        if (auth_.has_challenge()) {
            req.set(http::field::authorization, auth_.authorization("POST", service.control_url));
        }
        req.body() = build_envelope(service.service_type, action);
        req.prepare_payload();

        auto res = send(req);
        if (res.result() != http::status::unauthorized) {
            return res;
        }

        auto challenge = DigestAuth::parse_challenge(std::string(res[http::field::www_authenticate]));
        if (!challenge) {
            throw TransportError("Device rejected the request without a digest challenge");
        }
        if (fresh_challenge && !challenge->stale) {
            throw TransportError("Authentication failed for user '" + username_ + "'");
        }

        auth_.set_challenge(*challenge);
        fresh_challenge = true;
        Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION,
                    "Received digest challenge for realm " + challenge->realm);
    }

    throw TransportError("Authentication failed for user '" + username_ + "'");
}

http::response<http::string_body> Tr064Client::send(http::request<http::string_body>& req) {
    beast::tcp_stream stream(ioc_);
    beast::error_code ec;
    auto on_complete = [&ec](beast::error_code e, auto&&...) { ec = e; };

    stream.expires_after(timeout_);
    stream.async_connect(endpoints_, on_complete);
    run_io();
    if (ec) {
        throw TransportError("Cannot connect to " + host_ + ":" + std::to_string(port_) + ": " + ec.message());
    }

    stream.expires_after(timeout_);
    http::async_write(stream, req, on_complete);
    run_io();
    if (ec) {
        throw TransportError("Sending request to " + host_ + " failed: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_RESPONSE_SIZE);

    stream.expires_after(timeout_);
    http::async_read(stream, buffer, parser, on_complete);
    run_io();
    if (ec) {
        throw TransportError("Reading response from " + host_ + " failed: " + ec.message());
    }

    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);

    return parser.release();
}

// Drives the pending asynchronous operation (bounded by the stream expiry) to completion.
void Tr064Client::run_io() {
    ioc_.restart();
    ioc_.run();
}

}
