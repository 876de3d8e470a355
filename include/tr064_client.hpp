#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include "transport.hpp"
#include "digest_auth.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace fritz {

// One <service> entry of the device description.
struct ServiceInfo {
    std::string service_type;  // e.g. urn:dslforum-org:service:WANCommonInterfaceConfig:1
    std::string service_id;    // e.g. urn:WANCIfConfig-com:serviceId:WANCommonInterfaceConfig1
    std::string control_url;   // e.g. /upnp/control/wancommonifconfig1
};

// TR-064 (SOAP over HTTP) session to an AVM FRITZ!Box or compatible device.
class Tr064Client : public Transport {
public:
    static constexpr const char* DESCRIPTION_PATH = "/tr64desc.xml";
    static constexpr size_t MAX_RESPONSE_SIZE = 4 * 1024 * 1024;

    Tr064Client(std::string host, uint16_t port, std::string username, std::string password,
                std::chrono::seconds timeout);

    /**
     * Resolves the device and loads its service table from the description document.
     * Must succeed before call(). Throws TransportError.
     */
    void connect();

    ActionResponse call(const std::string& service, const std::string& action) override;

    size_t service_count() const { return services_.size(); }

    // --- Protocol helpers ---

    /**
     * Extracts all services of the device tree, keyed by service name
     * (the serviceId suffix, e.g. "WANCommonInterfaceConfig1"). Throws TransportError.
     */
    static std::map<std::string, ServiceInfo> parse_description(const std::string& xml);

    /**
     * Looks a service up by name. A name without instance number also matches instance 1.
     * Throws TransportError if the device has no such service.
     */
    static const ServiceInfo& resolve_service(const std::map<std::string, ServiceInfo>& services,
                                              const std::string& name);

    static std::string build_envelope(const std::string& service_type, const std::string& action);

    /**
     * Maps the output arguments of <action>Response to their text values.
     * A SOAP Fault is raised as TransportError carrying the UPnP error code.
     */
    static ActionResponse parse_action_response(const std::string& xml, const std::string& action);

private:
    std::string host_;
    uint16_t port_;
    std::string username_;
    std::chrono::seconds timeout_;

    net::io_context ioc_;
    tcp::resolver::results_type endpoints_;
    DigestAuth auth_;
    std::map<std::string, ServiceInfo> services_;

    http::response<http::string_body> send(http::request<http::string_body>& req);
    http::response<http::string_body> post_authenticated(const ServiceInfo& service, const std::string& action);
    void run_io();
};

}
