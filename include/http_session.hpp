#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/strand.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>

#include "exporter_config.hpp"
#include "handlers/metrics_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace fritz {

// One scrape connection. Serves GET /metrics and GET /health, keep-alive aware.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    static constexpr size_t MAX_BODY_SIZE = 64 * 1024;
    static constexpr int READ_TIMEOUT_SEC = 30;

    HttpSession(tcp::socket&& socket, MetricsHandler& handler);

    void run();

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    MetricsHandler& handler_;
    std::string remote_addr_;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request();
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();
};

}
