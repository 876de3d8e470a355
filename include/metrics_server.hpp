#pragma once

#include <boost/beast/core.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <memory>

#include "handlers/metrics_handler.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace fritz {

// Accepts scrape connections and hands each to an HttpSession.
class MetricsServer : public std::enable_shared_from_this<MetricsServer> {
public:
    // Opens, binds and listens. Throws std::runtime_error if the port is unavailable.
    MetricsServer(net::io_context& ioc, tcp::endpoint endpoint, MetricsHandler& handler);

    void run();
    void stop();

    tcp::endpoint local_endpoint() const;

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    MetricsHandler& handler_;

    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
};

}
