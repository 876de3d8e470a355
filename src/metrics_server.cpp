#include "metrics_server.hpp"
#include "http_session.hpp"
#include "logger.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <stdexcept>

namespace fritz {

MetricsServer::MetricsServer(net::io_context& ioc, tcp::endpoint endpoint, MetricsHandler& handler)
    : ioc_(ioc)
    , acceptor_(net::make_strand(ioc))
    , handler_(handler)
{
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error("Failed to bind: " + ec.message());
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Failed to listen: " + ec.message());
    }
}

void MetricsServer::run() {
    do_accept();
}

void MetricsServer::stop() {
    // Close on the acceptor's strand; the signal handler runs elsewhere
    net::post(acceptor_.get_executor(), [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

tcp::endpoint MetricsServer::local_endpoint() const {
    beast::error_code ec;
    return acceptor_.local_endpoint(ec);
}

void MetricsServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            self->on_accept(ec, std::move(socket));
        });
}

void MetricsServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
        return;
    }

    if (ec) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::SCRAPE, "Accept error: " + ec.message());
    } else {
        std::make_shared<HttpSession>(std::move(socket), handler_)->run();
    }

    if (acceptor_.is_open()) {
        do_accept();
    }
}

}
