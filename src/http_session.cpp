#include "http_session.hpp"
#include "logger.hpp"
#include <boost/asio/dispatch.hpp>
#include <chrono>

namespace fritz {

HttpSession::HttpSession(tcp::socket&& socket, MetricsHandler& handler)
    : stream_(std::move(socket))
    , handler_(handler)
{
    beast::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

// Starts the asynchronous session activity
void HttpSession::run() {
    // Dispatch onto the session strand before touching the stream
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

// Initiates the asynchronous read of an HTTP request
void HttpSession::do_read() {
    req_ = {};

    stream_.expires_after(std::chrono::seconds(READ_TIMEOUT_SEC));

    parser_.emplace();
    parser_->body_limit(MAX_BODY_SIZE);

    http::async_read(
        stream_,
        buffer_,
        *parser_,
        beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec) {
        // Timeouts and resets of idle scrapers are routine
        return;
    }

    req_ = parser_->release();
    handle_request();
}

void HttpSession::handle_request() {
    auto target = req_.target();
    auto method = req_.method();

    // Scrapers may append query parameters
    auto query = target.find('?');
    if (query != decltype(target)::npos) {
        target = target.substr(0, query);
    }

    if (method != http::verb::get && method != http::verb::head) {
        send_response(handler_.handle_method_not_allowed(req_.version()));
        return;
    }

    if (target == "/metrics") {
        Logger::log(Logger::Level::DEBUG, Logger::EventType::SCRAPE, "Scrape from " + remote_addr_);
        send_response(handler_.handle_metrics(req_.version()));
    } else if (target == "/health") {
        send_response(handler_.handle_health(req_.version()));
    } else {
        send_response(handler_.handle_not_found(req_.version()));
    }
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    res.keep_alive(req_.keep_alive());
    if (req_.method() == http::verb::head) {
        auto length = res.body().size();
        res.body().clear();
        res.content_length(length);
    }

    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

    auto self = shared_from_this();
    http::async_write(
        stream_,
        *sp,
        [self, sp](beast::error_code ec, std::size_t bytes) {
            self->on_write(sp->need_eof(), ec, bytes);
        });
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::SCRAPE, "HTTP write error: " + ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
