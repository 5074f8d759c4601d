#include "dashwire/transport/beast/websocket.hpp"

#include <exception>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/field.hpp>

#include "dashwire/transport/state.hpp"
#include "dashwire/log/logger.hpp"

namespace dashwire::transport::beast {

namespace bbeast = boost::beast;
namespace bws = boost::beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

WebSocket::WebSocket()
    : ws_(ioc_)
{}

WebSocket::~WebSocket() {
    closing_ = true;
    bbeast::error_code ec;
    bbeast::get_lowest_layer(ws_).close(ec);
    // Drain cancelled handlers so none outlives this object
    ioc_.restart();
    ioc_.poll();
}

void WebSocket::set_protocols(const std::vector<std::string>& protocols) {
    protocols_ = protocols;
}

void WebSocket::set_message_callback(MessageCallback cb) {
    on_message_ = std::move(cb);
}

Error WebSocket::connect(const std::string& host, const std::string& port, const std::string& path) noexcept {
    try {
        bbeast::error_code ec;

        tcp::resolver resolver(ioc_);
        const auto results = resolver.resolve(host, port, ec);
        if (ec) {
            DW_WARN("[WS] Resolve failed for " << host << ":" << port << " (" << ec.message() << ")");
            return Error::ConnectionFailed;
        }

        const auto endpoint = asio::connect(ws_.next_layer(), results, ec);
        if (ec) {
            DW_WARN("[WS] TCP connect failed for " << host << ":" << port << " (" << ec.message() << ")");
            return Error::ConnectionFailed;
        }

        ws_.set_option(bws::stream_base::timeout::suggested(bbeast::role_type::client));
        const std::string protocols = join(protocols_, ", ");
        ws_.set_option(bws::stream_base::decorator([protocols](bws::request_type& req) {
            req.set(bbeast::http::field::user_agent, "dashwire/1.0");
            if (!protocols.empty()) {
                req.set(bbeast::http::field::sec_websocket_protocol, protocols);
            }
        }));

        const std::string host_header = host + ":" + std::to_string(endpoint.port());
        ws_.handshake(host_header, path, ec);
        if (ec) {
            DW_WARN("[WS] Handshake failed for " << host_header << path << " (" << ec.message() << ")");
            return Error::HandshakeFailed;
        }
    }
    catch (const std::exception& ex) {
        DW_ERROR("[WS] Connect threw: " << ex.what());
        return Error::TransportFailure;
    }

    ws_.text(true);
    open_ = true;
    DW_DEBUG("[WS] Connected to " << host << ":" << port << path);
    start_read_();
    return Error::None;
}

void WebSocket::close(std::uint16_t code) noexcept {
    if (!open_) {
        return;
    }
    open_ = false;
    closing_ = true;
    drop_queued_();
    events_.push_back(websocket::Event::make_close(code));
    try {
        ws_.async_close(bws::close_reason(code), [](const bbeast::error_code&) {});
    }
    catch (const std::exception& ex) {
        DW_WARN("[WS] Close threw: " << ex.what());
    }
}

bool WebSocket::send(const std::string& msg) noexcept {
    if (!open_) {
        return false;
    }
    try {
        outbox_.push_back(msg);
        if (!writing_) {
            start_write_();
        }
    }
    catch (const std::exception& ex) {
        DW_ERROR("[WS] Send threw: " << ex.what());
        fail_(Error::TransportFailure, close_code::Abnormal);
        return false;
    }
    return true;
}

bool WebSocket::poll_event(websocket::Event& ev) noexcept {
    try {
        if (ioc_.stopped()) {
            ioc_.restart();
        }
        ioc_.poll();
    }
    catch (const std::exception& ex) {
        DW_ERROR("[WS] I/O handler threw: " << ex.what());
        fail_(Error::TransportFailure, close_code::Abnormal);
    }

    if (events_.empty()) {
        return false;
    }
    ev = events_.front();
    events_.pop_front();
    return true;
}

void WebSocket::start_read_() {
    ws_.async_read(buffer_, [this](const bbeast::error_code& ec, std::size_t) {
        on_read_(ec);
    });
}

void WebSocket::on_read_(const bbeast::error_code& ec) {
    if (closing_) {
        return;
    }
    if (ec == bws::error::closed) {
        const std::uint16_t code = ws_.reason().code != bws::close_code::none
            ? static_cast<std::uint16_t>(ws_.reason().code)
            : close_code::Abnormal;
        DW_DEBUG("[WS] Closed by peer (code=" << code << ")");
        open_ = false;
        closing_ = true;
        events_.push_back(websocket::Event::make_close(code));
        return;
    }
    if (ec) {
        DW_WARN("[WS] Read failed (" << ec.message() << ")");
        fail_(Error::TransportFailure, close_code::Abnormal);
        return;
    }

    const std::string text = bbeast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    if (on_message_) {
        on_message_(text);
    }
    if (open_) {
        start_read_();
    }
}

// One async_write in flight at a time, the outbox holds the rest
void WebSocket::start_write_() {
    writing_ = true;
    ws_.async_write(asio::buffer(outbox_.front()), [this](const bbeast::error_code& ec, std::size_t) {
        on_write_(ec);
    });
}

void WebSocket::on_write_(const bbeast::error_code& ec) {
    writing_ = false;
    if (closing_) {
        return;
    }
    if (ec) {
        DW_WARN("[WS] Write failed (" << ec.message() << ")");
        fail_(Error::TransportFailure, close_code::Abnormal);
        return;
    }
    outbox_.pop_front();
    if (!outbox_.empty()) {
        start_write_();
    }
}

// Keeps the frame an in-flight write still references
void WebSocket::drop_queued_() noexcept {
    if (writing_ && !outbox_.empty()) {
        outbox_.erase(outbox_.begin() + 1, outbox_.end());
    }
    else {
        outbox_.clear();
    }
}

void WebSocket::fail_(Error err, std::uint16_t code) {
    if (closing_) {
        return;
    }
    open_ = false;
    closing_ = true;
    drop_queued_();
    events_.push_back(websocket::Event::make_error(err));
    events_.push_back(websocket::Event::make_close(code));
    bbeast::error_code ec;
    bbeast::get_lowest_layer(ws_).close(ec);
}

} // namespace dashwire::transport::beast
