#include "websocket.hpp"

#include <protocol/endpoints.hpp>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <atomic>
#include <cstdint>
#include <deque>
#include <iostream>
#include <type_traits>
#include <utility>
#include <vector>

namespace websocket {

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace ws = beast::websocket;
using tcp = net::ip::tcp;

using PlainStream = ws::stream<beast::tcp_stream>;
using SecureStream = ws::stream<beast::ssl_stream<beast::tcp_stream>>;

// Owned jointly by the Transport and the worker thread. Apart from the
// atomics, state is only touched by handlers running on ioc.
struct Transport::Session : std::enable_shared_from_this<Transport::Session> {
    Session(tvremote::SessionConfig config, Callbacks callbacks)
        : config(std::move(config)), callbacks(std::move(callbacks)) {
        // Devices present self-signed certificates; trust is delegated to
        // config.certificate_validator
        boost::system::error_code ignored;
        tls.set_verify_mode(ssl::verify_none, ignored);
    }
    virtual ~Session() = default;

    virtual void start() = 0;
    virtual void write(std::string text) = 0;
    virtual void shut_down() = 0;

    net::io_context ioc;
    ssl::context tls{ssl::context::tls_client};

    tvremote::SessionConfig config;
    Callbacks callbacks;

    std::atomic<bool> stop{false};
    std::atomic<bool> open{false};
};

namespace {

bool is_ip_literal(const std::string& host) {
    boost::system::error_code ec;
    net::ip::make_address(host, ec);
    return !ec;
}

std::string describe(const ws::close_reason& reason) {
    if (reason.code == ws::close_code::none) {
        return "no status";
    }
    std::string text = "status " + std::to_string(static_cast<uint16_t>(reason.code));
    if (!reason.reason.empty()) {
        text += ": ";
        text.append(reason.reason.data(), reason.reason.size());
    }
    return text;
}

template <typename Stream>
class Channel : public Transport::Session {
public:
    static constexpr bool SECURE = std::is_same_v<Stream, SecureStream>;

    Channel(tvremote::SessionConfig config, tvremote::Transport::Callbacks callbacks)
        : Session(std::move(config), std::move(callbacks)), resolver_(ioc), ws_(make_stream()) {}

    void start() override {
        if (stop) return;
        resolver_.async_resolve(config.address, std::to_string(config.port),
            beast::bind_front_handler(&Channel::on_resolve, self()));
    }

    void write(std::string text) override {
        if (stop || !open) return;
        outbox_.push_back(std::move(text));
        if (outbox_.size() == 1) {
            write_next();
        }
    }

    void shut_down() override {
        resolver_.cancel();
        if (open.exchange(false) && ws_.is_open()) {
            ws_.async_close(ws::close_code::normal, [s = self()](beast::error_code ec) {
                if (ec) {
                    std::cerr << "ws: close handshake failed: " << ec.message() << std::endl;
                }
                beast::get_lowest_layer(s->ws_).close();
            });
            return;
        }
        beast::get_lowest_layer(ws_).close();
    }

private:
    Stream make_stream() {
        if constexpr (SECURE) {
            return Stream(ioc, tls);
        } else {
            return Stream(ioc);
        }
    }

    std::shared_ptr<Channel> self() {
        return std::static_pointer_cast<Channel>(shared_from_this());
    }

    // Invoke a callback unless the transport is being closed; false once closed
    template <typename Fn, typename... Args>
    bool dispatch(const Fn& fn, Args&&... args) {
        if (stop) return false;
        if (fn) fn(std::forward<Args>(args)...);
        return !stop;
    }

    void fail(const std::string& reason) {
        if (stop || finished_) return;
        finished_ = true;
        open = false;

        std::cerr << "ws: " << reason << std::endl;
        beast::get_lowest_layer(ws_).close();
        dispatch(callbacks.on_failure, reason);
    }

    // True when the handler chain ends here
    bool failed(beast::error_code ec, const char* what) {
        if (stop || finished_) return true;
        if (!ec) return false;
        fail(std::string(what) + ": " + ec.message());
        return true;
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (failed(ec, "cannot resolve device")) return;

        beast::get_lowest_layer(ws_).expires_after(CONNECT_TIMEOUT);
        beast::get_lowest_layer(ws_).async_connect(results,
            beast::bind_front_handler(&Channel::on_connect, self()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (failed(ec, "connect failed")) return;

        boost::system::error_code ignored;
        beast::get_lowest_layer(ws_).socket().set_option(tcp::no_delay(true), ignored);

        if constexpr (SECURE) {
            if (!is_ip_literal(config.address)) {
                SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), config.address.c_str());
            }
            beast::get_lowest_layer(ws_).expires_after(CONNECT_TIMEOUT);
            ws_.next_layer().async_handshake(ssl::stream_base::client,
                beast::bind_front_handler(&Channel::on_tls_handshake, self()));
        } else {
            upgrade();
        }
    }

    void on_tls_handshake(beast::error_code ec) {
        if (failed(ec, "TLS handshake failed")) return;

        if (config.certificate_validator && !certificate_accepted()) {
            return fail("certificate rejected for " + config.address);
        }
        upgrade();
    }

    bool certificate_accepted() {
        X509* cert = SSL_get1_peer_certificate(ws_.next_layer().native_handle());
        if (!cert) {
            std::cerr << "ws: device presented no certificate" << std::endl;
            return false;
        }

        int len = i2d_X509(cert, nullptr);
        std::vector<uint8_t> der(len > 0 ? static_cast<size_t>(len) : 0);
        unsigned char* out = der.data();
        if (len > 0) i2d_X509(cert, &out);
        X509_free(cert);

        return !der.empty() && config.certificate_validator->validate(config.address, der);
    }

    void upgrade() {
        // The websocket stream applies its own timeouts from here on
        beast::get_lowest_layer(ws_).expires_never();

        ws::stream_base::timeout timeouts;
        timeouts.handshake_timeout = HANDSHAKE_TIMEOUT;
        timeouts.idle_timeout = ws::stream_base::none();
        timeouts.keep_alive_pings = false;
        ws_.set_option(timeouts);
        ws_.set_option(ws::stream_base::decorator([](ws::request_type& req) {
            req.set(beast::http::field::user_agent, "tvremote");
        }));
        ws_.read_message_max(MAX_MESSAGE_SIZE);

        ws_.async_handshake(response_, config.address + ":" + std::to_string(config.port),
            tvremote::endpoints::channel_target(config),
            beast::bind_front_handler(&Channel::on_upgrade, self()));
    }

    void on_upgrade(beast::error_code ec) {
        if (ec && response_.result_int() != 0 && response_.result_int() != 101) {
            return fail("handshake rejected with HTTP " + std::to_string(response_.result_int()));
        }
        if (failed(ec, "handshake failed")) return;

        std::cout << "ws: connected to " << config.address << ":" << config.port
                  << (SECURE ? " (tls)" : "") << std::endl;
        open = true;
        if (!dispatch(callbacks.on_open)) return;
        read();
    }

    void read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&Channel::on_read, self()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (stop || finished_) return;

        if (ec == ws::error::closed) {
            finished_ = true;
            open = false;
            std::string reason = describe(ws_.reason());
            std::cout << "ws: device closed channel (" << reason << ")" << std::endl;
            dispatch(callbacks.on_closed, reason);
            return;
        }
        if (failed(ec, "read failed")) return;

        if (!ws_.got_text()) {
            std::cout << "ws: ignoring binary message" << std::endl;
            buffer_.consume(buffer_.size());
        } else {
            std::string text = beast::buffers_to_string(buffer_.data());
            buffer_.consume(buffer_.size());
            if (!dispatch(callbacks.on_message, text)) return;
        }
        read();
    }

    void write_next() {
        ws_.text(true);
        ws_.async_write(net::buffer(outbox_.front()),
            beast::bind_front_handler(&Channel::on_write, self()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (failed(ec, "write failed")) return;

        outbox_.pop_front();
        if (!outbox_.empty()) {
            write_next();
        }
    }

    tcp::resolver resolver_;
    Stream ws_;
    beast::flat_buffer buffer_;
    ws::response_type response_;
    std::deque<std::string> outbox_;
    bool finished_ = false;
};

} // namespace

Transport::~Transport() {
    close();
}

void Transport::open(const tvremote::SessionConfig& config, Callbacks callbacks) {
    if (session_) {
        std::cerr << "ws: transport already opened" << std::endl;
        return;
    }

    if (config.secure) {
        session_ = std::make_shared<Channel<SecureStream>>(config, std::move(callbacks));
    } else {
        session_ = std::make_shared<Channel<PlainStream>>(config, std::move(callbacks));
    }

    std::cout << "ws: opening " << tvremote::endpoints::channel_url(config) << std::endl;
    net::post(session_->ioc, [weak = std::weak_ptr<Session>(session_)]() {
        if (auto s = weak.lock()) s->start();
    });

    // Runs until the connection ends; the thread keeps the session alive
    worker_ = std::thread([s = session_]() { s->ioc.run(); });
}

bool Transport::send(const std::string& text) {
    auto s = session_;
    if (!s || !s->open || s->stop) {
        return false;
    }

    net::post(s->ioc, [weak = std::weak_ptr<Session>(s), text]() mutable {
        if (auto s = weak.lock()) s->write(std::move(text));
    });
    return true;
}

void Transport::close() {
    auto s = std::move(session_);
    if (!s) {
        return;
    }

    s->stop = true;
    net::post(s->ioc, [weak = std::weak_ptr<Session>(s)]() {
        if (auto s = weak.lock()) s->shut_down();
    });

    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

} // namespace websocket
