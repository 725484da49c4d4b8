#include "rest.hpp"

#include <protocol/endpoints.hpp>
#include <protocol/packets.hpp>
#include <protocol/parse.hpp>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <algorithm>
#include <iostream>
#include <memory>
#include <utility>

namespace rest {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

tvremote::Error fetch_failure(std::string context) {
    return tvremote::Error{tvremote::ErrorKind::FetchFailure, std::move(context)};
}

} // namespace

// One request/response exchange; keeps itself alive through its handlers
class Exchange : public std::enable_shared_from_this<Exchange> {
public:
    Exchange(net::io_context& ioc, std::function<void(Result<Response>)> done)
        : resolver_(ioc), stream_(ioc), done_(std::move(done)) {}

    void run(http::verb verb, const std::string& host, uint16_t port, const std::string& target) {
        host_ = host;
        req_.version(11);
        req_.method(verb);
        req_.target(target);
        req_.set(http::field::host, host + ":" + std::to_string(port));
        req_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req_.prepare_payload();

        resolver_.async_resolve(host, std::to_string(port),
            beast::bind_front_handler(&Exchange::on_resolve, shared_from_this()));
    }

    // The pending operation completes with operation_aborted
    void cancel() {
        cancelled_ = true;
        resolver_.cancel();
        stream_.cancel();
    }

private:
    // A handler already queued when cancel() ran still ends the exchange
    beast::error_code checked(beast::error_code ec) const {
        if (!ec && cancelled_) return net::error::operation_aborted;
        return ec;
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if ((ec = checked(ec))) return fail("resolve", ec);

        stream_.expires_after(REQUEST_TIMEOUT);
        stream_.async_connect(results,
            beast::bind_front_handler(&Exchange::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if ((ec = checked(ec))) return fail("connect", ec);

        stream_.expires_after(REQUEST_TIMEOUT);
        http::async_write(stream_, req_,
            beast::bind_front_handler(&Exchange::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if ((ec = checked(ec))) return fail("write", ec);

        http::async_read(stream_, buffer_, res_,
            beast::bind_front_handler(&Exchange::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if ((ec = checked(ec))) return fail("read", ec);

        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);

        Response response;
        response.status = res_.result_int();
        response.body = std::move(res_.body());
        done_(std::move(response));
    }

    void fail(const char* what, beast::error_code ec) {
        std::cerr << "rest: " << what << " " << host_ << " failed: " << ec.message() << std::endl;
        done_(fetch_failure(std::string(what) + " " + host_ + ": " + ec.message()));
    }

    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::empty_body> req_;
    http::response<http::string_body> res_;
    std::string host_;
    std::function<void(Result<Response>)> done_;
    bool cancelled_ = false;
};

Client::Client(uint16_t port) : port_(port), work_(net::make_work_guard(ioc_)) {
    worker_ = std::thread([this]() { ioc_.run(); });
}

Client::~Client() {
    closing_ = true;

    // Queued behind every request posted so far; those fail without starting
    net::post(ioc_, [this]() {
        for (auto& weak : pending_) {
            if (auto exchange = weak.lock()) exchange->cancel();
        }
        pending_.clear();
    });

    // run() returns once the cancelled exchanges have reported
    work_.reset();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void Client::request(bool post, const std::string& address, const std::string& target,
                     std::function<void(Result<Response>)> done) {
    std::cout << "rest: " << (post ? "POST " : "GET ") << address << target << std::endl;
    auto verb = post ? http::verb::post : http::verb::get;

    net::post(ioc_, [this, verb, address, target, done = std::move(done)]() mutable {
        if (closing_) {
            return done(fetch_failure("client shut down before " + address + target + " was sent"));
        }

        auto exchange = std::make_shared<Exchange>(ioc_, std::move(done));
        std::erase_if(pending_, [](const std::weak_ptr<Exchange>& weak) { return weak.expired(); });
        pending_.push_back(exchange);
        exchange->run(verb, address, port_, target);
    });
}

void Client::fetch_device_info(const std::string& address,
                               std::function<void(Result<tvremote::Device>)> done) {
    request(false, address, tvremote::endpoints::device_info_target(),
        [address, done = std::move(done)](Result<Response> result) {
            if (auto* error = std::get_if<tvremote::Error>(&result)) {
                return done(*error);
            }

            const auto& response = std::get<Response>(result);
            if (response.status != 200) {
                return done(fetch_failure("device info returned HTTP " + std::to_string(response.status)));
            }

            auto device = tvremote::parse::parse_device_info(response.body);
            if (!device) {
                return done(fetch_failure("malformed device info from " + address));
            }
            if (device->address.empty()) {
                device->address = address;
            }
            done(std::move(*device));
        });
}

void Client::app_status(const std::string& address, const std::string& app_id,
                        std::function<void(Result<tvremote::AppStatus>)> done) {
    request(false, address, tvremote::endpoints::application_target(app_id),
        [app_id, done = std::move(done)](Result<Response> result) {
            if (auto* error = std::get_if<tvremote::Error>(&result)) {
                return done(*error);
            }

            const auto& response = std::get<Response>(result);
            if (response.status == 404) {
                tvremote::AppStatus status;
                status.id = app_id;
                status.state = tvremote::AppState::NotInstalled;
                return done(std::move(status));
            }
            if (response.status != 200) {
                return done(fetch_failure("app status returned HTTP " + std::to_string(response.status)));
            }

            auto status = tvremote::parse::parse_app_status(response.body);
            if (!status) {
                return done(fetch_failure("malformed app status for " + app_id));
            }
            done(std::move(*status));
        });
}

void Client::launch_app(const std::string& address, const std::string& app_id,
                        std::function<void(std::optional<tvremote::Error>)> done) {
    request(true, address, tvremote::endpoints::application_target(app_id),
        [app_id, done = std::move(done)](Result<Response> result) {
            if (auto* error = std::get_if<tvremote::Error>(&result)) {
                return done(*error);
            }

            const auto& response = std::get<Response>(result);
            if (response.status == 404) {
                return done(fetch_failure(app_id + " is not installed"));
            }
            if (response.status != 200 && response.status != 201) {
                return done(fetch_failure("launch returned HTTP " + std::to_string(response.status)));
            }
            done(std::nullopt);
        });
}

} // namespace rest
