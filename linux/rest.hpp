#pragma once

#include <protocol/packets.hpp>
#include <types/app.hpp>
#include <types/device.hpp>
#include <types/error.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace rest {

template <typename T>
using Result = std::variant<T, tvremote::Error>;

struct Response {
    unsigned status = 0;
    std::string body;
};

constexpr std::chrono::seconds REQUEST_TIMEOUT{5};

class Exchange;

// HTTP client for the device's REST api (plain http on port 8001).
// Requests run on the client's own thread; completion handlers are called
// there, once per request. Requests still pending when the client is
// destroyed complete with fetch-failure before the destructor returns, so
// the client must not be destroyed from one of its own handlers.
class Client {
public:
    explicit Client(uint16_t port = tvremote::packets::REST_PORT);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // GET /api/v2/ -> identity and model metadata
    void fetch_device_info(const std::string& address,
                           std::function<void(Result<tvremote::Device>)> done);

    // GET /api/v2/applications/<id>; 404 means not installed
    void app_status(const std::string& address, const std::string& app_id,
                    std::function<void(Result<tvremote::AppStatus>)> done);

    // POST /api/v2/applications/<id>
    void launch_app(const std::string& address, const std::string& app_id,
                    std::function<void(std::optional<tvremote::Error>)> done);

private:
    void request(bool post, const std::string& address, const std::string& target,
                 std::function<void(Result<Response>)> done);

    uint16_t port_;
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread worker_;

    std::atomic<bool> closing_{false};
    // Only touched on the client's thread
    std::vector<std::weak_ptr<Exchange>> pending_;
};

} // namespace rest
