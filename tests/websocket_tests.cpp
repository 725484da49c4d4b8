#include <gtest/gtest.h>

#include "websocket.hpp"

#include <protocol/crypto.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace ws = beast::websocket;
using tcp = net::ip::tcp;

constexpr const char* GREETING = R"({"event":"ms.channel.connect","data":{"id":"c1"}})";

// Self-signed P-256 certificate, made fresh for each server
struct TestCertificate {
    EVP_PKEY* key = nullptr;
    X509* cert = nullptr;
    std::vector<uint8_t> der;

    TestCertificate() {
        key = EVP_EC_gen("P-256");
        cert = X509_new();
        X509_set_version(cert, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert), 0);
        X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
        X509_set_pubkey(cert, key);

        X509_NAME* name = X509_get_subject_name(cert);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("127.0.0.1"), -1, -1, 0);
        X509_set_issuer_name(cert, name);
        X509_sign(cert, key, EVP_sha256());

        int len = i2d_X509(cert, nullptr);
        der.resize(len > 0 ? static_cast<size_t>(len) : 0);
        unsigned char* out = der.data();
        i2d_X509(cert, &out);
    }

    ~TestCertificate() {
        X509_free(cert);
        EVP_PKEY_free(key);
    }

    TestCertificate(const TestCertificate&) = delete;
    TestCertificate& operator=(const TestCertificate&) = delete;
};

// What the device end does once the upgrade is accepted
enum class Behavior {
    Echo,               // echo text messages until the client closes
    CloseAfterGreeting, // send one event, then a close frame
    DropAfterGreeting,  // send one event, then drop TCP without a close frame
};

// Single-connection WebSocket server on 127.0.0.1, served on its own thread
class TestServer {
public:
    TestServer(bool secure, Behavior behavior) : secure_(secure), behavior_(behavior) {
        tcp::endpoint endpoint(net::ip::make_address("127.0.0.1"), 0);
        acceptor_.open(endpoint.protocol());
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();

        if (secure_) {
            SSL_CTX_use_certificate(tls_.native_handle(), certificate_.cert);
            SSL_CTX_use_PrivateKey(tls_.native_handle(), certificate_.key);
        }

        thread_ = std::thread([this]() { serve(); });
    }

    ~TestServer() {
        // Unblock accept() if no client ever arrived
        if (!accepted_) {
            boost::system::error_code ec;
            tcp::socket poke(ioc_);
            poke.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
            poke.close(ec);
        }
        thread_.join();
    }

    uint16_t port() const { return port_; }
    const std::vector<uint8_t>& certificate_der() const { return certificate_.der; }

    std::string request_target() {
        std::lock_guard<std::mutex> lock(mutex_);
        return target_;
    }

private:
    void serve() {
        boost::system::error_code ec;
        tcp::socket socket(ioc_);
        acceptor_.accept(socket, ec);
        accepted_ = true;
        if (ec) return;

        if (secure_) {
            ws::stream<beast::ssl_stream<tcp::socket&>> stream(socket, tls_);
            stream.next_layer().handshake(ssl::stream_base::server, ec);
            if (ec) return;
            run(stream);
        } else {
            ws::stream<tcp::socket> stream(std::move(socket));
            run(stream);
        }
    }

    template <typename Stream>
    void run(Stream& stream) {
        boost::system::error_code ec;
        beast::flat_buffer buffer;

        http::request<http::string_body> request;
        http::read(stream.next_layer(), buffer, request, ec);
        if (ec) return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            target_ = std::string(request.target());
        }

        stream.accept(request, ec);
        if (ec) return;

        if (behavior_ == Behavior::Echo) {
            for (;;) {
                buffer.consume(buffer.size());
                stream.read(buffer, ec);
                if (ec) return;
                stream.text(stream.got_text());
                stream.write(buffer.data(), ec);
                if (ec) return;
            }
        }

        stream.text(true);
        stream.write(net::buffer(std::string(GREETING)), ec);
        if (ec) return;

        if (behavior_ == Behavior::CloseAfterGreeting) {
            stream.close(ws::close_reason(ws::close_code::normal, "bye"), ec);
        } else {
            beast::get_lowest_layer(stream).close(ec);
        }
    }

    bool secure_;
    Behavior behavior_;

    net::io_context ioc_;
    tcp::acceptor acceptor_{ioc_};
    ssl::context tls_{ssl::context::tls_server};
    TestCertificate certificate_;
    uint16_t port_ = 0;

    std::atomic<bool> accepted_{false};
    std::mutex mutex_;
    std::string target_;
    std::thread thread_;
};

// Everything the transport reported, in order
struct Events {
    std::mutex mutex;
    std::condition_variable cv;
    bool opened = false;
    std::vector<std::string> messages;
    std::optional<std::string> closed;
    std::optional<std::string> failure;

    tvremote::Transport::Callbacks callbacks() {
        tvremote::Transport::Callbacks cb;
        cb.on_open = [this]() { record([&] { opened = true; }); };
        cb.on_message = [this](const std::string& text) { record([&] { messages.push_back(text); }); };
        cb.on_closed = [this](const std::string& reason) { record([&] { closed = reason; }); };
        cb.on_failure = [this](const std::string& reason) { record([&] { failure = reason; }); };
        return cb;
    }

    template <typename Fn>
    void record(Fn fn) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            fn();
        }
        cv.notify_all();
    }

    template <typename Pred>
    bool wait(Pred pred) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, 5s, pred);
    }

    bool wait_open() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, 5s, [&] { return opened || failure.has_value(); });
        return opened;
    }
    bool wait_messages(size_t count) { return wait([&] { return messages.size() >= count; }); }
    bool wait_closed() { return wait([&] { return closed.has_value(); }); }
    bool wait_failure() { return wait([&] { return failure.has_value(); }); }
};

class RecordingValidator : public tvremote::CertificateValidator {
public:
    explicit RecordingValidator(bool accept) : accept_(accept) {}

    bool validate(std::string_view host, std::span<const uint8_t> der) override {
        host_ = std::string(host);
        der_.assign(der.begin(), der.end());
        ++calls_;
        return accept_;
    }

    std::string host_;
    std::vector<uint8_t> der_;
    int calls_ = 0;

private:
    bool accept_;
};

} // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class WebSocketTransportTest : public ::testing::Test {
protected:
    tvremote::SessionConfig start_server(bool secure, Behavior behavior) {
        server_ = std::make_unique<TestServer>(secure, behavior);

        tvremote::SessionConfig config;
        config.address = "127.0.0.1";
        config.app_name = "tvremote";
        config.port = server_->port();
        config.secure = secure;
        return config;
    }

    // Declared before transport_ so they outlive the connection
    std::unique_ptr<TestServer> server_;
    RecordingValidator accepting_{true};
    RecordingValidator rejecting_{false};
    Events events_;
    websocket::Transport transport_;
};

// =============================================================================
// Plain channel
// =============================================================================

TEST_F(WebSocketTransportTest, Plain_OpensAndExchangesMessages) {
    auto config = start_server(false, Behavior::Echo);
    config.token = "12345678";

    transport_.open(config, events_.callbacks());
    ASSERT_TRUE(events_.wait_open());

    EXPECT_EQ(server_->request_target(),
              "/api/v2/channels/samsung.remote.control?name=" +
              tvremote::crypto::base64_encode(std::string_view("tvremote")) + "&token=12345678");

    ASSERT_TRUE(transport_.send(R"({"method":"ms.remote.control"})"));
    ASSERT_TRUE(events_.wait_messages(1));
    EXPECT_EQ(events_.messages[0], R"({"method":"ms.remote.control"})");

    transport_.close();
    EXPECT_FALSE(events_.closed.has_value());
    EXPECT_FALSE(events_.failure.has_value());
}

TEST_F(WebSocketTransportTest, Plain_CloseFrameReportsClosed) {
    transport_.open(start_server(false, Behavior::CloseAfterGreeting), events_.callbacks());
    ASSERT_TRUE(events_.wait_closed());

    ASSERT_EQ(events_.messages.size(), 1u);
    EXPECT_EQ(events_.messages[0], GREETING);
    EXPECT_EQ(*events_.closed, "status 1000: bye");
    EXPECT_FALSE(events_.failure.has_value());
}

TEST_F(WebSocketTransportTest, Plain_EofWithoutCloseFrameReportsFailure) {
    transport_.open(start_server(false, Behavior::DropAfterGreeting), events_.callbacks());
    ASSERT_TRUE(events_.wait_failure());
    EXPECT_FALSE(events_.closed.has_value());
}

// =============================================================================
// TLS channel
// =============================================================================

TEST_F(WebSocketTransportTest, Secure_ValidatorSeesLeafCertificate) {
    auto config = start_server(true, Behavior::Echo);
    config.certificate_validator = &accepting_;

    transport_.open(config, events_.callbacks());
    ASSERT_TRUE(events_.wait_open());

    EXPECT_EQ(accepting_.calls_, 1);
    EXPECT_EQ(accepting_.host_, "127.0.0.1");
    EXPECT_EQ(accepting_.der_, server_->certificate_der());

    ASSERT_TRUE(transport_.send("ping"));
    ASSERT_TRUE(events_.wait_messages(1));
    EXPECT_EQ(events_.messages[0], "ping");
}

TEST_F(WebSocketTransportTest, Secure_RejectedCertificateFails) {
    auto config = start_server(true, Behavior::Echo);
    config.certificate_validator = &rejecting_;

    transport_.open(config, events_.callbacks());
    ASSERT_TRUE(events_.wait_failure());

    EXPECT_NE(events_.failure->find("certificate rejected"), std::string::npos);
    EXPECT_FALSE(events_.opened);
    EXPECT_EQ(rejecting_.calls_, 1);
    EXPECT_FALSE(transport_.send("ping"));
}

TEST_F(WebSocketTransportTest, Secure_SelfSignedAcceptedWithoutValidator) {
    transport_.open(start_server(true, Behavior::Echo), events_.callbacks());
    ASSERT_TRUE(events_.wait_open());
    EXPECT_FALSE(events_.failure.has_value());
}

TEST_F(WebSocketTransportTest, Secure_EofWithoutCloseFrameReportsFailure) {
    transport_.open(start_server(true, Behavior::DropAfterGreeting), events_.callbacks());
    ASSERT_TRUE(events_.wait_failure());
    EXPECT_FALSE(events_.closed.has_value());
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(WebSocketTransportTest, Connect_RefusedReportsFailure) {
    uint16_t port;
    {
        net::io_context ioc;
        tcp::acceptor unused(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = unused.local_endpoint().port();
    }

    tvremote::SessionConfig config;
    config.address = "127.0.0.1";
    config.app_name = "tvremote";
    config.port = port;
    config.secure = false;

    transport_.open(config, events_.callbacks());
    ASSERT_TRUE(events_.wait_failure());
    EXPECT_FALSE(events_.opened);
}

TEST_F(WebSocketTransportTest, Send_BeforeOpenFails) {
    EXPECT_FALSE(transport_.send("hello"));
}

TEST_F(WebSocketTransportTest, Close_SilencesCallbacks) {
    transport_.open(start_server(false, Behavior::Echo), events_.callbacks());
    ASSERT_TRUE(events_.wait_open());

    transport_.close();
    EXPECT_FALSE(transport_.send("late"));

    std::this_thread::sleep_for(100ms);
    std::lock_guard<std::mutex> lock(events_.mutex);
    EXPECT_FALSE(events_.closed.has_value());
    EXPECT_FALSE(events_.failure.has_value());
}

TEST_F(WebSocketTransportTest, Close_FromInsideCallback) {
    auto config = start_server(false, Behavior::CloseAfterGreeting);

    auto callbacks = events_.callbacks();
    auto record = callbacks.on_message;
    callbacks.on_message = [&](const std::string& text) {
        record(text);
        transport_.close();
    };

    transport_.open(config, callbacks);
    ASSERT_TRUE(events_.wait_messages(1));

    std::this_thread::sleep_for(100ms);
    std::lock_guard<std::mutex> lock(events_.mutex);
    EXPECT_FALSE(events_.closed.has_value());
    EXPECT_FALSE(events_.failure.has_value());
}
