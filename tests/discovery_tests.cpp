#include <gtest/gtest.h>

#include <core/discovery.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace tvremote;
using namespace std::chrono_literals;

namespace {

// Datagrams the "network" will hand to whichever channel is open
struct FakeNetwork {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<DatagramChannel::Datagram> inbox;
    std::vector<std::string> requests;

    void reply(std::string payload, std::string sender) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            inbox.push_back({std::move(payload), std::move(sender)});
        }
        cv.notify_all();
    }

    size_t request_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return requests.size();
    }
};

class FakeDatagramChannel : public DatagramChannel {
public:
    explicit FakeDatagramChannel(std::shared_ptr<FakeNetwork> network) : network_(std::move(network)) {}

    bool send(std::string_view payload) override {
        std::lock_guard<std::mutex> lock(network_->mutex);
        network_->requests.emplace_back(payload);
        return true;
    }

    std::optional<Datagram> receive(int timeout_ms) override {
        std::unique_lock<std::mutex> lock(network_->mutex);
        if (!network_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                   [this] { return !network_->inbox.empty(); })) {
            return std::nullopt;
        }
        auto datagram = std::move(network_->inbox.front());
        network_->inbox.pop_front();
        return datagram;
    }

private:
    std::shared_ptr<FakeNetwork> network_;
};

// Observer side: everything the engine reported
struct Recorder {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Device> found;
    std::vector<Error> errors;
    int started = 0;
    int finished = 0;

    DiscoveryEngine::Callbacks callbacks() {
        DiscoveryEngine::Callbacks cb;
        cb.on_device_found = [this](const Device& device) { record([&] { found.push_back(device); }); };
        cb.on_search_started = [this]() { record([&] { ++started; }); };
        cb.on_search_finished = [this]() { record([&] { ++finished; }); };
        cb.on_error = [this](const Error& error) { record([&] { errors.push_back(error); }); };
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

    bool wait_found(size_t count) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, 2s, [&] { return found.size() >= count; });
    }

    bool wait_finished() {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, 2s, [&] { return finished > 0; });
    }
};

std::string ssdp_response(const std::string& id, const std::string& address) {
    return "HTTP/1.1 200 OK\r\n"
           "CACHE-CONTROL: max-age=1800\r\n"
           "LOCATION: http://" + address + ":7676/smp_15_\r\n"
           "ST: urn:samsung.com:device:RemoteControlReceiver:1\r\n"
           "USN: uuid:" + id + "::urn:samsung.com:device:RemoteControlReceiver:1\r\n"
           "\r\n";
}

} // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class DiscoveryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_unique<DiscoveryEngine>(
            [this]() -> std::unique_ptr<DatagramChannel> {
                if (!channel_available_) return nullptr;
                return std::make_unique<FakeDatagramChannel>(network_);
            },
            50ms);
        engine_->add_observer(recorder_.callbacks());
    }

    std::shared_ptr<FakeNetwork> network_ = std::make_shared<FakeNetwork>();
    Recorder recorder_;
    bool channel_available_ = true;
    std::unique_ptr<DiscoveryEngine> engine_;
};

// =============================================================================
// Open search
// =============================================================================

TEST_F(DiscoveryEngineTest, Search_ReportsEachDeviceOnce) {
    ASSERT_TRUE(engine_->start_search());
    EXPECT_TRUE(engine_->is_searching());

    network_->reply(ssdp_response("aaaa", "10.0.0.5"), "10.0.0.5");
    network_->reply(ssdp_response("aaaa", "10.0.0.5"), "10.0.0.5");
    network_->reply(ssdp_response("bbbb", "10.0.0.6"), "10.0.0.6");

    ASSERT_TRUE(recorder_.wait_found(2));
    ASSERT_TRUE(engine_->stop_search());

    EXPECT_FALSE(engine_->is_searching());
    EXPECT_EQ(recorder_.started, 1);
    EXPECT_EQ(recorder_.finished, 1);
    EXPECT_TRUE(recorder_.errors.empty());

    ASSERT_EQ(recorder_.found.size(), 2u);
    EXPECT_EQ(recorder_.found[0].id, "aaaa");
    EXPECT_EQ(recorder_.found[0].address, "10.0.0.5");
    EXPECT_EQ(recorder_.found[1].id, "bbbb");
    EXPECT_EQ(engine_->devices().size(), 2u);
}

TEST_F(DiscoveryEngineTest, Search_SendsRequestEveryInterval) {
    ASSERT_TRUE(engine_->start_search());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (network_->request_count() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(engine_->stop_search());

    ASSERT_GE(network_->request_count(), 3u);
    EXPECT_EQ(network_->requests[0].rfind("M-SEARCH * HTTP/1.1\r\n", 0), 0u);
}

TEST_F(DiscoveryEngineTest, Search_DropsMalformedResponses) {
    ASSERT_TRUE(engine_->start_search());

    network_->reply("garbage", "10.0.0.9");
    network_->reply("HTTP/1.1 200 OK\r\nST: urn:other\r\nUSN: uuid:cccc\r\n\r\n", "10.0.0.9");
    network_->reply(ssdp_response("aaaa", "10.0.0.5"), "10.0.0.5");

    ASSERT_TRUE(recorder_.wait_found(1));
    ASSERT_TRUE(engine_->stop_search());

    EXPECT_EQ(recorder_.found.size(), 1u);
    EXPECT_TRUE(recorder_.errors.empty());
}

TEST_F(DiscoveryEngineTest, Search_FinishesAtTimeout) {
    ASSERT_TRUE(engine_->start_search(std::nullopt, 150ms));

    ASSERT_TRUE(recorder_.wait_finished());
    EXPECT_FALSE(engine_->is_searching());
    EXPECT_TRUE(recorder_.errors.empty());
    EXPECT_FALSE(engine_->stop_search());
}

// =============================================================================
// Targeted search
// =============================================================================

TEST_F(DiscoveryEngineTest, Target_StopsOnFirstMatch) {
    ASSERT_TRUE(engine_->start_search("uuid:bbbb"));

    network_->reply(ssdp_response("aaaa", "10.0.0.5"), "10.0.0.5");
    network_->reply(ssdp_response("bbbb", "10.0.0.6"), "10.0.0.6");

    ASSERT_TRUE(recorder_.wait_finished());
    EXPECT_FALSE(engine_->is_searching());

    ASSERT_EQ(recorder_.found.size(), 1u);
    EXPECT_EQ(recorder_.found[0].id, "bbbb");
    EXPECT_TRUE(recorder_.errors.empty());
}

TEST_F(DiscoveryEngineTest, Target_TimeoutReportsError) {
    ASSERT_TRUE(engine_->start_search("missing", 150ms));

    network_->reply(ssdp_response("aaaa", "10.0.0.5"), "10.0.0.5");

    ASSERT_TRUE(recorder_.wait_finished());
    EXPECT_TRUE(recorder_.found.empty());
    ASSERT_EQ(recorder_.errors.size(), 1u);
    EXPECT_EQ(recorder_.errors[0].kind, ErrorKind::DiscoveryTimeout);
}

// =============================================================================
// Session control
// =============================================================================

TEST_F(DiscoveryEngineTest, Start_RejectedWhileSearching) {
    ASSERT_TRUE(engine_->start_search());

    EXPECT_FALSE(engine_->start_search());
    ASSERT_EQ(recorder_.errors.size(), 1u);
    EXPECT_EQ(recorder_.errors[0].kind, ErrorKind::AlreadySearching);
    EXPECT_TRUE(engine_->is_searching());

    ASSERT_TRUE(engine_->stop_search());
}

TEST_F(DiscoveryEngineTest, Start_AgainAfterStop) {
    ASSERT_TRUE(engine_->start_search());
    network_->reply(ssdp_response("aaaa", "10.0.0.5"), "10.0.0.5");
    ASSERT_TRUE(recorder_.wait_found(1));
    ASSERT_TRUE(engine_->stop_search());

    // A new session reports devices seen by the previous one again
    ASSERT_TRUE(engine_->start_search());
    network_->reply(ssdp_response("aaaa", "10.0.0.5"), "10.0.0.5");
    ASSERT_TRUE(recorder_.wait_found(2));
    ASSERT_TRUE(engine_->stop_search());

    EXPECT_EQ(recorder_.started, 2);
    EXPECT_EQ(recorder_.finished, 2);
}

TEST_F(DiscoveryEngineTest, Start_FailsWithoutSocket) {
    channel_available_ = false;

    EXPECT_FALSE(engine_->start_search());
    ASSERT_EQ(recorder_.errors.size(), 1u);
    EXPECT_EQ(recorder_.errors[0].kind, ErrorKind::TransportFailure);
    EXPECT_FALSE(engine_->is_searching());
}

TEST_F(DiscoveryEngineTest, Stop_WhenIdle) {
    EXPECT_FALSE(engine_->stop_search());
    EXPECT_EQ(recorder_.finished, 0);
}

TEST_F(DiscoveryEngineTest, Observers_AddAndRemoveDuringSearch) {
    Recorder late;
    ASSERT_TRUE(engine_->start_search());

    auto id = engine_->add_observer(late.callbacks());
    network_->reply(ssdp_response("aaaa", "10.0.0.5"), "10.0.0.5");
    ASSERT_TRUE(late.wait_found(1));

    engine_->remove_observer(id);
    network_->reply(ssdp_response("bbbb", "10.0.0.6"), "10.0.0.6");
    ASSERT_TRUE(recorder_.wait_found(2));
    ASSERT_TRUE(engine_->stop_search());

    EXPECT_EQ(late.found.size(), 1u);
    EXPECT_EQ(late.finished, 0);
}

TEST_F(DiscoveryEngineTest, Destroy_FromSearchThreadCallback) {
    std::mutex mutex;
    std::condition_variable cv;
    bool destroyed = false;

    DiscoveryEngine::Callbacks cb;
    cb.on_device_found = [&](const Device&) {
        engine_.reset();
        {
            std::lock_guard<std::mutex> lock(mutex);
            destroyed = true;
        }
        cv.notify_all();
    };
    engine_->add_observer(cb);

    ASSERT_TRUE(engine_->start_search());
    network_->reply(ssdp_response("aaaa", "10.0.0.5"), "10.0.0.5");
    network_->reply(ssdp_response("bbbb", "10.0.0.6"), "10.0.0.6");

    {
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, 2s, [&] { return destroyed; }));
    }

    // The orphaned search thread winds down without reporting anything else
    std::this_thread::sleep_for(200ms);
    std::lock_guard<std::mutex> lock(recorder_.mutex);
    ASSERT_EQ(recorder_.found.size(), 1u);
    EXPECT_EQ(recorder_.found[0].id, "aaaa");
    EXPECT_EQ(recorder_.finished, 0);
    EXPECT_TRUE(recorder_.errors.empty());
}
