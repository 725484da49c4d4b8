#pragma once

#include "transport.hpp"
#include "../types/device.hpp"
#include "../types/error.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tvremote {

// Periodic SSDP search for devices on the local subnet.
//
// One search session at a time. Each response is parsed into a Device and
// reported once per identifier. With a target identifier the session ends on
// the first match. Observers are notified on the search thread, except for
// on_search_started and the on_search_finished that stop_search() produces,
// which fire on the calling thread. The engine may be destroyed from a
// callback running on the search thread.
class DiscoveryEngine {
public:
    struct Callbacks {
        std::function<void(const Device&)> on_device_found;
        std::function<void()> on_search_started;
        std::function<void()> on_search_finished;
        std::function<void(const Error&)> on_error;
    };

    using ObserverId = uint64_t;

    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{3000};

    explicit DiscoveryEngine(DatagramChannelFactory factory,
                             std::chrono::milliseconds interval = DEFAULT_INTERVAL);
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    // Safe to call while a search is running, including from a callback
    ObserverId add_observer(Callbacks callbacks);
    void remove_observer(ObserverId id);

    // Rejected with already-searching while a session is active
    bool start_search(std::optional<std::string> target = std::nullopt,
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Ends the session; nothing is reported for it once this returns
    bool stop_search();

    bool is_searching() const;

    // Distinct devices reported by the current or most recent session
    std::vector<Device> devices() const;

private:
    struct State;

    static void run(std::shared_ptr<State> state, uint64_t session,
                    std::unique_ptr<DatagramChannel> channel, std::chrono::milliseconds interval,
                    std::optional<std::string> target,
                    std::optional<std::chrono::steady_clock::time_point> deadline);

    DatagramChannelFactory factory_;
    std::chrono::milliseconds interval_;

    // Co-owned by the search thread, which outlives the engine when a
    // callback destroys it
    std::shared_ptr<State> state_;
    std::thread worker_;
};

} // namespace tvremote
