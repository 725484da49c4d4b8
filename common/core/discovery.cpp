#include "discovery.hpp"
#include "../protocol/endpoints.hpp"
#include "../protocol/parse.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <unordered_set>
#include <utility>

namespace tvremote {

namespace {

constexpr std::chrono::milliseconds POLL_SLICE{100};

std::string normalize_id(std::string id) {
    if (id.rfind("uuid:", 0) == 0) {
        id.erase(0, 5);
    }
    return id;
}

} // namespace

struct DiscoveryEngine::State {
    // Held while observers run so stop_search() waits out an in-flight callback
    std::recursive_mutex mutex;

    std::vector<std::pair<ObserverId, Callbacks>> observers;
    ObserverId next_observer = 1;

    bool searching = false;
    uint64_t session = 0;
    std::vector<Device> devices;
    std::unordered_set<std::string> seen;

    // Everything below is called with mutex held

    bool is_current(uint64_t id) const {
        return searching && id == session;
    }

    void finish(std::optional<Error> error) {
        searching = false;
        ++session;

        if (error) {
            notify_error(*error);
        }
        notify_finished();
    }

    // Observers are looked up again before each call so that one removed by
    // an earlier callback is skipped
    template <typename Fn>
    void for_each_observer(Fn fn) {
        std::vector<ObserverId> ids;
        ids.reserve(observers.size());
        for (const auto& [id, _] : observers) {
            ids.push_back(id);
        }

        for (auto id : ids) {
            auto it = std::find_if(observers.begin(), observers.end(),
                                   [id](const auto& entry) { return entry.first == id; });
            if (it == observers.end()) continue;
            // Copy: the callback may remove itself
            auto callbacks = it->second;
            fn(callbacks);
        }
    }

    void notify_found(const Device& device) {
        const uint64_t current = session;
        for_each_observer([&](const Callbacks& cb) {
            if (current == session && cb.on_device_found) cb.on_device_found(device);
        });
    }

    void notify_started() {
        for_each_observer([](const Callbacks& cb) {
            if (cb.on_search_started) cb.on_search_started();
        });
    }

    void notify_finished() {
        for_each_observer([](const Callbacks& cb) {
            if (cb.on_search_finished) cb.on_search_finished();
        });
    }

    void notify_error(const Error& error) {
        for_each_observer([&](const Callbacks& cb) {
            if (cb.on_error) cb.on_error(error);
        });
    }
};

DiscoveryEngine::DiscoveryEngine(DatagramChannelFactory factory, std::chrono::milliseconds interval)
    : factory_(std::move(factory)), interval_(interval), state_(std::make_shared<State>()) {}

DiscoveryEngine::~DiscoveryEngine() {
    {
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);
        ++state_->session;
        state_->searching = false;
        state_->observers.clear();
    }

    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

DiscoveryEngine::ObserverId DiscoveryEngine::add_observer(Callbacks callbacks) {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    ObserverId id = state_->next_observer++;
    state_->observers.emplace_back(id, std::move(callbacks));
    return id;
}

void DiscoveryEngine::remove_observer(ObserverId id) {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    std::erase_if(state_->observers, [id](const auto& entry) { return entry.first == id; });
}

bool DiscoveryEngine::start_search(std::optional<std::string> target,
                                   std::optional<std::chrono::milliseconds> timeout) {
    auto& state = *state_;
    std::thread previous;
    {
        std::lock_guard<std::recursive_mutex> lock(state.mutex);
        if (state.searching) {
            state.notify_error({ErrorKind::AlreadySearching, "a search session is already active"});
            return false;
        }
        if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
            state.notify_error({ErrorKind::AlreadySearching, "cannot start a search from the search thread"});
            return false;
        }
        previous = std::move(worker_);
    }

    // A stopped session's thread may still be waking from its last receive
    if (previous.joinable()) {
        previous.join();
    }

    std::lock_guard<std::recursive_mutex> lock(state.mutex);
    if (state.searching || worker_.joinable()) {
        state.notify_error({ErrorKind::AlreadySearching, "a search session is already active"});
        return false;
    }

    auto channel = factory_ ? factory_() : nullptr;
    if (!channel) {
        std::cerr << "discovery: failed to open discovery socket" << std::endl;
        state.notify_error({ErrorKind::TransportFailure, "failed to open discovery socket"});
        return false;
    }

    if (target) {
        target = normalize_id(std::move(*target));
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout) {
        deadline = std::chrono::steady_clock::now() + *timeout;
    }

    state.devices.clear();
    state.seen.clear();
    state.searching = true;
    const uint64_t session = ++state.session;

    std::cout << "discovery: searching" << (target ? " for " + *target : std::string())
              << std::endl;
    state.notify_started();

    worker_ = std::thread(&DiscoveryEngine::run, state_, session, std::move(channel), interval_,
                          std::move(target), deadline);
    return true;
}

bool DiscoveryEngine::stop_search() {
    std::thread worker;
    {
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);
        if (!state_->searching) {
            return false;
        }

        std::cout << "discovery: search stopped, " << state_->devices.size() << " device(s) found"
                  << std::endl;
        state_->finish(std::nullopt);

        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker = std::move(worker_);
        }
    }

    if (worker.joinable()) {
        worker.join();
    }
    return true;
}

bool DiscoveryEngine::is_searching() const {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    return state_->searching;
}

std::vector<Device> DiscoveryEngine::devices() const {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    return state_->devices;
}

// Touches only the shared state: the engine may be gone after any callback
void DiscoveryEngine::run(std::shared_ptr<State> state, uint64_t session,
                          std::unique_ptr<DatagramChannel> channel, std::chrono::milliseconds interval,
                          std::optional<std::string> target,
                          std::optional<std::chrono::steady_clock::time_point> deadline) {
    using clock = std::chrono::steady_clock;

    const std::string request = endpoints::ssdp_search_request();
    auto next_send = clock::now();

    for (;;) {
        {
            std::lock_guard<std::recursive_mutex> lock(state->mutex);
            if (!state->is_current(session)) return;
        }

        auto now = clock::now();
        if (deadline && now >= *deadline) {
            std::lock_guard<std::recursive_mutex> lock(state->mutex);
            if (!state->is_current(session)) return;

            if (target) {
                std::cerr << "discovery: " << *target << " not found before timeout" << std::endl;
                state->finish(Error{ErrorKind::DiscoveryTimeout, "device " + *target + " not found"});
            } else {
                std::cout << "discovery: search finished, " << state->devices.size()
                          << " device(s) found" << std::endl;
                state->finish(std::nullopt);
            }
            return;
        }

        if (now >= next_send) {
            if (!channel->send(request)) {
                std::cerr << "discovery: failed to send search request" << std::endl;
            }
            next_send = now + interval;
        }

        auto wait = std::min<clock::duration>(POLL_SLICE, next_send - now);
        if (deadline) {
            wait = std::min<clock::duration>(wait, *deadline - now);
        }
        auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(wait).count();

        auto datagram = channel->receive(static_cast<int>(std::max<int64_t>(wait_ms, 1)));
        if (!datagram) {
            continue;
        }

        auto device = parse::parse_ssdp_response(datagram->payload, datagram->sender);
        if (!device) {
            std::cout << "discovery: dropping unrecognised response from " << datagram->sender << std::endl;
            continue;
        }

        std::lock_guard<std::recursive_mutex> lock(state->mutex);
        if (!state->is_current(session)) return;

        if (target && device->id != *target) {
            continue;
        }
        if (!state->seen.insert(device->id).second) {
            continue;
        }

        std::cout << "discovery: found " << device->id << " at " << device->address << std::endl;
        state->devices.push_back(*device);
        state->notify_found(*device);

        if (target && state->is_current(session)) {
            state->finish(std::nullopt);
            return;
        }
    }
}

} // namespace tvremote
