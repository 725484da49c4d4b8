#include "dbus.hpp"
#include "rest.hpp"
#include "token_store.hpp"
#include "udp.hpp"
#include "wake.hpp"
#include "websocket.hpp"

#include <core/connection_manager.hpp>
#include <core/discovery.hpp>
#include <protocol/packets.hpp>
#include <types/app.hpp>
#include <types/command.hpp>
#include <types/device.hpp>
#include <types/enums.hpp>
#include <types/error.hpp>
#include <types/keys.hpp>
#include <types/session.hpp>

#include <poll.h>
#include <signal.h>

#include <atomic>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

constexpr const char* DEFAULT_APP_NAME = "tvremote";
constexpr int DEFAULT_DISCOVERY_TIMEOUT_S = 5;
constexpr int DEFAULT_CONNECT_TIMEOUT_S = 60;

// Command line: positional arguments plus --options
struct Options {
    std::vector<std::string> args;
    std::string name = DEFAULT_APP_NAME;
    std::optional<std::string> token;
    bool insecure = false;
    std::optional<std::string> target;
    std::optional<int> timeout;
    std::optional<uint16_t> port;
    std::string broadcast = tvremote::packets::wol::BROADCAST_ADDRESS;
};

static std::optional<int> parse_int(const std::string& s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

static std::optional<Options> parse_options(int argc, char* argv[], int first) {
    Options opts;

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--insecure") {
            opts.insecure = true;
        } else if (arg == "--name" || arg == "--token" || arg == "--target" ||
                   arg == "--timeout" || arg == "--port" || arg == "--broadcast") {
            auto v = value();
            if (!v) return std::nullopt;

            if (arg == "--name") {
                opts.name = *v;
            } else if (arg == "--token") {
                opts.token = *v;
            } else if (arg == "--target") {
                opts.target = *v;
            } else if (arg == "--broadcast") {
                opts.broadcast = *v;
            } else if (arg == "--timeout") {
                auto n = parse_int(*v);
                if (!n || *n <= 0) {
                    std::cerr << "Invalid timeout: " << *v << std::endl;
                    return std::nullopt;
                }
                opts.timeout = *n;
            } else {
                auto n = parse_int(*v);
                if (!n || *n <= 0 || *n > 65535) {
                    std::cerr << "Invalid port: " << *v << std::endl;
                    return std::nullopt;
                }
                opts.port = static_cast<uint16_t>(*n);
            }
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else {
            opts.args.push_back(std::move(arg));
        }
    }

    return opts;
}

// ============================================================================
// Daemon
// ============================================================================

static std::atomic<bool> g_running{true};
static DBusConnection* g_session_dbus = nullptr;
static dbus_service::State g_dbus_state;
static dbus_service::Callbacks g_dbus_callbacks;
static std::unique_ptr<tvremote::ConnectionManager> g_manager;
static std::optional<std::filesystem::path> g_token_path;

// Written from transport and REST threads, published by the event loop
static std::mutex g_mutex;
static dbus_service::State g_latest;
static std::optional<tvremote::Error> g_last_error;
static tvremote::SessionConfig g_config;

// Signal handler
static void signal_handler(int signum) {
    std::cout << "\nReceived signal " << signum << ", shutting down..." << std::endl;
    g_running = false;
}

// Error reported while the last manager call ran, or fallback
static tvremote::Error rejection(tvremote::ErrorKind fallback, const std::string& context) {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_last_error.value_or(tvremote::Error{fallback, context});
}

static void clear_last_error() {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_last_error.reset();
}

// "click" / "CLICK" -> "Click"
static std::string capitalize(std::string s) {
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (i == 0 && c >= 'a' && c <= 'z') s[i] = static_cast<char>(c - 'a' + 'A');
        if (i > 0 && c >= 'A' && c <= 'Z') s[i] = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

static tvremote::ConnectionManager::Callbacks manager_callbacks() {
    tvremote::ConnectionManager::Callbacks cb;

    cb.on_state_changed = [](tvremote::ConnectionState state) {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_latest.connection_state = tvremote::to_string(state);
    };

    cb.on_connected = []() {
        std::cout << "Channel open, waiting for authorization (accept the prompt on the TV)" << std::endl;
    };

    cb.on_authorization_changed = [](tvremote::AuthorizationState auth,
                                     const std::optional<std::string>& token) {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_latest.authorization_state = tvremote::to_string(auth);

        if (auth != tvremote::AuthorizationState::Allowed || !token || token == g_config.token) {
            return;
        }

        // Reuse the issued token on the next connect
        g_config.token = token;
        if (g_token_path && token_store::save(*g_token_path, *token)) {
            std::cout << "Saved authorization token to " << g_token_path->string() << std::endl;
        }
    };

    cb.on_command_written = [](const tvremote::RemoteCommand& command) {
        std::cout << "Sent " << tvremote::describe(command) << std::endl;
    };

    cb.on_command_acknowledged = [](const tvremote::RemoteCommand& command) {
        std::cout << "Acknowledged " << tvremote::describe(command) << std::endl;
    };

    cb.on_disconnected = []() {
        std::cout << "Disconnected" << std::endl;
    };

    cb.on_error = [](const tvremote::Error& error) {
        std::cerr << "Error: " << tvremote::to_string(error) << std::endl;
        std::lock_guard<std::mutex> lock(g_mutex);
        g_latest.last_error = tvremote::to_string(error);
        g_last_error = error;
    };

    return cb;
}

static std::optional<tvremote::Error> connect_tv() {
    tvremote::SessionConfig config;
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        config = g_config;
    }

    clear_last_error();
    if (!g_manager->connect(config)) {
        return rejection(tvremote::ErrorKind::AlreadyConnected, "connect rejected");
    }
    return std::nullopt;
}

static std::optional<tvremote::Error> send_command(const tvremote::RemoteCommand& command) {
    clear_last_error();
    if (!g_manager->send_remote_command(command)) {
        return rejection(tvremote::ErrorKind::PreconditionViolation, "command rejected");
    }
    return std::nullopt;
}

// Main event loop
static void run_event_loop() {
    while (g_running) {
        int session_fd = dbus_service::get_fd(g_session_dbus);

        pollfd pfd = {};
        pfd.fd = session_fd;
        pfd.events = POLLIN;

        // Poll with 100ms timeout
        int ret = poll(&pfd, session_fd >= 0 ? 1 : 0, 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "poll error: " << strerror(errno) << std::endl;
            break;
        }

        // Process session D-Bus
        if (pfd.revents & POLLIN) {
            dbus_service::process_pending(g_session_dbus);
        }

        // Publish state changed by the transport and REST threads
        dbus_service::State latest;
        {
            std::lock_guard<std::mutex> lock(g_mutex);
            latest = g_latest;
        }
        dbus_service::update_state(g_session_dbus, &g_dbus_state, latest);
    }
}

static int cmd_daemon(const Options& opts) {
    if (opts.args.empty()) {
        std::cerr << "Usage: tvremote daemon <address> [--name N] [--token T] [--insecure] [--port P]" << std::endl;
        return 1;
    }

    // Set up signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    std::cout << "TV remote daemon starting..." << std::endl;

    g_config.address = opts.args[0];
    g_config.app_name = opts.name;
    g_config.secure = !opts.insecure;
    g_config.port = opts.port.value_or(opts.insecure ? tvremote::PLAIN_CHANNEL_PORT
                                                      : tvremote::SECURE_CHANNEL_PORT);

    g_token_path = token_store::default_path();
    if (opts.token) {
        g_config.token = opts.token;
    } else if (g_token_path) {
        g_config.token = token_store::load(*g_token_path);
        if (g_config.token) {
            std::cout << "Loaded authorization token from " << g_token_path->string() << std::endl;
        }
    }

    if (auto invalid = tvremote::validate(g_config)) {
        std::cerr << "Invalid configuration: " << tvremote::to_string(*invalid) << std::endl;
        return 1;
    }

    g_latest.address = g_config.address;

    g_manager = std::make_unique<tvremote::ConnectionManager>(
        []() { return std::make_unique<websocket::Transport>(); }, manager_callbacks());

    // Set up D-Bus service callbacks
    g_dbus_callbacks.on_connect = []() { return connect_tv(); };

    g_dbus_callbacks.on_disconnect = []() -> std::optional<tvremote::Error> {
        if (!g_manager->disconnect_from_tv()) {
            return tvremote::Error{tvremote::ErrorKind::PreconditionViolation, "not connected"};
        }
        return std::nullopt;
    };

    g_dbus_callbacks.on_send_key = [](const std::string& name, const std::string& action_name)
            -> std::optional<tvremote::Error> {
        auto key = tvremote::key_from_string(name);
        if (!key) {
            return tvremote::Error{tvremote::ErrorKind::InvalidConfiguration, "unknown key: " + name};
        }
        auto action = tvremote::key_action_from_string(capitalize(action_name));
        if (!action) {
            return tvremote::Error{tvremote::ErrorKind::InvalidConfiguration, "unknown key action: " + action_name};
        }
        return send_command(tvremote::key_command(*key, *action));
    };

    g_dbus_callbacks.on_send_text = [](const std::string& text) {
        return send_command(tvremote::text_command(text));
    };

    // Initialize session D-Bus service
    g_session_dbus = dbus_service::init(&g_dbus_callbacks, &g_dbus_state);
    if (!g_session_dbus) {
        std::cerr << "Failed to initialize D-Bus service" << std::endl;
        g_manager.reset();
        return 1;
    }

    if (!dbus_service::request_name(g_session_dbus)) {
        std::cerr << "Failed to request D-Bus name" << std::endl;
        g_manager.reset();
        dbus_service::cleanup(g_session_dbus);
        return 1;
    }

    // Fill in the display name and model; the channel does not carry them
    rest::Client rest_client;
    rest_client.fetch_device_info(g_config.address, [](rest::Result<tvremote::Device> result) {
        if (auto* error = std::get_if<tvremote::Error>(&result)) {
            std::cerr << "Device info unavailable: " << tvremote::to_string(*error) << std::endl;
            return;
        }

        const auto& device = std::get<tvremote::Device>(result);
        std::cout << "Device: " << device.name << " (" << device.id << ")" << std::endl;

        std::lock_guard<std::mutex> lock(g_mutex);
        g_latest.device_name = device.name;
        if (device.info) {
            g_latest.model = device.info->model_name.empty() ? device.info->model : device.info->model_name;
        }
    });

    // Auto-connect; a failure here leaves the daemon waiting for Connect
    if (auto error = connect_tv()) {
        std::cerr << "Initial connect failed: " << tvremote::to_string(*error) << std::endl;
    }

    std::cout << "Daemon ready. D-Bus service: " << dbus_service::SERVICE_NAME << std::endl;

    // Run event loop
    run_event_loop();

    // Cleanup
    g_manager.reset();
    dbus_service::cleanup(g_session_dbus);
    g_session_dbus = nullptr;

    std::cout << "Daemon stopped" << std::endl;
    return 0;
}

// ============================================================================
// Daemon clients
// ============================================================================

// Session bus connection to a running daemon
class DaemonClient {
public:
    DaemonClient() {
        DBusError err;
        dbus_error_init(&err);
        conn_ = dbus_bus_get(DBUS_BUS_SESSION, &err);
        if (dbus_error_is_set(&err)) {
            std::cerr << "Session bus unavailable: " << err.message << std::endl;
            dbus_error_free(&err);
            conn_ = nullptr;
        }
    }

    ~DaemonClient() {
        if (conn_) dbus_connection_unref(conn_);
    }

    DaemonClient(const DaemonClient&) = delete;
    DaemonClient& operator=(const DaemonClient&) = delete;

    bool is_open() const { return conn_ != nullptr; }

    // Invoke a daemon method with string arguments; prints the daemon's error
    bool call(const char* method, const std::vector<std::string>& args, int timeout_ms = 2000) {
        DBusMessage* reply = roundtrip(dbus_service::INTERFACE_NAME, method, args, timeout_ms, true);
        if (!reply) return false;
        dbus_message_unref(reply);
        return true;
    }

    // Properties.Get; empty if the daemon is unreachable
    std::string property(const char* name) {
        DBusMessage* reply = roundtrip(PROPERTIES, "Get", {dbus_service::INTERFACE_NAME, name}, 1000, false);
        if (!reply) return {};

        std::string value;
        DBusMessageIter iter;
        if (dbus_message_iter_init(reply, &iter)) {
            value = variant_string(&iter).value_or("");
        }
        dbus_message_unref(reply);
        return value;
    }

    // Properties.GetAll, in the order the daemon lists them
    std::optional<std::vector<std::pair<std::string, std::string>>> properties() {
        DBusMessage* reply = roundtrip(PROPERTIES, "GetAll", {dbus_service::INTERFACE_NAME}, 2000, true);
        if (!reply) return std::nullopt;

        std::vector<std::pair<std::string, std::string>> result;
        DBusMessageIter iter, dict;
        if (dbus_message_iter_init(reply, &iter) && dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {
            for (dbus_message_iter_recurse(&iter, &dict);
                 dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY;
                 dbus_message_iter_next(&dict)) {
                DBusMessageIter entry;
                dbus_message_iter_recurse(&dict, &entry);
                if (dbus_message_iter_get_arg_type(&entry) != DBUS_TYPE_STRING) continue;

                const char* name;
                dbus_message_iter_get_basic(&entry, &name);
                if (!dbus_message_iter_next(&entry)) continue;

                if (auto value = variant_string(&entry)) {
                    result.emplace_back(name, *value);
                }
            }
        }
        dbus_message_unref(reply);
        return result;
    }

private:
    static constexpr const char* PROPERTIES = "org.freedesktop.DBus.Properties";

    DBusMessage* roundtrip(const char* iface, const char* method, const std::vector<std::string>& args,
                           int timeout_ms, bool report) {
        DBusMessage* msg = dbus_message_new_method_call(dbus_service::SERVICE_NAME, dbus_service::OBJECT_PATH,
                                                        iface, method);
        if (!msg) return nullptr;

        DBusMessageIter iter;
        dbus_message_iter_init_append(msg, &iter);
        for (const auto& arg : args) {
            const char* value = arg.c_str();
            dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &value);
        }

        DBusError err;
        dbus_error_init(&err);
        DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn_, msg, timeout_ms, &err);
        dbus_message_unref(msg);

        if (dbus_error_is_set(&err)) {
            if (report) std::cerr << method << ": " << err.message << std::endl;
            dbus_error_free(&err);
            return nullptr;
        }
        return reply;
    }

    // String held by the variant at iter
    static std::optional<std::string> variant_string(DBusMessageIter* iter) {
        if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_VARIANT) return std::nullopt;

        DBusMessageIter variant;
        dbus_message_iter_recurse(iter, &variant);
        if (dbus_message_iter_get_arg_type(&variant) != DBUS_TYPE_STRING) return std::nullopt;

        const char* value;
        dbus_message_iter_get_basic(&variant, &value);
        return std::string(value);
    }

    DBusConnection* conn_ = nullptr;
};

static int cmd_connect(const Options& opts) {
    DaemonClient client;
    if (!client.is_open()) return 1;

    if (!client.call("Connect", {}, 5000)) {
        std::cerr << "(is the daemon running?)" << std::endl;
        return 1;
    }

    std::cout << "Connecting... accept the prompt on the TV if one appears" << std::flush;

    // Wait for the session to become ready or fall back to disconnected
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(opts.timeout.value_or(DEFAULT_CONNECT_TIMEOUT_S));
    while (std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));

        std::string state = client.property("ConnectionState");
        if (state == "ready") {
            std::string name = client.property("DeviceName");
            std::cout << "\nReady: " << (name.empty() ? "(name unknown)" : name)
                      << ", authorization " << client.property("AuthorizationState") << std::endl;
            return 0;
        }
        if (state == "disconnected") {
            std::string error = client.property("LastError");
            std::cerr << "\nConnection failed: " << (error.empty() ? "(no error reported)" : error) << std::endl;
            return 1;
        }
        std::cout << "." << std::flush;
    }

    std::cerr << "\nTimed out waiting for authorization" << std::endl;
    return 1;
}

static int cmd_call(const char* method, const std::vector<std::string>& args) {
    DaemonClient client;
    if (!client.is_open()) return 1;
    return client.call(method, args) ? 0 : 1;
}

static int cmd_status() {
    DaemonClient client;
    if (!client.is_open()) return 1;

    auto props = client.properties();
    if (!props) {
        std::cerr << "(is the daemon running?)" << std::endl;
        return 1;
    }

    for (const auto& [name, value] : *props) {
        std::cout << name << ": " << (value.empty() ? "-" : value) << std::endl;
    }
    return 0;
}

// ============================================================================
// Standalone commands
// ============================================================================

static int cmd_discover(const Options& opts) {
    std::promise<void> finished;
    std::atomic<bool> failed{false};
    tvremote::DiscoveryEngine engine(udp::open_ssdp_channel);

    tvremote::DiscoveryEngine::Callbacks cb;
    cb.on_device_found = [](const tvremote::Device& device) {
        std::cout << device.id << "  " << device.address << "  " << device.name << std::endl;
    };
    cb.on_error = [&failed](const tvremote::Error& error) {
        std::cerr << "Discovery failed: " << tvremote::to_string(error) << std::endl;
        failed = true;
    };
    cb.on_search_finished = [&finished]() { finished.set_value(); };
    engine.add_observer(std::move(cb));

    auto timeout = std::chrono::seconds(opts.timeout.value_or(DEFAULT_DISCOVERY_TIMEOUT_S));
    if (!engine.start_search(opts.target, std::chrono::duration_cast<std::chrono::milliseconds>(timeout))) {
        return 1;
    }

    finished.get_future().wait();

    if (!failed && engine.devices().empty()) {
        std::cout << "No devices found" << std::endl;
    }
    return failed ? 1 : 0;
}

static int cmd_info(const Options& opts) {
    if (opts.args.empty()) {
        std::cerr << "Usage: tvremote info <address>" << std::endl;
        return 1;
    }

    rest::Client client;
    std::promise<rest::Result<tvremote::Device>> promise;
    auto future = promise.get_future();
    client.fetch_device_info(opts.args[0], [&promise](rest::Result<tvremote::Device> result) {
        promise.set_value(std::move(result));
    });

    auto result = future.get();
    if (auto* error = std::get_if<tvremote::Error>(&result)) {
        std::cerr << "Failed to fetch device info: " << tvremote::to_string(*error) << std::endl;
        return 1;
    }

    const auto& device = std::get<tvremote::Device>(result);
    std::cout << "Name:      " << device.name << "\n"
              << "Id:        " << device.id << "\n"
              << "Address:   " << device.address << std::endl;
    if (device.info) {
        const auto& info = *device.info;
        std::cout << "Model:     " << info.model_name << " (" << info.model << ")\n"
                  << "Firmware:  " << info.firmware_version << "\n"
                  << "OS:        " << info.os << "\n"
                  << "Display:   " << info.resolution << "\n"
                  << "Power:     " << info.power_state << "\n"
                  << "Wi-Fi MAC: " << info.wifi_mac << "\n"
                  << "Network:   " << info.network_type << "\n"
                  << "Country:   " << info.country_code << "\n"
                  << "Token auth: " << (info.token_auth_support ? "yes" : "no") << std::endl;
    }
    return 0;
}

static int cmd_app(const Options& opts) {
    if (opts.args.size() < 2) {
        std::cerr << "Usage: tvremote app <address> <app-id> [launch]" << std::endl;
        return 1;
    }

    const std::string& address = opts.args[0];
    const std::string& app_id = opts.args[1];
    rest::Client client;

    if (opts.args.size() > 2 && opts.args[2] == "launch") {
        std::promise<std::optional<tvremote::Error>> promise;
        auto future = promise.get_future();
        client.launch_app(address, app_id, [&promise](std::optional<tvremote::Error> error) {
            promise.set_value(std::move(error));
        });

        if (auto error = future.get()) {
            std::cerr << "Launch failed: " << tvremote::to_string(*error) << std::endl;
            return 1;
        }
        std::cout << "Launched " << app_id << std::endl;
        return 0;
    }

    std::promise<rest::Result<tvremote::AppStatus>> promise;
    auto future = promise.get_future();
    client.app_status(address, app_id, [&promise](rest::Result<tvremote::AppStatus> result) {
        promise.set_value(std::move(result));
    });

    auto result = future.get();
    if (auto* error = std::get_if<tvremote::Error>(&result)) {
        std::cerr << "Failed to get app status: " << tvremote::to_string(*error) << std::endl;
        return 1;
    }

    const auto& status = std::get<tvremote::AppStatus>(result);
    std::cout << status.id;
    if (!status.name.empty()) std::cout << " (" << status.name << ")";
    std::cout << ": " << tvremote::to_string(status.state) << std::endl;
    return 0;
}

static int cmd_wake(const Options& opts) {
    if (opts.args.empty()) {
        std::cerr << "Usage: tvremote wake <mac> [--broadcast ADDR] [--port P]" << std::endl;
        return 1;
    }

    auto error = wake::send(opts.args[0], opts.broadcast,
                            opts.port.value_or(tvremote::packets::wol::PORT));
    if (error) {
        std::cerr << "Wake failed: " << tvremote::to_string(*error) << std::endl;
        return 1;
    }
    return 0;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  daemon <address>          Run the remote control daemon\n"
              << "  connect                   Connect the daemon and wait for authorization\n"
              << "  disconnect                Close the daemon's connection\n"
              << "  key <name> [action]       Send a key (click, press, release)\n"
              << "  text <text>               Send text to the focused input field\n"
              << "  status                    Show current status\n"
              << "  discover                  Search the local network for TVs\n"
              << "  info <address>            Show device information\n"
              << "  app <address> <id> [launch]  Show or launch an application\n"
              << "  wake <mac>                Send a Wake-on-LAN packet\n"
              << "  help                      Show this help\n"
              << "\n"
              << "Options:\n"
              << "  --name N        Client name shown on the TV (default " << DEFAULT_APP_NAME << ")\n"
              << "  --token T       Authorization token (default: saved token)\n"
              << "  --insecure      Use ws:// on port 8001 instead of wss:// on 8002\n"
              << "  --port P        Channel port, or Wake-on-LAN port for wake\n"
              << "  --target ID     Stop discovery at the device with this id\n"
              << "  --timeout S     Seconds to wait (discover, connect)\n"
              << "  --broadcast A   Wake-on-LAN broadcast address\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];
    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    auto opts = parse_options(argc, argv, 2);
    if (!opts) {
        print_usage(argv[0]);
        return 1;
    }

    if (cmd == "daemon") {
        return cmd_daemon(*opts);
    } else if (cmd == "connect") {
        return cmd_connect(*opts);
    } else if (cmd == "disconnect") {
        return cmd_call("Disconnect", {});
    } else if (cmd == "key") {
        if (opts->args.empty()) {
            std::cerr << "Usage: " << argv[0] << " key <name> [click|press|release]\n";
            return 1;
        }
        return cmd_call("SendKey", {opts->args[0], opts->args.size() > 1 ? opts->args[1] : "Click"});
    } else if (cmd == "text") {
        if (opts->args.empty()) {
            std::cerr << "Usage: " << argv[0] << " text <text>\n";
            return 1;
        }
        return cmd_call("SendText", {opts->args[0]});
    } else if (cmd == "status") {
        return cmd_status();
    } else if (cmd == "discover") {
        return cmd_discover(*opts);
    } else if (cmd == "info") {
        return cmd_info(*opts);
    } else if (cmd == "app") {
        return cmd_app(*opts);
    } else if (cmd == "wake") {
        return cmd_wake(*opts);
    } else {
        std::cerr << "Unknown command: " << cmd << std::endl;
        print_usage(argv[0]);
        return 1;
    }
}
