#include "avahi.hpp"
#include "clipboard.hpp"
#include "dbus.hpp"
#include "hidraw.hpp"
#include "net.hpp"
#include "sync_server.hpp"

#include <config/config.hpp>
#include <device/haptics.hpp>
#include <device/host_switch.hpp>
#include <device/session.hpp>
#include <flow/orchestrator.hpp>
#include <flow/pairing.hpp>
#include <flow/peer_directory.hpp>
#include <flow/trust_store.hpp>
#include <gesture/gesture.hpp>
#include <protocol/packets.hpp>
#include <protocol/parse.hpp>

#include <poll.h>
#include <signal.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <string_view>

using juhradial::Clock;
using juhradial::Error;

namespace flow = juhradial::flow;
namespace gesture = juhradial::gesture;
namespace packets = juhradial::packets;

constexpr auto RECONNECT_INTERVAL = std::chrono::seconds(5);
constexpr auto RESOLVE_INTERVAL = std::chrono::seconds(10);

// Global state (for daemon mode)
static std::atomic<bool> g_running{true};
static juhradial::Config g_config;
static DBusConnection* g_session_dbus = nullptr;
static DBusConnection* g_system_dbus = nullptr;
static dbus_service::State g_dbus_state;
static dbus_service::Callbacks g_dbus_callbacks;

// Device
static std::unique_ptr<juhradial::Session> g_session;
static std::unique_ptr<juhradial::HostSwitch> g_host_switch;
static std::unique_ptr<juhradial::Haptics> g_haptics;
static std::unique_ptr<gesture::StateMachine> g_gesture;
static bool g_gesture_held = false;
static int g_gesture_timer = -1;
static uint64_t g_hold_generation = 0;
static Clock::time_point g_last_connect_attempt{};

// Flow
static std::unique_ptr<flow::TrustStore> g_trust;
static std::unique_ptr<avahi::Backend> g_avahi;
static std::unique_ptr<flow::PeerDirectory> g_directory;
static std::unique_ptr<flow::PairingAuthority> g_pairing;
static std::unique_ptr<clipboard::SystemClipboard> g_clipboard;
static std::unique_ptr<sync_server::HttpPeerSender> g_sender;
static std::unique_ptr<flow::Orchestrator> g_orchestrator;
static std::unique_ptr<sync_server::Mailbox> g_mailbox;
static std::unique_ptr<sync_server::Server> g_server;
static std::string g_hostname;
static int g_maintenance_timer = -1;
static Clock::time_point g_last_sweep{};
static Clock::time_point g_last_resolve{};

// Signal handler
static void signal_handler(int signum) {
    std::cout << "\nReceived signal " << signum << ", shutting down..." << std::endl;
    g_running = false;
}

static int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

static std::string local_hostname() {
    if (!g_config.flow.hostname.empty()) return g_config.flow.hostname;
    char buf[256] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) return "localhost";
    return buf;
}

// ============================================================================
// Timers
// ============================================================================

static void arm_timer(int fd, std::chrono::nanoseconds first, std::chrono::nanoseconds interval) {
    if (fd < 0) return;

    auto to_timespec = [](std::chrono::nanoseconds ns) {
        timespec ts{};
        ts.tv_sec = static_cast<time_t>(ns.count() / 1000000000);
        ts.tv_nsec = static_cast<long>(ns.count() % 1000000000);
        return ts;
    };

    itimerspec spec{};
    spec.it_value = to_timespec(first);
    spec.it_interval = to_timespec(interval);
    if (timerfd_settime(fd, 0, &spec, nullptr) < 0) {
        std::cerr << "timerfd_settime failed: " << strerror(errno) << std::endl;
    }
}

static void disarm_timer(int fd) {
    arm_timer(fd, std::chrono::nanoseconds(0), std::chrono::nanoseconds(0));
}

static bool consume_timer(int fd) {
    uint64_t expirations = 0;
    return ::read(fd, &expirations, sizeof(expirations)) == sizeof(expirations);
}

// ============================================================================
// Gesture
// ============================================================================

// Missing motor or device was already reported at connect time
static void report_haptic(std::string_view what, Error err) {
    if (err == Error::None || err == Error::DeviceUnavailable || err == Error::FeatureUnsupported) return;
    std::cerr << "Haptic " << what << " not played: " << juhradial::to_string(err) << std::endl;
}

static void haptic(juhradial::HapticEvent event) {
    if (!g_haptics) return;
    report_haptic(juhradial::to_string(event), g_haptics->emit(event, Clock::now()));
}

static void apply_intents(const std::vector<juhradial::MenuIntent>& intents) {
    using Kind = juhradial::MenuIntent::Kind;

    for (const auto& intent : intents) {
        switch (intent.kind) {
            case Kind::OpenAt:
                std::cout << "Menu open at " << intent.position.x << "," << intent.position.y << std::endl;
                if (g_haptics) g_haptics->reset_slices();
                haptic(juhradial::HapticEvent::MenuAppear);
                dbus_service::emit_menu_open(g_session_dbus, intent.position);
                break;
            case Kind::Close:
                std::cout << "Menu close" << std::endl;
                dbus_service::emit_menu_close(g_session_dbus);
                break;
            case Kind::Select:
                std::cout << "Tap action: " << intent.action_id << std::endl;
                haptic(juhradial::HapticEvent::SelectionConfirm);
                dbus_service::emit_menu_select(g_session_dbus, intent.action_id);
                break;
        }
    }
    dbus_service::set_menu_open(g_session_dbus, &g_dbus_state, g_gesture->menu_open());
}

static void gesture_button(bool pressed) {
    if (pressed == g_gesture_held) return;
    g_gesture_held = pressed;

    auto now = Clock::now();
    if (pressed) {
        if (auto timer = g_gesture->press(now)) {
            g_hold_generation = timer->generation;
            arm_timer(g_gesture_timer, timer->deadline - now, std::chrono::nanoseconds(0));
        }
    } else {
        disarm_timer(g_gesture_timer);
        apply_intents(g_gesture->release(now));
    }
}

static void gesture_timer_fired() {
    if (!consume_timer(g_gesture_timer)) return;
    apply_intents(g_gesture->hold_elapsed(g_hold_generation));
}

// ============================================================================
// Device
// ============================================================================

static void publish_device_state() {
    if (!g_session) return;
    dbus_service::update_from_device_state(g_session_dbus, &g_dbus_state, g_session->state());
}

static void device_lost() {
    if (g_gesture->state() != gesture::State::Idle) {
        disarm_timer(g_gesture_timer);
        apply_intents(g_gesture->reset());
    }
    g_gesture_held = false;
}

static juhradial::Session::Callbacks session_callbacks() {
    juhradial::Session::Callbacks callbacks;
    callbacks.on_connection = [](bool connected) {
        std::cout << "Device " << (connected ? "connected" : "disconnected") << std::endl;
        if (connected) {
            if (g_orchestrator) g_orchestrator->claim_local();
        } else {
            device_lost();
        }
        publish_device_state();
    };
    callbacks.on_battery = [](const juhradial::Battery& battery) {
        std::cout << "Battery: " << static_cast<int>(battery.level) << "%"
                  << (battery.charging ? " (charging)" : "") << std::endl;
        publish_device_state();
    };
    callbacks.on_hosts = [](const juhradial::HostInfo& hosts) {
        std::cout << "Host: " << static_cast<int>(hosts.current) + 1 << "/" << static_cast<int>(hosts.count)
                  << std::endl;
        publish_device_state();
    };
    callbacks.on_dpi = [](uint16_t dpi) {
        std::cout << "DPI: " << dpi << std::endl;
        publish_device_state();
    };
    return callbacks;
}

static std::optional<hidraw::DeviceInfo> select_device() {
    if (g_config.device.hidraw_path.empty()) {
        return hidraw::find_device();
    }

    for (auto& device : hidraw::enumerate()) {
        if (device.path == g_config.device.hidraw_path) return device;
    }
    std::cerr << "Configured device " << g_config.device.hidraw_path << " is not a Logitech hidraw node" << std::endl;
    return std::nullopt;
}

static bool connect_device() {
    if (g_session && g_session->connected()) {
        std::cout << "Already connected" << std::endl;
        return true;
    }
    g_last_connect_attempt = Clock::now();

    auto device = select_device();
    if (!device) {
        std::cerr << "No Logitech HID++ device found" << std::endl;
        return false;
    }

    uint8_t index = hidraw::device_index_for(device->connection, g_config.device.receiver_index);
    auto transport = std::make_unique<hidraw::Connection>(*device, index);

    juhradial::Session::Options options;
    options.request_timeout_ms = g_config.device.request_timeout_ms;
    options.discovery_attempts = g_config.device.discovery_attempts;

    g_host_switch.reset();
    g_haptics.reset();
    g_session = std::make_unique<juhradial::Session>(std::move(transport), options, session_callbacks());

    if (Error err = g_session->connect(); err != Error::None) {
        std::cerr << "Connect failed: " << juhradial::to_string(err) << std::endl;
        return false;
    }

    g_host_switch = std::make_unique<juhradial::HostSwitch>(*g_session, g_config.easy_switch.host_names,
                                                            g_config.easy_switch.confirm_timeout_ms);
    g_haptics = std::make_unique<juhradial::Haptics>(*g_session, g_config.haptics);
    if (g_haptics->enabled() && !g_session->supports(packets::features::HAPTIC)) {
        std::cout << "Device has no haptic motor" << std::endl;
    }
    return true;
}

static void disconnect_device() {
    if (g_session) {
        g_session->disconnect();
    }
    std::cout << "Disconnected" << std::endl;
}

static void handle_notifications() {
    for (const auto& note : g_session->poll_notifications()) {
        if (note.feature_id == packets::features::REPROG_CONTROLS_V4 &&
            note.frame.function_id == packets::functions::DIVERTED_BUTTONS_EVENT) {
            auto cids = juhradial::parse::parse_diverted_buttons({note.frame.params.data(), note.frame.param_count()});
            gesture_button(juhradial::parse::is_gesture_pressed(cids));
        }
    }
}

static Error switch_host(int index) {
    if (!g_host_switch || !g_session->connected()) {
        return Error::DeviceUnavailable;
    }

    int previous = g_session->state().hosts.current;
    Error err = g_host_switch->switch_to(index);
    if (err != Error::None) {
        std::cerr << "Host switch to " << index << " failed: " << juhradial::to_string(err) << std::endl;
        haptic(juhradial::HapticEvent::InvalidAction);
        return err;
    }

    if (index != previous && g_orchestrator) {
        Error handoff = g_orchestrator->hand_off_to_slot(index);
        if (handoff != Error::None && handoff != Error::NotFound) {
            std::cerr << "Focus hand-off failed: " << juhradial::to_string(handoff) << std::endl;
        }
    }
    publish_device_state();
    return Error::None;
}

// ============================================================================
// Flow
// ============================================================================

static void peers_changed() {
    dbus_service::emit_peers_changed(g_session_dbus);
}

static void publish_server_info() {
    if (!g_server) return;
    g_server->set_info(flow::PeerInfo{g_trust->self_id(), g_hostname, g_config.flow.host_slot, avahi::PROTOCOL_VERSION});
}

static void handle_pair_job(sync_server::Mailbox::PairJob& job) {
    const auto& request = job.request;
    std::cout << "Pair request from " << request.peer_id << " (" << request.hostname << ")" << std::endl;

    auto token = g_pairing->verify(request.peer_id, request.code, Clock::now());
    if (!token) {
        std::cerr << "Pairing with " << request.peer_id << " rejected" << std::endl;
        job.reply.set_value(juhradial::fail<flow::PairResponse>(token.error));
        peers_changed();
        return;
    }

    flow::TrustEntry entry{token.value, request.hostname, unix_now()};
    if (auto peer = g_directory->find(request.peer_id)) {
        entry.address = peer->address;
        entry.port = peer->port;
        entry.host_slot = peer->host_slot;
    }
    g_trust->add(request.peer_id, std::move(entry));
    if (!g_trust->save()) {
        std::cerr << "Failed to persist trust for " << request.peer_id << std::endl;
    }

    juhradial::Result<flow::PairResponse> response;
    response.value = flow::PairResponse{g_trust->self_id(), token.value, g_hostname};
    job.reply.set_value(std::move(response));
    std::cout << "Paired with " << request.peer_id << std::endl;
    peers_changed();
}

static void drain_mailbox() {
    std::vector<juhradial::SyncMessage> messages;
    std::vector<sync_server::Mailbox::PairJob> pairs;
    g_mailbox->drain(messages, pairs);

    for (const auto& message : messages) {
        if (Error err = g_orchestrator->receive(message); err != Error::None) {
            std::cerr << "Sync message from " << message.origin << " not applied: " << juhradial::to_string(err)
                      << std::endl;
        }
    }
    for (auto& job : pairs) {
        handle_pair_job(job);
    }
}

static Error pair_with_peer(const std::string& peer_id, const std::string& code) {
    auto peer = g_directory->find(peer_id);
    if (!peer) {
        return Error::UnknownPeer;
    }
    if (peer->pairing_state == juhradial::PairingState::Paired) {
        return Error::None;
    }
    if (!g_directory->transition(peer_id, juhradial::PairingState::Pairing)) {
        return Error::InvalidPairing;
    }

    flow::PairRequest request{g_trust->self_id(), code, g_hostname};
    auto response = sync_server::request_pairing(*peer, request, g_config.flow.request_timeout_ms);
    if (!response) {
        g_directory->transition(peer_id, juhradial::PairingState::Unpaired);
        peers_changed();
        return response.error;
    }

    g_trust->add(peer_id, flow::TrustEntry{response.value.token, response.value.hostname, unix_now(), peer->address,
                                           peer->port, peer->host_slot});
    if (!g_trust->save()) {
        std::cerr << "Failed to persist trust for " << peer_id << std::endl;
    }
    g_directory->transition(peer_id, juhradial::PairingState::Paired);
    std::cout << "Paired with " << peer_id << std::endl;
    peers_changed();
    return Error::None;
}

static Error unpair(const std::string& peer_id) {
    bool known = g_trust->remove(peer_id);
    if (known && !g_trust->save()) {
        std::cerr << "Failed to persist trust store" << std::endl;
    }

    auto peer = g_directory->find(peer_id);
    if (peer && peer->pairing_state != juhradial::PairingState::Unpaired) {
        g_directory->transition(peer_id, juhradial::PairingState::Unpaired);
        known = true;
    }
    if (!known) {
        return Error::UnknownPeer;
    }

    std::cout << "Unpaired " << peer_id << std::endl;
    peers_changed();
    return Error::None;
}

static std::vector<dbus_service::PeerEntry> list_peers() {
    std::vector<dbus_service::PeerEntry> entries;
    if (!g_directory) return entries;

    for (const auto& peer : g_directory->peers()) {
        entries.push_back({peer.peer_id, peer.hostname, peer.address, peer.host_slot,
                           std::string(juhradial::to_string(peer.pairing_state))});
    }
    return entries;
}

static bool start_flow() {
    g_trust = std::make_unique<flow::TrustStore>(juhradial::config::data_dir() + "/flow_peers.json");
    if (!g_trust->load()) {
        std::cerr << "Trust store unreadable, Flow disabled" << std::endl;
        return false;
    }
    g_hostname = local_hostname();
    g_dbus_state.peer_id = g_trust->self_id();

    std::string address = g_config.flow.bind_address;
    if (address.empty()) {
        auto found = net::find_private_address();
        if (!found) {
            std::cerr << "No private IPv4 address, Flow disabled" << std::endl;
            return false;
        }
        address = *found;
    }

    avahi::Advertisement ad{g_trust->self_id(), g_hostname, g_config.flow.port, g_config.flow.host_slot};
    avahi::Callbacks discovery;
    discovery.on_found = [](const flow::Sighting& sighting) {
        // Paired peers that moved are remembered for the next start
        if (g_trust->update_location(sighting.peer_id, sighting.address, sighting.port, sighting.host_slot) &&
            !g_trust->save()) {
            std::cerr << "Failed to persist location of " << sighting.peer_id << std::endl;
        }
        if (g_directory->upsert(sighting, Clock::now())) {
            std::cout << "Peer found: " << sighting.peer_id << " (" << sighting.hostname << " at "
                      << sighting.address << ")" << std::endl;
            peers_changed();
        }
    };
    discovery.on_removed = [](const std::string& peer_id) {
        if (g_directory->forget(peer_id)) {
            std::cout << "Peer gone: " << peer_id << std::endl;
            peers_changed();
        }
    };
    g_avahi = std::make_unique<avahi::Backend>(g_system_dbus, ad, discovery);

    g_directory = std::make_unique<flow::PeerDirectory>(
        g_avahi.get(), std::chrono::milliseconds(g_config.flow.liveness_timeout_ms),
        [](const std::string& peer_id) { return g_trust->is_trusted(peer_id); });
    g_pairing = std::make_unique<flow::PairingAuthority>(*g_directory,
                                                         std::chrono::milliseconds(g_config.flow.pairing_ttl_ms));
    size_t restored = flow::restore_paired(*g_directory, *g_trust, Clock::now());
    if (restored > 0) {
        std::cout << "Restored " << restored << " paired peer(s)" << std::endl;
    }

    g_clipboard = std::make_unique<clipboard::SystemClipboard>(g_config.flow.max_payload);
    g_sender = std::make_unique<sync_server::HttpPeerSender>(*g_trust, g_config.flow.request_timeout_ms);

    auto epoch = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    g_orchestrator = std::make_unique<flow::Orchestrator>(g_trust->self_id(), epoch, *g_directory, *g_clipboard,
                                                          *g_sender, g_config.flow.max_payload);
    g_orchestrator->on_focus_changed([](const flow::Focus& focus) {
        dbus_service::set_focus_owner(g_session_dbus, &g_dbus_state, flow::describe(focus));
    });

    g_mailbox = std::make_unique<sync_server::Mailbox>();
    if (!g_mailbox->is_open()) {
        return false;
    }

    flow::SyncTransport::Limits limits;
    limits.payload_cap = g_config.flow.max_payload;
    g_server = std::make_unique<sync_server::Server>(*g_trust, limits, *g_mailbox, g_config.flow.request_timeout_ms);
    publish_server_info();
    if (!g_server->start(address, g_config.flow.port)) {
        std::cerr << "Sync server failed to start, Flow disabled" << std::endl;
        g_server.reset();
        return false;
    }

    if (g_session && g_session->connected()) {
        g_orchestrator->claim_local();
    }
    std::cout << "Flow ready as " << g_trust->self_id() << " on " << address << ":" << g_config.flow.port
              << std::endl;
    return true;
}

static void stop_flow() {
    if (g_server) g_server->stop();
    if (g_directory) {
        g_directory->detach_all();
    }
    g_server.reset();
    g_orchestrator.reset();
    g_pairing.reset();
    g_directory.reset();
    g_avahi.reset();
    g_sender.reset();
    g_clipboard.reset();
    g_mailbox.reset();
}

static void maintenance() {
    if (!consume_timer(g_maintenance_timer)) return;
    auto now = Clock::now();

    if ((!g_session || !g_session->connected()) && now - g_last_connect_attempt >= RECONNECT_INTERVAL) {
        connect_device();
    }

    if (!g_orchestrator) return;

    if (now - g_last_sweep >= std::chrono::milliseconds(g_config.flow.sweep_interval_ms)) {
        g_last_sweep = now;
        auto gone = g_directory->sweep(now);
        auto expired = g_pairing->expire(now);
        for (const auto& id : gone) std::cout << "Peer timed out: " << id << std::endl;
        for (const auto& id : expired) std::cout << "Pairing code for " << id << " expired" << std::endl;
        if (!gone.empty() || !expired.empty()) peers_changed();
    }

    if (g_avahi->active() && now - g_last_resolve >= RESOLVE_INTERVAL) {
        g_last_resolve = now;
        g_avahi->refresh();
    }

    g_orchestrator->poll_clipboard();
}

// Process Avahi signals and replies from system bus
static void process_system_bus() {
    dbus_connection_read_write(g_system_dbus, 0);
    while (dbus_connection_dispatch(g_system_dbus) == DBUS_DISPATCH_DATA_REMAINS) {}
}

// Main event loop
static void run_event_loop() {
    while (g_running) {
        std::vector<pollfd> fds;
        auto add = [&fds](int fd) -> int {
            if (fd < 0) return -1;
            pollfd pfd = {};
            pfd.fd = fd;
            pfd.events = POLLIN;
            fds.push_back(pfd);
            return static_cast<int>(fds.size()) - 1;
        };

        int session_idx = add(dbus_service::get_fd(g_session_dbus));
        int system_idx = g_system_dbus ? add(dbus_service::get_fd(g_system_dbus)) : -1;
        int device_idx = g_session && g_session->connected() ? add(g_session->fd()) : -1;
        int gesture_idx = add(g_gesture_timer);
        int maintenance_idx = add(g_maintenance_timer);
        int mailbox_idx = g_mailbox ? add(g_mailbox->fd()) : -1;

        int ret = poll(fds.data(), fds.size(), 1000);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "poll error: " << strerror(errno) << std::endl;
            break;
        }

        auto ready = [&fds](int idx) { return idx >= 0 && (fds[idx].revents & (POLLIN | POLLERR | POLLHUP)); };

        if (ready(session_idx)) dbus_service::process_pending(g_session_dbus);
        if (ready(system_idx)) process_system_bus();
        if (ready(device_idx)) handle_notifications();
        if (ready(gesture_idx)) gesture_timer_fired();
        if (ready(mailbox_idx)) drain_mailbox();
        if (ready(maintenance_idx)) maintenance();
    }
}

// ============================================================================
// Subcommand implementations
// ============================================================================

static gesture::StateMachine::Options gesture_options() {
    gesture::StateMachine::Options options;
    options.hold_threshold = std::chrono::milliseconds(g_config.gesture.hold_threshold_ms);
    options.tap_action = g_config.gesture.tap_action;
    options.geometry.radius = g_config.gesture.menu_radius;
    options.geometry.edge_margin = g_config.gesture.edge_margin;
    options.geometry.screen_width = g_config.gesture.screen_width;
    options.geometry.screen_height = g_config.gesture.screen_height;
    return options;
}

// Gesture, Easy-Switch names and haptics apply live. Device and Flow settings wait for a restart.
static Error reload_config() {
    auto config = juhradial::config::load(juhradial::config::default_path());
    if (!config) {
        std::cerr << "Config reload failed, keeping current settings" << std::endl;
        return config.error;
    }
    g_config = config.value;

    g_gesture->set_options(gesture_options());
    if (g_host_switch) g_host_switch->set_names(g_config.easy_switch.host_names);
    if (g_haptics) g_haptics->configure(g_config.haptics);
    dbus_service::set_haptics_enabled(g_session_dbus, &g_dbus_state, g_config.haptics.enabled);

    std::cout << "Configuration reloaded" << std::endl;
    return Error::None;
}

static void setup_dbus_callbacks() {
    g_dbus_callbacks.on_connect = []() { connect_device(); };
    g_dbus_callbacks.on_disconnect = []() { disconnect_device(); };
    g_dbus_callbacks.on_switch_host = [](int32_t index) { return switch_host(index); };
    g_dbus_callbacks.on_list_hosts = []() {
        return g_host_switch ? g_host_switch->list_hosts() : std::vector<juhradial::HostSlot>{};
    };
    g_dbus_callbacks.on_set_dpi = [](uint16_t dpi) {
        if (!g_session || !g_session->connected()) return Error::DeviceUnavailable;
        return g_session->set_dpi(dpi);
    };
    g_dbus_callbacks.on_select = [](const std::string& action) {
        std::cout << "Action selected: " << action << std::endl;
        dbus_service::emit_action_selected(g_session_dbus, action);
    };
    g_dbus_callbacks.on_report_pointer = [](juhradial::Position position) {
        if (g_gesture->motion(position)) {
            dbus_service::emit_pointer_moved(g_session_dbus, position);
        }
    };
    g_dbus_callbacks.on_slice_hover = [](uint8_t slice) {
        if (g_haptics) report_haptic("slice_change", g_haptics->slice_hovered(slice, Clock::now()));
    };
    g_dbus_callbacks.on_reload_config = []() { return reload_config(); };
    g_dbus_callbacks.on_attach_discovery = [](const std::string& client) {
        if (!g_directory) return false;
        if (!g_directory->attach(client)) {
            std::cerr << "Peer discovery unavailable (is avahi-daemon running?)" << std::endl;
            return false;
        }
        return true;
    };
    g_dbus_callbacks.on_detach_discovery = [](const std::string& client) {
        if (g_directory) g_directory->detach(client);
    };
    g_dbus_callbacks.on_client_vanished = [](const std::string& client) {
        if (g_directory && g_directory->attached(client)) {
            std::cout << "Discovery client " << client << " left the bus" << std::endl;
            g_directory->detach(client);
        }
    };
    g_dbus_callbacks.on_list_peers = []() { return list_peers(); };
    g_dbus_callbacks.on_issue_pairing_code = [](const std::string& peer_id) {
        if (!g_pairing) return juhradial::fail<std::string>(Error::UnknownPeer);
        auto code = g_pairing->issue_code(peer_id, Clock::now());
        if (!code) return juhradial::fail<std::string>(code.error);
        peers_changed();
        return juhradial::Result<std::string>{code.value.value, Error::None};
    };
    g_dbus_callbacks.on_pair_with_peer = [](const std::string& peer_id, const std::string& code) {
        return g_directory ? pair_with_peer(peer_id, code) : Error::UnknownPeer;
    };
    g_dbus_callbacks.on_unpair = [](const std::string& peer_id) {
        return g_trust ? unpair(peer_id) : Error::UnknownPeer;
    };
    g_dbus_callbacks.on_sync_clipboard = []() -> uint32_t {
        return g_orchestrator ? static_cast<uint32_t>(g_orchestrator->poll_clipboard()) : 0;
    };
}

static int cmd_daemon() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    std::cout << "juhradial daemon starting..." << std::endl;

    auto config = juhradial::config::load(juhradial::config::default_path());
    if (!config) {
        std::cerr << "Invalid configuration, using defaults" << std::endl;
    } else {
        g_config = config.value;
    }

    g_gesture = std::make_unique<gesture::StateMachine>(gesture_options());
    g_gesture_timer = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    g_maintenance_timer = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (g_gesture_timer < 0 || g_maintenance_timer < 0) {
        std::cerr << "Failed to create timers: " << strerror(errno) << std::endl;
        return 1;
    }
    int tick_ms = std::min(g_config.flow.sweep_interval_ms, g_config.flow.clipboard_poll_ms);
    arm_timer(g_maintenance_timer, std::chrono::milliseconds(tick_ms), std::chrono::milliseconds(tick_ms));

    // System bus is only needed for Avahi
    DBusError err;
    dbus_error_init(&err);
    g_system_dbus = dbus_bus_get(DBUS_BUS_SYSTEM, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to system D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        g_system_dbus = nullptr;
    }

    setup_dbus_callbacks();
    g_session_dbus = dbus_service::init(&g_dbus_callbacks, &g_dbus_state);
    if (!g_session_dbus) {
        std::cerr << "Failed to initialize D-Bus service" << std::endl;
        return 1;
    }

    if (!dbus_service::request_name(g_session_dbus)) {
        std::cerr << "Failed to request D-Bus name" << std::endl;
        return 1;
    }
    dbus_service::set_haptics_enabled(g_session_dbus, &g_dbus_state, g_config.haptics.enabled);

    connect_device();

    if (g_config.flow.enabled && !start_flow()) {
        stop_flow();
    }

    std::cout << "Daemon ready. D-Bus service: " << dbus_service::SERVICE_NAME << std::endl;

    run_event_loop();

    stop_flow();
    g_haptics.reset();
    g_host_switch.reset();
    g_session.reset();
    close(g_gesture_timer);
    close(g_maintenance_timer);
    dbus_service::cleanup(g_session_dbus);
    if (g_system_dbus) dbus_connection_unref(g_system_dbus);

    std::cout << "Daemon stopped" << std::endl;
    return 0;
}

// ============================================================================
// CLI clients
// ============================================================================

static DBusConnection* open_session_bus() {
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to session D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return conn;
}

// Sends msg to the daemon, returns the reply or nullptr after printing the error
static DBusMessage* call_daemon(DBusConnection* conn, DBusMessage* msg, const char* what, int timeout_ms = 5000) {
    DBusError err;
    dbus_error_init(&err);

    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, timeout_ms, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << what << " failed (is the daemon running?): " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

static DBusMessage* new_call(const char* method) {
    return dbus_message_new_method_call(dbus_service::SERVICE_NAME, dbus_service::OBJECT_PATH,
                                        dbus_service::INTERFACE_NAME, method);
}

static void print_variant(const char* name, DBusMessageIter* variant) {
    int type = dbus_message_iter_get_arg_type(variant);
    if (type == DBUS_TYPE_STRING) {
        const char* val;
        dbus_message_iter_get_basic(variant, &val);
        std::cout << name << ": " << val << std::endl;
    } else if (type == DBUS_TYPE_BOOLEAN) {
        dbus_bool_t val;
        dbus_message_iter_get_basic(variant, &val);
        std::cout << name << ": " << (val ? "true" : "false") << std::endl;
    } else if (type == DBUS_TYPE_INT32) {
        dbus_int32_t val;
        dbus_message_iter_get_basic(variant, &val);
        std::cout << name << ": " << val << std::endl;
    } else if (type == DBUS_TYPE_UINT32) {
        dbus_uint32_t val;
        dbus_message_iter_get_basic(variant, &val);
        std::cout << name << ": " << val << std::endl;
    }
}

static int cmd_status(const char* only = nullptr) {
    DBusConnection* conn = open_session_bus();
    if (!conn) return 1;

    DBusMessage* msg = dbus_message_new_method_call(dbus_service::SERVICE_NAME, dbus_service::OBJECT_PATH,
                                                    "org.freedesktop.DBus.Properties", "GetAll");
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }

    const char* iface = dbus_service::INTERFACE_NAME;
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface, DBUS_TYPE_INVALID);

    DBusMessage* reply = call_daemon(conn, msg, "Status", 2000);
    if (!reply) {
        dbus_connection_unref(conn);
        return 1;
    }

    DBusMessageIter iter, dict;
    if (dbus_message_iter_init(reply, &iter) && dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {
        dbus_message_iter_recurse(&iter, &dict);

        while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
            DBusMessageIter entry, variant;
            dbus_message_iter_recurse(&dict, &entry);

            const char* prop_name;
            dbus_message_iter_get_basic(&entry, &prop_name);
            dbus_message_iter_next(&entry);
            dbus_message_iter_recurse(&entry, &variant);

            if (!only || strcmp(only, prop_name) == 0) {
                print_variant(prop_name, &variant);
            }
            dbus_message_iter_next(&dict);
        }
    }

    dbus_message_unref(reply);
    dbus_connection_unref(conn);
    return 0;
}

static int cmd_hosts() {
    DBusConnection* conn = open_session_bus();
    if (!conn) return 1;

    DBusMessage* msg = new_call("ListHosts");
    DBusMessage* reply = msg ? call_daemon(conn, msg, "ListHosts") : nullptr;
    if (!reply) {
        dbus_connection_unref(conn);
        return 1;
    }

    DBusMessageIter iter, array;
    int count = 0;
    if (dbus_message_iter_init(reply, &iter) && dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {
        dbus_message_iter_recurse(&iter, &array);
        while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_STRUCT) {
            DBusMessageIter entry;
            dbus_message_iter_recurse(&array, &entry);

            uint8_t index;
            const char* name;
            dbus_bool_t current;
            dbus_message_iter_get_basic(&entry, &index);
            dbus_message_iter_next(&entry);
            dbus_message_iter_get_basic(&entry, &name);
            dbus_message_iter_next(&entry);
            dbus_message_iter_get_basic(&entry, &current);

            std::cout << (current ? "* " : "  ") << static_cast<int>(index) << "  " << name << std::endl;
            ++count;
            dbus_message_iter_next(&array);
        }
    }
    if (count == 0) {
        std::cout << "No host information (device not connected?)" << std::endl;
    }

    dbus_message_unref(reply);
    dbus_connection_unref(conn);
    return 0;
}

static int cmd_switch(const char* arg) {
    char* end = nullptr;
    long value = strtol(arg, &end, 10);
    if (!end || *end != '\0' || value < 0 || value > 255) {
        std::cerr << "Invalid host index: " << arg << std::endl;
        return 1;
    }

    DBusConnection* conn = open_session_bus();
    if (!conn) return 1;

    DBusMessage* msg = new_call("SwitchHost");
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }
    dbus_int32_t index = static_cast<dbus_int32_t>(value);
    dbus_message_append_args(msg, DBUS_TYPE_INT32, &index, DBUS_TYPE_INVALID);

    DBusMessage* reply = call_daemon(conn, msg, "SwitchHost", 10000);
    dbus_connection_unref(conn);
    if (!reply) return 1;
    dbus_message_unref(reply);

    std::cout << "Switched to host " << value << std::endl;
    return 0;
}

static int cmd_dpi(const char* arg) {
    if (!arg) {
        return cmd_status("Dpi");
    }

    char* end = nullptr;
    long value = strtol(arg, &end, 10);
    if (!end || *end != '\0' || value <= 0 || value > 0xFFFF) {
        std::cerr << "Invalid DPI: " << arg << std::endl;
        return 1;
    }

    DBusConnection* conn = open_session_bus();
    if (!conn) return 1;

    DBusMessage* msg = new_call("SetDpi");
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }
    dbus_uint16_t dpi = static_cast<dbus_uint16_t>(value);
    dbus_message_append_args(msg, DBUS_TYPE_UINT16, &dpi, DBUS_TYPE_INVALID);

    DBusMessage* reply = call_daemon(conn, msg, "SetDpi");
    dbus_connection_unref(conn);
    if (!reply) return 1;
    dbus_message_unref(reply);

    std::cout << "DPI set to " << value << std::endl;
    return 0;
}

static int cmd_peers() {
    DBusConnection* conn = open_session_bus();
    if (!conn) return 1;

    DBusMessage* msg = new_call("ListPeers");
    DBusMessage* reply = msg ? call_daemon(conn, msg, "ListPeers") : nullptr;
    if (!reply) {
        dbus_connection_unref(conn);
        return 1;
    }

    DBusMessageIter iter, array;
    int count = 0;
    if (dbus_message_iter_init(reply, &iter) && dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {
        dbus_message_iter_recurse(&iter, &array);
        while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_STRUCT) {
            DBusMessageIter entry;
            dbus_message_iter_recurse(&array, &entry);

            const char* id;
            const char* hostname;
            const char* address;
            dbus_int32_t slot;
            const char* state;
            dbus_message_iter_get_basic(&entry, &id);
            dbus_message_iter_next(&entry);
            dbus_message_iter_get_basic(&entry, &hostname);
            dbus_message_iter_next(&entry);
            dbus_message_iter_get_basic(&entry, &address);
            dbus_message_iter_next(&entry);
            dbus_message_iter_get_basic(&entry, &slot);
            dbus_message_iter_next(&entry);
            dbus_message_iter_get_basic(&entry, &state);

            std::cout << id << "  " << hostname << "  " << address;
            if (slot >= 0) std::cout << "  slot " << slot;
            std::cout << "  [" << state << "]" << std::endl;
            ++count;
            dbus_message_iter_next(&array);
        }
    }
    if (count == 0) {
        std::cout << "No peers discovered" << std::endl;
    }

    dbus_message_unref(reply);
    dbus_connection_unref(conn);
    return 0;
}

static int cmd_pair_code(const char* peer) {
    DBusConnection* conn = open_session_bus();
    if (!conn) return 1;

    DBusMessage* msg = new_call("IssuePairingCode");
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &peer, DBUS_TYPE_INVALID);

    DBusMessage* reply = call_daemon(conn, msg, "IssuePairingCode");
    dbus_connection_unref(conn);
    if (!reply) return 1;

    const char* code = nullptr;
    if (!dbus_message_get_args(reply, nullptr, DBUS_TYPE_STRING, &code, DBUS_TYPE_INVALID)) {
        dbus_message_unref(reply);
        return 1;
    }
    std::cout << "Pairing code for " << peer << ": " << code << "\n"
              << "Enter it on the other machine with: juhradiald pair <this machine's peer id> " << code
              << std::endl;
    dbus_message_unref(reply);
    return 0;
}

static int cmd_pair(const char* peer, const char* code) {
    DBusConnection* conn = open_session_bus();
    if (!conn) return 1;

    DBusMessage* msg = new_call("PairWithPeer");
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &peer, DBUS_TYPE_STRING, &code, DBUS_TYPE_INVALID);

    DBusMessage* reply = call_daemon(conn, msg, "PairWithPeer", 10000);
    dbus_connection_unref(conn);
    if (!reply) return 1;
    dbus_message_unref(reply);

    std::cout << "Paired with " << peer << std::endl;
    return 0;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  daemon              Run the juhradial daemon\n"
              << "  status              Show current status\n"
              << "  hosts               List Easy-Switch host slots\n"
              << "  switch <n>          Switch the mouse to host slot n (0-based)\n"
              << "  dpi [value]         Show or set the sensor DPI\n"
              << "  peers               List Flow peers on the network\n"
              << "  pair-code <peer>    Show a pairing code for a peer\n"
              << "  pair <peer> <code>  Pair with a peer using the code it shows\n"
              << "  help                Show this help\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "daemon") {
        return cmd_daemon();
    } else if (cmd == "status") {
        return cmd_status();
    } else if (cmd == "hosts") {
        return cmd_hosts();
    } else if (cmd == "switch") {
        if (argc < 3) {
            std::cerr << "Usage: " << argv[0] << " switch <n>\n";
            return 1;
        }
        return cmd_switch(argv[2]);
    } else if (cmd == "dpi") {
        return cmd_dpi(argc >= 3 ? argv[2] : nullptr);
    } else if (cmd == "peers") {
        return cmd_peers();
    } else if (cmd == "pair-code") {
        if (argc < 3) {
            std::cerr << "Usage: " << argv[0] << " pair-code <peer>\n";
            return 1;
        }
        return cmd_pair_code(argv[2]);
    } else if (cmd == "pair") {
        if (argc < 4) {
            std::cerr << "Usage: " << argv[0] << " pair <peer> <code>\n";
            return 1;
        }
        return cmd_pair(argv[2], argv[3]);
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    } else {
        std::cerr << "Unknown command: " << cmd << std::endl;
        print_usage(argv[0]);
        return 1;
    }
}
