#pragma once

#include <dbus/dbus.h>
#include <types/device.hpp>
#include <types/menu.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dbus_service {

// D-Bus service configuration
constexpr const char* SERVICE_NAME = "org.juhradial.Daemon";
constexpr const char* OBJECT_PATH = "/org/juhradial/Daemon";
constexpr const char* INTERFACE_NAME = "org.juhradial.Daemon";
constexpr const char* ERROR_PREFIX = "org.juhradial.Daemon.Error.";

struct PeerEntry {
    std::string peer_id;
    std::string hostname;
    std::string address;
    int32_t host_slot = -1;
    std::string state;
};

// Callbacks for method invocations
struct Callbacks {
    std::function<void()> on_connect;
    std::function<void()> on_disconnect;
    std::function<juhradial::Error(int32_t index)> on_switch_host;
    std::function<std::vector<juhradial::HostSlot>()> on_list_hosts;
    std::function<juhradial::Error(uint16_t dpi)> on_set_dpi;
    std::function<void(const std::string& action)> on_select;
    std::function<void(juhradial::Position)> on_report_pointer;
    std::function<void(uint8_t slice)> on_slice_hover;
    std::function<juhradial::Error()> on_reload_config;
    // `client` is the caller's unique bus name
    std::function<bool(const std::string& client)> on_attach_discovery;
    std::function<void(const std::string& client)> on_detach_discovery;
    std::function<void(const std::string& client)> on_client_vanished;
    std::function<std::vector<PeerEntry>()> on_list_peers;
    std::function<juhradial::Result<std::string>(const std::string& peer_id)> on_issue_pairing_code;
    std::function<juhradial::Error(const std::string& peer_id, const std::string& code)> on_pair_with_peer;
    std::function<juhradial::Error(const std::string& peer_id)> on_unpair;
    std::function<uint32_t()> on_sync_clipboard;
};

// Current state exposed via D-Bus
struct State {
    bool connected = false;
    std::string device_name;
    int32_t battery = -1;
    bool charging = false;
    uint32_t dpi = 0;
    uint32_t host_count = 0;
    int32_t current_host = -1;
    bool menu_open = false;
    std::string focus_owner = "unowned";
    std::string peer_id;
    bool haptics_enabled = false;
};

// Initialize D-Bus service, returns connection (caller owns)
DBusConnection* init(Callbacks* callbacks, State* state);

// Request the service name on the bus
bool request_name(DBusConnection* conn);

// Emit PropertiesChanged signal for given properties
void emit_properties_changed(DBusConnection* conn, const State& state, const std::vector<const char*>& names);

// Update state from DeviceState and emit signals
void update_from_device_state(DBusConnection* conn, State* state, const juhradial::DeviceState& device);

void set_menu_open(DBusConnection* conn, State* state, bool open);
void set_focus_owner(DBusConnection* conn, State* state, const std::string& owner);
void set_haptics_enabled(DBusConnection* conn, State* state, bool enabled);

// Unique name of a client that left the bus, from a NameOwnerChanged signal
std::optional<std::string> vanished_client(DBusMessage* msg);

// Overlay signals
void emit_menu_open(DBusConnection* conn, juhradial::Position position);
void emit_menu_close(DBusConnection* conn);
void emit_menu_select(DBusConnection* conn, const std::string& action);
void emit_pointer_moved(DBusConnection* conn, juhradial::Position position);
void emit_action_selected(DBusConnection* conn, const std::string& action);
void emit_peers_changed(DBusConnection* conn);

// Process pending D-Bus messages (call in event loop)
void process_pending(DBusConnection* conn);

// Get file descriptor for polling
int get_fd(DBusConnection* conn);

// Cleanup
void cleanup(DBusConnection* conn);

} // namespace dbus_service
