#include "dbus.hpp"
#include <cstdarg>
#include <cstring>
#include <iostream>

namespace dbus_service {

using juhradial::Error;

// Global pointers for callbacks (set in init)
static Callbacks* g_callbacks = nullptr;
static State* g_state = nullptr;
static bool g_watching_clients = false;

// Introspection XML
static const char* INTROSPECT_XML =
    "<!DOCTYPE node PUBLIC \"-//freedesktop//DTD D-BUS Object Introspection 1.0//EN\"\n"
    "\"http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd\">\n"
    "<node>\n"
    "  <interface name=\"org.juhradial.Daemon\">\n"
    "    <method name=\"Connect\"/>\n"
    "    <method name=\"Disconnect\"/>\n"
    "    <method name=\"SwitchHost\">\n"
    "      <arg name=\"index\" type=\"i\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"ListHosts\">\n"
    "      <arg name=\"hosts\" type=\"a(ysb)\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"SetDpi\">\n"
    "      <arg name=\"dpi\" type=\"q\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"Select\">\n"
    "      <arg name=\"action\" type=\"s\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"ReportPointer\">\n"
    "      <arg name=\"x\" type=\"i\" direction=\"in\"/>\n"
    "      <arg name=\"y\" type=\"i\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"NotifySliceHover\">\n"
    "      <arg name=\"index\" type=\"y\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"ReloadConfig\"/>\n"
    "    <method name=\"AttachDiscovery\">\n"
    "      <arg name=\"active\" type=\"b\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"DetachDiscovery\"/>\n"
    "    <method name=\"ListPeers\">\n"
    "      <arg name=\"peers\" type=\"a(sssis)\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"IssuePairingCode\">\n"
    "      <arg name=\"peer\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"code\" type=\"s\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"PairWithPeer\">\n"
    "      <arg name=\"peer\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"code\" type=\"s\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"Unpair\">\n"
    "      <arg name=\"peer\" type=\"s\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"SyncClipboard\">\n"
    "      <arg name=\"reached\" type=\"u\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <signal name=\"MenuOpen\">\n"
    "      <arg name=\"x\" type=\"i\"/>\n"
    "      <arg name=\"y\" type=\"i\"/>\n"
    "    </signal>\n"
    "    <signal name=\"MenuClose\"/>\n"
    "    <signal name=\"MenuSelect\">\n"
    "      <arg name=\"action\" type=\"s\"/>\n"
    "    </signal>\n"
    "    <signal name=\"PointerMoved\">\n"
    "      <arg name=\"x\" type=\"i\"/>\n"
    "      <arg name=\"y\" type=\"i\"/>\n"
    "    </signal>\n"
    "    <signal name=\"ActionSelected\">\n"
    "      <arg name=\"action\" type=\"s\"/>\n"
    "    </signal>\n"
    "    <signal name=\"PeersChanged\"/>\n"
    "    <property name=\"Connected\" type=\"b\" access=\"read\"/>\n"
    "    <property name=\"DeviceName\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"Battery\" type=\"i\" access=\"read\"/>\n"
    "    <property name=\"Charging\" type=\"b\" access=\"read\"/>\n"
    "    <property name=\"Dpi\" type=\"u\" access=\"read\"/>\n"
    "    <property name=\"HostCount\" type=\"u\" access=\"read\"/>\n"
    "    <property name=\"CurrentHost\" type=\"i\" access=\"read\"/>\n"
    "    <property name=\"MenuOpen\" type=\"b\" access=\"read\"/>\n"
    "    <property name=\"FocusOwner\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"PeerId\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"HapticsEnabled\" type=\"b\" access=\"read\"/>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Properties\">\n"
    "    <method name=\"Get\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"value\" type=\"v\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"GetAll\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"properties\" type=\"a{sv}\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <signal name=\"PropertiesChanged\">\n"
    "      <arg name=\"interface\" type=\"s\"/>\n"
    "      <arg name=\"changed_properties\" type=\"a{sv}\"/>\n"
    "      <arg name=\"invalidated_properties\" type=\"as\"/>\n"
    "    </signal>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Introspectable\">\n"
    "    <method name=\"Introspect\">\n"
    "      <arg name=\"xml\" type=\"s\" direction=\"out\"/>\n"
    "    </method>\n"
    "  </interface>\n"
    "</node>\n";

static const char* PROPERTY_NAMES[] = {
    "Connected", "DeviceName", "Battery", "Charging", "Dpi",
    "HostCount", "CurrentHost", "MenuOpen", "FocusOwner", "PeerId", "HapticsEnabled",
};

static const char* NAME_OWNER_MATCH =
    "type='signal',sender='org.freedesktop.DBus',interface='org.freedesktop.DBus',member='NameOwnerChanged'";

static void append_variant_string(DBusMessageIter* iter, const std::string& value) {
    const char* str = value.c_str();
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &str);
    dbus_message_iter_close_container(iter, &variant);
}

static void append_variant_bool(DBusMessageIter* iter, bool value) {
    dbus_bool_t val = value;
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &val);
    dbus_message_iter_close_container(iter, &variant);
}

static void append_variant_int32(DBusMessageIter* iter, dbus_int32_t value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "i", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_INT32, &value);
    dbus_message_iter_close_container(iter, &variant);
}

static void append_variant_uint32(DBusMessageIter* iter, dbus_uint32_t value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "u", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_UINT32, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Appends the property value as a variant. False for unknown names.
static bool append_property(DBusMessageIter* iter, const State& state, const char* prop) {
    if (strcmp(prop, "Connected") == 0) {
        append_variant_bool(iter, state.connected);
    } else if (strcmp(prop, "DeviceName") == 0) {
        append_variant_string(iter, state.device_name);
    } else if (strcmp(prop, "Battery") == 0) {
        append_variant_int32(iter, state.battery);
    } else if (strcmp(prop, "Charging") == 0) {
        append_variant_bool(iter, state.charging);
    } else if (strcmp(prop, "Dpi") == 0) {
        append_variant_uint32(iter, state.dpi);
    } else if (strcmp(prop, "HostCount") == 0) {
        append_variant_uint32(iter, state.host_count);
    } else if (strcmp(prop, "CurrentHost") == 0) {
        append_variant_int32(iter, state.current_host);
    } else if (strcmp(prop, "MenuOpen") == 0) {
        append_variant_bool(iter, state.menu_open);
    } else if (strcmp(prop, "FocusOwner") == 0) {
        append_variant_string(iter, state.focus_owner);
    } else if (strcmp(prop, "PeerId") == 0) {
        append_variant_string(iter, state.peer_id);
    } else if (strcmp(prop, "HapticsEnabled") == 0) {
        append_variant_bool(iter, state.haptics_enabled);
    } else {
        return false;
    }
    return true;
}

static void append_dict_entry(DBusMessageIter* dict, const State& state, const char* prop) {
    DBusMessageIter entry;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &prop);
    append_property(&entry, state, prop);
    dbus_message_iter_close_container(dict, &entry);
}

static DBusMessage* error_reply(DBusMessage* msg, Error error) {
    std::string name = std::string(ERROR_PREFIX) + std::string(juhradial::to_string(error));
    std::string text(juhradial::to_string(error));
    return dbus_message_new_error(msg, name.c_str(), text.c_str());
}

static DBusMessage* status_reply(DBusMessage* msg, Error error) {
    if (error != Error::None) return error_reply(msg, error);
    return dbus_message_new_method_return(msg);
}

// Handle Get property
static DBusMessage* handle_get(DBusMessage* msg, const State& state) {
    const char* iface;
    const char* prop;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &iface,
            DBUS_TYPE_STRING, &prop,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);

    if (!append_property(&iter, state, prop)) {
        dbus_message_unref(reply);
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_PROPERTY, "Unknown property");
    }
    return reply;
}

// Handle GetAll properties
static DBusMessage* handle_get_all(DBusMessage* msg, const State& state) {
    const char* iface;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &iface,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter, dict;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    for (const char* prop : PROPERTY_NAMES) {
        append_dict_entry(&dict, state, prop);
    }
    dbus_message_iter_close_container(&iter, &dict);
    return reply;
}

static DBusMessage* handle_list_hosts(DBusMessage* msg) {
    std::vector<juhradial::HostSlot> hosts;
    if (g_callbacks && g_callbacks->on_list_hosts) hosts = g_callbacks->on_list_hosts();

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter, array, entry;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "(ysb)", &array);

    for (const auto& host : hosts) {
        uint8_t index = host.index;
        const char* name = host.name.c_str();
        dbus_bool_t current = host.is_current;
        dbus_message_iter_open_container(&array, DBUS_TYPE_STRUCT, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_BYTE, &index);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &name);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_BOOLEAN, &current);
        dbus_message_iter_close_container(&array, &entry);
    }

    dbus_message_iter_close_container(&iter, &array);
    return reply;
}

static DBusMessage* handle_list_peers(DBusMessage* msg) {
    std::vector<PeerEntry> peers;
    if (g_callbacks && g_callbacks->on_list_peers) peers = g_callbacks->on_list_peers();

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter, array, entry;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "(sssis)", &array);

    for (const auto& peer : peers) {
        const char* id = peer.peer_id.c_str();
        const char* hostname = peer.hostname.c_str();
        const char* address = peer.address.c_str();
        dbus_int32_t slot = peer.host_slot;
        const char* state = peer.state.c_str();
        dbus_message_iter_open_container(&array, DBUS_TYPE_STRUCT, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &id);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &hostname);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &address);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_INT32, &slot);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &state);
        dbus_message_iter_close_container(&array, &entry);
    }

    dbus_message_iter_close_container(&iter, &array);
    return reply;
}

static std::string sender_of(DBusMessage* msg) {
    const char* sender = dbus_message_get_sender(msg);
    return sender ? sender : "";
}

// Methods of our own interface, nullptr for unknown members
static DBusMessage* handle_method(DBusMessage* msg, const char* member) {
    Callbacks* cb = g_callbacks;

    if (strcmp(member, "Connect") == 0) {
        std::cout << "dbus: Connect() called" << std::endl;
        if (cb && cb->on_connect) cb->on_connect();
        return dbus_message_new_method_return(msg);
    }
    if (strcmp(member, "Disconnect") == 0) {
        std::cout << "dbus: Disconnect() called" << std::endl;
        if (cb && cb->on_disconnect) cb->on_disconnect();
        return dbus_message_new_method_return(msg);
    }
    if (strcmp(member, "SwitchHost") == 0) {
        dbus_int32_t index;
        if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_INT32, &index, DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected int32 argument");
        }
        std::cout << "dbus: SwitchHost(" << index << ") called" << std::endl;
        Error err = cb && cb->on_switch_host ? cb->on_switch_host(index) : Error::DeviceUnavailable;
        return status_reply(msg, err);
    }
    if (strcmp(member, "ListHosts") == 0) {
        return handle_list_hosts(msg);
    }
    if (strcmp(member, "SetDpi") == 0) {
        dbus_uint16_t dpi;
        if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_UINT16, &dpi, DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected uint16 argument");
        }
        std::cout << "dbus: SetDpi(" << dpi << ") called" << std::endl;
        Error err = cb && cb->on_set_dpi ? cb->on_set_dpi(dpi) : Error::DeviceUnavailable;
        return status_reply(msg, err);
    }
    if (strcmp(member, "Select") == 0) {
        const char* action;
        if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &action, DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected string argument");
        }
        if (cb && cb->on_select) cb->on_select(action);
        return dbus_message_new_method_return(msg);
    }
    if (strcmp(member, "ReportPointer") == 0) {
        dbus_int32_t x, y;
        if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_INT32, &x, DBUS_TYPE_INT32, &y, DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected two int32 arguments");
        }
        if (cb && cb->on_report_pointer) cb->on_report_pointer(juhradial::Position{x, y});
        return dbus_message_new_method_return(msg);
    }
    if (strcmp(member, "NotifySliceHover") == 0) {
        uint8_t index;
        if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_BYTE, &index, DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected byte argument");
        }
        if (cb && cb->on_slice_hover) cb->on_slice_hover(index);
        return dbus_message_new_method_return(msg);
    }
    if (strcmp(member, "ReloadConfig") == 0) {
        std::cout << "dbus: ReloadConfig() called" << std::endl;
        Error err = cb && cb->on_reload_config ? cb->on_reload_config() : Error::NotFound;
        return status_reply(msg, err);
    }
    if (strcmp(member, "AttachDiscovery") == 0) {
        std::string client = sender_of(msg);
        std::cout << "dbus: AttachDiscovery() from " << client << std::endl;
        dbus_bool_t active = cb && cb->on_attach_discovery ? cb->on_attach_discovery(client) : false;
        DBusMessage* reply = dbus_message_new_method_return(msg);
        dbus_message_append_args(reply, DBUS_TYPE_BOOLEAN, &active, DBUS_TYPE_INVALID);
        return reply;
    }
    if (strcmp(member, "DetachDiscovery") == 0) {
        std::string client = sender_of(msg);
        std::cout << "dbus: DetachDiscovery() from " << client << std::endl;
        if (cb && cb->on_detach_discovery) cb->on_detach_discovery(client);
        return dbus_message_new_method_return(msg);
    }
    if (strcmp(member, "ListPeers") == 0) {
        return handle_list_peers(msg);
    }
    if (strcmp(member, "IssuePairingCode") == 0) {
        const char* peer;
        if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &peer, DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected string argument");
        }
        std::cout << "dbus: IssuePairingCode(" << peer << ") called" << std::endl;
        if (!cb || !cb->on_issue_pairing_code) return error_reply(msg, Error::UnknownPeer);

        auto code = cb->on_issue_pairing_code(peer);
        if (!code) return error_reply(msg, code.error);

        const char* value = code.value.c_str();
        DBusMessage* reply = dbus_message_new_method_return(msg);
        dbus_message_append_args(reply, DBUS_TYPE_STRING, &value, DBUS_TYPE_INVALID);
        return reply;
    }
    if (strcmp(member, "PairWithPeer") == 0) {
        const char* peer;
        const char* code;
        if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &peer, DBUS_TYPE_STRING, &code,
                                   DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected two string arguments");
        }
        std::cout << "dbus: PairWithPeer(" << peer << ") called" << std::endl;
        Error err = cb && cb->on_pair_with_peer ? cb->on_pair_with_peer(peer, code) : Error::UnknownPeer;
        return status_reply(msg, err);
    }
    if (strcmp(member, "Unpair") == 0) {
        const char* peer;
        if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &peer, DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected string argument");
        }
        std::cout << "dbus: Unpair(" << peer << ") called" << std::endl;
        Error err = cb && cb->on_unpair ? cb->on_unpair(peer) : Error::UnknownPeer;
        return status_reply(msg, err);
    }
    if (strcmp(member, "SyncClipboard") == 0) {
        dbus_uint32_t reached = cb && cb->on_sync_clipboard ? cb->on_sync_clipboard() : 0;
        DBusMessage* reply = dbus_message_new_method_return(msg);
        dbus_message_append_args(reply, DBUS_TYPE_UINT32, &reached, DBUS_TYPE_INVALID);
        return reply;
    }
    return nullptr;
}

// Message handler
static DBusHandlerResult message_handler(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)data;

    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);
    const char* path = dbus_message_get_path(msg);

    if (!path || strcmp(path, OBJECT_PATH) != 0 || !iface || !member) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    DBusMessage* reply = nullptr;

    if (strcmp(iface, "org.freedesktop.DBus.Introspectable") == 0 && strcmp(member, "Introspect") == 0) {
        reply = dbus_message_new_method_return(msg);
        dbus_message_append_args(reply, DBUS_TYPE_STRING, &INTROSPECT_XML, DBUS_TYPE_INVALID);
    } else if (strcmp(iface, "org.freedesktop.DBus.Properties") == 0) {
        if (strcmp(member, "Get") == 0) {
            reply = handle_get(msg, *g_state);
        } else if (strcmp(member, "GetAll") == 0) {
            reply = handle_get_all(msg, *g_state);
        } else if (strcmp(member, "Set") == 0) {
            reply = dbus_message_new_error(msg, DBUS_ERROR_PROPERTY_READ_ONLY, "Property is read-only");
        }
    } else if (strcmp(iface, INTERFACE_NAME) == 0) {
        reply = handle_method(msg, member);
    }

    if (reply) {
        dbus_connection_send(conn, reply, nullptr);
        dbus_message_unref(reply);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

std::optional<std::string> vanished_client(DBusMessage* msg) {
    if (!dbus_message_is_signal(msg, DBUS_INTERFACE_DBUS, "NameOwnerChanged")) {
        return std::nullopt;
    }

    const char* name;
    const char* old_owner;
    const char* new_owner;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &name, DBUS_TYPE_STRING, &old_owner,
                               DBUS_TYPE_STRING, &new_owner, DBUS_TYPE_INVALID)) {
        return std::nullopt;
    }

    // Unique names are never handed over, an empty new owner means the client is gone
    if (name[0] != ':' || new_owner[0] != '\0') {
        return std::nullopt;
    }
    return std::string(name);
}

// Bus signals are seen by every filter, never consume them
static DBusHandlerResult bus_filter(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)conn;
    (void)data;

    if (auto client = vanished_client(msg)) {
        if (g_callbacks && g_callbacks->on_client_vanished) g_callbacks->on_client_vanished(*client);
    }
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

DBusConnection* init(Callbacks* callbacks, State* state) {
    g_callbacks = callbacks;
    g_state = state;

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: connection error: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }

    DBusObjectPathVTable vtable = {};
    vtable.message_function = message_handler;

    if (!dbus_connection_register_object_path(conn, OBJECT_PATH, &vtable, nullptr)) {
        std::cerr << "dbus: failed to register object path" << std::endl;
        dbus_connection_unref(conn);
        return nullptr;
    }

    // Discovery attachments die with the client that made them
    dbus_bus_add_match(conn, NAME_OWNER_MATCH, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: cannot watch NameOwnerChanged: " << err.message << std::endl;
        dbus_error_free(&err);
    } else {
        g_watching_clients = dbus_connection_add_filter(conn, bus_filter, nullptr, nullptr);
    }

    return conn;
}

bool request_name(DBusConnection* conn) {
    DBusError err;
    dbus_error_init(&err);

    int ret = dbus_bus_request_name(conn, SERVICE_NAME, DBUS_NAME_FLAG_REPLACE_EXISTING, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: name error: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (ret != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER) {
        std::cerr << "dbus: not primary owner of " << SERVICE_NAME << std::endl;
        return false;
    }

    std::cout << "dbus: registered service " << SERVICE_NAME << std::endl;
    return true;
}

void emit_properties_changed(DBusConnection* conn, const State& state, const std::vector<const char*>& names) {
    if (!conn || names.empty()) return;

    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH,
        "org.freedesktop.DBus.Properties", "PropertiesChanged");
    if (!signal) return;

    DBusMessageIter iter, dict;
    dbus_message_iter_init_append(signal, &iter);

    const char* iface = INTERFACE_NAME;
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);

    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    for (const char* prop : names) {
        append_dict_entry(&dict, state, prop);
    }
    dbus_message_iter_close_container(&iter, &dict);

    DBusMessageIter invalidated;
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &invalidated);
    dbus_message_iter_close_container(&iter, &invalidated);

    dbus_connection_send(conn, signal, nullptr);
    dbus_message_unref(signal);
}

template<typename T>
static void assign(T& field, const T& value, const char* name, std::vector<const char*>& changed) {
    if (field != value) {
        field = value;
        changed.push_back(name);
    }
}

void update_from_device_state(DBusConnection* conn, State* state, const juhradial::DeviceState& device) {
    std::vector<const char*> changed;

    assign(state->connected, device.connected, "Connected", changed);
    assign(state->device_name, device.device_name, "DeviceName", changed);
    assign(state->battery, static_cast<int32_t>(device.battery.level), "Battery", changed);
    assign(state->charging, device.battery.charging, "Charging", changed);
    assign(state->dpi, static_cast<uint32_t>(device.dpi), "Dpi", changed);
    assign(state->host_count, static_cast<uint32_t>(device.hosts.count), "HostCount", changed);

    int32_t current = device.hosts.count > 0 ? device.hosts.current : -1;
    assign(state->current_host, current, "CurrentHost", changed);

    emit_properties_changed(conn, *state, changed);
}

void set_menu_open(DBusConnection* conn, State* state, bool open) {
    std::vector<const char*> changed;
    assign(state->menu_open, open, "MenuOpen", changed);
    emit_properties_changed(conn, *state, changed);
}

void set_focus_owner(DBusConnection* conn, State* state, const std::string& owner) {
    std::vector<const char*> changed;
    assign(state->focus_owner, owner, "FocusOwner", changed);
    emit_properties_changed(conn, *state, changed);
}

void set_haptics_enabled(DBusConnection* conn, State* state, bool enabled) {
    std::vector<const char*> changed;
    assign(state->haptics_enabled, enabled, "HapticsEnabled", changed);
    emit_properties_changed(conn, *state, changed);
}

static void send_signal(DBusConnection* conn, const char* name, int first_type, ...) {
    if (!conn) return;

    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH, INTERFACE_NAME, name);
    if (!signal) return;

    va_list args;
    va_start(args, first_type);
    bool ok = first_type == DBUS_TYPE_INVALID || dbus_message_append_args_valist(signal, first_type, args);
    va_end(args);

    if (ok) {
        dbus_connection_send(conn, signal, nullptr);
    } else {
        std::cerr << "dbus: failed to build " << name << " signal" << std::endl;
    }
    dbus_message_unref(signal);
}

void emit_menu_open(DBusConnection* conn, juhradial::Position position) {
    dbus_int32_t x = position.x;
    dbus_int32_t y = position.y;
    send_signal(conn, "MenuOpen", DBUS_TYPE_INT32, &x, DBUS_TYPE_INT32, &y, DBUS_TYPE_INVALID);
}

void emit_menu_close(DBusConnection* conn) {
    send_signal(conn, "MenuClose", DBUS_TYPE_INVALID);
}

void emit_menu_select(DBusConnection* conn, const std::string& action) {
    const char* str = action.c_str();
    send_signal(conn, "MenuSelect", DBUS_TYPE_STRING, &str, DBUS_TYPE_INVALID);
}

void emit_pointer_moved(DBusConnection* conn, juhradial::Position position) {
    dbus_int32_t x = position.x;
    dbus_int32_t y = position.y;
    send_signal(conn, "PointerMoved", DBUS_TYPE_INT32, &x, DBUS_TYPE_INT32, &y, DBUS_TYPE_INVALID);
}

void emit_action_selected(DBusConnection* conn, const std::string& action) {
    const char* str = action.c_str();
    send_signal(conn, "ActionSelected", DBUS_TYPE_STRING, &str, DBUS_TYPE_INVALID);
}

void emit_peers_changed(DBusConnection* conn) {
    send_signal(conn, "PeersChanged", DBUS_TYPE_INVALID);
}

void process_pending(DBusConnection* conn) {
    dbus_connection_read_write(conn, 0);
    while (dbus_connection_dispatch(conn) == DBUS_DISPATCH_DATA_REMAINS) {
        // Keep processing
    }
}

int get_fd(DBusConnection* conn) {
    int fd = -1;
    if (!dbus_connection_get_unix_fd(conn, &fd)) {
        return -1;
    }
    return fd;
}

void cleanup(DBusConnection* conn) {
    if (conn) {
        if (g_watching_clients) {
            dbus_connection_remove_filter(conn, bus_filter, nullptr);
            dbus_bus_remove_match(conn, NAME_OWNER_MATCH, nullptr);
            g_watching_clients = false;
        }
        dbus_connection_unregister_object_path(conn, OBJECT_PATH);
        dbus_connection_unref(conn);
    }
    g_callbacks = nullptr;
    g_state = nullptr;
}

} // namespace dbus_service
