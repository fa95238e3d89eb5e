#include "avahi.hpp"

#include <cstring>
#include <iostream>

namespace avahi {

using juhradial::flow::Sighting;

static const char* SERVER_INTERFACE = "org.freedesktop.Avahi.Server";
static const char* BROWSER_INTERFACE = "org.freedesktop.Avahi.ServiceBrowser";
static const char* GROUP_INTERFACE = "org.freedesktop.Avahi.EntryGroup";

static const char* BROWSER_MATCH =
    "type='signal',sender='org.freedesktop.Avahi',interface='org.freedesktop.Avahi.ServiceBrowser'";

std::vector<std::string> txt_records(const Advertisement& ad) {
    std::vector<std::string> txt;
    txt.push_back("id=" + ad.peer_id);
    txt.push_back("hostname=" + ad.hostname);
    if (ad.host_slot >= 0) {
        txt.push_back("slot=" + std::to_string(ad.host_slot));
    }
    txt.push_back(std::string("version=") + PROTOCOL_VERSION);
    return txt;
}

std::optional<Sighting> parse_txt(const std::vector<std::string>& txt, const std::string& address, uint16_t port) {
    Sighting sighting;
    sighting.address = address;
    sighting.port = port;

    for (const auto& entry : txt) {
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        std::string key = entry.substr(0, eq);
        std::string value = entry.substr(eq + 1);

        if (key == "id") {
            sighting.peer_id = value;
        } else if (key == "hostname") {
            sighting.hostname = value;
        } else if (key == "slot") {
            if (value.size() == 1 && value[0] >= '0' && value[0] <= '9') {
                sighting.host_slot = value[0] - '0';
            }
        }
    }

    if (sighting.peer_id.empty()) {
        return std::nullopt;
    }
    return sighting;
}

// Sends a call and returns the reply, logging and freeing the error on failure
static DBusMessage* call(DBusConnection* conn, DBusMessage* msg, const char* what) {
    DBusError err;
    dbus_error_init(&err);

    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "avahi: " << what << " failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

static void call_void(DBusConnection* conn, const std::string& path, const char* iface, const char* method) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, path.c_str(), iface, method);
    if (!msg) return;
    if (DBusMessage* reply = call(conn, msg, method)) {
        dbus_message_unref(reply);
    }
}

Backend::Backend(DBusConnection* system_bus, Advertisement ad, Callbacks callbacks)
    : conn_(system_bus), ad_(std::move(ad)), callbacks_(std::move(callbacks)) {}

Backend::~Backend() {
    stop();
}

DBusHandlerResult Backend::filter(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)conn;
    auto* backend = static_cast<Backend*>(data);

    if (dbus_message_get_type(msg) == DBUS_MESSAGE_TYPE_SIGNAL && backend->handle_signal(msg)) {
        return DBUS_HANDLER_RESULT_HANDLED;
    }
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

bool Backend::start() {
    if (active()) return true;
    if (!conn_) return false;

    // Match before creating the browser, avahi emits ItemNew right away
    DBusError err;
    dbus_error_init(&err);
    dbus_bus_add_match(conn_, BROWSER_MATCH, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "avahi: add match failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }
    if (!filter_installed_) {
        dbus_connection_add_filter(conn_, filter, this, nullptr);
        filter_installed_ = true;
    }

    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, "/", SERVER_INTERFACE, "ServiceBrowserNew");
    if (!msg) return false;

    int32_t interface = IF_UNSPEC;
    int32_t protocol = PROTO_INET;
    const char* type = SERVICE_TYPE;
    const char* domain = "";
    uint32_t flags = 0;
    dbus_message_append_args(msg, DBUS_TYPE_INT32, &interface, DBUS_TYPE_INT32, &protocol,
                             DBUS_TYPE_STRING, &type, DBUS_TYPE_STRING, &domain,
                             DBUS_TYPE_UINT32, &flags, DBUS_TYPE_INVALID);

    DBusMessage* reply = call(conn_, msg, "ServiceBrowserNew");
    if (!reply) {
        stop();
        return false;
    }

    const char* path = nullptr;
    if (dbus_message_get_args(reply, nullptr, DBUS_TYPE_OBJECT_PATH, &path, DBUS_TYPE_INVALID)) {
        browser_path_ = path;
    }
    dbus_message_unref(reply);

    if (browser_path_.empty()) {
        stop();
        return false;
    }

    std::cout << "avahi: browsing " << SERVICE_TYPE << " (" << browser_path_ << ")" << std::endl;
    advertise();
    return true;
}

void Backend::stop() {
    withdraw();

    if (!browser_path_.empty()) {
        call_void(conn_, browser_path_, BROWSER_INTERFACE, "Free");
        std::cout << "avahi: stopped browsing" << std::endl;
        browser_path_.clear();
    }

    if (filter_installed_) {
        dbus_connection_remove_filter(conn_, filter, this);
        dbus_bus_remove_match(conn_, BROWSER_MATCH, nullptr);
        filter_installed_ = false;
    }
    services_.clear();
}

std::string Backend::instance_name() const {
    return "juhradial-" + ad_.peer_id;
}

bool Backend::advertise() {
    if (ad_.peer_id.empty() || ad_.port == 0) return false;

    if (group_path_.empty()) {
        DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, "/", SERVER_INTERFACE, "EntryGroupNew");
        if (!msg) return false;

        DBusMessage* reply = call(conn_, msg, "EntryGroupNew");
        if (!reply) return false;

        const char* path = nullptr;
        if (dbus_message_get_args(reply, nullptr, DBUS_TYPE_OBJECT_PATH, &path, DBUS_TYPE_INVALID)) {
            group_path_ = path;
        }
        dbus_message_unref(reply);
        if (group_path_.empty()) return false;
    }

    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, group_path_.c_str(), GROUP_INTERFACE, "AddService");
    if (!msg) return false;

    int32_t interface = IF_UNSPEC;
    int32_t protocol = PROTO_INET;
    uint32_t flags = 0;
    std::string name = instance_name();
    const char* name_str = name.c_str();
    const char* type = SERVICE_TYPE;
    const char* empty = "";
    uint16_t port = ad_.port;

    DBusMessageIter iter, txt, entry;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_INT32, &interface);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_INT32, &protocol);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT32, &flags);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &name_str);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &type);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &empty);  // domain
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &empty);  // host
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT16, &port);

    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "ay", &txt);
    for (const auto& record : txt_records(ad_)) {
        const unsigned char* bytes = reinterpret_cast<const unsigned char*>(record.data());
        dbus_message_iter_open_container(&txt, DBUS_TYPE_ARRAY, "y", &entry);
        dbus_message_iter_append_fixed_array(&entry, DBUS_TYPE_BYTE, &bytes, static_cast<int>(record.size()));
        dbus_message_iter_close_container(&txt, &entry);
    }
    dbus_message_iter_close_container(&iter, &txt);

    DBusMessage* reply = call(conn_, msg, "AddService");
    if (!reply) return false;
    dbus_message_unref(reply);

    call_void(conn_, group_path_, GROUP_INTERFACE, "Commit");
    std::cout << "avahi: advertising " << name << " on port " << ad_.port << std::endl;
    return true;
}

void Backend::withdraw() {
    if (group_path_.empty()) return;
    call_void(conn_, group_path_, GROUP_INTERFACE, "Free");
    group_path_.clear();
}

void Backend::set_advertisement(Advertisement ad) {
    ad_ = std::move(ad);
    if (!active()) return;
    withdraw();
    advertise();
}

void Backend::resolve(const std::string& name, int32_t interface, int32_t protocol, const std::string& domain) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, "/", SERVER_INTERFACE, "ResolveService");
    if (!msg) return;

    const char* name_str = name.c_str();
    const char* type = SERVICE_TYPE;
    const char* domain_str = domain.c_str();
    int32_t aprotocol = PROTO_INET;
    uint32_t flags = 0;
    dbus_message_append_args(msg, DBUS_TYPE_INT32, &interface, DBUS_TYPE_INT32, &protocol,
                             DBUS_TYPE_STRING, &name_str, DBUS_TYPE_STRING, &type,
                             DBUS_TYPE_STRING, &domain_str, DBUS_TYPE_INT32, &aprotocol,
                             DBUS_TYPE_UINT32, &flags, DBUS_TYPE_INVALID);

    DBusMessage* reply = call(conn_, msg, "ResolveService");
    if (!reply) return;

    // (i interface, i protocol, s name, s type, s domain, s host, i aprotocol, s address, q port, aay txt, u flags)
    DBusMessageIter iter;
    std::string address;
    uint16_t port = 0;
    std::vector<std::string> txt;

    if (dbus_message_iter_init(reply, &iter)) {
        for (int skip = 0; skip < 7; ++skip) dbus_message_iter_next(&iter);

        if (dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_STRING) {
            const char* val;
            dbus_message_iter_get_basic(&iter, &val);
            address = val;
        }
        dbus_message_iter_next(&iter);

        if (dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_UINT16) {
            dbus_message_iter_get_basic(&iter, &port);
        }
        dbus_message_iter_next(&iter);

        if (dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {
            DBusMessageIter records;
            dbus_message_iter_recurse(&iter, &records);
            while (dbus_message_iter_get_arg_type(&records) == DBUS_TYPE_ARRAY) {
                DBusMessageIter bytes_iter;
                dbus_message_iter_recurse(&records, &bytes_iter);
                const unsigned char* bytes = nullptr;
                int len = 0;
                dbus_message_iter_get_fixed_array(&bytes_iter, &bytes, &len);
                if (bytes && len > 0) {
                    txt.emplace_back(reinterpret_cast<const char*>(bytes), static_cast<size_t>(len));
                }
                dbus_message_iter_next(&records);
            }
        }
    }
    dbus_message_unref(reply);

    auto sighting = parse_txt(txt, address, port);
    if (!sighting) {
        std::cerr << "avahi: " << name << " has no peer id, ignoring" << std::endl;
        return;
    }
    if (sighting->peer_id == ad_.peer_id) {
        return;  // ourselves
    }

    auto it = services_.find(name);
    if (it != services_.end()) {
        it->second.peer_id = sighting->peer_id;
    }
    if (callbacks_.on_found) callbacks_.on_found(*sighting);
}

void Backend::refresh() {
    if (!active()) return;

    // Callbacks may stop the backend, iterate over a copy
    std::vector<std::pair<std::string, Service>> known(services_.begin(), services_.end());
    for (const auto& [name, service] : known) {
        resolve(name, service.interface, service.protocol, service.domain);
    }
}

bool Backend::handle_signal(DBusMessage* msg) {
    const char* path = dbus_message_get_path(msg);
    if (!path || browser_path_ != path) {
        return false;
    }

    bool added = dbus_message_is_signal(msg, BROWSER_INTERFACE, "ItemNew");
    bool removed = dbus_message_is_signal(msg, BROWSER_INTERFACE, "ItemRemove");
    if (!added && !removed) {
        return dbus_message_is_signal(msg, BROWSER_INTERFACE, "AllForNow") ||
               dbus_message_is_signal(msg, BROWSER_INTERFACE, "CacheExhausted");
    }

    int32_t interface = IF_UNSPEC;
    int32_t protocol = PROTO_INET;
    const char* name = nullptr;
    const char* type = nullptr;
    const char* domain = nullptr;
    uint32_t flags = 0;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_INT32, &interface, DBUS_TYPE_INT32, &protocol,
                               DBUS_TYPE_STRING, &name, DBUS_TYPE_STRING, &type,
                               DBUS_TYPE_STRING, &domain, DBUS_TYPE_UINT32, &flags, DBUS_TYPE_INVALID)) {
        return true;
    }

    if (added) {
        if (name == instance_name()) return true;
        std::cout << "avahi: found " << name << std::endl;
        services_[name] = Service{interface, protocol, domain, {}};
        resolve(name, interface, protocol, domain);
    } else {
        std::cout << "avahi: lost " << name << std::endl;
        auto it = services_.find(name);
        if (it != services_.end()) {
            std::string peer_id = it->second.peer_id;
            services_.erase(it);
            if (!peer_id.empty() && callbacks_.on_removed) callbacks_.on_removed(peer_id);
        }
    }
    return true;
}

} // namespace avahi
