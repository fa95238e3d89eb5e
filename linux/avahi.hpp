#pragma once

#include <flow/peer_directory.hpp>

#include <dbus/dbus.h>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace avahi {

constexpr const char* SERVICE_NAME = "org.freedesktop.Avahi";
constexpr const char* SERVICE_TYPE = "_juhradialmx._tcp";
constexpr const char* PROTOCOL_VERSION = "1";

// avahi-common/address.h
constexpr int32_t IF_UNSPEC = -1;
constexpr int32_t PROTO_INET = 0;

// What we publish about ourselves in the TXT record
struct Advertisement {
    std::string peer_id;
    std::string hostname;
    uint16_t port = 0;
    int host_slot = -1;
};

struct Callbacks {
    std::function<void(const juhradial::flow::Sighting&)> on_found;
    std::function<void(const std::string& peer_id)> on_removed;
};

// "key=value" entries
std::vector<std::string> txt_records(const Advertisement& ad);

// Sighting from resolved TXT entries, nullopt without an id
std::optional<juhradial::flow::Sighting> parse_txt(const std::vector<std::string>& txt, const std::string& address,
                                                   uint16_t port);

// Browses and advertises the Flow service through avahi-daemon on the system bus
class Backend : public juhradial::flow::DiscoveryBackend {
public:
    Backend(DBusConnection* system_bus, Advertisement ad, Callbacks callbacks);
    ~Backend() override;

    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;

    bool start() override;
    void stop() override;
    bool active() const override { return !browser_path_.empty(); }

    // Re-resolves every known service so live peers refresh their last_seen
    void refresh();

    // Re-publishes if running
    void set_advertisement(Advertisement ad);

    bool handle_signal(DBusMessage* msg);

private:
    static DBusHandlerResult filter(DBusConnection* conn, DBusMessage* msg, void* data);

    bool advertise();
    void withdraw();
    void resolve(const std::string& name, int32_t interface, int32_t protocol, const std::string& domain);
    std::string instance_name() const;

    DBusConnection* conn_;
    Advertisement ad_;
    Callbacks callbacks_;

    std::string browser_path_;
    std::string group_path_;
    bool filter_installed_ = false;

    struct Service {
        int32_t interface = IF_UNSPEC;
        int32_t protocol = PROTO_INET;
        std::string domain;
        std::string peer_id;  // empty until resolved
    };
    std::map<std::string, Service> services_;  // by instance name
};

} // namespace avahi
