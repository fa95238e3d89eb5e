#pragma once

#include "../protocol/codec.hpp"
#include "../protocol/commands.hpp"
#include "../types/device.hpp"
#include "transport.hpp"

#include <array>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace juhradial {

// Unsolicited frame with the feature id it was resolved to (0 for receiver notifications)
struct Notification {
    uint16_t feature_id = 0;
    codec::Frame frame;

    bool is_receiver() const {
        return frame.is_short() && frame.feature_index >= packets::RECEIVER_NOTIFICATION_MIN &&
               frame.feature_index <= packets::RECEIVER_NOTIFICATION_MAX;
    }
};

// Owns one device connection: discovery, request correlation and the state snapshot
class Session {
public:
    struct Options {
        int request_timeout_ms = 1000;
        int discovery_attempts = 2;
    };

    // Fired only when the snapshot content actually changed
    struct Callbacks {
        std::function<void(bool connected)> on_connection;
        std::function<void(const Battery&)> on_battery;
        std::function<void(const HostInfo&)> on_hosts;
        std::function<void(uint16_t dpi)> on_dpi;
    };

    Session(std::unique_ptr<Transport> transport, Options options, Callbacks callbacks);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Error connect();
    Error discover_features();
    void disconnect();

    Result<codec::Frame> send_request(uint16_t feature, uint8_t function, std::span<const uint8_t> params = {});
    Result<codec::Frame> send_request(const commands::Request& request);

    // Fire and forget. The tag stays in flight so the acknowledgement is recognized and dropped.
    Error send_command(const commands::Request& request);

    // Non-blocking. Returns everything received so far in arrival order.
    std::vector<Notification> poll_notifications();

    // Waits until a notification satisfies `predicate`. Other notifications stay queued.
    Result<Notification> await_notification(const std::function<bool(const Notification&)>& predicate,
                                            int timeout_ms);

    Error refresh();
    Error refresh_battery();
    Error refresh_hosts();

    Result<uint16_t> get_dpi();
    Error set_dpi(uint16_t dpi);
    Result<std::vector<uint16_t>> get_dpi_list();

    // Record a host switch confirmed by other means (receiver link loss)
    void mark_current_host(uint8_t index);

    bool connected() const { return state_.connected; }
    bool supports(uint16_t feature) const { return handle_.features.contains(feature); }
    const DeviceState& state() const { return state_; }
    const DeviceHandle& handle() const { return handle_; }
    int fd() const;

private:
    struct InFlight {
        uint8_t feature_index = 0;
        uint8_t function = 0;
        bool awaited = false;
    };

    enum class ReadResult { Frame, Dropped, Timeout, Lost };

    void read_device_name();

    Result<uint8_t> resolve(uint16_t feature) const;
    uint8_t allocate_tag(uint8_t feature_index, uint8_t function, bool awaited);
    Error write_frame(const codec::Frame& frame);

    ReadResult read_frame(int timeout_ms, codec::Frame& out);
    // Returns true if the frame answered `tag`
    bool dispatch(const codec::Frame& frame, uint8_t tag);
    void apply(const Notification& notification);
    void lost();

    void update_battery(const Battery& battery);
    void update_hosts(const HostInfo& hosts);
    void update_dpi(uint16_t dpi);
    void set_connected(bool connected);

    std::unique_ptr<Transport> transport_;
    Options options_;
    Callbacks callbacks_;

    DeviceHandle handle_;
    DeviceState state_;

    std::array<std::optional<InFlight>, packets::MAX_SW_ID + 1> in_flight_{};
    uint8_t next_tag_ = packets::MIN_SW_ID;
    std::deque<Notification> pending_;
};

} // namespace juhradial
