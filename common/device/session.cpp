#include "session.hpp"
#include "../protocol/parse.hpp"

#include <chrono>
#include <iostream>

namespace juhradial {

using namespace std::chrono;

namespace {

int remaining_ms(steady_clock::time_point deadline) {
    auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace

Session::Session(std::unique_ptr<Transport> transport, Options options, Callbacks callbacks)
    : transport_(std::move(transport)), options_(options), callbacks_(std::move(callbacks)) {
    if (options_.discovery_attempts < 1) {
        options_.discovery_attempts = 1;
    }
}

Session::~Session() {
    callbacks_ = {};
    disconnect();
}

int Session::fd() const {
    return transport_ && transport_->is_open() ? transport_->fd() : -1;
}

Error Session::connect() {
    if (!transport_) {
        return Error::DeviceUnavailable;
    }
    if (state_.connected) {
        return Error::None;
    }

    for (int attempt = 1; attempt <= options_.discovery_attempts; ++attempt) {
        if (!transport_->is_open() && !transport_->open()) {
            std::cerr << "session: failed to open " << transport_->path() << std::endl;
            break;
        }

        Error err = discover_features();
        if (err == Error::None) {
            set_connected(true);
            std::cout << "session: connected to " << (state_.device_name.empty() ? handle_.path : state_.device_name)
                      << " via " << to_string(handle_.connection) << std::endl;
            refresh();
            return Error::None;
        }

        std::cerr << "session: feature discovery failed (" << to_string(err) << "), attempt "
                  << attempt << "/" << options_.discovery_attempts << std::endl;

        if (err != Error::Timeout) {
            break;
        }
    }

    // Same release path for every failure
    transport_->close();
    handle_.features.clear();
    in_flight_.fill(std::nullopt);
    pending_.clear();
    return Error::DeviceUnavailable;
}

Error Session::discover_features() {
    if (!transport_ || !transport_->is_open()) {
        return Error::DeviceUnavailable;
    }

    // Indices are per session, never carried over
    handle_ = DeviceHandle{};
    handle_.path = transport_->path();
    handle_.connection = transport_->connection();
    handle_.device_index = transport_->device_index();
    handle_.features.insert(packets::features::I_ROOT, packets::ROOT_FEATURE_INDEX);
    state_.device_name.clear();

    auto ping = send_request(commands::root::ping());
    if (!ping) {
        return ping.error;
    }
    auto version = parse::parse_protocol_version(ping.value.params);
    if (!version) {
        std::cerr << "session: device does not speak HID++ 2.0" << std::endl;
        return Error::FeatureUnsupported;
    }
    handle_.protocol_major = version->major;
    handle_.protocol_minor = version->minor;

    auto feature_set = send_request(commands::root::get_feature(packets::features::I_FEATURE_SET));
    if (!feature_set) {
        return feature_set.error;
    }
    auto feature_set_index = parse::parse_feature_index(feature_set.value.params);
    if (!feature_set_index) {
        std::cerr << "session: device has no IFeatureSet" << std::endl;
        return Error::FeatureUnsupported;
    }
    handle_.features.insert(packets::features::I_FEATURE_SET, *feature_set_index);

    auto count = send_request(commands::feature_set::get_count());
    if (!count) {
        return count.error;
    }

    // Counter is wider than the index so a count of 255 terminates
    unsigned total = parse::parse_feature_count(count.value.params);
    for (unsigned slot = 1; slot <= total; ++slot) {
        auto index = static_cast<uint8_t>(slot);
        auto entry = send_request(commands::feature_set::get_feature_id(index));
        if (!entry) {
            return entry.error;
        }

        uint16_t feature_id = parse::parse_feature_id(entry.value.params);
        handle_.features.insert(feature_id, index);

        if (auto reason = packets::blocklist::reason(feature_id)) {
            std::cout << "session: feature " << packets::to_hex(feature_id) << " at index "
                      << static_cast<int>(index) << " is blocked (" << *reason << ")" << std::endl;
        }
    }

    std::cout << "session: discovered " << handle_.features.size() << " features, HID++ "
              << static_cast<int>(handle_.protocol_major) << "." << static_cast<int>(handle_.protocol_minor)
              << std::endl;

    read_device_name();
    return Error::None;
}

void Session::read_device_name() {
    if (!supports(packets::features::DEVICE_NAME)) {
        return;
    }

    auto length = send_request(commands::device_name::get_length());
    if (!length) {
        return;
    }

    size_t total = parse::parse_name_length(length.value.params);
    std::string name;
    while (name.size() < total) {
        auto chunk = send_request(commands::device_name::get_name(static_cast<uint8_t>(name.size())));
        if (!chunk) {
            return;
        }
        std::string part = parse::parse_name_chunk(chunk.value.params, total - name.size());
        if (part.empty()) {
            break;
        }
        name += part;
    }

    state_.device_name = name;
}

void Session::disconnect() {
    if (transport_) {
        transport_->close();
    }
    in_flight_.fill(std::nullopt);
    pending_.clear();
    handle_.features.clear();
    set_connected(false);
}

Result<uint8_t> Session::resolve(uint16_t feature) const {
    if (packets::blocklist::contains(feature)) {
        return fail<uint8_t>(Error::FeatureBlocked);
    }
    auto index = handle_.features.find(feature);
    if (!index) {
        return fail<uint8_t>(Error::FeatureUnsupported);
    }
    return {*index, Error::None};
}

uint8_t Session::allocate_tag(uint8_t feature_index, uint8_t function, bool awaited) {
    uint8_t tag = next_tag_;
    next_tag_ = next_tag_ >= packets::MAX_SW_ID ? packets::MIN_SW_ID : next_tag_ + 1;

    // Wrapping onto a still-pending fire-and-forget tag forgets that ack
    in_flight_[tag] = InFlight{feature_index, function, awaited};
    return tag;
}

Error Session::write_frame(const codec::Frame& frame) {
    auto bytes = codec::encode(frame);
    if (!transport_->write(bytes)) {
        std::cerr << "session: write failed" << std::endl;
        lost();
        return Error::DeviceUnavailable;
    }
    return Error::None;
}

Result<codec::Frame> Session::send_request(const commands::Request& request) {
    return send_request(request.feature, request.function, request.params);
}

Result<codec::Frame> Session::send_request(uint16_t feature, uint8_t function, std::span<const uint8_t> params) {
    if (!transport_ || !transport_->is_open()) {
        return fail<codec::Frame>(Error::DeviceUnavailable);
    }

    auto index = resolve(feature);
    if (!index) {
        return fail<codec::Frame>(index.error);
    }

    uint8_t tag = allocate_tag(index.value, function, true);
    auto request = codec::make_request(handle_.device_index, index.value, function, tag, params);
    if (Error err = write_frame(request); err != Error::None) {
        return fail<codec::Frame>(err);
    }

    auto deadline = steady_clock::now() + milliseconds(options_.request_timeout_ms);
    while (true) {
        int left = remaining_ms(deadline);
        if (left <= 0) {
            break;
        }

        codec::Frame reply;
        switch (read_frame(left, reply)) {
            case ReadResult::Lost:
                return fail<codec::Frame>(Error::DeviceUnavailable);
            case ReadResult::Timeout:
            case ReadResult::Dropped:
                continue;
            case ReadResult::Frame:
                break;
        }

        if (!dispatch(reply, tag)) {
            continue;
        }

        if (reply.kind == codec::FrameKind::Error) {
            std::cerr << "session: feature " << packets::to_hex(feature) << " function "
                      << static_cast<int>(function) << " failed: " << parse::error_name(reply.error_code())
                      << std::endl;
            return {reply, Error::DeviceError};
        }
        return {reply, Error::None};
    }

    in_flight_[tag].reset();
    std::cerr << "session: request to feature " << packets::to_hex(feature) << " timed out" << std::endl;
    return fail<codec::Frame>(Error::Timeout);
}

Error Session::send_command(const commands::Request& request) {
    if (!transport_ || !transport_->is_open()) {
        return Error::DeviceUnavailable;
    }

    auto index = resolve(request.feature);
    if (!index) {
        return index.error;
    }

    uint8_t tag = allocate_tag(index.value, request.function, false);
    auto frame = codec::make_request(handle_.device_index, index.value, request.function, tag, request.params);
    return write_frame(frame);
}

Session::ReadResult Session::read_frame(int timeout_ms, codec::Frame& out) {
    auto data = transport_->read(timeout_ms);
    if (!data) {
        lost();
        return ReadResult::Lost;
    }
    if (data->empty()) {
        return ReadResult::Timeout;
    }

    // Mouse and keyboard input reports share the hidraw node
    uint8_t report_id = (*data)[0];
    if (report_id != packets::report::SHORT && report_id != packets::report::LONG) {
        return ReadResult::Dropped;
    }

    auto decoded = codec::decode(*data);
    if (!decoded) {
        std::cerr << "session: dropping malformed frame (" << data->size() << " bytes)" << std::endl;
        return ReadResult::Dropped;
    }

    // Receivers also forward traffic for their other paired devices
    if (decoded.value.device_index != handle_.device_index) {
        return ReadResult::Dropped;
    }

    out = decoded.value;
    return ReadResult::Frame;
}

bool Session::dispatch(const codec::Frame& frame, uint8_t tag) {
    if (frame.kind == codec::FrameKind::Notification) {
        Notification notification;
        notification.frame = frame;
        if (!notification.is_receiver()) {
            notification.feature_id = handle_.features.feature_at(frame.feature_index).value_or(0);
        }
        apply(notification);
        pending_.push_back(notification);
        return false;
    }

    uint8_t frame_tag = frame.tag();
    auto& entry = in_flight_[frame_tag];
    if (!entry) {
        std::cerr << "session: dropping reply with no outstanding request (tag "
                  << static_cast<int>(frame_tag) << ")" << std::endl;
        return false;
    }

    bool matches = frame.kind == codec::FrameKind::Error
        ? frame.error_feature_index() == entry->feature_index && frame.error_function() == entry->function
        : frame.feature_index == entry->feature_index && frame.function_id == entry->function;
    if (!matches) {
        std::cerr << "session: dropping reply that does not match request (tag "
                  << static_cast<int>(frame_tag) << ")" << std::endl;
        return false;
    }

    bool awaited = entry->awaited;
    entry.reset();

    if (!awaited) {
        if (frame.kind == codec::FrameKind::Error) {
            std::cerr << "session: command failed: " << parse::error_name(frame.error_code()) << std::endl;
        }
        return false;
    }

    return frame_tag == tag;
}

void Session::apply(const Notification& notification) {
    const auto& frame = notification.frame;

    if (notification.is_receiver()) {
        if (frame.feature_index == packets::DEVICE_CONNECTION && parse::parse_link_lost(frame.params)) {
            std::cout << "session: receiver reports link lost" << std::endl;
        }
        return;
    }

    switch (notification.feature_id) {
        case packets::features::BATTERY_STATUS:
            if (auto battery = parse::parse_battery_status(frame.params)) update_battery(*battery);
            break;
        case packets::features::UNIFIED_BATTERY:
            if (auto battery = parse::parse_unified_battery(frame.params)) update_battery(*battery);
            break;
        case packets::features::CHANGE_HOST:
            if (auto hosts = parse::parse_host_info(frame.params)) update_hosts(*hosts);
            break;
        case packets::features::ADJUSTABLE_DPI:
            if (auto dpi = parse::parse_dpi(frame.params)) update_dpi(*dpi);
            break;
        default:
            break;
    }
}

std::vector<Notification> Session::poll_notifications() {
    if (transport_ && transport_->is_open()) {
        codec::Frame frame;
        while (true) {
            auto result = read_frame(0, frame);
            if (result == ReadResult::Lost || result == ReadResult::Timeout) {
                break;
            }
            if (result == ReadResult::Frame) {
                dispatch(frame, 0);
            }
        }
    }

    std::vector<Notification> out(pending_.begin(), pending_.end());
    pending_.clear();
    return out;
}

Result<Notification> Session::await_notification(const std::function<bool(const Notification&)>& predicate,
                                                  int timeout_ms) {
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        if (predicate(*it)) {
            Notification found = *it;
            pending_.erase(it);
            return {found, Error::None};
        }
    }

    if (!transport_ || !transport_->is_open()) {
        return fail<Notification>(Error::DeviceUnavailable);
    }

    auto deadline = steady_clock::now() + milliseconds(timeout_ms);
    while (true) {
        int left = remaining_ms(deadline);
        if (left <= 0) {
            break;
        }

        codec::Frame frame;
        auto result = read_frame(left, frame);
        if (result == ReadResult::Lost) {
            return fail<Notification>(Error::DeviceUnavailable);
        }
        if (result != ReadResult::Frame) {
            continue;
        }

        size_t before = pending_.size();
        dispatch(frame, 0);
        if (pending_.size() > before && predicate(pending_.back())) {
            Notification found = pending_.back();
            pending_.pop_back();
            return {found, Error::None};
        }
    }

    return fail<Notification>(Error::Timeout);
}

void Session::lost() {
    std::cerr << "session: transport lost" << std::endl;
    if (transport_) {
        transport_->close();
    }
    in_flight_.fill(std::nullopt);
    set_connected(false);
}

Error Session::refresh() {
    Error result = Error::None;

    auto note = [&result](Error err) {
        if (err == Error::DeviceUnavailable) result = err;
    };

    if (supports(packets::features::UNIFIED_BATTERY) || supports(packets::features::BATTERY_STATUS)) {
        note(refresh_battery());
    }
    if (supports(packets::features::CHANGE_HOST)) {
        note(refresh_hosts());
    }
    if (supports(packets::features::ADJUSTABLE_DPI)) {
        note(get_dpi().error);
    }

    return result;
}

Error Session::refresh_battery() {
    if (supports(packets::features::UNIFIED_BATTERY)) {
        auto reply = send_request(commands::battery::get_unified_status());
        if (!reply) return reply.error;
        if (auto battery = parse::parse_unified_battery(reply.value.params)) {
            update_battery(*battery);
            return Error::None;
        }
        return Error::MalformedFrame;
    }

    auto reply = send_request(commands::battery::get_status());
    if (!reply) return reply.error;
    if (auto battery = parse::parse_battery_status(reply.value.params)) {
        update_battery(*battery);
        return Error::None;
    }
    return Error::MalformedFrame;
}

Error Session::refresh_hosts() {
    auto reply = send_request(commands::change_host::get_host_info());
    if (!reply) return reply.error;

    auto hosts = parse::parse_host_info(reply.value.params);
    if (!hosts) {
        return Error::MalformedFrame;
    }
    update_hosts(*hosts);
    return Error::None;
}

Result<uint16_t> Session::get_dpi() {
    auto reply = send_request(commands::dpi::get());
    if (!reply) return fail<uint16_t>(reply.error);

    auto dpi = parse::parse_dpi(reply.value.params);
    if (!dpi) {
        return fail<uint16_t>(Error::MalformedFrame);
    }
    update_dpi(*dpi);
    return {*dpi, Error::None};
}

Error Session::set_dpi(uint16_t dpi) {
    if (dpi == 0) {
        return Error::BadRequest;
    }

    auto reply = send_request(commands::dpi::set(dpi));
    if (!reply) return reply.error;

    std::cout << "session: DPI set to " << dpi << std::endl;
    update_dpi(dpi);
    return Error::None;
}

Result<std::vector<uint16_t>> Session::get_dpi_list() {
    auto reply = send_request(commands::dpi::get_list());
    if (!reply) return fail<std::vector<uint16_t>>(reply.error);
    return {parse::parse_dpi_list(reply.value.params), Error::None};
}

void Session::mark_current_host(uint8_t index) {
    if (index >= state_.hosts.count) {
        return;
    }
    update_hosts(HostInfo{state_.hosts.count, index});
}

void Session::update_battery(const Battery& battery) {
    if (state_.battery == battery) return;
    state_.battery = battery;
    if (callbacks_.on_battery) callbacks_.on_battery(battery);
}

void Session::update_hosts(const HostInfo& hosts) {
    if (state_.hosts == hosts) return;
    state_.hosts = hosts;
    if (callbacks_.on_hosts) callbacks_.on_hosts(hosts);
}

void Session::update_dpi(uint16_t dpi) {
    if (state_.dpi == dpi) return;
    state_.dpi = dpi;
    if (callbacks_.on_dpi) callbacks_.on_dpi(dpi);
}

void Session::set_connected(bool connected) {
    if (state_.connected == connected) return;

    if (!connected) {
        std::string name = state_.device_name;
        state_ = DeviceState{};
        state_.device_name = name;
    }
    state_.connected = connected;

    if (callbacks_.on_connection) callbacks_.on_connection(connected);
}

} // namespace juhradial
