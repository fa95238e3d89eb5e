#include "parse.hpp"
#include <algorithm>

namespace juhradial::parse {

namespace {

uint16_t read_be16(std::span<const uint8_t> data, size_t offset) {
    return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

} // namespace

std::optional<uint8_t> parse_feature_index(std::span<const uint8_t> params) {
    if (params.empty() || params[0] == 0) {
        return std::nullopt;
    }
    return params[0];
}

std::optional<ProtocolVersion> parse_protocol_version(std::span<const uint8_t> params) {
    if (params.size() < 3) {
        return std::nullopt;
    }
    // HID++ 1.0 devices answer ping with an error, 2.0+ echo the marker
    if (params[0] < 2 || params[2] != packets::PING_MARKER) {
        return std::nullopt;
    }
    return ProtocolVersion{params[0], params[1]};
}

uint8_t parse_feature_count(std::span<const uint8_t> params) {
    return params.empty() ? 0 : params[0];
}

uint16_t parse_feature_id(std::span<const uint8_t> params) {
    if (params.size() < 2) return 0;
    return read_be16(params, 0);
}

std::optional<Battery> parse_battery_status(std::span<const uint8_t> params) {
    if (params.size() < 3 || params[0] > 100) {
        return std::nullopt;
    }

    // 0=discharging, 1=recharging, 2=almost full, 3=full, 4=slow recharge, 5+=errors
    Battery battery{};
    battery.level = static_cast<int8_t>(params[0]);
    battery.charging = params[2] >= 1 && params[2] <= 4;

    switch (params[2]) {
        case 0: battery.status = BatteryStatus::Discharging; break;
        case 1:
        case 2: battery.status = BatteryStatus::Charging; break;
        case 3: battery.status = BatteryStatus::Full; break;
        case 4: battery.status = BatteryStatus::ChargingSlow; break;
        default: battery.status = BatteryStatus::Error; break;
    }

    return battery;
}

std::optional<Battery> parse_unified_battery(std::span<const uint8_t> params) {
    if (params.size() < 4 || params[0] > 100) {
        return std::nullopt;
    }

    // 0=discharging, 1=charging, 2=slow charging, 3=complete, 5=invalid
    Battery battery{};
    battery.level = static_cast<int8_t>(params[0]);
    battery.charging = params[3] >= 1 && params[3] <= 3;

    switch (params[3]) {
        case 0: battery.status = BatteryStatus::Discharging; break;
        case 1: battery.status = BatteryStatus::Charging; break;
        case 2: battery.status = BatteryStatus::ChargingSlow; break;
        case 3: battery.status = BatteryStatus::Full; break;
        default: battery.status = BatteryStatus::Error; break;
    }

    return battery;
}

std::optional<HostInfo> parse_host_info(std::span<const uint8_t> params) {
    if (params.size() < 2) {
        return std::nullopt;
    }

    HostInfo info{params[0], params[1]};
    if (info.count > 0 && info.current >= info.count) {
        return std::nullopt;
    }
    return info;
}

std::optional<uint16_t> parse_dpi(std::span<const uint8_t> params) {
    if (params.size() < 3) {
        return std::nullopt;
    }
    uint16_t dpi = read_be16(params, 1);
    if (dpi == 0) {
        return std::nullopt;
    }
    return dpi;
}

std::vector<uint16_t> parse_dpi_list(std::span<const uint8_t> params) {
    std::vector<uint16_t> values;

    for (size_t offset = 1; offset + 1 < params.size(); offset += 2) {
        uint16_t value = read_be16(params, offset);
        if (value == 0) break;
        if (value >= packets::DPI_STEP_MARKER) continue;
        values.push_back(value);
    }

    return values;
}

std::vector<uint16_t> parse_diverted_buttons(std::span<const uint8_t> params) {
    std::vector<uint16_t> cids;

    // Up to four simultaneously held controls
    size_t limit = std::min<size_t>(params.size(), 8);
    for (size_t offset = 0; offset + 1 < limit; offset += 2) {
        uint16_t cid = read_be16(params, offset);
        if (cid != 0) {
            cids.push_back(cid);
        }
    }

    return cids;
}

bool is_gesture_pressed(const std::vector<uint16_t>& cids) {
    return std::any_of(cids.begin(), cids.end(), [](uint16_t cid) {
        return cid == packets::cid::GESTURE_BUTTON || cid == packets::cid::HAPTIC_SENSE;
    });
}

uint8_t parse_name_length(std::span<const uint8_t> params) {
    return params.empty() ? 0 : params[0];
}

std::string parse_name_chunk(std::span<const uint8_t> params, size_t remaining) {
    std::string chunk;
    size_t n = std::min(params.size(), remaining);
    for (size_t i = 0; i < n && params[i] != 0; ++i) {
        chunk.push_back(static_cast<char>(params[i]));
    }
    return chunk;
}

bool parse_link_lost(std::span<const uint8_t> params) {
    return !params.empty() && (params[0] & packets::LINK_LOST_BIT) != 0;
}

std::string error_name(uint8_t code) {
    switch (code) {
        case 0x00: return "no error";
        case 0x01: return "unknown";
        case 0x02: return "invalid argument";
        case 0x03: return "out of range";
        case 0x04: return "hardware error";
        case 0x05: return "logitech internal";
        case 0x06: return "invalid feature index";
        case 0x07: return "invalid function id";
        case 0x08: return "busy";
        case 0x09: return "unsupported";
        default: return "error " + std::to_string(code);
    }
}

} // namespace juhradial::parse
