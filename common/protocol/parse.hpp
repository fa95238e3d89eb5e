#pragma once

#include "../types/battery.hpp"
#include "../types/host.hpp"
#include "packets.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

// Payload parsers. Each takes the parameter bytes of a decoded frame.
namespace juhradial::parse {

struct ProtocolVersion {
    uint8_t major = 0;
    uint8_t minor = 0;
};

// IRoot.getFeature: index in params[0], 0 means the feature is absent
std::optional<uint8_t> parse_feature_index(std::span<const uint8_t> params);

// IRoot.ping: [major][minor][echoed marker]
std::optional<ProtocolVersion> parse_protocol_version(std::span<const uint8_t> params);

uint8_t parse_feature_count(std::span<const uint8_t> params);
uint16_t parse_feature_id(std::span<const uint8_t> params);

// BATTERY_STATUS (0x1000): [level][next level][status]
std::optional<Battery> parse_battery_status(std::span<const uint8_t> params);

// UNIFIED_BATTERY (0x1004): [state of charge][level][flags][charging status]
std::optional<Battery> parse_unified_battery(std::span<const uint8_t> params);

// CHANGE_HOST (0x1814): [host count][current host]
std::optional<HostInfo> parse_host_info(std::span<const uint8_t> params);

// ADJUSTABLE_DPI getSensorDpi: [sensor][dpi hi][dpi lo]
std::optional<uint16_t> parse_dpi(std::span<const uint8_t> params);

// ADJUSTABLE_DPI getSensorDpiList: [sensor][hi lo]... terminated by 0
std::vector<uint16_t> parse_dpi_list(std::span<const uint8_t> params);

// REPROG_CONTROLS_V4 diverted buttons event, big-endian CIDs, empty when released
std::vector<uint16_t> parse_diverted_buttons(std::span<const uint8_t> params);

// True if the CID list holds the gesture or haptic sense button
bool is_gesture_pressed(const std::vector<uint16_t>& cids);

uint8_t parse_name_length(std::span<const uint8_t> params);

// Characters of one DEVICE_NAME chunk, at most `remaining`, stops at NUL
std::string parse_name_chunk(std::span<const uint8_t> params, size_t remaining);

// Receiver device connection notification (0x41): bit 6 of params[0] = link lost
bool parse_link_lost(std::span<const uint8_t> params);

std::string error_name(uint8_t code);

} // namespace juhradial::parse
