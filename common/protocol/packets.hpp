#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace juhradial::packets {

// Helper to create packet from hex string literal
template<size_t N>
constexpr std::array<uint8_t, (N - 1) / 2> from_hex(const char (&hex)[N]) {
    std::array<uint8_t, (N - 1) / 2> result{};
    for (size_t i = 0; i < result.size(); ++i) {
        auto hex_to_nibble = [](char c) -> uint8_t {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return 0;
        };
        result[i] = (hex_to_nibble(hex[i * 2]) << 4) | hex_to_nibble(hex[i * 2 + 1]);
    }
    return result;
}

// "0x1B04" style, for logging
inline std::string to_hex(unsigned value, int digits = 4) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%0*X", digits, value);
    return buf;
}

// HID++ report ids and their fixed sizes
namespace report {
    constexpr uint8_t SHORT = 0x10;
    constexpr uint8_t LONG = 0x11;

    constexpr size_t SHORT_SIZE = 7;
    constexpr size_t LONG_SIZE = 20;

    constexpr size_t SHORT_PARAMS = 3;
    constexpr size_t LONG_PARAMS = 16;
}

constexpr size_t HEADER_SIZE = 4;  // report id, device index, feature index, function|sw

// Device index for directly attached (USB cable / Bluetooth) devices
constexpr uint8_t DIRECT_DEVICE_INDEX = 0xFF;

// HID++ 2.0 error reply: [0xFF][orig feature][orig fn|sw][error code]
constexpr uint8_t ERROR_FEATURE_INDEX = 0xFF;
// HID++ 1.0 error reply, short reports only
constexpr uint8_t LEGACY_ERROR_INDEX = 0x8F;

// HID++ 1.0 receiver notifications live in 0x40-0x7F
constexpr uint8_t RECEIVER_NOTIFICATION_MIN = 0x40;
constexpr uint8_t RECEIVER_NOTIFICATION_MAX = 0x7F;
// Device connection / link status, params[0] bit 6 set = link lost
constexpr uint8_t DEVICE_CONNECTION = 0x41;
constexpr uint8_t LINK_LOST_BIT = 0x40;

constexpr uint8_t ROOT_FEATURE_INDEX = 0x00;

// Data byte echoed by IRoot.ping on HID++ 2.0 devices
constexpr uint8_t PING_MARKER = 0xAA;

// Tags 1..15, 0 marks unsolicited frames
constexpr uint8_t MIN_SW_ID = 0x01;
constexpr uint8_t MAX_SW_ID = 0x0F;

namespace features {
    constexpr uint16_t I_ROOT = 0x0000;
    constexpr uint16_t I_FEATURE_SET = 0x0001;
    constexpr uint16_t DEVICE_NAME = 0x0005;
    constexpr uint16_t BATTERY_STATUS = 0x1000;
    constexpr uint16_t UNIFIED_BATTERY = 0x1004;
    constexpr uint16_t CHANGE_HOST = 0x1814;
    constexpr uint16_t REPROG_CONTROLS_V4 = 0x1B04;
    constexpr uint16_t ADJUSTABLE_DPI = 0x2201;
    constexpr uint16_t HAPTIC = 0x19B0;
}

// Function ids per feature
namespace functions {
    constexpr uint8_t ROOT_GET_FEATURE = 0x00;
    constexpr uint8_t ROOT_PING = 0x01;

    constexpr uint8_t FEATURE_SET_COUNT = 0x00;
    constexpr uint8_t FEATURE_SET_GET_ID = 0x01;

    constexpr uint8_t DEVICE_NAME_LENGTH = 0x00;
    constexpr uint8_t DEVICE_NAME_CHUNK = 0x01;

    constexpr uint8_t BATTERY_STATUS_GET = 0x00;
    constexpr uint8_t UNIFIED_BATTERY_GET_STATUS = 0x01;

    constexpr uint8_t CHANGE_HOST_GET_INFO = 0x00;
    constexpr uint8_t CHANGE_HOST_SET_CURRENT = 0x01;

    constexpr uint8_t DPI_GET_LIST = 0x01;
    constexpr uint8_t DPI_GET = 0x02;
    constexpr uint8_t DPI_SET = 0x03;

    constexpr uint8_t DIVERTED_BUTTONS_EVENT = 0x00;

    constexpr uint8_t HAPTIC_PLAY = 0x04;
}

// Features that write to onboard memory. Never the target of a request.
namespace blocklist {
    constexpr uint16_t SPECIAL_KEYS = 0x1B04;
    constexpr uint16_t REPORT_RATE = 0x8060;
    constexpr uint16_t ONBOARD_PROFILES = 0x8100;
    constexpr uint16_t MODE_STATUS = 0x8090;
    constexpr uint16_t MOUSE_BUTTON_SPY = 0x8110;
    constexpr uint16_t PERSISTENT_REMAPPABLE_ACTION = 0x1BC0;
    constexpr uint16_t HOST_INFO = 0x1815;

    inline std::optional<std::string_view> reason(uint16_t feature_id) {
        switch (feature_id) {
            case SPECIAL_KEYS: return "persistent button remapping";
            case REPORT_RATE: return "may persist report rate settings";
            case ONBOARD_PROFILES: return "persistent profile storage";
            case MODE_STATUS: return "profile switching may persist";
            case MOUSE_BUTTON_SPY: return "profile modification";
            case PERSISTENT_REMAPPABLE_ACTION: return "persistent key remapping";
            case HOST_INFO: return "device pairing persistence";
        }
        return std::nullopt;
    }

    inline bool contains(uint16_t feature_id) {
        return reason(feature_id).has_value();
    }
}

// Control ids of diverted buttons
namespace cid {
    constexpr uint16_t GESTURE_BUTTON = 195;
    constexpr uint16_t HAPTIC_SENSE = 416;
}

// DPI list entries at or above this value are step markers
constexpr uint16_t DPI_STEP_MARKER = 0xE000;

} // namespace juhradial::packets
