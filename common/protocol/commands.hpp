#pragma once

#include "packets.hpp"
#include <cstdint>
#include <vector>

namespace juhradial::commands {

// A request addressed by feature id. The session resolves the index.
struct Request {
    uint16_t feature = 0;
    uint8_t function = 0;
    std::vector<uint8_t> params;
};

inline Request create(uint16_t feature, uint8_t function, std::vector<uint8_t> params = {}) {
    return {feature, function, std::move(params)};
}

namespace root {
    inline Request get_feature(uint16_t feature_id) {
        return create(packets::features::I_ROOT, packets::functions::ROOT_GET_FEATURE,
                      {static_cast<uint8_t>(feature_id >> 8), static_cast<uint8_t>(feature_id & 0xFF)});
    }

    inline Request ping() {
        return create(packets::features::I_ROOT, packets::functions::ROOT_PING, {0x00, 0x00, packets::PING_MARKER});
    }
}

namespace feature_set {
    inline Request get_count() {
        return create(packets::features::I_FEATURE_SET, packets::functions::FEATURE_SET_COUNT);
    }

    inline Request get_feature_id(uint8_t index) {
        return create(packets::features::I_FEATURE_SET, packets::functions::FEATURE_SET_GET_ID, {index});
    }
}

namespace device_name {
    inline Request get_length() {
        return create(packets::features::DEVICE_NAME, packets::functions::DEVICE_NAME_LENGTH);
    }

    inline Request get_name(uint8_t offset) {
        return create(packets::features::DEVICE_NAME, packets::functions::DEVICE_NAME_CHUNK, {offset});
    }
}

namespace battery {
    inline Request get_status() {
        return create(packets::features::BATTERY_STATUS, packets::functions::BATTERY_STATUS_GET);
    }

    inline Request get_unified_status() {
        return create(packets::features::UNIFIED_BATTERY, packets::functions::UNIFIED_BATTERY_GET_STATUS);
    }
}

namespace change_host {
    inline Request get_host_info() {
        return create(packets::features::CHANGE_HOST, packets::functions::CHANGE_HOST_GET_INFO);
    }

    inline Request set_current_host(uint8_t index) {
        return create(packets::features::CHANGE_HOST, packets::functions::CHANGE_HOST_SET_CURRENT, {index});
    }
}

namespace dpi {
    inline Request get_list(uint8_t sensor = 0) {
        return create(packets::features::ADJUSTABLE_DPI, packets::functions::DPI_GET_LIST, {sensor});
    }

    inline Request get(uint8_t sensor = 0) {
        return create(packets::features::ADJUSTABLE_DPI, packets::functions::DPI_GET, {sensor});
    }

    inline Request set(uint16_t value, uint8_t sensor = 0) {
        return create(packets::features::ADJUSTABLE_DPI, packets::functions::DPI_SET,
                      {sensor, static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF)});
    }
}

namespace haptic {
    // Runtime only, the waveform is played and nothing is stored on the device
    inline Request play(uint8_t waveform) {
        return create(packets::features::HAPTIC, packets::functions::HAPTIC_PLAY, {waveform});
    }
}

} // namespace juhradial::commands
