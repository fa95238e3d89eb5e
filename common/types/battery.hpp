#pragma once

#include <cstdint>

namespace juhradial {

enum class BatteryStatus : uint8_t {
    Discharging = 0x00,
    Charging = 0x01,
    ChargingSlow = 0x02,
    Full = 0x03,
    Error = 0x05,
    Unknown = 0xFF,
};

struct Battery {
    int8_t level = -1;  // 0-100, or -1 if unavailable
    bool charging = false;
    BatteryStatus status = BatteryStatus::Unknown;

    bool available() const { return level >= 0; }

    bool operator==(const Battery&) const = default;
};

} // namespace juhradial
