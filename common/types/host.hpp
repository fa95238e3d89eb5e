#pragma once

#include <cstdint>
#include <string>

namespace juhradial {

// Easy-Switch state as reported by the device (feature 0x1814)
struct HostInfo {
    uint8_t count = 0;    // number of slots, 0 until the device reported it
    uint8_t current = 0;

    bool operator==(const HostInfo&) const = default;
};

struct HostSlot {
    uint8_t index = 0;
    std::string name;
    bool is_current = false;

    bool operator==(const HostSlot&) const = default;
};

} // namespace juhradial
