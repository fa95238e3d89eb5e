#pragma once

#include "enums.hpp"
#include "battery.hpp"
#include "host.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace juhradial {

// feature id -> per-session feature index, rebuilt on every connect
class FeatureIndex {
public:
    void insert(uint16_t feature_id, uint8_t index) {
        by_id_[feature_id] = index;
        by_index_[index] = feature_id;
    }

    std::optional<uint8_t> find(uint16_t feature_id) const {
        auto it = by_id_.find(feature_id);
        if (it == by_id_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<uint16_t> feature_at(uint8_t index) const {
        auto it = by_index_.find(index);
        if (it == by_index_.end()) return std::nullopt;
        return it->second;
    }

    bool contains(uint16_t feature_id) const { return by_id_.count(feature_id) != 0; }
    size_t size() const { return by_id_.size(); }

    void clear() {
        by_id_.clear();
        by_index_.clear();
    }

private:
    std::unordered_map<uint16_t, uint8_t> by_id_;
    std::unordered_map<uint8_t, uint16_t> by_index_;
};

struct DeviceHandle {
    std::string path;
    ConnectionType connection = ConnectionType::Unknown;
    uint8_t device_index = 0xFF;
    uint8_t protocol_major = 0;
    uint8_t protocol_minor = 0;
    FeatureIndex features;
};

// Snapshot published to the presentation layer
struct DeviceState {
    bool connected = false;
    std::string device_name;
    Battery battery{};
    HostInfo hosts{};
    uint16_t dpi = 0;  // 0 until read
};

} // namespace juhradial
