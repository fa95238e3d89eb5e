#pragma once

#include "../types/enums.hpp"
#include "packets.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace juhradial::codec {

enum class FrameKind : uint8_t {
    Response,      // answer to the request carrying sw_id
    Notification,  // unsolicited, sw_id 0 or receiver notification
    Error,         // HID++ error reply, tag in params[0]
};

// One HID++ report. Byte 3 is split into function_id (high nibble) and sw_id.
struct Frame {
    uint8_t report_id = packets::report::LONG;
    uint8_t device_index = packets::DIRECT_DEVICE_INDEX;
    uint8_t feature_index = 0;
    uint8_t function_id = 0;
    uint8_t sw_id = 0;
    std::array<uint8_t, packets::report::LONG_PARAMS> params{};
    FrameKind kind = FrameKind::Response;

    bool is_short() const { return report_id == packets::report::SHORT; }
    size_t param_count() const {
        return is_short() ? packets::report::SHORT_PARAMS : packets::report::LONG_PARAMS;
    }

    // Error frames echo the failed request: [orig feature][orig fn|sw][code]
    uint8_t error_feature_index() const { return static_cast<uint8_t>((function_id << 4) | sw_id); }
    uint8_t error_function() const { return params[0] >> 4; }
    uint8_t error_sw_id() const { return params[0] & 0x0F; }
    uint8_t error_code() const { return params[1]; }

    // Tag used for correlation regardless of kind
    uint8_t tag() const { return kind == FrameKind::Error ? error_sw_id() : sw_id; }
};

// Build an outbound request. Requests always use long reports.
Frame make_request(uint8_t device_index, uint8_t feature_index, uint8_t function_id,
                   uint8_t sw_id, std::span<const uint8_t> params = {});

// Serialize to the fixed report length of frame.report_id
std::vector<uint8_t> encode(const Frame& frame);

// Parse one report. Fails with MalformedFrame, never returns a partial frame.
Result<Frame> decode(std::span<const uint8_t> data);

} // namespace juhradial::codec
