#include "codec.hpp"
#include <algorithm>

namespace juhradial::codec {

namespace {

size_t report_size(uint8_t report_id) {
    switch (report_id) {
        case packets::report::SHORT: return packets::report::SHORT_SIZE;
        case packets::report::LONG: return packets::report::LONG_SIZE;
        default: return 0;
    }
}

FrameKind classify(const Frame& frame) {
    if (frame.feature_index == packets::ERROR_FEATURE_INDEX) {
        return FrameKind::Error;
    }
    if (frame.is_short() && frame.feature_index == packets::LEGACY_ERROR_INDEX) {
        return FrameKind::Error;
    }
    if (frame.is_short() &&
        frame.feature_index >= packets::RECEIVER_NOTIFICATION_MIN &&
        frame.feature_index <= packets::RECEIVER_NOTIFICATION_MAX) {
        return FrameKind::Notification;
    }
    if (frame.sw_id == 0) {
        return FrameKind::Notification;
    }
    return FrameKind::Response;
}

} // namespace

Frame make_request(uint8_t device_index, uint8_t feature_index, uint8_t function_id,
                   uint8_t sw_id, std::span<const uint8_t> params) {
    Frame frame;
    frame.report_id = packets::report::LONG;
    frame.device_index = device_index;
    frame.feature_index = feature_index;
    frame.function_id = function_id & 0x0F;
    frame.sw_id = sw_id & 0x0F;

    size_t n = std::min(params.size(), frame.params.size());
    std::copy_n(params.begin(), n, frame.params.begin());

    frame.kind = classify(frame);
    return frame;
}

std::vector<uint8_t> encode(const Frame& frame) {
    size_t size = report_size(frame.report_id);
    if (size == 0) {
        return {};
    }

    std::vector<uint8_t> out(size, 0);
    out[0] = frame.report_id;
    out[1] = frame.device_index;
    out[2] = frame.feature_index;
    out[3] = static_cast<uint8_t>(((frame.function_id & 0x0F) << 4) | (frame.sw_id & 0x0F));
    std::copy_n(frame.params.begin(), size - packets::HEADER_SIZE, out.begin() + packets::HEADER_SIZE);
    return out;
}

Result<Frame> decode(std::span<const uint8_t> data) {
    if (data.empty()) {
        return fail<Frame>(Error::MalformedFrame);
    }

    size_t expected = report_size(data[0]);
    if (expected == 0 || data.size() != expected) {
        return fail<Frame>(Error::MalformedFrame);
    }

    Frame frame;
    frame.report_id = data[0];
    frame.device_index = data[1];
    frame.feature_index = data[2];
    frame.function_id = data[3] >> 4;
    frame.sw_id = data[3] & 0x0F;
    std::copy(data.begin() + packets::HEADER_SIZE, data.end(), frame.params.begin());

    // 0x8F is only an error index in the HID++ 1.0 short format
    if (!frame.is_short() && frame.feature_index == packets::LEGACY_ERROR_INDEX) {
        return fail<Frame>(Error::MalformedFrame);
    }

    frame.kind = classify(frame);

    if (frame.kind == FrameKind::Error && frame.error_sw_id() == 0) {
        return fail<Frame>(Error::MalformedFrame);
    }

    return {frame, Error::None};
}

} // namespace juhradial::codec
