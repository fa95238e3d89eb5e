#include "haptics.hpp"

#include <iostream>
#include <utility>

namespace juhradial {

namespace {

std::chrono::milliseconds since(std::optional<Haptics::Clock::time_point> then, Haptics::Clock::time_point now) {
    if (!then) {
        return std::chrono::milliseconds::max();
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - *then);
}

} // namespace

Haptics::Haptics(Session& session, HapticProfile profile) : session_(session), profile_(std::move(profile)) {}

void Haptics::configure(HapticProfile profile) {
    profile_ = std::move(profile);
    last_pulse_.reset();
    reset_slices();
}

void Haptics::reset_slices() {
    last_slice_ = NO_SLICE;
    centred_ = false;
    last_slice_change_.reset();
}

Error Haptics::emit(HapticEvent event, Clock::time_point now) {
    if (!profile_.enabled) {
        return Error::None;
    }
    if (since(last_pulse_, now) < std::chrono::milliseconds(profile_.debounce_ms)) {
        return Error::None;
    }
    if (!session_.connected()) {
        return Error::DeviceUnavailable;
    }

    HapticPattern pattern = profile_.pattern_for(event);
    if (Error err = session_.send_command(commands::haptic::play(static_cast<uint8_t>(pattern)));
        err != Error::None) {
        std::cerr << "haptics: " << to_string(event) << " failed: " << to_string(err) << std::endl;
        return err;
    }

    last_pulse_ = now;
    return Error::None;
}

Error Haptics::slice_hovered(uint8_t slice, Clock::time_point now) {
    if (slice == NO_SLICE) {
        centred_ = true;
        return Error::None;
    }

    bool same = slice == last_slice_;
    bool returning = centred_;
    centred_ = false;
    if (same && !returning) {
        return Error::None;
    }

    auto elapsed = since(last_slice_change_, now);
    if (same && elapsed < std::chrono::milliseconds(profile_.reentry_debounce_ms)) {
        return Error::None;
    }
    if (elapsed < std::chrono::milliseconds(profile_.slice_debounce_ms)) {
        last_slice_ = slice;
        return Error::None;
    }

    last_slice_change_ = now;
    last_slice_ = slice;
    return emit(HapticEvent::SliceChange, now);
}

} // namespace juhradial
