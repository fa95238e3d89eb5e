#pragma once

#include "../types/haptic.hpp"
#include "session.hpp"

#include <chrono>
#include <optional>

namespace juhradial {

// Haptic feedback for radial menu events, paced so a fast sweep does not buzz continuously
class Haptics {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr uint8_t NO_SLICE = 255;

    Haptics(Session& session, HapticProfile profile);

    // None when disabled or debounced, the device is only touched when a pulse is due
    Error emit(HapticEvent event, Clock::time_point now);

    // Pulses only when the hovered slice changes. NO_SLICE marks the cursor back in the centre,
    // re-entering the slice just left is held back by the reentry debounce.
    Error slice_hovered(uint8_t slice, Clock::time_point now);

    void reset_slices();

    void configure(HapticProfile profile);
    const HapticProfile& profile() const { return profile_; }
    bool enabled() const { return profile_.enabled; }

private:
    Session& session_;
    HapticProfile profile_;
    std::optional<Clock::time_point> last_pulse_;
    std::optional<Clock::time_point> last_slice_change_;
    uint8_t last_slice_ = NO_SLICE;
    bool centred_ = false;
};

} // namespace juhradial
