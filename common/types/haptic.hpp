#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace juhradial {

// Waveform ids understood by the haptic motor feature (0x19B0)
enum class HapticPattern : uint8_t {
    SharpStateChange = 0x00,
    DampStateChange = 0x01,
    SharpCollision = 0x02,
    DampCollision = 0x03,
    SubtleCollision = 0x04,
    HappyAlert = 0x05,
    AngryAlert = 0x06,
    Completed = 0x07,
    Square = 0x08,
    Wave = 0x09,
    Firework = 0x0A,
    Mad = 0x0B,
    Knock = 0x0C,
    Jingle = 0x0D,
    Ringing = 0x0E,
    WhisperCollision = 0x1B,
};

inline std::string_view to_string(HapticPattern pattern) {
    switch (pattern) {
        case HapticPattern::SharpStateChange: return "sharp_state_change";
        case HapticPattern::DampStateChange: return "damp_state_change";
        case HapticPattern::SharpCollision: return "sharp_collision";
        case HapticPattern::DampCollision: return "damp_collision";
        case HapticPattern::SubtleCollision: return "subtle_collision";
        case HapticPattern::HappyAlert: return "happy_alert";
        case HapticPattern::AngryAlert: return "angry_alert";
        case HapticPattern::Completed: return "completed";
        case HapticPattern::Square: return "square";
        case HapticPattern::Wave: return "wave";
        case HapticPattern::Firework: return "firework";
        case HapticPattern::Mad: return "mad";
        case HapticPattern::Knock: return "knock";
        case HapticPattern::Jingle: return "jingle";
        case HapticPattern::Ringing: return "ringing";
        case HapticPattern::WhisperCollision: return "whisper_collision";
    }
    return "unknown";
}

inline std::optional<HapticPattern> haptic_pattern_from_string(std::string_view s) {
    for (auto pattern : {HapticPattern::SharpStateChange, HapticPattern::DampStateChange,
                         HapticPattern::SharpCollision, HapticPattern::DampCollision,
                         HapticPattern::SubtleCollision, HapticPattern::HappyAlert, HapticPattern::AngryAlert,
                         HapticPattern::Completed, HapticPattern::Square, HapticPattern::Wave,
                         HapticPattern::Firework, HapticPattern::Mad, HapticPattern::Knock,
                         HapticPattern::Jingle, HapticPattern::Ringing, HapticPattern::WhisperCollision}) {
        if (to_string(pattern) == s) return pattern;
    }
    return std::nullopt;
}

enum class HapticEvent : uint8_t {
    MenuAppear,
    SliceChange,
    SelectionConfirm,
    InvalidAction,
};

inline std::string_view to_string(HapticEvent event) {
    switch (event) {
        case HapticEvent::MenuAppear: return "menu_appear";
        case HapticEvent::SliceChange: return "slice_change";
        case HapticEvent::SelectionConfirm: return "selection_confirm";
        case HapticEvent::InvalidAction: return "invalid_action";
    }
    return "unknown";
}

// Per-event waveform and pacing
struct HapticProfile {
    bool enabled = true;
    HapticPattern menu_appear = HapticPattern::DampStateChange;
    HapticPattern slice_change = HapticPattern::SubtleCollision;
    HapticPattern confirm = HapticPattern::SharpStateChange;
    HapticPattern invalid = HapticPattern::AngryAlert;
    int debounce_ms = 20;          // between any two pulses
    int slice_debounce_ms = 20;    // between slice changes while sweeping
    int reentry_debounce_ms = 50;  // back into the slice just left

    HapticPattern pattern_for(HapticEvent event) const {
        switch (event) {
            case HapticEvent::MenuAppear: return menu_appear;
            case HapticEvent::SliceChange: return slice_change;
            case HapticEvent::SelectionConfirm: return confirm;
            case HapticEvent::InvalidAction: return invalid;
        }
        return slice_change;
    }

    bool operator==(const HapticProfile&) const = default;
};

} // namespace juhradial
