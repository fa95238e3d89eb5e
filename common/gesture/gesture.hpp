#pragma once

#include "../types/menu.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace juhradial::gesture {

// Menu size and screen area used to keep an opened menu fully visible
struct MenuGeometry {
    int32_t radius = 140;
    int32_t edge_margin = 20;
    int32_t screen_width = 1920;
    int32_t screen_height = 1080;
};

Position clamp_to_screen(Position position, const MenuGeometry& geometry);

enum class State : uint8_t {
    Idle,
    Pressed,
    HoldOpen,
};

std::string_view to_string(State state);

// Hold-vs-tap classification of the gesture button. Single source of truth for "menu open".
// Time is passed in, the hold timer is owned by the caller.
class StateMachine {
public:
    struct Options {
        std::chrono::milliseconds hold_threshold{300};
        std::string tap_action = "toggle";
        MenuGeometry geometry;
    };

    // Returned by press(): arm a timer for `deadline`, then call hold_elapsed(generation)
    struct HoldTimer {
        Clock::time_point deadline;
        uint64_t generation = 0;
    };

    explicit StateMachine(Options options);

    // nullopt if not Idle (duplicate press, ignored)
    std::optional<HoldTimer> press(Clock::time_point now);
    std::vector<MenuIntent> release(Clock::time_point now);
    std::vector<MenuIntent> hold_elapsed(uint64_t generation);

    // Records the pointer; true if it should be forwarded for highlight tracking
    bool motion(Position position);

    // Device went away mid-gesture
    std::vector<MenuIntent> reset();

    State state() const { return state_; }
    bool menu_open() const { return state_ == State::HoldOpen; }
    Position position() const { return position_; }
    const Options& options() const { return options_; }
    void set_options(Options options);

private:
    MenuIntent open_intent() const;

    Options options_;
    State state_ = State::Idle;
    Clock::time_point pressed_at_{};
    uint64_t generation_ = 0;
    Position position_{};
};

} // namespace juhradial::gesture
