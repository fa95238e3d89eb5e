#include "gesture.hpp"

#include <algorithm>
#include <iostream>

namespace juhradial::gesture {

Position clamp_to_screen(Position position, const MenuGeometry& geometry) {
    auto clamp_axis = [&geometry](int32_t value, int32_t extent) {
        int32_t low = geometry.edge_margin + geometry.radius;
        int32_t high = extent - geometry.edge_margin - geometry.radius;
        if (high < low) {
            return extent / 2;  // Screen smaller than the menu
        }
        return std::clamp(value, low, high);
    };

    return Position{clamp_axis(position.x, geometry.screen_width),
                    clamp_axis(position.y, geometry.screen_height)};
}

std::string_view to_string(State state) {
    switch (state) {
        case State::Idle: return "idle";
        case State::Pressed: return "pressed";
        case State::HoldOpen: return "hold_open";
    }
    return "unknown";
}

StateMachine::StateMachine(Options options) : options_(std::move(options)) {}

void StateMachine::set_options(Options options) {
    options_ = std::move(options);
}

MenuIntent StateMachine::open_intent() const {
    return MenuIntent::open_at(clamp_to_screen(position_, options_.geometry));
}

std::optional<StateMachine::HoldTimer> StateMachine::press(Clock::time_point now) {
    if (state_ != State::Idle) {
        std::cerr << "gesture: press while " << to_string(state_) << ", ignored" << std::endl;
        return std::nullopt;
    }

    state_ = State::Pressed;
    pressed_at_ = now;
    ++generation_;
    return HoldTimer{now + options_.hold_threshold, generation_};
}

std::vector<MenuIntent> StateMachine::release(Clock::time_point now) {
    switch (state_) {
        case State::Idle:
            return {};

        case State::Pressed:
            state_ = State::Idle;
            // Invalidate the armed timer
            ++generation_;
            if (now - pressed_at_ < options_.hold_threshold) {
                return {MenuIntent::select(options_.tap_action)};
            }
            // Held long enough but the timer has not been delivered yet
            return {open_intent(), MenuIntent::close()};

        case State::HoldOpen:
            state_ = State::Idle;
            return {MenuIntent::close()};
    }
    return {};
}

std::vector<MenuIntent> StateMachine::hold_elapsed(uint64_t generation) {
    if (state_ != State::Pressed || generation != generation_) {
        return {};
    }

    state_ = State::HoldOpen;
    return {open_intent()};
}

bool StateMachine::motion(Position position) {
    position_ = position;
    return state_ == State::HoldOpen;
}

std::vector<MenuIntent> StateMachine::reset() {
    State previous = state_;
    state_ = State::Idle;
    ++generation_;

    if (previous == State::HoldOpen) {
        return {MenuIntent::close()};
    }
    return {};
}

} // namespace juhradial::gesture
