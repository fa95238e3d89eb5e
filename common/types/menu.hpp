#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace juhradial {

using Clock = std::chrono::steady_clock;

struct Position {
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const Position&) const = default;
};

struct GestureEvent {
    enum class Kind : uint8_t { Press, Release };

    Kind kind = Kind::Press;
    Clock::time_point timestamp{};
};

// The only gesture information handed to the presentation layer
struct MenuIntent {
    enum class Kind : uint8_t { OpenAt, Close, Select };

    Kind kind = Kind::Close;
    Position position{};     // OpenAt
    std::string action_id;   // Select

    static MenuIntent open_at(Position pos) { return {Kind::OpenAt, pos, {}}; }
    static MenuIntent close() { return {Kind::Close, {}, {}}; }
    static MenuIntent select(std::string action) { return {Kind::Select, {}, std::move(action)}; }

    bool operator==(const MenuIntent&) const = default;
};

} // namespace juhradial
