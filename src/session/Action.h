#pragma once

#include <boost/json/value.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace deskpool::session {

enum class MouseButton { Left, Right, Middle };
enum class ScrollDirection { Up, Down };

struct ClickAction {
    int x = 0;
    int y = 0;
    MouseButton button = MouseButton::Left;
};

struct TypeAction {
    std::string text;
};

struct KeyAction {
    std::string key;    // single key or '+'-joined combo, e.g. "ctrl+l"
};

struct ScrollAction {
    ScrollDirection direction = ScrollDirection::Down;
    int amount = 3;
};

struct MoveAction {
    int x = 0;
    int y = 0;
};

struct ScreenshotAction {};

using Action = std::variant<ClickAction, TypeAction, KeyAction, ScrollAction, MoveAction, ScreenshotAction>;

// Parses {"type":"click","x":..,"y":..,"button":"left"} and friends.
// Missing or malformed fields throw deskpool::Error(Errc::InvalidArgument).
Action action_from_json(const boost::json::value& v);

// Rejects payloads that must never reach a transport.
void validate(const Action& action);

std::string describe(const Action& action);

std::string_view to_string(MouseButton button) noexcept;
std::string_view to_string(ScrollDirection direction) noexcept;

} // namespace deskpool::session
