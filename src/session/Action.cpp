#include "session/Action.h"

#include "core/Error.h"

#include <boost/json.hpp>

#include <limits>
#include <type_traits>

namespace deskpool::session {

namespace json = boost::json;

namespace {

constexpr int kMaxScrollAmount = 50;
constexpr std::size_t kDescribeTextLen = 20;

[[noreturn]] void reject(const std::string& why) {
    throw Error(Errc::InvalidArgument, "invalid action: " + why);
}

const json::value& require(const json::object& obj, std::string_view key) {
    const json::value* v = obj.if_contains(key);
    if (!v) reject("missing '" + std::string(key) + "'");
    return *v;
}

int require_int(const json::object& obj, std::string_view key) {
    const json::value& v = require(obj, key);
    if (v.is_int64()) {
        const auto n = v.get_int64();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            reject("'" + std::string(key) + "' out of range");
        }
        return static_cast<int>(n);
    }
    if (v.is_uint64() && v.get_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        return static_cast<int>(v.get_uint64());
    }
    reject("'" + std::string(key) + "' must be an integer");
}

std::string require_string(const json::object& obj, std::string_view key) {
    const json::value& v = require(obj, key);
    if (!v.is_string()) reject("'" + std::string(key) + "' must be a string");
    return std::string(v.get_string());
}

std::string optional_string(const json::object& obj, std::string_view key, std::string fallback) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return fallback;
    if (!v->is_string()) reject("'" + std::string(key) + "' must be a string");
    return std::string(v->get_string());
}

MouseButton parse_button(const std::string& s) {
    if (s == "left")   return MouseButton::Left;
    if (s == "right")  return MouseButton::Right;
    if (s == "middle") return MouseButton::Middle;
    reject("unknown button '" + s + "'");
}

ScrollDirection parse_direction(const std::string& s) {
    if (s == "up")   return ScrollDirection::Up;
    if (s == "down") return ScrollDirection::Down;
    reject("unknown scroll direction '" + s + "'");
}

} // namespace

Action action_from_json(const json::value& v) {
    const json::object* obj = v.if_object();
    if (!obj) reject("payload must be an object");

    const std::string type = require_string(*obj, "type");

    Action action;
    if (type == "click") {
        action = ClickAction{require_int(*obj, "x"), require_int(*obj, "y"),
                             parse_button(optional_string(*obj, "button", "left"))};
    } else if (type == "type") {
        action = TypeAction{require_string(*obj, "text")};
    } else if (type == "key") {
        action = KeyAction{require_string(*obj, "key")};
    } else if (type == "scroll") {
        ScrollAction s;
        s.direction = parse_direction(optional_string(*obj, "direction", "down"));
        if (obj->if_contains("amount")) s.amount = require_int(*obj, "amount");
        action = s;
    } else if (type == "move") {
        action = MoveAction{require_int(*obj, "x"), require_int(*obj, "y")};
    } else if (type == "screenshot") {
        action = ScreenshotAction{};
    } else {
        reject("unknown type '" + type + "'");
    }

    validate(action);
    return action;
}

void validate(const Action& action) {
    std::visit([](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, ClickAction> || std::is_same_v<T, MoveAction>) {
            if (a.x < 0 || a.y < 0) reject("coordinates must be non-negative");
        } else if constexpr (std::is_same_v<T, TypeAction>) {
            if (a.text.empty()) reject("text must not be empty");
        } else if constexpr (std::is_same_v<T, KeyAction>) {
            if (a.key.empty()) reject("key must not be empty");
        } else if constexpr (std::is_same_v<T, ScrollAction>) {
            if (a.amount <= 0 || a.amount > kMaxScrollAmount) {
                reject("scroll amount must be between 1 and " + std::to_string(kMaxScrollAmount));
            }
        }
    }, action);
}

std::string describe(const Action& action) {
    return std::visit([](const auto& a) -> std::string {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, ClickAction>) {
            return "click(" + std::to_string(a.x) + ", " + std::to_string(a.y) + ") [" +
                   std::string(to_string(a.button)) + "]";
        } else if constexpr (std::is_same_v<T, TypeAction>) {
            std::string shown = a.text.substr(0, kDescribeTextLen);
            if (a.text.size() > kDescribeTextLen) shown += "...";
            return "type(\"" + shown + "\")";
        } else if constexpr (std::is_same_v<T, KeyAction>) {
            return "key(" + a.key + ")";
        } else if constexpr (std::is_same_v<T, ScrollAction>) {
            return "scroll(" + std::string(to_string(a.direction)) + ", " + std::to_string(a.amount) + ")";
        } else if constexpr (std::is_same_v<T, MoveAction>) {
            return "move(" + std::to_string(a.x) + ", " + std::to_string(a.y) + ")";
        } else {
            return "screenshot()";
        }
    }, action);
}

std::string_view to_string(MouseButton button) noexcept {
    switch (button) {
        case MouseButton::Left:   return "left";
        case MouseButton::Right:  return "right";
        case MouseButton::Middle: return "middle";
    }
    return "left";
}

std::string_view to_string(ScrollDirection direction) noexcept {
    return direction == ScrollDirection::Up ? "up" : "down";
}

} // namespace deskpool::session
