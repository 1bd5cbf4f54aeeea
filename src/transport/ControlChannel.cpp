#include "transport/ControlChannel.h"

#include <type_traits>

namespace deskpool::transport {

void apply(ControlChannel& channel, const session::Action& action) {
    std::visit([&channel](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, session::ClickAction>) {
            channel.click(a.x, a.y, a.button);
        } else if constexpr (std::is_same_v<T, session::TypeAction>) {
            channel.type_text(a.text);
        } else if constexpr (std::is_same_v<T, session::KeyAction>) {
            channel.press_key(a.key);
        } else if constexpr (std::is_same_v<T, session::ScrollAction>) {
            channel.scroll(a.direction, a.amount);
        } else if constexpr (std::is_same_v<T, session::MoveAction>) {
            channel.move_cursor(a.x, a.y);
        }
    }, action);
}

} // namespace deskpool::transport
