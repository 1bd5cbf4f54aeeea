#pragma once

#include "session/Action.h"

#include <string>

namespace deskpool::transport {

// Input-injection and capture primitives of a session's remote control
// endpoint. Every call throws deskpool::Error(Errc::TransportError) when the
// channel is down or the remote side reports a failure.
class ControlChannel {
public:
    virtual ~ControlChannel() = default;

    virtual void click(int x, int y, session::MouseButton button) = 0;
    virtual void type_text(const std::string& text) = 0;
    virtual void press_key(const std::string& key) = 0;
    virtual void scroll(session::ScrollDirection direction, int amount) = 0;
    virtual void move_cursor(int x, int y) = 0;

    // Raw PNG bytes.
    virtual std::string screenshot() = 0;

    virtual void close() = 0;
};

// Routes one primitive action to the matching channel call. ScreenshotAction
// is a no-op here; callers capture frames separately.
void apply(ControlChannel& channel, const session::Action& action);

} // namespace deskpool::transport
