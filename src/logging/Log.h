#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace deskpool::logging {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_level(Level level) noexcept;
Level level() noexcept;
bool enabled(Level level) noexcept;

std::optional<Level> parse_level(std::string_view name);
std::string_view level_name(Level level) noexcept;

// Writes one complete line to stderr.
void write(Level level, std::string_view tag, std::string_view message);

// Collects a message and writes it as a single line when destroyed:
//   logging::warn("Tunnel") << "health check failed on port " << port;
class Line {
public:
    Line(Level level, std::string_view tag);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <typename T>
    Line& operator<<(const T& value) {
        if (enabled_) buf_ << value;
        return *this;
    }

private:
    Level level_;
    std::string tag_;
    bool enabled_;
    std::ostringstream buf_;
};

inline Line debug(std::string_view tag) { return Line(Level::Debug, tag); }
inline Line info(std::string_view tag)  { return Line(Level::Info, tag); }
inline Line warn(std::string_view tag)  { return Line(Level::Warn, tag); }
inline Line error(std::string_view tag) { return Line(Level::Error, tag); }

} // namespace deskpool::logging
