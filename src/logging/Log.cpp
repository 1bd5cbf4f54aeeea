#include "logging/Log.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace deskpool::logging {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_write_mu;

std::string timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << ms;
    return ss.str();
}

} // namespace

void set_level(Level level) noexcept { g_level.store(static_cast<int>(level)); }

Level level() noexcept { return static_cast<Level>(g_level.load()); }

bool enabled(Level lvl) noexcept { return static_cast<int>(lvl) >= g_level.load(); }

std::optional<Level> parse_level(std::string_view name) {
    if (name == "debug") return Level::Debug;
    if (name == "info")  return Level::Info;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    return std::nullopt;
}

std::string_view level_name(Level lvl) noexcept {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

void write(Level lvl, std::string_view tag, std::string_view message) {
    if (!enabled(lvl)) return;

    std::string line = timestamp();
    line += ' ';
    line += level_name(lvl);
    line += " [";
    line += tag;
    line += "] ";
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lk(g_write_mu);
    std::cerr << line;
}

Line::Line(Level lvl, std::string_view tag)
    : level_(lvl), tag_(tag), enabled_(enabled(lvl)) {}

Line::~Line() {
    if (enabled_) write(level_, tag_, buf_.str());
}

} // namespace deskpool::logging
