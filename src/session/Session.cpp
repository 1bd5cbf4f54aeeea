#include "session/Session.h"

#include "core/Error.h"

#include <algorithm>

namespace deskpool::session {

Resources resources_for(SizeClass size) noexcept {
    switch (size) {
        case SizeClass::Small:  return {4096, 1, 20};
        case SizeClass::Medium: return {8192, 2, 40};
        case SizeClass::Large:  return {32768, 8, 80};
    }
    return {};
}

std::string_view to_string(Status status) noexcept {
    switch (status) {
        case Status::Spawning:   return "spawning";
        case Status::SettingUp:  return "setting_up";
        case Status::Ready:      return "ready";
        case Status::Working:    return "working";
        case Status::Idle:       return "idle";
        case Status::Error:      return "error";
        case Status::Stopped:    return "stopped";
    }
    return "unknown";
}

std::string_view to_string(OsKind kind) noexcept {
    switch (kind) {
        case OsKind::Linux:   return "linux";
        case OsKind::Windows: return "windows";
        case OsKind::MacOS:   return "macos";
    }
    return "unknown";
}

std::string_view to_string(SizeClass size) noexcept {
    switch (size) {
        case SizeClass::Small:  return "small";
        case SizeClass::Medium: return "medium";
        case SizeClass::Large:  return "large";
    }
    return "unknown";
}

std::string_view to_string(Region region) noexcept {
    switch (region) {
        case Region::NorthAmerica: return "north-america";
        case Region::Europe:        return "europe";
        case Region::AsiaPacific:  return "asia-pacific";
        case Region::SouthAmerica: return "south-america";
    }
    return "unknown";
}

Status parse_status(std::string_view name) {
    for (Status s : {Status::Spawning, Status::SettingUp, Status::Ready, Status::Working,
                     Status::Idle, Status::Error, Status::Stopped}) {
        if (to_string(s) == name) return s;
    }
    throw Error(Errc::InvalidArgument, "unknown status '" + std::string(name) + "'");
}

OsKind parse_os_kind(std::string_view name) {
    for (OsKind k : {OsKind::Linux, OsKind::Windows, OsKind::MacOS}) {
        if (to_string(k) == name) return k;
    }
    throw Error(Errc::InvalidArgument,
                "unknown kind '" + std::string(name) + "' (expected linux, windows or macos)");
}

SizeClass parse_size_class(std::string_view name) {
    for (SizeClass s : {SizeClass::Small, SizeClass::Medium, SizeClass::Large}) {
        if (to_string(s) == name) return s;
    }
    throw Error(Errc::InvalidArgument,
                "unknown size class '" + std::string(name) + "' (expected small, medium or large)");
}

Region parse_region(std::string_view name) {
    for (Region r : {Region::NorthAmerica, Region::Europe, Region::AsiaPacific, Region::SouthAmerica}) {
        if (to_string(r) == name) return r;
    }
    throw Error(Errc::InvalidArgument, "unknown region '" + std::string(name) + "'");
}

bool is_terminal(Status status) noexcept {
    return status == Status::Stopped || status == Status::Error;
}

// spawning -> setting_up -> ready -> {working <-> idle} -> stopped,
// error from any non-terminal state, error -> stopped on teardown.
bool can_transition(Status from, Status to) noexcept {
    if (from == to) return false;
    if (from == Status::Stopped) return false;
    if (to == Status::Stopped) return true;
    if (from == Status::Error) return false;
    if (to == Status::Error) return true;

    switch (from) {
        case Status::Spawning:   return to == Status::SettingUp;
        case Status::SettingUp: return to == Status::Ready;
        case Status::Ready:      return to == Status::Working;
        case Status::Working:    return to == Status::Idle;
        case Status::Idle:       return to == Status::Working;
        default:                 return false;
    }
}

bool Session::has_tag(std::string_view tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

} // namespace deskpool::session
