#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deskpool::session {

enum class Status { Spawning, SettingUp, Ready, Working, Idle, Error, Stopped };

enum class OsKind { Linux, Windows, MacOS };

enum class SizeClass { Small, Medium, Large };

enum class Region { NorthAmerica, Europe, AsiaPacific, SouthAmerica };

struct Resources {
    std::uint32_t memory_mb = 0;
    std::uint32_t vcpus = 0;
    std::uint32_t storage_gb = 0;
};

Resources resources_for(SizeClass size) noexcept;

std::string_view to_string(Status status) noexcept;
std::string_view to_string(OsKind kind) noexcept;
std::string_view to_string(SizeClass size) noexcept;
std::string_view to_string(Region region) noexcept;

// Parsers throw deskpool::Error(Errc::InvalidArgument) on unknown names.
Status parse_status(std::string_view name);
OsKind parse_os_kind(std::string_view name);
SizeClass parse_size_class(std::string_view name);
Region parse_region(std::string_view name);

bool is_terminal(Status status) noexcept;
bool can_transition(Status from, Status to) noexcept;

struct Frame {
    using Clock = std::chrono::system_clock;

    std::string session_id;
    std::string image_base64;   // PNG
    Clock::time_point timestamp{};
    std::string reasoning;
    std::string last_action;
};

struct Session {
    using Clock = std::chrono::system_clock;

    std::string id;
    std::string display_name;
    OsKind kind = OsKind::Windows;
    Status status = Status::Spawning;
    std::vector<std::string> tags;     // unique
    SizeClass size_class = SizeClass::Small;
    Resources resources{};
    std::optional<Region> region;
    Clock::time_point created_at{};
    Clock::time_point last_activity_at{};
    std::optional<std::string> current_task;
    std::optional<Frame> last_frame;
    std::string last_action_description;

    bool has_tag(std::string_view tag) const;
    void touch() { last_activity_at = Clock::now(); }
};

// Route to a session's control channel. Unset fields fall back to what the
// provider returned (host, machine name).
struct TransportHint {
    std::string type = "direct";    // direct | auto | ssh | iap | relay
    std::string host;
    std::string vm_name;
    std::string zone;
    std::string project;
    std::string username;
    std::string identity_file;
    std::string relay_hostname;
    std::uint16_t ssh_port = 22;
};

// Inputs accepted by SessionOrchestrator::create.
struct SessionConfig {
    std::string name;
    OsKind kind = OsKind::Windows;
    SizeClass size_class = SizeClass::Small;
    std::optional<Region> region;
    std::vector<std::string> tags;
    std::optional<TransportHint> transport;
};

struct TaskResult {
    std::string session_id;
    std::string task;
    bool success = false;
    std::string output;
    std::vector<Frame> frames;
    std::chrono::milliseconds duration{0};
    std::optional<std::string> error;
};

struct PoolStatus {
    std::size_t total = 0;
    std::size_t ready = 0;
    std::size_t working = 0;
    std::size_t idle = 0;
    std::size_t error = 0;
    std::size_t capacity = 0;
};

} // namespace deskpool::session
