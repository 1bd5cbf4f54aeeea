#include "orchestrator/JsonViews.h"

#include "core/Error.h"

#include <iomanip>
#include <sstream>

namespace deskpool::orchestrator {

namespace json = boost::json;
using namespace session;

namespace {

json::value optional_string(const std::optional<std::string>& s) {
    if (s) return json::value(*s);
    return nullptr;
}

std::string string_field(const json::object& obj, json::string_view key, const std::string& fallback = {}) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return fallback;
    if (!v->is_string()) {
        throw Error(Errc::InvalidArgument, "'" + std::string(key) + "' must be a string");
    }
    return std::string(v->get_string());
}

TransportHint transport_from_json(const json::value& v) {
    if (!v.is_object()) throw Error(Errc::InvalidArgument, "'transport' must be an object");
    const json::object& obj = v.as_object();

    TransportHint hint;
    hint.type = string_field(obj, "type", hint.type);
    hint.host = string_field(obj, "host");
    hint.vm_name = string_field(obj, "vmName");
    hint.zone = string_field(obj, "zone");
    hint.project = string_field(obj, "project");
    hint.username = string_field(obj, "username");
    hint.identity_file = string_field(obj, "identityFile");
    hint.relay_hostname = string_field(obj, "relayHostname");
    if (const json::value* port = obj.if_contains("sshPort")) {
        if (!port->is_int64() || port->as_int64() <= 0 || port->as_int64() > 65535) {
            throw Error(Errc::InvalidArgument, "'sshPort' must be a port number");
        }
        hint.ssh_port = static_cast<std::uint16_t>(port->as_int64());
    }
    return hint;
}

} // namespace

std::string iso8601(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const std::time_t t = system_clock::to_time_t(tp);
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return out.str();
}

json::object to_json(const Frame& frame) {
    json::object obj;
    obj["sessionId"] = frame.session_id;
    obj["imageBase64"] = frame.image_base64;
    obj["timestamp"] = iso8601(frame.timestamp);
    obj["reasoning"] = frame.reasoning;
    obj["lastAction"] = frame.last_action;
    return obj;
}

json::object summary_json(const Session& s) {
    json::array tags;
    for (const auto& t : s.tags) tags.emplace_back(t);

    json::object resources;
    resources["memoryMb"] = s.resources.memory_mb;
    resources["vcpus"] = s.resources.vcpus;
    resources["storageGb"] = s.resources.storage_gb;

    json::object obj;
    obj["id"] = s.id;
    obj["name"] = s.display_name;
    obj["kind"] = to_string(s.kind);
    obj["status"] = to_string(s.status);
    obj["tags"] = std::move(tags);
    obj["size"] = to_string(s.size_class);
    obj["resources"] = std::move(resources);
    if (s.region) obj["region"] = to_string(*s.region);
    else obj["region"] = nullptr;
    obj["createdAt"] = iso8601(s.created_at);
    obj["lastActivityAt"] = iso8601(s.last_activity_at);
    obj["currentTask"] = optional_string(s.current_task);
    obj["lastActionDescription"] = s.last_action_description;
    obj["hasFrame"] = s.last_frame.has_value();
    return obj;
}

json::object to_json(const Session& s) {
    json::object obj = summary_json(s);
    if (s.last_frame) obj["lastFrame"] = to_json(*s.last_frame);
    else obj["lastFrame"] = nullptr;
    return obj;
}

json::array to_json(const std::vector<Session>& sessions) {
    json::array arr;
    for (const auto& s : sessions) arr.emplace_back(summary_json(s));
    return arr;
}

json::object to_json(const TaskResult& result) {
    json::array frames;
    for (const auto& f : result.frames) frames.emplace_back(to_json(f));

    json::object obj;
    obj["sessionId"] = result.session_id;
    obj["task"] = result.task;
    obj["success"] = result.success;
    obj["output"] = result.output;
    obj["frames"] = std::move(frames);
    obj["durationMs"] = result.duration.count();
    obj["error"] = optional_string(result.error);
    return obj;
}

json::object to_json(const PoolStatus& status) {
    json::object obj;
    obj["total"] = status.total;
    obj["ready"] = status.ready;
    obj["working"] = status.working;
    obj["idle"] = status.idle;
    obj["error"] = status.error;
    obj["capacity"] = status.capacity;
    return obj;
}

std::vector<std::string> string_list(const json::value& v, const char* field) {
    if (!v.is_array()) throw Error(Errc::InvalidArgument, std::string("'") + field + "' must be an array");
    std::vector<std::string> out;
    for (const auto& item : v.as_array()) {
        if (!item.is_string() || item.get_string().empty()) {
            throw Error(Errc::InvalidArgument, std::string("'") + field + "' must hold non-empty strings");
        }
        out.emplace_back(item.get_string());
    }
    return out;
}

SessionConfig session_config_from_json(const json::object& obj, OsKind default_kind,
                                       std::optional<Region> default_region) {
    SessionConfig cfg;
    cfg.name = string_field(obj, "name");
    cfg.kind = default_kind;
    cfg.region = default_region;

    const std::string kind = string_field(obj, "kind");
    if (!kind.empty()) cfg.kind = parse_os_kind(kind);
    const std::string size = string_field(obj, "size");
    if (!size.empty()) cfg.size_class = parse_size_class(size);
    const std::string region = string_field(obj, "region");
    if (!region.empty()) cfg.region = parse_region(region);

    if (const json::value* tags = obj.if_contains("tags")) cfg.tags = string_list(*tags, "tags");
    if (const json::value* transport = obj.if_contains("transport")) cfg.transport = transport_from_json(*transport);
    return cfg;
}

} // namespace deskpool::orchestrator
