#include "transport/TunnelStateFile.h"

#include "logging/Log.h"

#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace deskpool::transport {

namespace fs = std::filesystem;
namespace json = boost::json;

namespace {

std::string iso8601(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Serializes read-modify-write cycles of establishers sharing one file.
std::mutex& file_mutex() {
    static std::mutex mu;
    return mu;
}

} // namespace

json::object TunnelStateFile::to_json(const TunnelStatus& status) {
    json::object obj;
    obj["type"] = to_string(status.type);
    if (status.local_port) obj["localPort"] = *status.local_port;
    else obj["localPort"] = nullptr;
    obj["remotePort"] = status.remote_port;
    obj["endpoint"] = status.endpoint;
    obj["target"] = status.target;
    obj["startedAt"] = iso8601(status.started_at);
    obj["degraded"] = status.degraded;
    return obj;
}

bool TunnelStateFile::store(const json::object& doc) const {
    std::error_code ec;
    const fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            logging::warn("Tunnel") << "cannot create " << target.parent_path().string() << ": " << ec.message();
            return false;
        }
    }

    const fs::path tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            logging::warn("Tunnel") << "cannot write tunnel state to " << tmp.string();
            return false;
        }
        out << json::serialize(doc) << '\n';
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        logging::warn("Tunnel") << "cannot replace " << path_ << ": " << ec.message();
        return false;
    }
    return true;
}

void TunnelStateFile::write(const TunnelStatus& status) const {
    if (path_.empty() || !status.local_port) return;

    std::lock_guard<std::mutex> lock(file_mutex());
    json::object doc = read(path_).value_or(json::object{});
    json::value& tunnels = doc["tunnels"];
    if (!tunnels.is_object()) tunnels = json::object{};
    tunnels.as_object()[std::to_string(*status.local_port)] = to_json(status);
    store(doc);
}

void TunnelStateFile::remove(std::uint16_t local_port) const {
    if (path_.empty()) return;

    std::lock_guard<std::mutex> lock(file_mutex());
    std::optional<json::object> doc = read(path_);
    if (!doc) return;

    json::value* tunnels = doc->if_contains("tunnels");
    if (tunnels && tunnels->is_object()) tunnels->as_object().erase(std::to_string(local_port));

    if (tunnels && tunnels->is_object() && !tunnels->as_object().empty()) {
        store(*doc);
        return;
    }
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) logging::debug("Tunnel") << "cannot remove " << path_ << ": " << ec.message();
}

std::optional<json::object> TunnelStateFile::read(const std::string& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;

    std::ostringstream text;
    text << in.rdbuf();

    boost::system::error_code ec;
    json::value doc = json::parse(text.str(), ec);
    if (ec || !doc.is_object()) {
        logging::warn("Tunnel") << "ignoring malformed state file " << path;
        return std::nullopt;
    }
    return std::move(doc.as_object());
}

std::optional<json::object> TunnelStateFile::read_entry(const std::string& path, std::uint16_t local_port) {
    const std::optional<json::object> doc = read(path);
    if (!doc) return std::nullopt;
    const json::value* tunnels = doc->if_contains("tunnels");
    if (!tunnels || !tunnels->is_object()) return std::nullopt;
    const json::value* entry = tunnels->as_object().if_contains(std::to_string(local_port));
    if (!entry || !entry->is_object()) return std::nullopt;
    return entry->as_object();
}

} // namespace deskpool::transport
