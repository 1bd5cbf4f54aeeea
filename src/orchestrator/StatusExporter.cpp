#include "orchestrator/StatusExporter.h"

#include "logging/Log.h"
#include "orchestrator/JsonViews.h"

#include <boost/json/serialize.hpp>

#include <filesystem>
#include <fstream>

namespace deskpool::orchestrator {

namespace fs = std::filesystem;
namespace json = boost::json;

void StatusExporter::write(const std::vector<session::Session>& sessions, const session::PoolStatus& pool) {
    std::uint64_t memory_mb = 0;
    std::uint64_t vcpus = 0;
    for (const auto& s : sessions) {
        memory_mb += s.resources.memory_mb;
        vcpus += s.resources.vcpus;
    }

    json::object resources;
    resources["memoryMb"] = memory_mb;
    resources["vcpus"] = vcpus;
    resources["count"] = sessions.size();

    json::object doc;
    doc["updatedAt"] = iso8601(std::chrono::system_clock::now());
    doc["sessions"] = to_json(sessions);
    doc["pool"] = to_json(pool);
    doc["resources"] = std::move(resources);
    const std::string text = json::serialize(doc);

    std::lock_guard<std::mutex> lock(mu_);
    std::error_code ec;
    const fs::path target(path_);
    if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);

    const fs::path tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            logging::warn("Export") << "cannot write " << tmp.string();
            return;
        }
        out << text << '\n';
    }
    fs::rename(tmp, target, ec);
    if (ec) logging::warn("Export") << "cannot replace " << path_ << ": " << ec.message();
}

} // namespace deskpool::orchestrator
