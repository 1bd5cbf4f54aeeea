#pragma once

#include "session/Session.h"

#include <mutex>
#include <string>
#include <vector>

namespace deskpool::orchestrator {

// Rewrites a JSON snapshot of the pool for outside observers. Nothing in the
// service reads it back. Failures are logged and otherwise ignored.
class StatusExporter {
public:
    explicit StatusExporter(std::string path) : path_(std::move(path)) {}

    void write(const std::vector<session::Session>& sessions, const session::PoolStatus& pool);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mu_;
};

} // namespace deskpool::orchestrator
