#pragma once

#include "session/Action.h"
#include "session/Session.h"

#include <chrono>
#include <string>
#include <vector>

namespace deskpool::session {

// Fixed-rule interpretation of free-text tasks. Precedence when several rules
// match: navigate, then search, then open-browser. Anything else is a no-op.
struct ParsedTask {
    enum class Kind { None, Navigate, Search, OpenBrowser };

    Kind kind = Kind::None;
    std::string url;     // Navigate, always with a scheme
    std::string query;   // Search
};

ParsedTask parse_task(const std::string& task);

struct TimedAction {
    Action action;
    std::chrono::milliseconds settle{0};   // wait after the action
};

struct TaskStep {
    std::string summary;      // appended to TaskResult::output
    std::string reasoning;    // attached to the frame captured after the step
    std::string frame_label;
    std::vector<TimedAction> actions;
};

// Steps for a parsed task on a given OS. Empty for Kind::None.
std::vector<TaskStep> plan_task(const ParsedTask& parsed, OsKind kind);

} // namespace deskpool::session
