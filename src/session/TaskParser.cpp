#include "session/TaskParser.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace deskpool::session {

namespace {

using std::chrono::milliseconds;

const std::regex& navigate_pattern() {
    static const std::regex re(
        R"(\b(?:go to|navigate to|open|visit|browse to)\s+(https?://\S+|[a-zA-Z0-9][-a-zA-Z0-9]*(?:\.[a-zA-Z]{2,})+\S*))",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& search_pattern() {
    static const std::regex re(
        R"(\b(?:search|google|look up|find)\s+(?:for\s+)?["']?([^"']+?)["']?(?:\s+on\s+(?:google|chrome|the\s+web))?$)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool mentions_browser_launch(const std::string& lowered) {
    static const char* const phrases[] = {
        "open chrome", "launch chrome", "start chrome", "open browser", "open chromium",
        "open firefox", "launch firefox", "start firefox",
    };
    for (const char* p : phrases) {
        if (lowered.find(p) != std::string::npos) return true;
    }
    return false;
}

TimedAction key(std::string k, int settle_ms = 0) {
    return {KeyAction{std::move(k)}, milliseconds(settle_ms)};
}

TimedAction type(std::string text, int settle_ms = 0) {
    return {TypeAction{std::move(text)}, milliseconds(settle_ms)};
}

TaskStep launch_browser(OsKind kind) {
    TaskStep step;
    step.reasoning = "Firefox launched";
    step.frame_label = "Firefox opened";

    switch (kind) {
        case OsKind::Linux:
            step.summary = "Opened terminal and launched Firefox";
            step.actions = {
                key("ctrl+alt+t", 1500),
                type("firefox 2>/dev/null || chromium-browser --no-first-run 2>/dev/null || "
                     "google-chrome --no-first-run 2>/dev/null &"),
                key("Return", 3000),
                key("ctrl+d", 500),
            };
            break;
        case OsKind::Windows:
            step.summary = "Launched Firefox via Run dialog";
            step.actions = {key("super+r", 500), type("firefox"), key("Return", 3000)};
            break;
        case OsKind::MacOS:
            step.summary = "Launched Firefox via Spotlight";
            step.actions = {key("cmd+space", 500), type("Firefox"), key("Return", 3000)};
            break;
    }
    return step;
}

TaskStep address_bar_entry(const std::string& text) {
    TaskStep step;
    step.actions = {key("ctrl+l", 300), type(text), key("Return", 3000)};
    return step;
}

} // namespace

ParsedTask parse_task(const std::string& task) {
    ParsedTask parsed;
    std::smatch m;

    if (std::regex_search(task, m, navigate_pattern())) {
        std::string url = m[1].str();
        while (!url.empty() && std::string(".,;!?)").find(url.back()) != std::string::npos) {
            url.pop_back();
        }
        if (lower(url).rfind("http", 0) != 0) url = "https://" + url;
        parsed.kind = ParsedTask::Kind::Navigate;
        parsed.url = std::move(url);
        return parsed;
    }

    if (std::regex_search(task, m, search_pattern())) {
        std::string query = trim(m[1].str());
        if (!query.empty()) {
            parsed.kind = ParsedTask::Kind::Search;
            parsed.query = std::move(query);
            return parsed;
        }
    }

    if (mentions_browser_launch(lower(task))) {
        parsed.kind = ParsedTask::Kind::OpenBrowser;
    }
    return parsed;
}

std::vector<TaskStep> plan_task(const ParsedTask& parsed, OsKind kind) {
    std::vector<TaskStep> steps;
    if (parsed.kind == ParsedTask::Kind::None) return steps;

    steps.push_back(launch_browser(kind));

    if (parsed.kind == ParsedTask::Kind::Navigate) {
        TaskStep nav = address_bar_entry(parsed.url);
        nav.summary = "Navigated to " + parsed.url;
        nav.reasoning = "Navigated to " + parsed.url;
        nav.frame_label = "Loaded " + parsed.url;
        steps.push_back(std::move(nav));
    } else if (parsed.kind == ParsedTask::Kind::Search) {
        TaskStep search = address_bar_entry(parsed.query);
        search.summary = "Searched for \"" + parsed.query + "\"";
        search.reasoning = search.summary;
        search.frame_label = "Search results for \"" + parsed.query + "\"";
        steps.push_back(std::move(search));
    }
    return steps;
}

} // namespace deskpool::session
