#include <catch2/catch.hpp>

#include "session/TaskParser.h"

#include <variant>

using namespace deskpool::session;

namespace {

std::vector<std::string> keys_of(const TaskStep& step) {
    std::vector<std::string> keys;
    for (const auto& timed : step.actions) {
        if (const auto* k = std::get_if<KeyAction>(&timed.action)) keys.push_back(k->key);
    }
    return keys;
}

std::vector<std::string> typed_text(const TaskStep& step) {
    std::vector<std::string> texts;
    for (const auto& timed : step.actions) {
        if (const auto* t = std::get_if<TypeAction>(&timed.action)) texts.push_back(t->text);
    }
    return texts;
}

} // namespace

TEST_CASE("Navigate phrases become https URLs", "[task]") {
    const ParsedTask p = parse_task("go to example.com");
    REQUIRE(p.kind == ParsedTask::Kind::Navigate);
    REQUIRE(p.url == "https://example.com");

    REQUIRE(parse_task("Visit https://docs.example.org/start.").url == "https://docs.example.org/start");
    REQUIRE(parse_task("please navigate to news.ycombinator.com!").url == "https://news.ycombinator.com");
    REQUIRE(parse_task("open http://localhost.dev:8080/x").url == "http://localhost.dev:8080/x");
}

TEST_CASE("Search phrases capture the query", "[task]") {
    ParsedTask p = parse_task("search for cute otters");
    REQUIRE(p.kind == ParsedTask::Kind::Search);
    REQUIRE(p.query == "cute otters");

    p = parse_task("google \"boost asio strands\" on google");
    REQUIRE(p.kind == ParsedTask::Kind::Search);
    REQUIRE(p.query == "boost asio strands");

    p = parse_task("look up weather in Oslo");
    REQUIRE(p.query == "weather in Oslo");
}

TEST_CASE("Ambiguous phrases follow navigate > search > browser", "[task]") {
    SECTION("search with a domain-looking query stays a search") {
        const ParsedTask p = parse_task("search example.com");
        REQUIRE(p.kind == ParsedTask::Kind::Search);
        REQUIRE(p.query == "example.com");
    }
    SECTION("navigate wins when both match") {
        REQUIRE(parse_task("go to example.com and search for cats").kind == ParsedTask::Kind::Navigate);
    }
    SECTION("browser launch only when nothing else matched") {
        REQUIRE(parse_task("open firefox").kind == ParsedTask::Kind::OpenBrowser);
        REQUIRE(parse_task("open browser and search for cats").kind == ParsedTask::Kind::Search);
    }
}

TEST_CASE("Trigger words only match as whole words", "[task]") {
    REQUIRE(parse_task("reopen docs.io").kind == ParsedTask::Kind::None);
    REQUIRE(parse_task("revisit example.com").kind == ParsedTask::Kind::None);
    REQUIRE(parse_task("research quantum dots").kind == ParsedTask::Kind::None);
    REQUIRE(parse_task("then open docs.io").url == "https://docs.io");
}

TEST_CASE("Unmatched text is a no-op", "[task]") {
    const ParsedTask p = parse_task("make me a sandwich");
    REQUIRE(p.kind == ParsedTask::Kind::None);
    REQUIRE(plan_task(p, OsKind::Linux).empty());
}

TEST_CASE("Plans open a browser the way each OS does", "[task]") {
    const ParsedTask nav = parse_task("go to example.com");

    SECTION("linux uses a terminal") {
        const auto steps = plan_task(nav, OsKind::Linux);
        REQUIRE(steps.size() == 2);
        REQUIRE(keys_of(steps[0]) == std::vector<std::string>{"ctrl+alt+t", "Return", "ctrl+d"});
    }
    SECTION("windows uses the run dialog") {
        const auto steps = plan_task(nav, OsKind::Windows);
        REQUIRE(keys_of(steps[0]) == std::vector<std::string>{"super+r", "Return"});
        REQUIRE(typed_text(steps[0]) == std::vector<std::string>{"firefox"});
    }
    SECTION("macos uses spotlight") {
        const auto steps = plan_task(nav, OsKind::MacOS);
        REQUIRE(keys_of(steps[0]).front() == "cmd+space");
    }
    SECTION("the second step drives the address bar") {
        const auto steps = plan_task(nav, OsKind::Windows);
        REQUIRE(keys_of(steps[1]) == std::vector<std::string>{"ctrl+l", "Return"});
        REQUIRE(typed_text(steps[1]) == std::vector<std::string>{"https://example.com"});
        REQUIRE(steps[1].summary == "Navigated to https://example.com");
    }
}

TEST_CASE("Open-browser plans have a single step", "[task]") {
    const auto steps = plan_task(parse_task("launch chrome"), OsKind::Windows);
    REQUIRE(steps.size() == 1);
}
