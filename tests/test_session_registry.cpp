#include <catch2/catch.hpp>

#include "core/Error.h"
#include "session/SessionRegistry.h"

#include <algorithm>

using namespace deskpool;
using namespace deskpool::session;

namespace {

Session make_session(const std::string& id, Status status = Status::Ready) {
    Session s;
    s.id = id;
    s.display_name = id;
    s.status = status;
    s.size_class = SizeClass::Medium;
    s.resources = resources_for(SizeClass::Medium);
    return s;
}

bool has_id(const std::vector<Session>& sessions, const std::string& id) {
    return std::any_of(sessions.begin(), sessions.end(), [&](const Session& s) { return s.id == id; });
}

} // namespace

TEST_CASE("Registry rejects inserts past capacity without mutating", "[registry]") {
    SessionRegistry reg(2);
    reg.insert(make_session("a"));
    reg.insert(make_session("b"));
    REQUIRE(reg.size() == 2);

    try {
        reg.insert(make_session("c"));
        FAIL("insert past capacity succeeded");
    } catch (const Error& e) {
        REQUIRE(e.code() == Errc::ResourceExhausted);
    }
    REQUIRE(reg.size() == 2);
    REQUIRE_FALSE(reg.contains("c"));
}

TEST_CASE("Stopped records do not occupy a slot", "[registry]") {
    SessionRegistry reg(1);
    reg.insert(make_session("a"));
    REQUIRE(reg.transition("a", Status::Stopped));
    REQUIRE(reg.size() == 0);
    REQUIRE_NOTHROW(reg.insert(make_session("b")));
}

TEST_CASE("Error sessions keep their slot", "[registry]") {
    SessionRegistry reg(1);
    reg.insert(make_session("a"));
    REQUIRE(reg.transition("a", Status::Error));
    REQUIRE_THROWS_AS(reg.insert(make_session("b")), Error);
}

TEST_CASE("Tag edits are idempotent", "[registry][tags]") {
    SessionRegistry reg(4);
    reg.insert(make_session("a"));

    const auto once = reg.add_tags("a", {"gpu"});
    const auto twice = reg.add_tags("a", {"gpu", "gpu"});
    REQUIRE(once);
    REQUIRE(twice);
    REQUIRE(once->tags == twice->tags);
    REQUIRE(twice->tags.size() == 1);

    REQUIRE(reg.remove_tags("a", {"gpu"})->tags.empty());
    REQUIRE(reg.remove_tags("a", {"gpu"})->tags.empty());
    REQUIRE(reg.remove_tags("a", {"never-added"}));

    REQUIRE_FALSE(reg.add_tags("missing", {"x"}));
}

TEST_CASE("ListByTag follows tag edits", "[registry][tags]") {
    SessionRegistry reg(4);
    reg.insert(make_session("a"));
    reg.insert(make_session("b"));

    reg.add_tags("a", {"blue"});
    REQUIRE(has_id(reg.list_by_tag("blue"), "a"));
    REQUIRE_FALSE(has_id(reg.list_by_tag("blue"), "b"));

    reg.remove_tags("a", {"blue"});
    REQUIRE_FALSE(has_id(reg.list_by_tag("blue"), "a"));
}

TEST_CASE("all_tags is the sorted union", "[registry][tags]") {
    SessionRegistry reg(4);
    reg.insert(make_session("a"));
    reg.insert(make_session("b"));
    reg.add_tags("a", {"zeta", "alpha"});
    reg.add_tags("b", {"alpha", "mid"});

    REQUIRE(reg.all_tags() == std::vector<std::string>{"alpha", "mid", "zeta"});
}

TEST_CASE("Status graph", "[registry][status]") {
    SECTION("forward path") {
        REQUIRE(can_transition(Status::Spawning, Status::SettingUp));
        REQUIRE(can_transition(Status::SettingUp, Status::Ready));
        REQUIRE(can_transition(Status::Ready, Status::Working));
        REQUIRE(can_transition(Status::Working, Status::Idle));
        REQUIRE(can_transition(Status::Idle, Status::Working));
    }
    SECTION("never back to provisioning states") {
        for (Status from : {Status::Ready, Status::Working, Status::Idle}) {
            REQUIRE_FALSE(can_transition(from, Status::Spawning));
            REQUIRE_FALSE(can_transition(from, Status::SettingUp));
        }
    }
    SECTION("error from every non-terminal state") {
        for (Status from : {Status::Spawning, Status::SettingUp, Status::Ready, Status::Working, Status::Idle}) {
            REQUIRE(can_transition(from, Status::Error));
        }
        REQUIRE_FALSE(can_transition(Status::Stopped, Status::Error));
    }
    SECTION("terminal states") {
        REQUIRE(can_transition(Status::Error, Status::Stopped));
        REQUIRE_FALSE(can_transition(Status::Error, Status::Ready));
        REQUIRE_FALSE(can_transition(Status::Stopped, Status::Ready));
        REQUIRE(is_terminal(Status::Stopped));
        REQUIRE(is_terminal(Status::Error));
    }
}

TEST_CASE("Illegal transitions leave the record untouched", "[registry][status]") {
    SessionRegistry reg(2);
    reg.insert(make_session("a", Status::Ready));
    REQUIRE_FALSE(reg.transition("a", Status::Spawning));
    REQUIRE(reg.get("a")->status == Status::Ready);
    REQUIRE_FALSE(reg.transition("missing", Status::Ready));
}

TEST_CASE("claim serializes work on a session", "[registry][status]") {
    SessionRegistry reg(2);
    reg.insert(make_session("a", Status::Ready));

    REQUIRE(reg.claim("a", {Status::Ready, Status::Idle}, Status::Working) == Status::Ready);
    REQUIRE(reg.get("a")->status == Status::Working);

    try {
        reg.claim("a", {Status::Ready, Status::Idle}, Status::Working);
        FAIL("second claim succeeded");
    } catch (const Error& e) {
        REQUIRE(e.code() == Errc::InvalidState);
    }

    REQUIRE_THROWS_AS(reg.claim("missing", {Status::Ready}, Status::Working), Error);
}

TEST_CASE("Pool status counts by status", "[registry]") {
    SessionRegistry reg(5);
    reg.insert(make_session("a", Status::Ready));
    reg.insert(make_session("b", Status::Working));
    reg.insert(make_session("c", Status::Idle));
    reg.insert(make_session("d", Status::Error));

    const PoolStatus ps = reg.pool_status();
    REQUIRE(ps.total == 4);
    REQUIRE(ps.ready == 1);
    REQUIRE(ps.working == 1);
    REQUIRE(ps.idle == 1);
    REQUIRE(ps.error == 1);
    REQUIRE(ps.capacity == 5);

    REQUIRE(reg.list_by_status(Status::Idle).size() == 1);
    REQUIRE(reg.list_by_status(Status::Idle).front().id == "c");
}

TEST_CASE("Size classes map to fixed resources", "[session]") {
    REQUIRE(resources_for(SizeClass::Small).memory_mb == 4096);
    REQUIRE(resources_for(SizeClass::Medium).vcpus == 2);
    REQUIRE(resources_for(SizeClass::Large).storage_gb == 80);

    REQUIRE(parse_size_class("medium") == SizeClass::Medium);
    REQUIRE(parse_region("asia-pacific") == Region::AsiaPacific);
    REQUIRE_THROWS_AS(parse_os_kind("beos"), Error);
}
