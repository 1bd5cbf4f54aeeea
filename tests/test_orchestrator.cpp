#include <catch2/catch.hpp>

#include "Fakes.hpp"

using namespace deskpool;
using namespace deskpool::testing;

TEST_CASE("Create brings a session to ready", "[orchestrator]") {
    Harness h;
    const Session s = h.orchestrator->create(linux_desk({"qa"}));

    REQUIRE(s.id.rfind("sess-", 0) == 0);
    REQUIRE(s.status == Status::Ready);
    REQUIRE(s.display_name == "x");
    REQUIRE(s.resources.vcpus == resources_for(SizeClass::Medium).vcpus);
    REQUIRE(h.transports.requests.front().type == transport::TunnelType::Direct);
    REQUIRE(h.transports.requests.front().host == "10.0.0.1");
    REQUIRE(h.registrar.registered.count(s.id) == 1);
    REQUIRE(h.orchestrator->active_heartbeats() == 1);
    REQUIRE(h.saw(EventType::SessionCreated));
    REQUIRE(h.saw(EventType::SessionReady));
}

TEST_CASE("Create beyond capacity is rejected without touching the registry", "[orchestrator]") {
    Harness h(2);
    h.orchestrator->create(linux_desk());
    h.orchestrator->create(linux_desk());

    REQUIRE(code_of([&] { h.orchestrator->create(linux_desk()); }) == Errc::ResourceExhausted);
    REQUIRE(h.orchestrator->registry().size() == 2);
    REQUIRE(h.orchestrator->list().size() == 2);
    REQUIRE(h.provider.created == 2);
}

TEST_CASE("Navigate tasks run on a ready Linux session", "[orchestrator]") {
    Harness h;
    const Session s = h.orchestrator->create(linux_desk());

    const TaskResult r = h.orchestrator->execute_task(s.id, "go to example.com");
    REQUIRE(r.success);
    REQUIRE_FALSE(r.error);
    REQUIRE(r.frames.size() >= 1);
    REQUIRE(r.output.find("Navigated to https://example.com") != std::string::npos);

    const auto calls = h.transports.last_channel()->calls();
    REQUIRE(calls.front() == "key ctrl+alt+t");
    REQUIRE(std::find(calls.begin(), calls.end(), "type https://example.com") != calls.end());

    const auto after = h.orchestrator->get(s.id);
    REQUIRE(after->status == Status::Idle);
    REQUIRE_FALSE(after->current_task);
    REQUIRE(after->last_frame);
    REQUIRE(h.saw(EventType::TaskComplete));
}

TEST_CASE("Unrecognized tasks capture the screen and succeed", "[orchestrator]") {
    Harness h;
    const Session s = h.orchestrator->create(linux_desk());

    const TaskResult r = h.orchestrator->execute_task(s.id, "make me a sandwich");
    REQUIRE(r.success);
    REQUIRE(r.frames.size() == 1);
    REQUIRE(h.transports.last_channel()->calls().empty());
}

TEST_CASE("Task step failures keep the frames captured so far", "[orchestrator]") {
    Harness h;
    const Session s = h.orchestrator->create(linux_desk());
    h.transports.last_channel()->fail_keys = true;

    const TaskResult r = h.orchestrator->execute_task(s.id, "go to example.com");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error);
    REQUIRE(r.frames.size() == 1);
    REQUIRE(h.orchestrator->get(s.id)->status == Status::Error);
    REQUIRE(h.saw(EventType::TaskFailed));
}

TEST_CASE("Actions return the frame captured after them", "[orchestrator]") {
    Harness h;
    const Session s = h.orchestrator->create(linux_desk());

    const Frame f = h.orchestrator->execute_action(s.id, ClickAction{40, 50, MouseButton::Left});
    REQUIRE(f.session_id == s.id);
    REQUIRE(f.last_action == "click(40, 50) [left]");
    REQUIRE_FALSE(f.image_base64.empty());

    const auto after = h.orchestrator->get(s.id);
    REQUIRE(after->status == Status::Idle);
    REQUIRE(after->last_action_description == "click(40, 50) [left]");

    REQUIRE(code_of([&] { h.orchestrator->execute_action(s.id, ScrollAction{ScrollDirection::Up, 0}); }) ==
            Errc::InvalidArgument);
}

TEST_CASE("Input failures mark the session as errored", "[orchestrator]") {
    Harness h;
    const Session s = h.orchestrator->create(linux_desk());
    h.transports.last_channel()->fail_keys = true;

    REQUIRE(code_of([&] { h.orchestrator->execute_action(s.id, KeyAction{"Return"}); }) == Errc::TransportError);
    const auto after = h.orchestrator->get(s.id);
    REQUIRE(after->status == Status::Error);
    REQUIRE(after->last_frame);
}

TEST_CASE("Actions on unavailable sessions are rejected", "[orchestrator]") {
    Harness h;

    SECTION("unknown id") {
        REQUIRE(code_of([&] { h.orchestrator->execute_action("sess-nope", KeyAction{"a"}); }) == Errc::NotFound);
    }
    SECTION("stopped session") {
        const Session s = h.orchestrator->create(linux_desk());
        h.orchestrator->stop(s.id);
        REQUIRE(code_of([&] { h.orchestrator->execute_action(s.id, KeyAction{"a"}); }) == Errc::InvalidState);
        REQUIRE_FALSE(h.orchestrator->get(s.id));
    }
    SECTION("errored session keeps its record") {
        const Session s = h.orchestrator->create(linux_desk());
        h.transports.last_channel()->fail_keys = true;
        REQUIRE_THROWS(h.orchestrator->execute_action(s.id, KeyAction{"a"}));

        const auto before = h.orchestrator->get(s.id);
        REQUIRE(code_of([&] { h.orchestrator->execute_action(s.id, KeyAction{"b"}); }) == Errc::InvalidState);
        const auto after = h.orchestrator->get(s.id);
        REQUIRE(after->status == Status::Error);
        REQUIRE(after->last_action_description == before->last_action_description);
    }
}

TEST_CASE("Stop is idempotent and closes the transport once", "[orchestrator]") {
    Harness h;
    const Session s = h.orchestrator->create(linux_desk());

    h.orchestrator->stop(s.id);
    h.orchestrator->stop(s.id);
    REQUIRE_NOTHROW(h.orchestrator->stop("sess-never-existed"));

    REQUIRE(h.transports.closes == 1);
    REQUIRE(h.provider.deleted == std::vector<std::string>{"desk-1"});
    REQUIRE(h.registrar.offline.count(s.id) == 1);
    REQUIRE(h.orchestrator->registry().size() == 0);
    REQUIRE(h.saw(EventType::SessionStopped));
}

TEST_CASE("Stop removes the session even when provider delete fails", "[orchestrator]") {
    Harness h;
    const Session s = h.orchestrator->create(linux_desk());
    h.provider.fail_delete = true;

    REQUIRE_NOTHROW(h.orchestrator->stop(s.id));
    REQUIRE_FALSE(h.orchestrator->get(s.id));
}

TEST_CASE("StopAll leaves no sessions and no heartbeats", "[orchestrator]") {
    Harness h;
    for (int i = 0; i < 3; ++i) h.orchestrator->create(linux_desk());
    REQUIRE(h.orchestrator->active_heartbeats() == 3);

    h.orchestrator->stop_all();
    REQUIRE(h.orchestrator->registry().size() == 0);
    REQUIRE(h.orchestrator->active_heartbeats() == 0);
    REQUIRE(h.transports.closes == 3);

    const int beats = h.registrar.beats;
    std::this_thread::sleep_for(60ms);
    REQUIRE(h.registrar.beats == beats);
}

TEST_CASE("Create failures leave the session in error", "[orchestrator]") {
    Harness h;

    SECTION("provisioning") {
        h.provider.fail_create = true;
        REQUIRE(code_of([&] { h.orchestrator->create(linux_desk()); }) == Errc::ProvisionError);
        const auto all = h.orchestrator->list();
        REQUIRE(all.size() == 1);
        REQUIRE(all.front().status == Status::Error);
        REQUIRE(h.provider.deleted.empty());
    }
    SECTION("transport") {
        h.transports.fail_open = true;
        REQUIRE(code_of([&] { h.orchestrator->create(linux_desk()); }) == Errc::TransportTimeout);
        REQUIRE(h.orchestrator->list().front().status == Status::Error);
        REQUIRE(h.provider.deleted == std::vector<std::string>{"desk-1"});
    }
    SECTION("readiness") {
        h.probe_ok = false;
        REQUIRE(code_of([&] { h.orchestrator->create(linux_desk()); }) == Errc::NotReady);
        REQUIRE(h.orchestrator->list().front().status == Status::Error);
        REQUIRE(h.transports.closes == 1);
        REQUIRE(h.provider.deleted.size() == 1);
    }
    REQUIRE(h.orchestrator->active_heartbeats() == 0);
    REQUIRE(h.saw(EventType::SessionError));
}

TEST_CASE("Auto transport without routing fields is ambiguous", "[orchestrator]") {
    Harness h;
    SessionConfig c = linux_desk();
    c.transport = TransportHint{};
    c.transport->type = "auto";

    REQUIRE(code_of([&] { h.orchestrator->create(c); }) == Errc::AmbiguousTransport);
    REQUIRE(h.orchestrator->list().front().status == Status::Error);
}

TEST_CASE("Tag operations are idempotent and drive tag queries", "[orchestrator]") {
    Harness h;
    const Session s = h.orchestrator->create(linux_desk());

    h.orchestrator->add_tags(s.id, {"a"});
    const Session twice = h.orchestrator->add_tags(s.id, {"a", "a"});
    REQUIRE(twice.tags == std::vector<std::string>{"a"});
    REQUIRE(h.orchestrator->list_by_tag("a").size() == 1);
    REQUIRE(h.orchestrator->list_tags() == std::vector<std::string>{"a"});

    h.orchestrator->remove_tags(s.id, {"a"});
    REQUIRE(h.orchestrator->remove_tags(s.id, {"a"}).tags.empty());
    REQUIRE(h.orchestrator->list_by_tag("a").empty());

    REQUIRE(code_of([&] { h.orchestrator->add_tags("sess-nope", {"a"}); }) == Errc::NotFound);
}

TEST_CASE("Tagged tasks run on every matching session", "[orchestrator]") {
    Harness h;
    const Session a = h.orchestrator->create(linux_desk({"batch"}));
    const Session b = h.orchestrator->create(linux_desk({"batch"}));
    h.orchestrator->create(linux_desk({"other"}));
    h.transports.channels[1]->fail_keys = true;

    const auto results = h.orchestrator->execute_task_on_tag("batch", "go to example.com");
    REQUIRE(results.size() == 2);

    std::map<std::string, bool> ok;
    for (const auto& r : results) ok[r.session_id] = r.success;
    REQUIRE(ok.at(a.id));
    REQUIRE_FALSE(ok.at(b.id));
    REQUIRE(h.orchestrator->list_by_status(Status::Idle).size() == 1);
}

TEST_CASE("Screenshots fall back to the cached frame", "[orchestrator]") {
    Harness h;
    const Session s = h.orchestrator->create(linux_desk());

    REQUIRE(h.orchestrator->screenshot(s.id));
    h.orchestrator->execute_action(s.id, MoveAction{1, 2});

    h.transports.last_channel()->fail_screenshot = true;
    const auto cached = h.orchestrator->screenshot(s.id);
    REQUIRE(cached);
    REQUIRE(cached->last_action == "move(1, 2)");

    REQUIRE(code_of([&] { h.orchestrator->screenshot("sess-nope"); }) == Errc::NotFound);
}

TEST_CASE("Pool status counts sessions by state", "[orchestrator]") {
    Harness h(3);
    const Session a = h.orchestrator->create(linux_desk());
    h.orchestrator->create(linux_desk());
    h.orchestrator->execute_action(a.id, MoveAction{0, 0});

    const PoolStatus p = h.orchestrator->pool_status();
    REQUIRE(p.total == 2);
    REQUIRE(p.ready == 1);
    REQUIRE(p.idle == 1);
    REQUIRE(p.capacity == 3);
}

TEST_CASE("A failed fleet registration still yields a ready session", "[orchestrator]") {
    Harness h;
    h.registrar.fail_register = true;

    Session s;
    REQUIRE_NOTHROW(s = h.orchestrator->create(linux_desk()));
    REQUIRE(s.status == Status::Ready);
    REQUIRE(h.orchestrator->get(s.id)->status == Status::Ready);
    REQUIRE(h.registrar.registered.empty());
    REQUIRE(h.orchestrator->active_heartbeats() == 1);
    REQUIRE(eventually([&] { return h.registrar.beats >= 1; }));
    REQUIRE(h.saw(EventType::SessionReady));

    h.orchestrator->stop(s.id);
    REQUIRE(h.registrar.offline.count(s.id) == 1);
}

TEST_CASE("Failing heartbeat pushes leave the session untouched", "[orchestrator]") {
    Harness h;
    h.registrar.fail_heartbeat = true;
    const Session s = h.orchestrator->create(linux_desk());

    REQUIRE(eventually([&] { return h.registrar.beats >= 3; }));
    const auto after = h.orchestrator->get(s.id);
    REQUIRE(after->status == Status::Ready);
    REQUIRE(h.orchestrator->active_heartbeats() == 1);
    REQUIRE_FALSE(h.saw(EventType::SessionError));
}

TEST_CASE("A working session rejects further actions and tasks", "[orchestrator]") {
    Harness h;
    const Session s = h.orchestrator->create(linux_desk());

    std::future<TaskResult> task;
    KeyGate gate(*h.transports.last_channel());
    task = std::async(std::launch::async, [&] { return h.orchestrator->execute_task(s.id, "go to example.com"); });
    REQUIRE(gate.wait_entered());

    REQUIRE(h.orchestrator->get(s.id)->status == Status::Working);
    REQUIRE(code_of([&] { h.orchestrator->execute_action(s.id, KeyAction{"a"}); }) == Errc::InvalidState);
    REQUIRE(code_of([&] { h.orchestrator->execute_task(s.id, "search for cats"); }) == Errc::InvalidState);
    REQUIRE(h.orchestrator->get(s.id)->current_task == std::optional<std::string>("go to example.com"));

    gate.open();
    const TaskResult r = task.get();
    REQUIRE(r.success);
    REQUIRE(h.orchestrator->get(s.id)->status == Status::Idle);
}

TEST_CASE("Stopping mid-task abandons the remaining steps", "[orchestrator]") {
    Harness h;
    const Session s = h.orchestrator->create(linux_desk());

    std::future<TaskResult> task;
    std::future<void> stopping;
    KeyGate gate(*h.transports.last_channel());
    task = std::async(std::launch::async, [&] { return h.orchestrator->execute_task(s.id, "go to example.com"); });
    REQUIRE(gate.wait_entered());

    stopping = std::async(std::launch::async, [&] { h.orchestrator->stop(s.id); });
    // New work is refused as "stopping" once the stop request is visible.
    REQUIRE(eventually([&] {
        try {
            h.orchestrator->execute_action(s.id, KeyAction{"a"});
        } catch (const Error& e) {
            return std::string(e.what()).find("stopping") != std::string::npos;
        }
        return false;
    }));
    REQUIRE(stopping.wait_for(20ms) == std::future_status::timeout);

    gate.open();
    const TaskResult r = task.get();
    stopping.get();

    REQUIRE_FALSE(r.success);
    REQUIRE(r.error == std::optional<std::string>("stopped before completion"));
    REQUIRE(r.frames.size() == 2);
    REQUIRE(r.output == "Opened terminal and launched Firefox");

    const auto calls = h.transports.last_channel()->calls();
    REQUIRE(std::find(calls.begin(), calls.end(), "key ctrl+d") != calls.end());
    REQUIRE(std::find(calls.begin(), calls.end(), "type https://example.com") == calls.end());
    REQUIRE_FALSE(h.orchestrator->get(s.id));
    REQUIRE(h.saw(EventType::TaskFailed));
    REQUIRE(h.transports.closes == 1);
}
