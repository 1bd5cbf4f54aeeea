#include "networking/CommandRouter.h"

#include "core/Error.h"
#include "logging/Log.h"
#include "orchestrator/JsonViews.h"

#include <boost/asio/post.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>

namespace deskpool::networking {

namespace json = boost::json;
using orchestrator::to_json;

namespace {

std::string required_string(const json::object& req, const char* key) {
    const json::value* v = req.if_contains(key);
    if (!v || !v->is_string() || v->get_string().empty()) {
        throw Error(Errc::InvalidArgument, std::string("'") + key + "' is required");
    }
    return std::string(v->get_string());
}

const json::value& required(const json::object& req, const char* key) {
    const json::value* v = req.if_contains(key);
    if (!v) throw Error(Errc::InvalidArgument, std::string("'") + key + "' is required");
    return *v;
}

std::string ok_reply(const json::value& req, json::value result) {
    json::object reply;
    reply["req"] = req;
    reply["ok"] = true;
    reply["result"] = std::move(result);
    return json::serialize(reply);
}

std::string error_reply(const json::value& req, std::string_view code, const std::string& message) {
    json::object err;
    err["code"] = code;
    err["message"] = message;

    json::object reply;
    reply["req"] = req;
    reply["ok"] = false;
    reply["error"] = std::move(err);
    return json::serialize(reply);
}

} // namespace

CommandRouter::CommandRouter(orchestrator::SessionOrchestrator& orchestrator, boost::asio::thread_pool& workers,
                             session::OsKind default_kind, std::optional<session::Region> default_region)
    : orchestrator_(orchestrator),
      workers_(workers),
      default_kind_(default_kind),
      default_region_(default_region) {}

void CommandRouter::dispatch(const std::string& message, Reply reply) {
    boost::asio::post(workers_, [this, message, reply = std::move(reply)] {
        reply(process(message));
    });
}

void CommandRouter::shutdown() {
    workers_.join();
    orchestrator_.stop_all();
}

std::string CommandRouter::process(const std::string& message) {
    json::value req_id = nullptr;
    try {
        boost::system::error_code ec;
        json::value doc = json::parse(message, ec);
        if (ec || !doc.is_object()) {
            throw Error(Errc::InvalidArgument, "request must be a JSON object");
        }
        const json::object& request = doc.get_object();
        if (const json::value* id = request.if_contains("req")) req_id = *id;

        return ok_reply(req_id, handle(request));
    } catch (const Error& e) {
        logging::debug("Router") << errc_name(e.code()) << ": " << e.what();
        return error_reply(req_id, errc_name(e.code()), e.what());
    } catch (const std::exception& e) {
        logging::error("Router") << "unexpected failure: " << e.what();
        return error_reply(req_id, "Internal", e.what());
    }
}

json::value CommandRouter::handle(const json::object& req) {
    const std::string op = required_string(req, "op");
    logging::debug("Router") << "op " << op;

    if (op == "create") {
        json::object config;
        if (const json::value* c = req.if_contains("config")) {
            if (!c->is_object()) throw Error(Errc::InvalidArgument, "'config' must be an object");
            config = c->get_object();
        }
        const auto cfg = orchestrator::session_config_from_json(config, default_kind_, default_region_);
        return to_json(orchestrator_.create(cfg));
    }
    if (op == "action") {
        const std::string id = required_string(req, "id");
        const session::Action action = session::action_from_json(required(req, "action"));
        return to_json(orchestrator_.execute_action(id, action));
    }
    if (op == "task") {
        const std::string id = required_string(req, "id");
        return to_json(orchestrator_.execute_task(id, required_string(req, "task")));
    }
    if (op == "task_on_tag") {
        const std::string tag = required_string(req, "tag");
        json::array results;
        for (const auto& r : orchestrator_.execute_task_on_tag(tag, required_string(req, "task"))) {
            results.emplace_back(to_json(r));
        }
        return results;
    }
    if (op == "screenshot") {
        const auto frame = orchestrator_.screenshot(required_string(req, "id"));
        if (!frame) return nullptr;
        return to_json(*frame);
    }
    if (op == "get") {
        const std::string id = required_string(req, "id");
        const auto s = orchestrator_.get(id);
        if (!s) throw Error(Errc::NotFound, "no session " + id);
        return to_json(*s);
    }
    if (op == "list") {
        return to_json(orchestrator_.list());
    }
    if (op == "list_by_tag") {
        return to_json(orchestrator_.list_by_tag(required_string(req, "tag")));
    }
    if (op == "list_by_status") {
        return to_json(orchestrator_.list_by_status(session::parse_status(required_string(req, "status"))));
    }
    if (op == "list_tags") {
        json::array tags;
        for (const auto& t : orchestrator_.list_tags()) tags.emplace_back(t);
        return tags;
    }
    if (op == "add_tags" || op == "remove_tags") {
        const std::string id = required_string(req, "id");
        const auto tags = orchestrator::string_list(required(req, "tags"), "tags");
        return to_json(op == "add_tags" ? orchestrator_.add_tags(id, tags) : orchestrator_.remove_tags(id, tags));
    }
    if (op == "stop") {
        const std::string id = required_string(req, "id");
        orchestrator_.stop(id);
        json::object out;
        out["stopped"] = id;
        return out;
    }
    if (op == "stop_all") {
        const std::size_t count = orchestrator_.registry().size();
        orchestrator_.stop_all();
        json::object out;
        out["stopped"] = count;
        return out;
    }
    if (op == "pool_status") {
        return to_json(orchestrator_.pool_status());
    }
    throw Error(Errc::InvalidArgument, "unknown op '" + op + "'");
}

} // namespace deskpool::networking
