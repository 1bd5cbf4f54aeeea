#include <catch2/catch.hpp>

#include "core/Error.h"
#include "transport/TunnelEstablisher.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/json.hpp>

#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <optional>
#include <thread>
#include <unistd.h>

using namespace deskpool;
using namespace deskpool::transport;
using namespace std::chrono_literals;

namespace asio = boost::asio;
namespace fs = std::filesystem;

namespace {

Errc code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    FAIL("expected a deskpool::Error");
    return Errc::NotFound;
}

// Runs an io_context on a background thread for the establisher's async work.
class IoThread {
public:
    IoThread() : guard_(asio::make_work_guard(ioc_)), thread_([this] { ioc_.run(); }) {}
    ~IoThread() {
        guard_.reset();
        ioc_.stop();
        thread_.join();
    }

    asio::io_context& ioc() { return ioc_; }

private:
    asio::io_context ioc_;
    asio::executor_work_guard<asio::io_context::executor_type> guard_;
    std::thread thread_;
};

class ScratchDir {
public:
    ScratchDir() : path_(fs::temp_directory_path() / ("deskpool-tunnel-" + std::to_string(::getpid()))) {
        fs::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    // Writes an executable /bin/sh script standing in for a tunnel program.
    std::string script(const std::string& name, const std::string& body) const {
        const fs::path p = path_ / name;
        {
            std::ofstream out(p);
            out << "#!/bin/sh\n" << body << "\n";
        }
        fs::permissions(p, fs::perms::owner_all, fs::perm_options::add);
        return p.string();
    }

    fs::path file(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

TunnelRequest iap_request() {
    TunnelRequest r;
    r.vm_name = "desk-1";
    r.zone = "us-central1-a";
    return r;
}

} // namespace

TEST_CASE("Auto transport selection", "[tunnel]") {
    TunnelRequest r = iap_request();
    REQUIRE(resolve_tunnel_type(r) == TunnelType::Iap);

    r.host = "10.0.0.4";
    REQUIRE(resolve_tunnel_type(r) == TunnelType::Iap);

    r.zone.clear();
    REQUIRE(resolve_tunnel_type(r) == TunnelType::Ssh);

    r.host.clear();
    REQUIRE(code_of([&] { resolve_tunnel_type(r); }) == Errc::AmbiguousTransport);

    r.type = TunnelType::Relay;
    REQUIRE(resolve_tunnel_type(r) == TunnelType::Relay);
}

TEST_CASE("Transport type names", "[tunnel]") {
    REQUIRE(parse_tunnel_type("iap") == TunnelType::Iap);
    REQUIRE(to_string(TunnelType::Relay) == "relay");
    REQUIRE(code_of([] { parse_tunnel_type("carrier-pigeon"); }) == Errc::InvalidArgument);
}

TEST_CASE("Forwarding command lines", "[tunnel]") {
    TunnelOptions options;

    SECTION("iap") {
        TunnelRequest r = iap_request();
        r.project = "acme";
        const CommandLine cmd = build_command(TunnelType::Iap, r, 7790, options);
        REQUIRE(cmd.program == "gcloud");
        REQUIRE(cmd.args == std::vector<std::string>{"compute", "start-iap-tunnel", "desk-1", "8080",
                                                     "--local-host-port", "localhost:7790",
                                                     "--zone", "us-central1-a", "--project", "acme"});
    }
    SECTION("ssh") {
        TunnelRequest r;
        r.host = "desk.example.net";
        r.username = "ops";
        r.ssh_port = 2222;
        r.identity_file = "/keys/id";
        const CommandLine cmd = build_command(TunnelType::Ssh, r, 7788, options);
        REQUIRE(cmd.program == "ssh");
        REQUIRE(cmd.args[0] == "-N");
        REQUIRE(cmd.args[2] == "7788:localhost:8080");
        REQUIRE(cmd.args[4] == "2222");
        REQUIRE(cmd.args.back() == "ops@desk.example.net");
        REQUIRE(cmd.args[cmd.args.size() - 2] == "/keys/id");
    }
    SECTION("relay") {
        TunnelRequest r;
        r.relay_hostname = "desk.relay.example";
        const CommandLine cmd = build_command(TunnelType::Relay, r, 7788, options);
        REQUIRE(cmd.program == "cloudflared");
        REQUIRE(cmd.args.back() == "127.0.0.1:7788");
    }
    SECTION("direct has no process") {
        REQUIRE(code_of([&] { build_command(TunnelType::Direct, TunnelRequest{}, 7788, options); }) ==
                Errc::InvalidArgument);
    }
}

TEST_CASE("Free port search skips ports in use", "[tunnel]") {
    asio::io_context ioc;
    asio::ip::tcp::acceptor taken(ioc, {asio::ip::address_v4::loopback(), 0});
    const auto port = taken.local_endpoint().port();

    const auto found = find_free_port(port);
    REQUIRE(found > port);
}

TEST_CASE("Direct transport needs no process", "[tunnel]") {
    IoThread io;
    TunnelEstablisher establisher(io.ioc(), TunnelOptions{});

    TunnelRequest r;
    r.type = TunnelType::Direct;
    r.host = "10.1.2.3";
    const TunnelEndpoint ep = establisher.establish(r);
    REQUIRE(ep.host == "10.1.2.3");
    REQUIRE(ep.port == 8080);
    REQUIRE_FALSE(ep.local_port);
    REQUIRE(establisher.status().active);

    establisher.close();
    establisher.close();
    REQUIRE_FALSE(establisher.status().active);
}

TEST_CASE("IAP tunnels are ready on the listening signal", "[tunnel]") {
    ScratchDir dir;
    IoThread io;

    TunnelOptions options;
    options.gcloud_program = dir.script("gcloud", "echo 'Listening on port [7788].' >&2\nexec sleep 30");
    options.state_file = dir.file("tunnel.json").string();
    options.health_interval = 0ms;
    options.timeout = 10s;

    TunnelEstablisher establisher(io.ioc(), options);
    const TunnelEndpoint ep = establisher.establish(iap_request());
    REQUIRE(ep.host == "127.0.0.1");
    REQUIRE(ep.local_port);
    REQUIRE(ep.port == *ep.local_port);

    const auto sidecar = TunnelStateFile::read_entry(options.state_file, *ep.local_port);
    REQUIRE(sidecar);
    REQUIRE(sidecar->at("type").as_string() == "iap");
    REQUIRE(sidecar->at("localPort").to_number<int>() == *ep.local_port);
    REQUIRE(sidecar->at("target").as_string() == "desk-1");

    establisher.close();
    REQUIRE_FALSE(fs::exists(options.state_file));
}

TEST_CASE("Concurrent tunnels keep their own sidecar entries", "[tunnel]") {
    ScratchDir dir;
    IoThread io;

    TunnelOptions options;
    options.gcloud_program = dir.script("gcloud", "echo 'Listening on port [7788].' >&2\nexec sleep 30");
    options.state_file = dir.file("tunnel.json").string();
    options.health_interval = 0ms;
    options.timeout = 10s;

    TunnelOptions first_options = options;
    first_options.base_local_port = 17788;
    TunnelOptions second_options = options;
    second_options.base_local_port = 18788;

    TunnelEstablisher first(io.ioc(), first_options);
    TunnelEstablisher second(io.ioc(), second_options);
    const TunnelEndpoint a = first.establish(iap_request());
    TunnelRequest other = iap_request();
    other.vm_name = "desk-2";
    const TunnelEndpoint b = second.establish(other);
    REQUIRE(*a.local_port != *b.local_port);

    REQUIRE(TunnelStateFile::read_entry(options.state_file, *a.local_port));
    REQUIRE(TunnelStateFile::read_entry(options.state_file, *b.local_port));

    first.close();
    REQUIRE_FALSE(TunnelStateFile::read_entry(options.state_file, *a.local_port));
    const auto remaining = TunnelStateFile::read_entry(options.state_file, *b.local_port);
    REQUIRE(remaining);
    REQUIRE(remaining->at("target").as_string() == "desk-2");

    second.close();
    REQUIRE_FALSE(fs::exists(options.state_file));
}

TEST_CASE("SSH tunnels are ready once the local port accepts", "[tunnel]") {
    ScratchDir dir;
    IoThread io;

    // The forwarding spec "L:localhost:R" is the third argument.
    const fs::path started = dir.file("ssh-started");
    TunnelOptions options;
    options.ssh_program = dir.script("ssh", "echo \"$3\" > '" + started.string() + ".tmp'\n"
                                            "mv '" + started.string() + ".tmp' '" + started.string() + "'\n"
                                            "exec sleep 30");
    options.base_local_port = 19788;
    options.health_interval = 0ms;
    options.ssh_settle = 50ms;
    options.timeout = 10s;

    TunnelEstablisher establisher(io.ioc(), options);
    TunnelRequest r;
    r.type = TunnelType::Ssh;
    r.host = "10.0.0.5";
    auto pending = std::async(std::launch::async, [&] { return establisher.establish(r); });

    const auto until = std::chrono::steady_clock::now() + 5s;
    while (!fs::exists(started) && std::chrono::steady_clock::now() < until) std::this_thread::sleep_for(10ms);
    REQUIRE(fs::exists(started));

    std::string forward;
    std::ifstream(started) >> forward;
    const auto port = static_cast<std::uint16_t>(std::stoi(forward.substr(0, forward.find(':'))));

    asio::io_context listener_ioc;
    asio::ip::tcp::acceptor listener(listener_ioc, {asio::ip::address_v4::loopback(), port});

    const TunnelEndpoint ep = pending.get();
    REQUIRE(ep.type == TunnelType::Ssh);
    REQUIRE(ep.host == "127.0.0.1");
    REQUIRE(ep.local_port == std::optional<std::uint16_t>(port));
    REQUIRE(establisher.status().active);
}

TEST_CASE("Failed health checks flag the tunnel without reconnecting", "[tunnel]") {
    ScratchDir dir;
    IoThread io;

    // Announces readiness but never listens on the local port.
    const fs::path launches = dir.file("launches");
    TunnelOptions options;
    options.gcloud_program = dir.script("gcloud", "echo run >> '" + launches.string() + "'\n"
                                                  "echo 'Listening on port [7788].' >&2\n"
                                                  "exec sleep 30");
    options.health_interval = 50ms;
    options.timeout = 10s;

    TunnelEstablisher establisher(io.ioc(), options);
    establisher.establish(iap_request());

    const auto until = std::chrono::steady_clock::now() + 5s;
    while (!establisher.status().degraded && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(establisher.status().degraded);
    REQUIRE(establisher.status().active);

    std::this_thread::sleep_for(200ms);
    std::ifstream in(launches);
    int runs = 0;
    for (std::string line; std::getline(in, line);) ++runs;
    REQUIRE(runs == 1);
    REQUIRE(establisher.status().degraded);
}

TEST_CASE("Silent tunnel processes time out", "[tunnel]") {
    ScratchDir dir;
    IoThread io;

    TunnelOptions options;
    options.gcloud_program = dir.script("gcloud", "exec sleep 30");
    options.timeout = 300ms;

    TunnelEstablisher establisher(io.ioc(), options);
    REQUIRE(code_of([&] { establisher.establish(iap_request()); }) == Errc::TransportTimeout);
    REQUIRE_FALSE(establisher.status().active);
}

TEST_CASE("Tunnel processes that exit early fail", "[tunnel]") {
    ScratchDir dir;
    IoThread io;

    TunnelOptions options;
    options.gcloud_program = dir.script("gcloud", "echo 'ERROR: no such instance' >&2\nexit 1");
    options.timeout = 10s;

    TunnelEstablisher establisher(io.ioc(), options);
    REQUIRE(code_of([&] { establisher.establish(iap_request()); }) == Errc::TransportError);
}

TEST_CASE("Missing tunnel programs are reported", "[tunnel]") {
    IoThread io;
    TunnelOptions options;
    options.gcloud_program = "deskpool-no-such-gcloud";

    TunnelEstablisher establisher(io.ioc(), options);
    REQUIRE(code_of([&] { establisher.establish(iap_request()); }) == Errc::TransportError);
}
