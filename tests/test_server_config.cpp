#include <doctest/doctest.h>
#include "server/ServerConfig.hpp"

#include <stdexcept>
#include <vector>

using namespace lan_sentry::server;

static ServerConfig parse(std::vector<const char*> args) {
    args.insert(args.begin(), "lansentry_server");
    return ParseServerArgs(static_cast<int>(args.size()), args.data());
}

TEST_CASE("No arguments gives the documented defaults") {
    ServerConfig config = parse({});

    CHECK(config.port == 8080);
    CHECK(config.cert_path == "certs/server.crt");
    CHECK(config.key_path == "certs/server.key");
    CHECK(config.recheck_interval == std::chrono::seconds(30));
    CHECK(config.probe_timeout == std::chrono::milliseconds(1000));
    CHECK(config.name_timeout == std::chrono::milliseconds(500));
    CHECK(config.recheck_timeout == std::chrono::milliseconds(1000));
    CHECK(config.ping_count == 4);
    CHECK(config.ping_timeout == std::chrono::milliseconds(2000));
    CHECK(config.worker_threads == 4);
    CHECK_FALSE(config.show_help);
}

TEST_CASE("Flags override their settings") {
    ServerConfig config = parse({"--port", "9443", "--interval", "5", "--probe-timeout", "250",
                                 "--ping-count", "2", "--workers", "8", "--cert", "/tmp/a.crt"});

    CHECK(config.port == 9443);
    CHECK(config.recheck_interval == std::chrono::seconds(5));
    CHECK(config.probe_timeout == std::chrono::milliseconds(250));
    CHECK(config.ping_count == 2);
    CHECK(config.worker_threads == 8);
    CHECK(config.cert_path == "/tmp/a.crt");
    CHECK(config.key_path == "certs/server.key");
}

TEST_CASE("Help flag is recognised") {
    CHECK(parse({"--help"}).show_help);
    CHECK(ServerUsage("lansentry_server").find("--interval") != std::string::npos);
}

TEST_CASE("Bad input is rejected") {
    CHECK_THROWS_AS(parse({"--verbose", "1"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--port"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--port", "http"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--port", "70000"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--workers", "0"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--interval", "12s"}), std::invalid_argument);
}
