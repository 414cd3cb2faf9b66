#include "fixtures.hpp"
#include "lpb/catalog.hpp"
#include "lpb/interrupt.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <csignal>
#include <reproc++/reproc.hpp>
#include <reproc++/run.hpp>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace libprobe;
using namespace std::chrono_literals;

namespace {

// A complete installation for the command line: catalog, hardware, tools and one library root.
struct CommandLine {
    CommandLine() {
        ws.library("libs", "A-1.0.0", "A", "1.0.0", "", {{"src/A.h", "#pragma once\ninline int a_value() { return 1; }\n"}});
        ws.write("catalog.json", test::catalog_json({{"A", "1.0.0"}}));
        ws.write("hardware/profiles.json",
                 std::string(R"({"profiles": {"*": {"cc": ")") + LIBPROBE_TEST_CXX + R"(", "cxx": ")" +
                     LIBPROBE_TEST_CXX + R"("}}})");
        fs::create_directories(ws.path() / "tools");
    }

    std::vector<std::string> args(bool with_libraries = true) const {
        std::vector<std::string> out = {LIBPROBE_LPB_PATH,
                                        "--json",
                                        (ws.path() / "catalog.json").string(),
                                        "--cache",
                                        (ws.path() / "cache.json").string(),
                                        "--hardware",
                                        (ws.path() / "hardware").string(),
                                        "--tools",
                                        (ws.path() / "tools").string()};
        if (with_libraries) {
            out.insert(out.end(), {"--libraries", (ws.path() / "libs").string()});
        }
        return out;
    }

    int run(const std::vector<std::string> &arguments) const {
        reproc::options options;
        options.redirect.discard = true;
        options.deadline = reproc::milliseconds(60000);
        auto [status, ec] = reproc::run(arguments, options);
        INFO(ec.message());
        REQUIRE_FALSE(ec);
        return status;
    }

    test::Workspace ws;
};

} // namespace

TEST_CASE("lpb exits with 1 on configuration and input errors", "[cli]") {
    CommandLine cli;

    SECTION("missing --libraries") {
        REQUIRE(cli.run(cli.args(false)) == 1);
    }
    SECTION("malformed catalog") {
        cli.ws.write("catalog.json", "{\"libraries\": [");
        REQUIRE(cli.run(cli.args()) == 1);
    }
    SECTION("malformed cache") {
        cli.ws.write("cache.json", "[1, 2");
        REQUIRE(cli.run(cli.args()) == 1);
        REQUIRE(cli.ws.read("cache.json") == "[1, 2");
    }
    SECTION("unknown argument") {
        auto args = cli.args();
        args.push_back("--bogus");
        REQUIRE(cli.run(args) == 1);
    }
}

TEST_CASE("lpb exits with 0 after a complete run", "[cli][e2e]") {
    CommandLine cli;
    REQUIRE(cli.run(cli.args()) == 0);

    auto catalog = Catalog::load(cli.ws.path() / "catalog.json");
    REQUIRE(catalog.has_value());
    REQUIRE(catalog->requires_of(*catalog->find("A", "1.0.0")).empty());
    auto cache = ProcessedCache::load(cli.ws.path() / "cache.json");
    REQUIRE(cache.has_value());
    REQUIRE(cache->processed("A"));
}

TEST_CASE("lpb exits with 2 when interrupted during a compile", "[cli][interrupt]") {
    CommandLine cli;
    const fs::path marker = cli.ws.path() / "compiling";
    const fs::path slow =
        cli.ws.write("tools/bin/slow-cc", "#!/bin/sh\ntouch \"" + marker.string() + "\"\nexec sleep 10\n");
    fs::permissions(slow, fs::perms::owner_all, fs::perm_options::add);
    cli.ws.write("hardware/profiles.json", R"({"profiles": {"*": {"cc": "slow-cc", "cxx": "slow-cc"}}})");

    reproc::options options;
    options.redirect.discard = true;
    reproc::process lpb;
    REQUIRE_FALSE(lpb.start(cli.args(), options));

    const auto give_up = std::chrono::steady_clock::now() + 10s;
    while (!fs::exists(marker) && std::chrono::steady_clock::now() < give_up) {
        std::this_thread::sleep_for(20ms);
    }
    REQUIRE(fs::exists(marker));

    auto [pid, pid_ec] = lpb.pid();
    REQUIRE_FALSE(pid_ec);
    REQUIRE(::kill(pid, SIGINT) == 0);

    auto [status, ec] = lpb.wait(reproc::milliseconds(8000));
    REQUIRE_FALSE(ec);
    REQUIRE(status == EXIT_INTERRUPTED);

    // the interrupted library is not recorded, and both files stay readable
    auto catalog = Catalog::load(cli.ws.path() / "catalog.json");
    REQUIRE(catalog.has_value());
    REQUIRE(catalog->requires_of(*catalog->find("A", "1.0.0")).empty());
    auto cache = ProcessedCache::load(cli.ws.path() / "cache.json");
    REQUIRE(cache.has_value());
    REQUIRE_FALSE(cache->processed("A"));
}
