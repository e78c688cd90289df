#include "util/command_runner.hpp"

#include <catch2/catch.hpp>

#include <chrono>

using ykmon::util::CommandResult;
using ykmon::util::run_command;
using namespace std::chrono_literals;

TEST_CASE("run_command captures stdout and stderr", "[command]") {
    const auto result = run_command({"/bin/sh", "-c", "echo hello; echo oops 1>&2"}, 5s);

    REQUIRE(result.status == CommandResult::Status::Exited);
    CHECK(result.exit_code == 0);
    CHECK(result.stdout_text == "hello\n");
    CHECK(result.stderr_text == "oops\n");
}

TEST_CASE("run_command reports the exit code", "[command]") {
    const auto result = run_command({"/bin/sh", "-c", "exit 3"}, 5s);

    REQUIRE(result.status == CommandResult::Status::Exited);
    CHECK(result.exit_code == 3);
}

TEST_CASE("run_command reports a missing executable", "[command]") {
    const auto result = run_command({"ykmon-definitely-not-installed"}, 5s);
    CHECK(result.status == CommandResult::Status::NotFound);
}

TEST_CASE("run_command kills a child that outlives the timeout", "[command]") {
    const auto started = std::chrono::steady_clock::now();
    const auto result = run_command({"/bin/sh", "-c", "sleep 5"}, 200ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(result.status == CommandResult::Status::TimedOut);
    CHECK(elapsed < 3s);
}

TEST_CASE("run_command drains large output", "[command]") {
    const auto result = run_command({"/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done"}, 10s);

    REQUIRE(result.status == CommandResult::Status::Exited);
    CHECK(result.stdout_text.size() == 20000u * 11u);
}

TEST_CASE("run_command times out a child that closed its output and kept running", "[command]") {
    const auto started = std::chrono::steady_clock::now();
    const auto result = run_command({"/bin/sh", "-c", "exec >&- 2>&-; sleep 5"}, 200ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(result.status == CommandResult::Status::TimedOut);
    CHECK(elapsed < 3s);
}
