#include "commands/commands.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <random>
#include <thread>

#include "catch2/catch.hpp"

namespace mpris_notifier::commands {
  namespace fs = std::filesystem;

  namespace {
    // Polls until every started child has been reaped or `limit` passes.
    auto WaitForChildren(SpawnRunner& runner, const std::chrono::milliseconds limit) -> bool {
      const auto until = std::chrono::steady_clock::now() + limit;
      while (runner.runningCount() > 0) {
        if (std::chrono::steady_clock::now() > until)
          return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      return true;
    }
  } // namespace

  TEST_CASE("spawning commands", "[unit]") {
    using namespace std::chrono;

    SpawnRunner runner;

    SECTION("arguments reach the program and the child is reaped") {
      std::random_device device;
      const fs::path     marker = fs::temp_directory_path() / std::format("mpris-notifier-command-{:x}", device());

      REQUIRE(runner.run({ "touch", marker.string() }));
      REQUIRE(WaitForChildren(runner, seconds(5)));
      REQUIRE(fs::exists(marker));

      std::error_code errc;
      fs::remove(marker, errc);
    }

    SECTION("a slow program does not block the caller") {
      const auto start = steady_clock::now();
      REQUIRE(runner.run({ "sleep", "1" }));
      REQUIRE(steady_clock::now() - start < milliseconds(500));
      REQUIRE(runner.runningCount() == 1);
      REQUIRE(WaitForChildren(runner, seconds(5)));
    }

    SECTION("a failing program is still reaped") {
      REQUIRE(runner.run({ "false" }));
      REQUIRE(WaitForChildren(runner, seconds(5)));
    }

    SECTION("a missing program is an error") {
      REQUIRE_FALSE(runner.run({ "mpris-notifier-no-such-program" }));
      REQUIRE(runner.runningCount() == 0);
    }

    SECTION("an empty command is an error") {
      REQUIRE_FALSE(runner.run({}));
      REQUIRE_FALSE(runner.run({ "" }));
    }
  }
} // namespace mpris_notifier::commands
