#include <unity.h>

#include <chrono>
#include <string>

#include "btmonitor-system.h"

namespace {
int SecondsSince(const std::chrono::steady_clock::time_point& start) {
  return int(std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start).count());
}
} // namespace

void test_run_captures_output_and_exit_code() {
  LinuxSystem system;

  CommandResult result = system.Run({"sh", "-c", "echo out; echo err >&2; exit 3"});
  TEST_ASSERT_EQUAL(3, result.ExitCode);
  TEST_ASSERT_FALSE(result.TimedOut);
  TEST_ASSERT_TRUE(result.Output.find("out") != std::string::npos);
  TEST_ASSERT_TRUE(result.Output.find("err") != std::string::npos);
}

void test_run_feeds_standard_input() {
  LinuxSystem system;

  CommandResult result = system.Run({"cat"}, 5, "power/control=on\n");
  TEST_ASSERT_TRUE(result.Succeeded());
  TEST_ASSERT_EQUAL_STRING("power/control=on\n", result.Output.c_str());
}

void test_run_reports_missing_program() {
  LinuxSystem system;

  CommandResult result = system.Run({"btmonitor-no-such-program"});
  TEST_ASSERT_EQUAL(127, result.ExitCode);
  TEST_ASSERT_FALSE(system.CommandExists("btmonitor-no-such-program"));
}

void test_run_kills_command_at_timeout() {
  LinuxSystem system;
  const auto start = std::chrono::steady_clock::now();

  CommandResult result = system.Run({"sleep", "10"}, 1);
  TEST_ASSERT_TRUE(result.TimedOut);
  TEST_ASSERT_EQUAL(124, result.ExitCode);
  TEST_ASSERT_FALSE(result.Succeeded());
  TEST_ASSERT_TRUE(SecondsSince(start) < 5);
}

void test_run_timeout_holds_after_output_closes() {
  LinuxSystem system;
  const auto start = std::chrono::steady_clock::now();

  CommandResult result = system.Run({"sh", "-c", "exec >/dev/null 2>&1; sleep 6"}, 1);
  TEST_ASSERT_TRUE(result.TimedOut);
  TEST_ASSERT_EQUAL(124, result.ExitCode);
  TEST_ASSERT_TRUE(SecondsSince(start) < 5);
}

void test_run_quiet_command_finishes_before_timeout() {
  LinuxSystem system;

  CommandResult result = system.Run({"sh", "-c", "exec >/dev/null 2>&1; exit 2"}, 5);
  TEST_ASSERT_FALSE(result.TimedOut);
  TEST_ASSERT_EQUAL(2, result.ExitCode);
}
