#include "../common/assertions.hpp"
#include "core/process/process_runner.hpp"

#include <chrono>
#include <iostream>
#include <string>

int main() {
  using sweval::core::process::ProcessOptions;
  using sweval::core::process::ProcessResult;
  using sweval::core::process::RunProcess;
  using sweval::tests::common::Assert;
  using sweval::tests::common::AssertContains;

  std::string error;

  // Separate stdout/stderr capture and exit status.
  {
    ProcessResult result;
    Assert(RunProcess({"sh", "-c", "echo out; echo err >&2; exit 3"}, {}, result, error),
           "sh should spawn: " + error);
    Assert(result.exit_code == 3, "exit status should be reported");
    Assert(result.stdout_text == "out\n", "stdout mismatch: " + result.stdout_text);
    Assert(result.stderr_text == "err\n", "stderr mismatch: " + result.stderr_text);
    Assert(!result.timed_out, "quick command should not time out");
  }

  // Stdin is delivered and closed.
  {
    ProcessOptions options;
    options.stdin_text = "line one\nline two\n";
    ProcessResult result;
    Assert(RunProcess({"cat"}, options, result, error), error);
    Assert(result.exit_code == 0 && result.stdout_text == options.stdin_text,
           "stdin should round-trip through cat");
  }

  // Timeout kills the child and keeps output captured so far.
  {
    ProcessOptions options;
    options.timeout = std::chrono::milliseconds(300);
    ProcessResult result;
    const auto started = std::chrono::steady_clock::now();
    Assert(RunProcess({"sh", "-c", "echo started; sleep 30"}, options, result, error), error);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    Assert(result.timed_out, "long command should time out");
    Assert(elapsed < std::chrono::seconds(10), "timeout should not wait for the child");
    AssertContains(result.stdout_text, "started");
  }

  // Working directory is honored.
  {
    ProcessOptions options;
    options.working_dir = "/";
    ProcessResult result;
    Assert(RunProcess({"pwd"}, options, result, error), error);
    Assert(result.stdout_text == "/\n", "working directory not applied: " + result.stdout_text);
  }

  // Spawn failures are errors, not exit codes.
  {
    ProcessResult result;
    const bool spawned =
        RunProcess({"/nonexistent/sweval-no-such-binary"}, {}, result, error);
    Assert(!spawned || result.exit_code == 127, "missing binary should not look like success");
  }

  Assert(sweval::core::process::DescribeCommand({"docker", "compose", "-p", "a b"}) ==
             "docker compose -p 'a b'",
         "describe should shell-join argv");

  std::cout << "process_runner_smoke: ok\n";
  return 0;
}
