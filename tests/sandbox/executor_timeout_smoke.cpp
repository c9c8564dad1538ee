#include "../common/assertions.hpp"
#include "../common/fake_container_runtime.hpp"
#include "core/logging/logger.hpp"
#include "sandbox/executor.hpp"
#include "scoring/signatures.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>

int main() {
  using sweval::tests::common::Assert;
  using sweval::tests::common::AssertContains;
  using sweval::tests::common::AssertNotContains;

  sweval::tests::common::FakeContainerRuntime runtime;
  sweval::sandbox::ExecResult slow;
  slow.exit_code = 137;
  slow.stdout_text = "collected 12 items";
  slow.timed_out = true;
  runtime.exec_rules.push_back({"sleep", slow});

  sweval::sandbox::ExecResult fast;
  fast.exit_code = 0;
  fast.stdout_text = "PASSED tests/test_a.py::test_one\n";
  runtime.exec_rules.push_back({"pytest", fast});

  std::ostringstream log_stream;
  sweval::core::logging::Logger logger(sweval::core::logging::LogLevel::kInfo, log_stream);
  sweval::sandbox::SandboxExecutor executor(runtime, logger);

  sweval::sandbox::SandboxHandle handle;
  handle.descriptor_path = "compose.yaml";
  handle.project_name = "sweval-smoke";
  std::string error;

  sweval::sandbox::ExecResult result;
  Assert(executor.Execute(handle, "sleep 3600\n", std::chrono::seconds(2), result, error),
         "timed out script should still report a result");
  Assert(result.timed_out, "timeout flag should be kept");
  AssertContains(result.stdout_text,
                 "collected 12 items\n" + std::string(sweval::scoring::kTestsTimeout) + "\n");
  Assert(runtime.exec_timeouts.back() == std::chrono::milliseconds(2000),
         "timeout should be forwarded to the runtime");
  AssertContains(log_stream.str(), "sandbox script timed out");

  Assert(executor.Execute(handle, "pytest -rA\n", std::chrono::seconds(2), result, error),
         "normal script should run");
  Assert(!result.timed_out && result.exit_code == 0, "normal script should exit cleanly");
  AssertNotContains(result.stdout_text, sweval::scoring::kTestsTimeout);

  std::cout << "executor_timeout_smoke: ok\n";
  return 0;
}
