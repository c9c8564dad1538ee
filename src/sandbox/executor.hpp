#pragma once

#include "core/logging/logger.hpp"
#include "sandbox/container_runtime.hpp"

#include <chrono>
#include <string>

namespace sweval::sandbox {

// Runs scripts inside a started sandbox. No retries: a failed run is
// reported once, as observed.
class SandboxExecutor {
public:
  SandboxExecutor(IContainerRuntime& runtime, core::logging::Logger& logger);

  // Contract:
  // - true: the script ran; `result` holds its output. On timeout the
  //   client is killed, `timed_out` is set and the tests-timed-out signature
  //   is appended to `stdout_text` so scoring reports an infrastructure
  //   failure.
  // - false: the runtime could not run the script at all.
  bool Execute(const SandboxHandle& handle, const std::string& script,
               std::chrono::milliseconds timeout, ExecResult& result, std::string& error);

private:
  IContainerRuntime& runtime_;
  core::logging::Logger& logger_;
};

} // namespace sweval::sandbox
