#include "sandbox/executor.hpp"

#include "scoring/signatures.hpp"

namespace sweval::sandbox {

SandboxExecutor::SandboxExecutor(IContainerRuntime& runtime, core::logging::Logger& logger)
    : runtime_(runtime), logger_(logger) {}

bool SandboxExecutor::Execute(const SandboxHandle& handle, const std::string& script,
                              std::chrono::milliseconds timeout, ExecResult& result,
                              std::string& error) {
  logger_.Debug("executing script in sandbox",
                {{"project", handle.project_name},
                 {"script_bytes", std::to_string(script.size())},
                 {"timeout_ms", std::to_string(timeout.count())}});

  if (!runtime_.ExecInSandbox(handle, script, timeout, result, error)) {
    logger_.Error("sandbox exec failed", {{"project", handle.project_name}, {"error", error}});
    return false;
  }

  if (result.timed_out) {
    if (!result.stdout_text.empty() && result.stdout_text.back() != '\n') {
      result.stdout_text.push_back('\n');
    }
    result.stdout_text.append(scoring::kTestsTimeout);
    result.stdout_text.push_back('\n');
    logger_.Warn("sandbox script timed out",
                 {{"project", handle.project_name},
                  {"timeout_ms", std::to_string(timeout.count())}});
    return true;
  }

  logger_.Debug("sandbox script finished",
                {{"project", handle.project_name},
                 {"exit_code", std::to_string(result.exit_code)}});
  return true;
}

} // namespace sweval::sandbox
