#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sweval::core::process {

struct ProcessOptions {
  // Bytes written to the child's stdin, after which stdin is closed.
  std::string stdin_text;
  // Wall-clock limit. Zero means wait forever.
  std::chrono::milliseconds timeout{0};
  // Empty keeps the caller's working directory.
  std::filesystem::path working_dir;
};

struct ProcessResult {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
};

// Runs `argv` (argv[0] resolved through PATH) with separate stdout/stderr
// capture.
//
// Contract:
// - true: the child was spawned and reaped. `result.exit_code` is the exit
//   status, or 128+signal when the child was killed. A timeout kills the
//   child's whole process group and sets `result.timed_out`; output captured
//   before the kill is kept.
// - false: the child could not be spawned; `error` explains why.
//
// A command that starts but exits non-zero is NOT an error at this layer.
bool RunProcess(const std::vector<std::string>& argv, const ProcessOptions& options,
                ProcessResult& result, std::string& error);

// Shell-joins argv for log lines only. Not safe to pass to a shell.
std::string DescribeCommand(const std::vector<std::string>& argv);

} // namespace sweval::core::process
