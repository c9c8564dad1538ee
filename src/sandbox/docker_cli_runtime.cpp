#include "sandbox/docker_cli_runtime.hpp"

#include "core/fs_utils.hpp"
#include "core/process/process_runner.hpp"

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace sweval::sandbox {

namespace {

constexpr const char* kDockerEnvVar = "SWEVAL_DOCKER";
constexpr std::chrono::minutes kComposeTimeout{5};

std::string DefaultDockerBinary() {
  const char* value = std::getenv(kDockerEnvVar);
  if (value != nullptr && value[0] != '\0') {
    return value;
  }
  return "docker";
}

std::string Trimmed(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
    text.pop_back();
  }
  return text;
}

// Runs a docker command and treats a non-zero exit as failure.
bool RunChecked(const std::vector<std::string>& argv, const core::process::ProcessOptions& options,
                core::process::ProcessResult& result, std::string& error) {
  if (!core::process::RunProcess(argv, options, result, error)) {
    return false;
  }
  if (result.timed_out) {
    error = "timed out: " + core::process::DescribeCommand(argv);
    return false;
  }
  if (result.exit_code != 0) {
    error = "command failed (exit " + std::to_string(result.exit_code) +
            "): " + core::process::DescribeCommand(argv);
    const std::string detail = Trimmed(result.stderr_text);
    if (!detail.empty()) {
      error += ": " + detail;
    }
    return false;
  }
  return true;
}

// Removes the build context directory on every exit path.
class ScopedBuildContext {
public:
  ScopedBuildContext() = default;
  ScopedBuildContext(const ScopedBuildContext&) = delete;
  ScopedBuildContext& operator=(const ScopedBuildContext&) = delete;

  ~ScopedBuildContext() {
    if (!dir_.empty()) {
      std::error_code ec;
      (void)fs::remove_all(dir_, ec);
    }
  }

  bool Create(std::string& error) {
    static std::atomic<std::uint64_t> counter{0};
    std::error_code ec;
    const fs::path base = fs::temp_directory_path(ec);
    if (ec) {
      error = "failed to locate temp directory: " + ec.message();
      return false;
    }
    dir_ = base / ("sweval-build-" + std::to_string(::getpid()) + "-" +
                   std::to_string(counter.fetch_add(1U)));
    fs::create_directories(dir_, ec);
    if (ec) {
      error = "failed to create build context '" + dir_.string() + "': " + ec.message();
      dir_.clear();
      return false;
    }
    return true;
  }

  const fs::path& Dir() const {
    return dir_;
  }

private:
  fs::path dir_;
};

} // namespace

DockerCliRuntime::DockerCliRuntime() : docker_binary_(DefaultDockerBinary()) {}

DockerCliRuntime::DockerCliRuntime(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {}

std::vector<std::string> DockerCliRuntime::ComposeArgs(
    const SandboxHandle& handle, std::initializer_list<std::string> subcommand) const {
  std::vector<std::string> argv = {docker_binary_, "compose", "-f",
                                   handle.descriptor_path.string(), "-p", handle.project_name};
  argv.insert(argv.end(), subcommand.begin(), subcommand.end());
  return argv;
}

bool DockerCliRuntime::ListImages(std::set<std::string>& images, std::string& error) {
  images.clear();
  const std::vector<std::string> argv = {docker_binary_, "images", "--format",
                                         "{{.Repository}}:{{.Tag}}"};
  core::process::ProcessOptions options;
  options.timeout = kComposeTimeout;
  core::process::ProcessResult result;
  if (!RunChecked(argv, options, result, error)) {
    return false;
  }

  std::istringstream lines(result.stdout_text);
  std::string line;
  while (std::getline(lines, line)) {
    line = Trimmed(std::move(line));
    if (!line.empty() && line.find("<none>") == std::string::npos) {
      images.insert(line);
    }
  }
  return true;
}

bool DockerCliRuntime::BuildImage(const ImageBuildRequest& request, std::string& build_log,
                                  std::string& error) {
  build_log.clear();
  ScopedBuildContext context;
  if (!context.Create(error)) {
    return false;
  }
  if (!core::WriteTextFileAtomic(context.Dir() / "Dockerfile", request.dockerfile, error)) {
    return false;
  }
  for (const auto& [relative_path, content] : request.context_files) {
    if (!core::WriteTextFileAtomic(context.Dir() / relative_path, content, error)) {
      return false;
    }
  }

  const std::vector<std::string> argv = {docker_binary_, "build", "--tag", request.image_name,
                                         context.Dir().string()};
  core::process::ProcessResult result;
  const bool ok = RunChecked(argv, core::process::ProcessOptions{}, result, error);
  build_log = result.stdout_text + result.stderr_text;
  return ok;
}

bool DockerCliRuntime::StartSandbox(const SandboxHandle& handle, std::string& error) {
  const std::vector<std::string> argv = ComposeArgs(handle, {"up", "-d"});
  core::process::ProcessOptions options;
  options.timeout = kComposeTimeout;
  core::process::ProcessResult result;
  return RunChecked(argv, options, result, error);
}

bool DockerCliRuntime::ExecInSandbox(const SandboxHandle& handle, const std::string& script,
                                     std::chrono::milliseconds timeout, ExecResult& result,
                                     std::string& error) {
  result = ExecResult{};

  // Stage the script first: a script streamed straight into `bash -s` would
  // share stdin with the commands it runs.
  const std::vector<std::string> stage = ComposeArgs(
      handle, {"exec", "-T", handle.service, "bash", "-c",
               std::string("cat > ") + kSandboxScriptPath});
  core::process::ProcessOptions stage_options;
  stage_options.stdin_text = script;
  stage_options.timeout = kComposeTimeout;
  core::process::ProcessResult stage_result;
  if (!RunChecked(stage, stage_options, stage_result, error)) {
    error = "failed to stage script in sandbox: " + error;
    return false;
  }

  const std::vector<std::string> run =
      ComposeArgs(handle, {"exec", "-T", handle.service, "bash", kSandboxScriptPath});
  core::process::ProcessOptions run_options;
  run_options.timeout = timeout;
  core::process::ProcessResult run_result;
  if (!core::process::RunProcess(run, run_options, run_result, error)) {
    return false;
  }

  result.exit_code = run_result.exit_code;
  result.stdout_text = std::move(run_result.stdout_text);
  result.stderr_text = std::move(run_result.stderr_text);
  result.timed_out = run_result.timed_out;
  return true;
}

bool DockerCliRuntime::StopSandbox(const SandboxHandle& handle, std::string& error) {
  const std::vector<std::string> argv = ComposeArgs(handle, {"down", "--remove-orphans"});
  core::process::ProcessOptions options;
  options.timeout = kComposeTimeout;
  core::process::ProcessResult result;
  return RunChecked(argv, options, result, error);
}

} // namespace sweval::sandbox
