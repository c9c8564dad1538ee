#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace sweval::sandbox {

// Build input for one image. `context_files` are written into a private
// build context directory next to the Dockerfile (relative path -> content).
struct ImageBuildRequest {
  std::string image_name;
  std::string dockerfile;
  std::map<std::string, std::string> context_files;
};

// A running sandbox started from a descriptor file.
struct SandboxHandle {
  std::filesystem::path descriptor_path;
  std::string project_name;
  std::string service = "default";
};

struct ExecResult {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
};

// Container runtime contract used by the image builder, provisioner and
// executor.
//
// Contract goals:
// - keep image and sandbox lifecycles explicit (`Build`, `Start/Stop`)
// - report runtime failures as `false` + `error`; a script that runs and
//   exits non-zero is NOT a runtime failure
// - be safe to call from several builder workers at once
class IContainerRuntime {
public:
  virtual ~IContainerRuntime() = default;

  // Image references known to the runtime, as "<repository>:<tag>".
  virtual bool ListImages(std::set<std::string>& images, std::string& error) = 0;

  virtual bool BuildImage(const ImageBuildRequest& request, std::string& build_log,
                          std::string& error) = 0;

  virtual bool StartSandbox(const SandboxHandle& handle, std::string& error) = 0;

  // Feeds `script` to bash inside the sandbox. A zero timeout waits forever.
  virtual bool ExecInSandbox(const SandboxHandle& handle, const std::string& script,
                             std::chrono::milliseconds timeout, ExecResult& result,
                             std::string& error) = 0;

  virtual bool StopSandbox(const SandboxHandle& handle, std::string& error) = 0;
};

} // namespace sweval::sandbox
