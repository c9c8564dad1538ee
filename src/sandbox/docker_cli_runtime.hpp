#pragma once

#include "sandbox/container_runtime.hpp"

#include <chrono>
#include <initializer_list>
#include <string>
#include <vector>

namespace sweval::sandbox {

// Path inside the sandbox where executed scripts are staged.
inline constexpr const char* kSandboxScriptPath = "/tmp/sweval_script.sh";

// IContainerRuntime backed by the `docker` CLI (`images`, `build`,
// `compose up/exec/down`). The binary name defaults to "docker" and can be
// replaced through the SWEVAL_DOCKER environment variable.
class DockerCliRuntime final : public IContainerRuntime {
public:
  DockerCliRuntime();
  explicit DockerCliRuntime(std::string docker_binary);

  const std::string& DockerBinary() const {
    return docker_binary_;
  }

  bool ListImages(std::set<std::string>& images, std::string& error) override;
  bool BuildImage(const ImageBuildRequest& request, std::string& build_log,
                  std::string& error) override;
  bool StartSandbox(const SandboxHandle& handle, std::string& error) override;
  bool ExecInSandbox(const SandboxHandle& handle, const std::string& script,
                     std::chrono::milliseconds timeout, ExecResult& result,
                     std::string& error) override;
  bool StopSandbox(const SandboxHandle& handle, std::string& error) override;

private:
  std::vector<std::string> ComposeArgs(const SandboxHandle& handle,
                                       std::initializer_list<std::string> subcommand) const;

  std::string docker_binary_;
};

} // namespace sweval::sandbox
