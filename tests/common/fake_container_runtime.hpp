#ifndef SWEVAL_TESTS_COMMON_FAKE_CONTAINER_RUNTIME_HPP_
#define SWEVAL_TESTS_COMMON_FAKE_CONTAINER_RUNTIME_HPP_

#include "sandbox/container_runtime.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sweval::tests::common {

// In-memory IContainerRuntime for tests. Images "exist" once built; exec
// responses are chosen by the first rule whose needle appears in the script.
class FakeContainerRuntime final : public sandbox::IContainerRuntime {
public:
  struct ExecRule {
    std::string script_needle;
    sandbox::ExecResult result;
  };

  bool ListImages(std::set<std::string>& images, std::string& error) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++list_calls;
    if (fail_list) {
      error = "fake: images unavailable";
      return false;
    }
    images = images_;
    return true;
  }

  bool BuildImage(const sandbox::ImageBuildRequest& request, std::string& build_log,
                  std::string& error) override {
    std::lock_guard<std::mutex> lock(mu_);
    build_requests.push_back(request);
    build_log = "fake build of " + request.image_name + "\n";
    if (!throw_builds_containing.empty() && RequestMentions(request, throw_builds_containing)) {
      throw std::runtime_error("fake: builder crashed");
    }
    if (!fail_builds_containing.empty() && RequestMentions(request, fail_builds_containing)) {
      error = "fake: build failed";
      return false;
    }
    if (!silently_drop_builds) {
      images_.insert(request.image_name);
    }
    return true;
  }

  bool StartSandbox(const sandbox::SandboxHandle& handle, std::string& error) override {
    std::lock_guard<std::mutex> lock(mu_);
    if (fail_start) {
      error = "fake: start failed";
      return false;
    }
    started.push_back(handle.project_name);
    return true;
  }

  bool ExecInSandbox(const sandbox::SandboxHandle& handle, const std::string& script,
                     std::chrono::milliseconds timeout, sandbox::ExecResult& result,
                     std::string& error) override {
    (void)handle;
    std::lock_guard<std::mutex> lock(mu_);
    executed_scripts.push_back(script);
    exec_timeouts.push_back(timeout);
    if (!fail_exec_containing.empty() && script.find(fail_exec_containing) != std::string::npos) {
      error = "fake: container died";
      return false;
    }
    result = sandbox::ExecResult{};
    result.exit_code = 0;
    for (const auto& rule : exec_rules) {
      if (script.find(rule.script_needle) != std::string::npos) {
        result = rule.result;
        break;
      }
    }
    return true;
  }

  bool StopSandbox(const sandbox::SandboxHandle& handle, std::string& error) override {
    (void)error;
    std::lock_guard<std::mutex> lock(mu_);
    stopped.push_back(handle.project_name);
    return true;
  }

  void AddImage(std::string image_name) {
    std::lock_guard<std::mutex> lock(mu_);
    images_.insert(std::move(image_name));
  }

  bool HasImage(const std::string& image_name) {
    std::lock_guard<std::mutex> lock(mu_);
    return images_.count(image_name) != 0U;
  }

  // Configuration.
  bool fail_list = false;
  bool fail_start = false;
  bool silently_drop_builds = false;
  // Matched against the Dockerfile and every context file.
  std::string fail_builds_containing;
  // Same matching; BuildImage throws instead of reporting failure.
  std::string throw_builds_containing;
  // ExecInSandbox reports a runtime error for scripts containing this.
  std::string fail_exec_containing;
  std::vector<ExecRule> exec_rules;

  // Observations.
  std::size_t list_calls = 0;
  std::vector<sandbox::ImageBuildRequest> build_requests;
  std::vector<std::string> started;
  std::vector<std::string> stopped;
  std::vector<std::string> executed_scripts;
  std::vector<std::chrono::milliseconds> exec_timeouts;

private:
  static bool RequestMentions(const sandbox::ImageBuildRequest& request,
                              const std::string& needle) {
    if (request.dockerfile.find(needle) != std::string::npos) {
      return true;
    }
    for (const auto& [name, contents] : request.context_files) {
      (void)name;
      if (contents.find(needle) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

  std::mutex mu_;
  std::set<std::string> images_;
};

} // namespace sweval::tests::common

#endif // SWEVAL_TESTS_COMMON_FAKE_CONTAINER_RUNTIME_HPP_
