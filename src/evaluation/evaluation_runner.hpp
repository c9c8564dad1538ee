#pragma once

#include "core/logging/logger.hpp"
#include "dataset/instance.hpp"
#include "repos/repo_spec.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/executor.hpp"
#include "sandbox/provisioner.hpp"
#include "scoring/log_parsers.hpp"
#include "scoring/outcome_classifier.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace sweval::evaluation {

struct EvaluationOptions {
  std::filesystem::path output_root = "out";
  std::chrono::milliseconds setup_timeout = std::chrono::minutes(30);
  std::chrono::milliseconds eval_timeout = std::chrono::minutes(30);
  // Applied after setup in place of an agent. Empty leaves the checkout as
  // the agent left it.
  std::string candidate_patch;
};

enum class EvaluationStatus {
  // A Score was produced and its artifacts written.
  kScored,
  // Repo spec, mapping entry or image missing.
  kNotFound,
  // Sandbox start or artifact failure; no Score was produced.
  kFailed,
};

const char* ToString(EvaluationStatus status);

struct EvaluationResult {
  scoring::Score score;
  std::filesystem::path instance_dir;
  std::filesystem::path score_json_path;
};

// Runs one instance end to end:
// provision -> start -> setup -> [candidate patch] -> capture agent patch ->
// eval script -> score -> artifacts -> stop.
//
// Setup and candidate-patch failures, and runtime errors while a script
// runs, still produce a 0.0 Score whose stdout carries the matching
// infrastructure signature, so every started sandbox yields a score.json. The sandbox is stopped on every path after start.
class EvaluationRunner {
public:
  EvaluationRunner(sandbox::SandboxProvisioner& provisioner, sandbox::IContainerRuntime& runtime,
                   const repos::RepoSpecRegistry& repo_specs,
                   const scoring::LogParserRegistry& parsers, core::logging::Logger& logger);

  EvaluationStatus Evaluate(const dataset::BenchmarkInstance& instance,
                            const EvaluationOptions& options, EvaluationResult& result,
                            std::string& error);

private:
  void RunInSandbox(const dataset::BenchmarkInstance& instance, const repos::RepoSpec& spec,
                    const sandbox::SandboxHandle& handle, const EvaluationOptions& options,
                    EvaluationResult& result, std::string& eval_script, std::string& eval_stdout);

  // A runtime error mid-run is scored as an infrastructure failure whose
  // stdout names the step, so the instance still counts in the summary.
  void ScoreRuntimeFailure(const dataset::BenchmarkInstance& instance,
                           const repos::RepoSpec& spec, std::string_view step,
                           std::string_view runtime_error, std::string_view agent_patch,
                           EvaluationResult& result, std::string& eval_stdout);

  sandbox::SandboxProvisioner& provisioner_;
  sandbox::IContainerRuntime& runtime_;
  const repos::RepoSpecRegistry& repo_specs_;
  const scoring::LogParserRegistry& parsers_;
  core::logging::Logger& logger_;
  sandbox::SandboxExecutor executor_;
};

} // namespace sweval::evaluation
