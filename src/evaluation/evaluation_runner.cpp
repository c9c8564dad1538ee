#include "evaluation/evaluation_runner.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "artifacts/score_writer.hpp"
#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"
#include "scoring/signatures.hpp"
#include "scripts/script_generator.hpp"

#include <cctype>

#include <unistd.h>

namespace fs = std::filesystem;

namespace sweval::evaluation {

namespace {

constexpr std::chrono::minutes kPatchStepTimeout{5};

// Compose project names allow lowercase letters, digits, '-' and '_'.
std::string ProjectNameFor(std::string_view instance_id) {
  std::string name = "sweval-";
  for (const char c : instance_id) {
    const auto as_unsigned = static_cast<unsigned char>(c);
    if (std::isalnum(as_unsigned) != 0) {
      name.push_back(static_cast<char>(std::tolower(as_unsigned)));
    } else {
      name.push_back(c == '_' ? '_' : '-');
    }
  }
  return name + "-" + std::to_string(::getpid());
}

std::string WithSignature(std::string stdout_text, std::string_view signature) {
  if (!stdout_text.empty() && stdout_text.back() != '\n') {
    stdout_text.push_back('\n');
  }
  stdout_text.append(signature);
  stdout_text.push_back('\n');
  return stdout_text;
}

// Stops the sandbox when the evaluation leaves scope, whatever the path.
class SandboxSession {
public:
  SandboxSession(sandbox::IContainerRuntime& runtime, sandbox::SandboxHandle handle,
                 core::logging::Logger& logger)
      : runtime_(runtime), handle_(std::move(handle)), logger_(logger) {}

  SandboxSession(const SandboxSession&) = delete;
  SandboxSession& operator=(const SandboxSession&) = delete;

  ~SandboxSession() {
    if (!started_) {
      return;
    }
    std::string error;
    if (!runtime_.StopSandbox(handle_, error)) {
      logger_.Warn("failed to stop sandbox",
                   {{"project", handle_.project_name}, {"error", error}});
    }
  }

  bool Start(std::string& error) {
    started_ = runtime_.StartSandbox(handle_, error);
    return started_;
  }

  const sandbox::SandboxHandle& Handle() const {
    return handle_;
  }

private:
  sandbox::IContainerRuntime& runtime_;
  sandbox::SandboxHandle handle_;
  core::logging::Logger& logger_;
  bool started_ = false;
};

} // namespace

const char* ToString(EvaluationStatus status) {
  switch (status) {
  case EvaluationStatus::kScored:
    return "scored";
  case EvaluationStatus::kNotFound:
    return "not_found";
  case EvaluationStatus::kFailed:
    return "failed";
  }
  return "failed";
}

EvaluationRunner::EvaluationRunner(sandbox::SandboxProvisioner& provisioner,
                                   sandbox::IContainerRuntime& runtime,
                                   const repos::RepoSpecRegistry& repo_specs,
                                   const scoring::LogParserRegistry& parsers,
                                   core::logging::Logger& logger)
    : provisioner_(provisioner),
      runtime_(runtime),
      repo_specs_(repo_specs),
      parsers_(parsers),
      logger_(logger),
      executor_(runtime, logger) {}

void EvaluationRunner::ScoreRuntimeFailure(const dataset::BenchmarkInstance& instance,
                                           const repos::RepoSpec& spec, std::string_view step,
                                           std::string_view runtime_error,
                                           std::string_view agent_patch,
                                           EvaluationResult& result, std::string& eval_stdout) {
  logger_.Error("sandbox runtime failed", {{"step", std::string(step)},
                                           {"error", std::string(runtime_error)}});
  std::string text = "sandbox runtime failed during " + std::string(step) + ": " +
                     std::string(runtime_error);
  eval_stdout = WithSignature(std::move(text), scoring::kTestsError);
  result.score =
      scoring::ScoreEvalOutput(instance, eval_stdout, agent_patch, parsers_, spec.log_parser);
}

void EvaluationRunner::RunInSandbox(const dataset::BenchmarkInstance& instance,
                                    const repos::RepoSpec& spec,
                                    const sandbox::SandboxHandle& handle,
                                    const EvaluationOptions& options, EvaluationResult& result,
                                    std::string& eval_script, std::string& eval_stdout) {
  std::string agent_patch;
  std::string error;

  sandbox::ExecResult setup;
  const std::string setup_script = scripts::GenerateSetupScript(spec, instance.base_commit);
  if (!executor_.Execute(handle, setup_script, options.setup_timeout, setup, error)) {
    ScoreRuntimeFailure(instance, spec, "setup script", error, agent_patch, result, eval_stdout);
    return;
  }
  if (setup.timed_out || setup.exit_code != 0) {
    logger_.Warn("setup script failed", {{"exit_code", std::to_string(setup.exit_code)}});
    eval_stdout = WithSignature(setup.stdout_text + setup.stderr_text,
                                scoring::kTaskEnvResetFailed);
    result.score = scoring::ScoreEvalOutput(instance, eval_stdout, agent_patch, parsers_,
                                            spec.log_parser);
    return;
  }

  if (!options.candidate_patch.empty()) {
    sandbox::ExecResult apply;
    if (!executor_.Execute(handle, scripts::GenerateApplyPatchScript(options.candidate_patch),
                           kPatchStepTimeout, apply, error)) {
      ScoreRuntimeFailure(instance, spec, "candidate patch apply", error,
                          options.candidate_patch, result, eval_stdout);
      return;
    }
    if (apply.timed_out || apply.exit_code != 0) {
      logger_.Warn("candidate patch did not apply",
                   {{"exit_code", std::to_string(apply.exit_code)}});
      eval_stdout =
          WithSignature(apply.stdout_text + apply.stderr_text, scoring::kApplyPatchFail);
      result.score = scoring::ScoreEvalOutput(instance, eval_stdout, options.candidate_patch,
                                              parsers_, spec.log_parser);
      return;
    }
  }

  sandbox::ExecResult capture;
  if (!executor_.Execute(handle, scripts::GenerateCapturePatchScript(instance.base_commit),
                         kPatchStepTimeout, capture, error)) {
    ScoreRuntimeFailure(instance, spec, "agent patch capture", error, agent_patch, result,
                        eval_stdout);
    return;
  }
  if (capture.exit_code == 0 && !capture.timed_out) {
    agent_patch = capture.stdout_text;
  } else {
    logger_.Warn("could not capture agent patch",
                 {{"exit_code", std::to_string(capture.exit_code)}});
  }

  eval_script = scripts::GenerateEvalScript(instance.test_patch, spec, instance.base_commit);
  sandbox::ExecResult eval;
  if (!executor_.Execute(handle, eval_script, options.eval_timeout, eval, error)) {
    ScoreRuntimeFailure(instance, spec, "eval script", error, agent_patch, result, eval_stdout);
    return;
  }
  eval_stdout = eval.stdout_text;
  result.score =
      scoring::ScoreEvalOutput(instance, eval_stdout, agent_patch, parsers_, spec.log_parser);
}

EvaluationStatus EvaluationRunner::Evaluate(const dataset::BenchmarkInstance& instance,
                                            const EvaluationOptions& options,
                                            EvaluationResult& result, std::string& error) {
  result = EvaluationResult{};
  logger_.SetInstanceId(instance.instance_id);
  const auto started = std::chrono::steady_clock::now();

  repos::RepoSpec spec;
  if (!repo_specs_.Lookup(instance.repo, instance.version, spec, error)) {
    return EvaluationStatus::kNotFound;
  }

  fs::path descriptor_path;
  switch (provisioner_.ProvisionForInstance(instance, descriptor_path, error)) {
  case sandbox::ProvisionStatus::kOk:
    break;
  case sandbox::ProvisionStatus::kNotFound:
    return EvaluationStatus::kNotFound;
  case sandbox::ProvisionStatus::kFailed:
    return EvaluationStatus::kFailed;
  }

  sandbox::SandboxHandle handle;
  handle.descriptor_path = descriptor_path;
  handle.project_name = ProjectNameFor(instance.instance_id);

  std::string eval_script;
  std::string eval_stdout;
  {
    SandboxSession session(runtime_, handle, logger_);
    logger_.Info("starting sandbox", {{"descriptor", descriptor_path.string()},
                                      {"project", handle.project_name}});
    if (!session.Start(error)) {
      error = "failed to start sandbox: " + error;
      return EvaluationStatus::kFailed;
    }
    RunInSandbox(instance, spec, session.Handle(), options, result, eval_script, eval_stdout);
  }

  result.instance_dir = artifacts::InstanceOutputDir(options.output_root, instance.instance_id);
  if (!artifacts::EnsureOutputDir(result.instance_dir, error) ||
      !core::WriteTextFileAtomic(result.instance_dir / "eval_stdout.txt", eval_stdout, error) ||
      !core::WriteTextFileAtomic(result.instance_dir / "model.patch", result.score.model_patch,
                                 error)) {
    return EvaluationStatus::kFailed;
  }
  if (!eval_script.empty() &&
      !core::WriteTextFileAtomic(result.instance_dir / "eval_script.sh", eval_script, error)) {
    return EvaluationStatus::kFailed;
  }
  if (!artifacts::WriteScoreJson(instance.instance_id, result.score,
                                 std::chrono::system_clock::now(), result.instance_dir,
                                 result.score_json_path, error)) {
    return EvaluationStatus::kFailed;
  }

  logger_.Info("instance scored",
               {{"value", result.score.Resolved() ? "1.0" : "0.0"},
                {"score_json", result.score_json_path.string()},
                {"elapsed", core::FormatElapsed(std::chrono::steady_clock::now() - started)}});
  return EvaluationStatus::kScored;
}

} // namespace sweval::evaluation
