#include "sweval/cli/router.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "artifacts/score_writer.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "dataset/instance.hpp"
#include "evaluation/evaluation_runner.hpp"
#include "images/image_builder.hpp"
#include "images/mapping_store.hpp"
#include "repos/repo_spec.hpp"
#include "sandbox/docker_cli_runtime.hpp"
#include "sandbox/provisioner.hpp"
#include "scoring/log_parsers.hpp"
#include "scoring/outcome_classifier.hpp"
#include "scripts/script_generator.hpp"

#include <charconv>
#include <iostream>
#include <string_view>

namespace fs = std::filesystem;

namespace sweval::cli {

namespace {

// Keep local names for readability while using one shared core contract.
constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitMappingConflict =
    core::errors::ToInt(core::errors::ExitCode::kMappingConflict);
constexpr int kExitNotFound = core::errors::ToInt(core::errors::ExitCode::kNotFound);
constexpr int kExitBuildFailures = core::errors::ToInt(core::errors::ExitCode::kBuildFailures);
constexpr int kExitNotResolved = core::errors::ToInt(core::errors::ExitCode::kNotResolved);

constexpr std::string_view kCommonFlags =
    "[--repo-specs <file>] [--mapping <file>] [--descriptors <dir>] "
    "[--log-level <debug|info|warn|error>]";

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  sweval build-images --dataset <file> [--instance <id>]... [--max-workers <n>] "
         "[--force-rebuild] [--arch <x86_64|arm64>] "
      << kCommonFlags << '\n'
      << "  sweval provision --dataset <file> --instance <id> " << kCommonFlags << '\n'
      << "  sweval setup-script --dataset <file> --instance <id> [--repo-specs <file>]\n"
      << "  sweval eval-script --dataset <file> --instance <id> [--repo-specs <file>]\n"
      << "  sweval evaluate --dataset <file> [--instance <id>]... [--patch <file> | --gold] "
         "[--timeout-sec <n>] [--out <dir>] "
      << kCommonFlags << '\n'
      << "  sweval score --dataset <file> --instance <id> --stdout <file> [--patch <file>] "
         "[--out <dir>] [--repo-specs <file>]\n"
      << "  sweval version\n";
}

enum class OptionParse {
  kConsumed,
  kUnknown,
  kError,
};

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

bool ParseUnsigned(std::string_view flag, std::string_view text, std::size_t& value,
                   std::string& error) {
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || text.empty()) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(text) +
            "' (expected a non-negative integer)";
    return false;
  }
  return true;
}

// Flags understood by every pipeline command. Anything else is left to the
// command-specific parser.
OptionParse ParseCommonOption(const std::vector<std::string_view>& args, std::size_t& i,
                              CommonOptions& options, std::string& error) {
  const std::string_view token = args[i];
  std::string value;
  if (token == "--dataset" || token == "--instance" || token == "--repo-specs" ||
      token == "--mapping" || token == "--descriptors" || token == "--out" ||
      token == "--log-level") {
    if (!TakeValue(args, i, value, error)) {
      return OptionParse::kError;
    }
  } else {
    return OptionParse::kUnknown;
  }

  if (token == "--dataset") {
    options.dataset_path = value;
  } else if (token == "--instance") {
    options.instance_ids.push_back(value);
  } else if (token == "--repo-specs") {
    options.repo_specs_path = value;
  } else if (token == "--mapping") {
    options.mapping_path = value;
  } else if (token == "--descriptors") {
    options.descriptor_dir = value;
  } else if (token == "--out") {
    options.output_dir = value;
  } else {
    if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
      return OptionParse::kError;
    }
  }
  return OptionParse::kConsumed;
}

bool RequireDataset(const CommonOptions& options, std::string_view command, std::string& error) {
  if (options.dataset_path.empty()) {
    error = std::string(command) + " requires --dataset <file>";
    return false;
  }
  return true;
}

bool RequireSingleInstance(const CommonOptions& options, std::string_view command,
                           std::string& error) {
  if (options.instance_ids.size() != 1U) {
    error = std::string(command) + " requires exactly 1 --instance <id>";
    return false;
  }
  return true;
}

// Parses a command that only takes common flags.
bool ParseCommonOnly(const std::vector<std::string_view>& args, CommonOptions& options,
                     std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    switch (ParseCommonOption(args, i, options, error)) {
    case OptionParse::kConsumed:
      continue;
    case OptionParse::kError:
      return false;
    case OptionParse::kUnknown:
      error = "unknown option: " + std::string(args[i]);
      return false;
    }
  }
  return true;
}

bool ParseBuildImagesOptions(const std::vector<std::string_view>& args,
                             BuildImagesOptions& options, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    switch (ParseCommonOption(args, i, options.common, error)) {
    case OptionParse::kConsumed:
      continue;
    case OptionParse::kError:
      return false;
    case OptionParse::kUnknown:
      break;
    }

    const std::string_view token = args[i];
    std::string value;
    if (token == "--force-rebuild") {
      options.force_rebuild = true;
      continue;
    }
    if (token == "--max-workers") {
      if (!TakeValue(args, i, value, error) ||
          !ParseUnsigned(token, value, options.max_workers, error)) {
        return false;
      }
      if (options.max_workers == 0U) {
        error = "--max-workers must be at least 1";
        return false;
      }
      continue;
    }
    if (token == "--arch") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (value != "x86_64" && value != "arm64") {
        error = "invalid --arch '" + value + "' (expected x86_64|arm64)";
        return false;
      }
      options.arch = value;
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }
  return RequireDataset(options.common, "build-images", error);
}

bool ParseEvaluateOptions(const std::vector<std::string_view>& args, EvaluateOptions& options,
                          std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    switch (ParseCommonOption(args, i, options.common, error)) {
    case OptionParse::kConsumed:
      continue;
    case OptionParse::kError:
      return false;
    case OptionParse::kUnknown:
      break;
    }

    const std::string_view token = args[i];
    std::string value;
    if (token == "--gold") {
      options.use_gold_patch = true;
      continue;
    }
    if (token == "--patch") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.patch_path = value;
      continue;
    }
    if (token == "--timeout-sec") {
      std::size_t seconds = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsigned(token, value, seconds, error)) {
        return false;
      }
      options.timeout = std::chrono::seconds(static_cast<long long>(seconds));
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }

  if (options.use_gold_patch && !options.patch_path.empty()) {
    error = "--gold and --patch are mutually exclusive";
    return false;
  }
  return RequireDataset(options.common, "evaluate", error);
}

bool ParseScoreOptions(const std::vector<std::string_view>& args, ScoreOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    switch (ParseCommonOption(args, i, options.common, error)) {
    case OptionParse::kConsumed:
      continue;
    case OptionParse::kError:
      return false;
    case OptionParse::kUnknown:
      break;
    }

    const std::string_view token = args[i];
    std::string value;
    if (token == "--stdout" || token == "--patch") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      (token == "--stdout" ? options.stdout_path : options.patch_path) = value;
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }

  if (options.stdout_path.empty()) {
    error = "score requires --stdout <file>";
    return false;
  }
  return RequireDataset(options.common, "score", error) &&
         RequireSingleInstance(options.common, "score", error);
}

// Loaded configuration shared by the pipeline commands.
struct PipelineInputs {
  std::vector<dataset::BenchmarkInstance> instances;
  repos::RepoSpecRegistry repo_specs;
  // Instances selected by --instance, or all of them, in dataset order.
  std::vector<const dataset::BenchmarkInstance*> selected;
};

// Returns an exit code; kExitSuccess means `inputs` is ready.
int LoadPipelineInputs(const CommonOptions& options, PipelineInputs& inputs) {
  std::string error;
  if (!dataset::LoadDataset(options.dataset_path, inputs.instances, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (!inputs.repo_specs.LoadFile(options.repo_specs_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  if (options.instance_ids.empty()) {
    for (const auto& instance : inputs.instances) {
      inputs.selected.push_back(&instance);
    }
    return kExitSuccess;
  }
  for (const auto& instance_id : options.instance_ids) {
    const dataset::BenchmarkInstance* instance =
        dataset::FindInstance(inputs.instances, instance_id);
    if (instance == nullptr) {
      std::cerr << "error: instance '" << instance_id << "' not found in dataset '"
                << options.dataset_path.string() << "'\n";
      return kExitNotFound;
    }
    inputs.selected.push_back(instance);
  }
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "sweval 0.1.0\n";
  return kExitSuccess;
}

int CommandBuildImages(const std::vector<std::string_view>& args) {
  BuildImagesOptions options;
  std::string error;
  if (!ParseBuildImagesOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  PipelineInputs inputs;
  if (const int code = LoadPipelineInputs(options.common, inputs); code != kExitSuccess) {
    return code;
  }
  std::vector<dataset::BenchmarkInstance> selected;
  selected.reserve(inputs.selected.size());
  for (const auto* instance : inputs.selected) {
    selected.push_back(*instance);
  }

  core::logging::Logger logger(options.common.log_level);
  images::ImageMappingStore store(options.common.mapping_path);
  if (!store.Load(error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  sandbox::DockerCliRuntime runtime;
  images::ImageBuilder builder(runtime, inputs.repo_specs, store, logger);

  images::BuildOptions build_options;
  build_options.max_workers = options.max_workers;
  build_options.force_rebuild = options.force_rebuild;
  build_options.arch = options.arch;

  images::BuildReport report;
  const images::BuildOutcome outcome = builder.BuildSplit(selected, build_options, report, error);

  std::cout << "built: " << report.built.size() << '\n';
  std::cout << "skipped: " << report.skipped.size() << '\n';
  std::cout << "failed_instances: " << report.failures.size() << '\n';
  for (const auto& failure : report.failures) {
    std::cout << "  - " << failure.instance_id << ": " << failure.reason << '\n';
  }
  std::cout << "recorded: " << report.recorded << '\n';
  std::cout << "unchanged: " << report.unchanged << '\n';
  std::cout << "mapping: " << store.Path().string() << '\n';

  switch (outcome) {
  case images::BuildOutcome::kOk:
    return kExitSuccess;
  case images::BuildOutcome::kPartialFailure:
    std::cerr << "error: " << error << '\n';
    return kExitBuildFailures;
  case images::BuildOutcome::kMappingConflict:
    std::cerr << "error: " << error << '\n';
    return kExitMappingConflict;
  case images::BuildOutcome::kSilentBuildFailure:
  case images::BuildOutcome::kFailed:
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  return kExitFailure;
}

int CommandProvision(const std::vector<std::string_view>& args) {
  CommonOptions options;
  std::string error;
  if (!ParseCommonOnly(args, options, error) || !RequireDataset(options, "provision", error) ||
      !RequireSingleInstance(options, "provision", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  PipelineInputs inputs;
  if (const int code = LoadPipelineInputs(options, inputs); code != kExitSuccess) {
    return code;
  }

  images::ImageMappingStore store(options.mapping_path);
  if (!store.Load(error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  sandbox::DockerCliRuntime runtime;
  sandbox::SandboxProvisioner provisioner(options.descriptor_dir, store, runtime);

  fs::path descriptor_path;
  switch (provisioner.ProvisionForInstance(*inputs.selected.front(), descriptor_path, error)) {
  case sandbox::ProvisionStatus::kOk:
    std::cout << "descriptor: " << descriptor_path.string() << '\n';
    return kExitSuccess;
  case sandbox::ProvisionStatus::kNotFound:
    std::cerr << "error: " << error << '\n';
    return kExitNotFound;
  case sandbox::ProvisionStatus::kFailed:
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  return kExitFailure;
}

// Shared by setup-script and eval-script: both print one generated script.
int CommandPrintScript(const std::vector<std::string_view>& args, std::string_view command,
                       bool eval_script) {
  CommonOptions options;
  std::string error;
  if (!ParseCommonOnly(args, options, error) || !RequireDataset(options, command, error) ||
      !RequireSingleInstance(options, command, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  PipelineInputs inputs;
  if (const int code = LoadPipelineInputs(options, inputs); code != kExitSuccess) {
    return code;
  }
  const dataset::BenchmarkInstance& instance = *inputs.selected.front();

  repos::RepoSpec spec;
  if (!inputs.repo_specs.Lookup(instance.repo, instance.version, spec, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitNotFound;
  }

  std::cout << (eval_script
                    ? scripts::GenerateEvalScript(instance.test_patch, spec, instance.base_commit)
                    : scripts::GenerateSetupScript(spec, instance.base_commit));
  return kExitSuccess;
}

int CommandEvaluate(const std::vector<std::string_view>& args) {
  EvaluateOptions options;
  std::string error;
  if (!ParseEvaluateOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  PipelineInputs inputs;
  if (const int code = LoadPipelineInputs(options.common, inputs); code != kExitSuccess) {
    return code;
  }

  std::string candidate_patch;
  if (!options.patch_path.empty() &&
      !core::ReadTextFile(options.patch_path, candidate_patch, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  core::logging::Logger logger(options.common.log_level);
  images::ImageMappingStore store(options.common.mapping_path);
  if (!store.Load(error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  sandbox::DockerCliRuntime runtime;
  sandbox::SandboxProvisioner provisioner(options.common.descriptor_dir, store, runtime);
  const scoring::LogParserRegistry parsers = scoring::LogParserRegistry::WithDefaults();
  evaluation::EvaluationRunner runner(provisioner, runtime, inputs.repo_specs, parsers, logger);

  std::vector<artifacts::ScoreRecord> records;
  bool any_not_found = false;
  bool any_failed = false;
  for (const auto* instance : inputs.selected) {
    evaluation::EvaluationOptions run_options;
    run_options.output_root = options.common.output_dir;
    run_options.eval_timeout = options.timeout;
    if (options.use_gold_patch) {
      if (instance->patch.empty()) {
        std::cerr << "error: instance '" << instance->instance_id
                  << "' has no reference patch for --gold\n";
        any_failed = true;
        continue;
      }
      run_options.candidate_patch = instance->patch;
    } else {
      run_options.candidate_patch = candidate_patch;
    }

    evaluation::EvaluationResult result;
    const evaluation::EvaluationStatus status =
        runner.Evaluate(*instance, run_options, result, error);
    if (status == evaluation::EvaluationStatus::kNotFound) {
      std::cerr << "error: " << instance->instance_id << ": " << error << '\n';
      any_not_found = true;
      continue;
    }
    if (status == evaluation::EvaluationStatus::kFailed) {
      std::cerr << "error: " << instance->instance_id << ": " << error << '\n';
      any_failed = true;
      continue;
    }

    records.push_back({instance->instance_id, result.score.value,
                       result.score.infrastructure_failure, result.score.malformed_output});
    std::cout << instance->instance_id << ": " << (result.score.Resolved() ? "1.0" : "0.0")
              << " (" << result.score_json_path.string() << ")\n";
  }

  fs::path summary_path;
  if (!artifacts::WriteSummaryJson(records, options.common.output_dir, summary_path, error)) {
    std::cerr << "error: failed to write summary.json: " << error << '\n';
    return kExitFailure;
  }
  const artifacts::ScoreSummary summary = artifacts::ComputeSummary(records);
  std::cout << "summary: " << summary_path.string() << '\n';
  std::cout << "resolved: " << summary.resolved << "/" << summary.count << '\n';
  std::cout << "mean: " << summary.mean << " std: " << summary.stddev << '\n';

  if (any_not_found) {
    return kExitNotFound;
  }
  if (any_failed) {
    return kExitFailure;
  }
  return summary.resolved == summary.count ? kExitSuccess : kExitNotResolved;
}

int CommandScore(const std::vector<std::string_view>& args) {
  ScoreOptions options;
  std::string error;
  if (!ParseScoreOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  PipelineInputs inputs;
  if (const int code = LoadPipelineInputs(options.common, inputs); code != kExitSuccess) {
    return code;
  }
  const dataset::BenchmarkInstance& instance = *inputs.selected.front();

  std::string stdout_text;
  if (!core::ReadTextFile(options.stdout_path, stdout_text, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  std::string agent_patch;
  if (!options.patch_path.empty() &&
      !core::ReadTextFile(options.patch_path, agent_patch, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  // A repo without a spec still scores with its default parser.
  std::string parser_override;
  repos::RepoSpec spec;
  std::string lookup_error;
  if (inputs.repo_specs.Lookup(instance.repo, instance.version, spec, lookup_error)) {
    parser_override = spec.log_parser;
  }

  const scoring::LogParserRegistry parsers = scoring::LogParserRegistry::WithDefaults();
  const scoring::Score score =
      scoring::ScoreEvalOutput(instance, stdout_text, agent_patch, parsers, parser_override);

  const fs::path instance_dir =
      artifacts::InstanceOutputDir(options.common.output_dir, instance.instance_id);
  fs::path score_json_path;
  if (!artifacts::WriteScoreJson(instance.instance_id, score, std::chrono::system_clock::now(),
                                 instance_dir, score_json_path, error)) {
    std::cerr << "error: failed to write score.json: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "score: " << (score.Resolved() ? "1.0" : "0.0") << '\n';
  std::cout << "score_json: " << score_json_path.string() << '\n';
  std::cout << score.explanation;
  if (!score.explanation.empty() && score.explanation.back() != '\n') {
    std::cout << '\n';
  }
  return score.Resolved() ? kExitSuccess : kExitNotResolved;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "build-images") {
    return CommandBuildImages(args);
  }

  if (command == "provision") {
    return CommandProvision(args);
  }

  if (command == "setup-script") {
    return CommandPrintScript(args, command, false);
  }

  if (command == "eval-script") {
    return CommandPrintScript(args, command, true);
  }

  if (command == "evaluate") {
    return CommandEvaluate(args);
  }

  if (command == "score") {
    return CommandScore(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace sweval::cli
