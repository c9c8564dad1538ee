#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sweval::cli {

// Options shared by every pipeline subcommand. Defaults match the layout
// the build step writes, so `build-images` then `evaluate` needs no flags
// beyond the dataset.
struct CommonOptions {
  std::filesystem::path dataset_path;
  std::vector<std::string> instance_ids;
  std::filesystem::path repo_specs_path = "config/repo_specs.json";
  std::filesystem::path mapping_path = "state/sample_to_image.json";
  std::filesystem::path descriptor_dir = "state/compose_files";
  std::filesystem::path output_dir = "out";
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

struct BuildImagesOptions {
  CommonOptions common;
  std::size_t max_workers = 4;
  bool force_rebuild = false;
  std::string arch;
};

struct EvaluateOptions {
  CommonOptions common;
  std::filesystem::path patch_path;
  bool use_gold_patch = false;
  std::chrono::seconds timeout{1800};
};

struct ScoreOptions {
  CommonOptions common;
  std::filesystem::path stdout_path;
  std::filesystem::path patch_path;
};

// Routes `sweval` subcommands and returns process exit codes with a stable
// contract for scripts and CI (see core/errors/exit_codes.hpp):
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => dataset or repo spec file invalid
//   40 => image mapping conflict
//   41 => mapping entry, image or repo spec not found
//   42 => some instances failed to build
//   50 => evaluation finished but an instance was not resolved
int Dispatch(int argc, char** argv);

} // namespace sweval::cli
