#pragma once

#include "core/logging/logger.hpp"
#include "dataset/instance.hpp"
#include "images/build_spec.hpp"
#include "images/mapping_store.hpp"
#include "repos/repo_spec.hpp"
#include "sandbox/container_runtime.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace sweval::images {

struct BuildOptions {
  std::size_t max_workers = 4;
  bool force_rebuild = false;
  // Empty means HostArch().
  std::string arch;
};

struct BuildFailure {
  std::string instance_id;
  std::string image_name;
  std::string reason;
};

struct BuildReport {
  // Image names built in this run.
  std::vector<std::string> built;
  // Image names already present and not rebuilt.
  std::vector<std::string> skipped;
  // One entry per affected instance.
  std::vector<BuildFailure> failures;
  std::size_t recorded = 0;
  std::size_t unchanged = 0;
};

enum class BuildOutcome {
  kOk,
  // Some instances failed to build; every other instance was recorded.
  kPartialFailure,
  // A build reported success but the image is not in the runtime. Nothing
  // was recorded.
  kSilentBuildFailure,
  // The mapping store already maps an instance to a different image.
  kMappingConflict,
  // Runtime or store failure affecting the whole run.
  kFailed,
};

const char* ToString(BuildOutcome outcome);

// Builds the environment images of a dataset split and records
// (instance id, environment commit) -> image in the mapping store.
//
// Distinct images are built once each, in parallel, bounded by
// `max_workers`. Each build gets its own build context; a failed build only
// affects the instances that need that image.
class ImageBuilder {
public:
  ImageBuilder(sandbox::IContainerRuntime& runtime, const repos::RepoSpecRegistry& repo_specs,
               ImageMappingStore& store, core::logging::Logger& logger);

  // `report` is filled for every outcome. `error` is set for every outcome
  // except kOk.
  BuildOutcome BuildSplit(const std::vector<dataset::BenchmarkInstance>& instances,
                          const BuildOptions& options, BuildReport& report, std::string& error);

private:
  bool EnsureBaseImage(const std::string& arch, bool force_rebuild,
                       const std::set<std::string>& present, std::string& error);

  sandbox::IContainerRuntime& runtime_;
  const repos::RepoSpecRegistry& repo_specs_;
  ImageMappingStore& store_;
  core::logging::Logger& logger_;
};

} // namespace sweval::images
