#include "images/image_builder.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <map>
#include <mutex>
#include <thread>

namespace sweval::images {

namespace {

constexpr std::size_t kBuildLogTailBytes = 2000;

struct ImageJob {
  BuildSpec spec;
  // Every instance that resolves to this image, in dataset order.
  std::vector<std::string> instance_ids;
};

std::string LogTail(const std::string& build_log) {
  if (build_log.size() <= kBuildLogTailBytes) {
    return build_log;
  }
  return "..." + build_log.substr(build_log.size() - kBuildLogTailBytes);
}

} // namespace

const char* ToString(BuildOutcome outcome) {
  switch (outcome) {
  case BuildOutcome::kOk:
    return "ok";
  case BuildOutcome::kPartialFailure:
    return "partial_failure";
  case BuildOutcome::kSilentBuildFailure:
    return "silent_build_failure";
  case BuildOutcome::kMappingConflict:
    return "mapping_conflict";
  case BuildOutcome::kFailed:
    return "failed";
  }
  return "failed";
}

ImageBuilder::ImageBuilder(sandbox::IContainerRuntime& runtime,
                           const repos::RepoSpecRegistry& repo_specs, ImageMappingStore& store,
                           core::logging::Logger& logger)
    : runtime_(runtime), repo_specs_(repo_specs), store_(store), logger_(logger) {}

bool ImageBuilder::EnsureBaseImage(const std::string& arch, bool force_rebuild,
                                   const std::set<std::string>& present, std::string& error) {
  const std::string base_image = BaseImageName(arch);
  if (!force_rebuild && present.count(base_image) != 0U) {
    logger_.Debug("base image present", {{"image", base_image}});
    return true;
  }

  logger_.Info("building base image", {{"image", base_image}});
  sandbox::ImageBuildRequest request;
  request.image_name = base_image;
  request.dockerfile = BaseDockerfile(arch);
  std::string build_log;
  if (!runtime_.BuildImage(request, build_log, error)) {
    error = "base image '" + base_image + "' failed to build: " + error;
    logger_.Error("base image build failed",
                  {{"image", base_image}, {"log_tail", LogTail(build_log)}});
    return false;
  }
  return true;
}

BuildOutcome ImageBuilder::BuildSplit(const std::vector<dataset::BenchmarkInstance>& instances,
                                      const BuildOptions& options, BuildReport& report,
                                      std::string& error) {
  report = BuildReport{};
  error.clear();
  const auto started = std::chrono::steady_clock::now();
  const std::string arch = options.arch.empty() ? HostArch() : options.arch;

  // Group instances by image. std::map keeps build order stable across runs.
  std::map<std::string, ImageJob> jobs_by_image;
  std::vector<std::pair<const dataset::BenchmarkInstance*, std::string>> resolved;
  for (const auto& instance : instances) {
    repos::RepoSpec spec;
    std::string lookup_error;
    if (!repo_specs_.Lookup(instance.repo, instance.version, spec, lookup_error)) {
      report.failures.push_back({instance.instance_id, "", lookup_error});
      logger_.Warn("skipping instance without repo spec",
                   {{"instance", instance.instance_id}, {"error", lookup_error}});
      continue;
    }
    BuildSpec build = DeriveBuildSpec(instance, spec, arch);
    auto& job = jobs_by_image[build.image_name];
    if (job.instance_ids.empty()) {
      job.spec = build;
    }
    job.instance_ids.push_back(instance.instance_id);
    resolved.emplace_back(&instance, build.image_name);
  }

  std::set<std::string> present;
  if (!runtime_.ListImages(present, error)) {
    error = "failed to list images: " + error;
    return BuildOutcome::kFailed;
  }
  if (!jobs_by_image.empty() && !EnsureBaseImage(arch, options.force_rebuild, present, error)) {
    return BuildOutcome::kFailed;
  }

  std::vector<const ImageJob*> pending;
  for (const auto& [image_name, job] : jobs_by_image) {
    if (!options.force_rebuild && present.count(image_name) != 0U) {
      report.skipped.push_back(image_name);
      continue;
    }
    pending.push_back(&job);
  }

  std::set<std::string> failed_images;
  std::mutex report_mu;
  std::atomic<std::size_t> next_job{0};
  auto worker = [&]() {
    for (std::size_t index = next_job.fetch_add(1U); index < pending.size();
         index = next_job.fetch_add(1U)) {
      const ImageJob& job = *pending[index];
      logger_.Info("building environment image",
                   {{"image", job.spec.image_name},
                    {"repo", job.spec.repo},
                    {"version", job.spec.version}});

      sandbox::ImageBuildRequest request;
      request.image_name = job.spec.image_name;
      request.dockerfile = job.spec.dockerfile;
      request.context_files.emplace("setup_env.sh", job.spec.env_script);

      std::string build_log;
      std::string build_error;
      bool ok = false;
      // An exception escaping a worker would terminate the whole batch.
      try {
        ok = runtime_.BuildImage(request, build_log, build_error);
      } catch (const std::exception& ex) {
        build_error = std::string("build raised an exception: ") + ex.what();
      }

      std::lock_guard<std::mutex> lock(report_mu);
      if (ok) {
        report.built.push_back(job.spec.image_name);
        continue;
      }
      failed_images.insert(job.spec.image_name);
      for (const auto& instance_id : job.instance_ids) {
        report.failures.push_back({instance_id, job.spec.image_name, build_error});
      }
      logger_.Warn("environment image build failed",
                   {{"image", job.spec.image_name},
                    {"error", build_error},
                    {"log_tail", LogTail(build_log)}});
    }
  };

  const std::size_t worker_count =
      std::min(std::max<std::size_t>(options.max_workers, 1U), pending.size());
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker);
  }
  for (auto& thread : workers) {
    thread.join();
  }
  std::sort(report.built.begin(), report.built.end());

  if (!runtime_.ListImages(present, error)) {
    error = "failed to list images after build: " + error;
    return BuildOutcome::kFailed;
  }

  std::vector<ImageMappingEntry> entries;
  for (const auto& [instance, image_name] : resolved) {
    if (failed_images.count(image_name) != 0U) {
      continue;
    }
    if (present.count(image_name) == 0U) {
      error = "image '" + image_name + "' for instance '" + instance->instance_id +
              "' is missing after a successful build; refusing to record any mapping";
      logger_.Error("silent build failure",
                    {{"instance", instance->instance_id}, {"image", image_name}});
      return BuildOutcome::kSilentBuildFailure;
    }
    entries.push_back({instance->instance_id, instance->environment_setup_commit, image_name});
  }

  BatchRecordResult batch;
  if (!store_.RecordBatch(entries, batch, error)) {
    return batch.conflict ? BuildOutcome::kMappingConflict : BuildOutcome::kFailed;
  }
  report.recorded = batch.recorded;
  report.unchanged = batch.unchanged;

  logger_.Info("image build finished",
               {{"built", std::to_string(report.built.size())},
                {"skipped", std::to_string(report.skipped.size())},
                {"failed_instances", std::to_string(report.failures.size())},
                {"recorded", std::to_string(report.recorded)},
                {"elapsed", core::FormatElapsed(std::chrono::steady_clock::now() - started)}});

  if (!report.failures.empty()) {
    error = std::to_string(report.failures.size()) + " instance(s) failed to build";
    return BuildOutcome::kPartialFailure;
  }
  return BuildOutcome::kOk;
}

} // namespace sweval::images
