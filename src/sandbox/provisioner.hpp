#pragma once

#include "dataset/instance.hpp"
#include "images/mapping_store.hpp"
#include "sandbox/container_runtime.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace sweval::sandbox {

enum class ProvisionStatus {
  kOk,
  // Mapping entry or image missing; the build step has to run first.
  kNotFound,
  // Runtime or filesystem failure.
  kFailed,
};

const char* ToString(ProvisionStatus status);

// Compose file text for one sandbox: a single `default` service running the
// image with a keep-alive command and `/testbed` as working directory.
std::string RenderDescriptor(std::string_view image_name);

// Turns an image name into a cached sandbox descriptor on disk.
//
// Descriptors are keyed by image name and never rewritten once present, so
// any number of evaluations against the same image share one file.
class SandboxProvisioner {
public:
  SandboxProvisioner(std::filesystem::path descriptor_dir, const images::ImageMappingStore& store,
                     IContainerRuntime& runtime);

  // `<descriptor_dir>/<image name with [^A-Za-z0-9._-] replaced by '_'>.yaml`.
  std::filesystem::path DescriptorPathFor(std::string_view image_name) const;

  // Contract:
  // - kOk: `descriptor_path` exists. A cache hit never touches the runtime.
  // - kNotFound: the image is not known to the runtime; `error` names the
  //   build step to run.
  // - kFailed: runtime query or descriptor write failed.
  ProvisionStatus Provision(std::string_view image_name, std::filesystem::path& descriptor_path,
                            std::string& error);

  // Resolves the instance image through the mapping store, then Provision().
  ProvisionStatus ProvisionForInstance(const dataset::BenchmarkInstance& instance,
                                       std::filesystem::path& descriptor_path,
                                       std::string& error);

private:
  std::filesystem::path descriptor_dir_;
  const images::ImageMappingStore& store_;
  IContainerRuntime& runtime_;
};

} // namespace sweval::sandbox
