#include "../common/assertions.hpp"
#include "../common/dataset_fixtures.hpp"
#include "../common/fake_container_runtime.hpp"
#include "../common/temp_dir.hpp"
#include "images/mapping_store.hpp"
#include "sandbox/provisioner.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

int main() {
  using sweval::sandbox::ProvisionStatus;
  using sweval::tests::common::Assert;
  using sweval::tests::common::AssertContains;

  const fs::path root = sweval::tests::common::CreateUniqueTempDir("sweval-provisioner-smoke");
  const std::string image = "sweval.env.x86_64.0011223344556677:latest";
  const auto instance = sweval::tests::common::MakeInstance("acme__widgets-1");
  std::string error;

  sweval::images::ImageMappingStore store(root / "mapping.json");
  Assert(store.Load(error), error);
  sweval::tests::common::FakeContainerRuntime runtime;
  sweval::sandbox::SandboxProvisioner provisioner(root / "compose_files", store, runtime);

  // No mapping entry yet: not found, and the runtime is never asked.
  fs::path descriptor;
  Assert(provisioner.ProvisionForInstance(instance, descriptor, error) ==
             ProvisionStatus::kNotFound,
         "unmapped instance should be not found");
  AssertContains(error, "sweval build-images");
  Assert(runtime.list_calls == 0U, "unmapped instance should not query the runtime");

  // Mapped but the image is gone from the runtime.
  Assert(store.Record(instance.instance_id, instance.environment_setup_commit, image, error) ==
             sweval::images::RecordStatus::kRecorded,
         error);
  Assert(provisioner.ProvisionForInstance(instance, descriptor, error) ==
             ProvisionStatus::kNotFound,
         "missing image should be not found");
  AssertContains(error, image);
  Assert(!fs::exists(descriptor), "no descriptor should be written for a missing image");

  // Image present: descriptor written once, then served from the cache.
  runtime.AddImage(image);
  const std::size_t calls_before = runtime.list_calls;
  Assert(provisioner.ProvisionForInstance(instance, descriptor, error) == ProvisionStatus::kOk,
         "present image should provision: " + error);
  Assert(runtime.list_calls == calls_before + 1U, "first provision should query the runtime");
  Assert(descriptor == provisioner.DescriptorPathFor(image), "unexpected descriptor path");
  Assert(descriptor.filename() == "sweval.env.x86_64.0011223344556677_latest.yaml",
         "descriptor name should sanitize the image name");

  const std::string text = sweval::tests::common::ReadFileToString(descriptor);
  Assert(text == sweval::sandbox::RenderDescriptor(image), "descriptor content mismatch");
  AssertContains(text, "  default:\n");
  AssertContains(text, "    image: " + image + "\n");
  AssertContains(text, "tail -f /dev/null");
  AssertContains(text, "working_dir: /testbed");

  fs::path second;
  Assert(provisioner.Provision(image, second, error) == ProvisionStatus::kOk, error);
  Assert(second == descriptor, "cache hit should return the same path");
  Assert(runtime.list_calls == calls_before + 1U, "cache hit must not query the runtime");

  // Runtime failures are reported as failures, not as missing images.
  runtime.fail_list = true;
  Assert(provisioner.Provision("other:latest", second, error) == ProvisionStatus::kFailed,
         "list failure should be a provisioning failure");

  sweval::tests::common::RemovePathBestEffort(root);
  std::cout << "provisioner_cache_smoke: ok\n";
  return 0;
}
