#include "sandbox/provisioner.hpp"

#include "core/fs_utils.hpp"
#include "scripts/script_generator.hpp"

#include <cctype>
#include <set>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace sweval::sandbox {

namespace {

std::string SanitizeFileStem(std::string_view image_name) {
  std::string stem;
  stem.reserve(image_name.size());
  for (const char c : image_name) {
    const bool keep = std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '_' ||
                      c == '-';
    stem.push_back(keep ? c : '_');
  }
  return stem;
}

} // namespace

const char* ToString(ProvisionStatus status) {
  switch (status) {
  case ProvisionStatus::kOk:
    return "ok";
  case ProvisionStatus::kNotFound:
    return "not_found";
  case ProvisionStatus::kFailed:
    return "failed";
  }
  return "failed";
}

std::string RenderDescriptor(std::string_view image_name) {
  std::ostringstream out;
  out << "services:\n"
      << "  default:\n"
      << "    image: " << image_name << '\n'
      << "    command: \"tail -f /dev/null\"\n"
      << "    working_dir: " << scripts::kTestbedDir << '\n'
      << "    x-local: true\n";
  return out.str();
}

SandboxProvisioner::SandboxProvisioner(fs::path descriptor_dir,
                                       const images::ImageMappingStore& store,
                                       IContainerRuntime& runtime)
    : descriptor_dir_(std::move(descriptor_dir)), store_(store), runtime_(runtime) {}

fs::path SandboxProvisioner::DescriptorPathFor(std::string_view image_name) const {
  return descriptor_dir_ / (SanitizeFileStem(image_name) + ".yaml");
}

ProvisionStatus SandboxProvisioner::Provision(std::string_view image_name,
                                              fs::path& descriptor_path, std::string& error) {
  descriptor_path = DescriptorPathFor(image_name);

  std::error_code ec;
  if (fs::is_regular_file(descriptor_path, ec)) {
    return ProvisionStatus::kOk;
  }

  std::set<std::string> images;
  if (!runtime_.ListImages(images, error)) {
    error = "failed to list images: " + error;
    return ProvisionStatus::kFailed;
  }
  if (images.find(std::string(image_name)) == images.end()) {
    error = "image '" + std::string(image_name) +
            "' is not present in the container runtime; run `sweval build-images` first";
    return ProvisionStatus::kNotFound;
  }

  if (!core::WriteTextFileAtomic(descriptor_path, RenderDescriptor(image_name), error)) {
    return ProvisionStatus::kFailed;
  }
  return ProvisionStatus::kOk;
}

ProvisionStatus SandboxProvisioner::ProvisionForInstance(const dataset::BenchmarkInstance& instance,
                                                         fs::path& descriptor_path,
                                                         std::string& error) {
  std::string image_name;
  if (!store_.Resolve(instance.instance_id, instance.environment_setup_commit, image_name,
                      error)) {
    return ProvisionStatus::kNotFound;
  }
  return Provision(image_name, descriptor_path, error);
}

} // namespace sweval::sandbox
