#ifndef SWEVAL_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
#define SWEVAL_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_

#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace sweval::artifacts {

// Centralized output-dir creation guard used by artifact writers.
inline bool EnsureOutputDir(const std::filesystem::path& output_dir, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// `<out_root>/<instance_id>`, with path separators and other unsafe
// characters in the id replaced so one instance always maps to one folder.
inline std::filesystem::path InstanceOutputDir(const std::filesystem::path& out_root,
                                               std::string_view instance_id) {
  std::string name;
  name.reserve(instance_id.size());
  for (const char c : instance_id) {
    const bool keep = std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '_' ||
                      c == '-';
    name.push_back(keep ? c : '_');
  }
  if (name.empty() || name == "." || name == "..") {
    name = "_";
  }
  return out_root / name;
}

} // namespace sweval::artifacts

#endif // SWEVAL_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
