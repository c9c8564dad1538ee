#include "images/mapping_store.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace sweval::images {

namespace {

using JsonValue = core::json::Value;

fs::path LockPathFor(const fs::path& mapping_path) {
  return mapping_path.string() + ".lock";
}

} // namespace

const char* ToString(RecordStatus status) {
  switch (status) {
  case RecordStatus::kRecorded:
    return "recorded";
  case RecordStatus::kUnchanged:
    return "unchanged";
  case RecordStatus::kConflict:
    return "conflict";
  }
  return "conflict";
}

ImageMappingStore::ImageMappingStore(fs::path path) : path_(std::move(path)) {}

bool ImageMappingStore::ReadMappingFile(const fs::path& path, Mapping& mapping,
                                        std::string& error) {
  mapping.clear();

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) {
      error = "failed to stat image mapping '" + path.string() + "': " + ec.message();
      return false;
    }
    return true;
  }

  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    error = "invalid image mapping JSON '" + path.string() + "': " + parse_error;
    return false;
  }
  if (!root.IsObject()) {
    error = "image mapping '" + path.string() + "' must be a JSON object";
    return false;
  }

  for (const auto& [instance_id, commits] : root.object_value) {
    if (!commits.IsObject()) {
      error = "image mapping '" + path.string() + "' entry '" + instance_id +
              "' must be an object of environment commit -> image name";
      return false;
    }
    auto& by_commit = mapping[instance_id];
    for (const auto& [commit, image] : commits.object_value) {
      if (!image.IsString() || image.string_value.empty()) {
        error = "image mapping '" + path.string() + "' entry '" + instance_id + "/" + commit +
                "' must be a non-empty image name string";
        return false;
      }
      by_commit.emplace(commit, image.string_value);
    }
  }
  return true;
}

RecordStatus ImageMappingStore::RecordInto(Mapping& mapping, std::string_view instance_id,
                                           std::string_view environment_commit,
                                           std::string_view image_name, std::string& error) {
  const auto instance_it = mapping.find(std::string(instance_id));
  if (instance_it != mapping.end()) {
    const auto commit_it = instance_it->second.find(std::string(environment_commit));
    if (commit_it != instance_it->second.end()) {
      if (commit_it->second == image_name) {
        return RecordStatus::kUnchanged;
      }
      error = "image mapping conflict for instance '" + std::string(instance_id) +
              "' environment commit '" + std::string(environment_commit) +
              "': already mapped to '" + commit_it->second + "', refusing to remap to '" +
              std::string(image_name) + "'";
      return RecordStatus::kConflict;
    }
  }
  mapping[std::string(instance_id)][std::string(environment_commit)] = std::string(image_name);
  return RecordStatus::kRecorded;
}

bool ImageMappingStore::WriteMappingFile(const Mapping& mapping, std::string& error) const {
  JsonValue root = JsonValue::MakeObject();
  for (const auto& [instance_id, by_commit] : mapping) {
    JsonValue commits = JsonValue::MakeObject();
    for (const auto& [commit, image] : by_commit) {
      commits.object_value.emplace(commit, JsonValue::MakeString(image));
    }
    root.object_value.emplace(instance_id, std::move(commits));
  }
  return core::WriteTextFileAtomic(path_, core::json::Serialize(root, 2) + "\n", error);
}

bool ImageMappingStore::Load(std::string& error) {
  Mapping loaded;
  if (!ReadMappingFile(path_, loaded, error)) {
    return false;
  }
  std::unique_lock<std::shared_mutex> lock(mu_);
  mapping_ = std::move(loaded);
  return true;
}

bool ImageMappingStore::Resolve(std::string_view instance_id,
                                std::string_view environment_commit, std::string& image_name,
                                std::string& error) const {
  image_name.clear();
  std::shared_lock<std::shared_mutex> lock(mu_);
  const auto instance_it = mapping_.find(std::string(instance_id));
  if (instance_it != mapping_.end()) {
    const auto commit_it = instance_it->second.find(std::string(environment_commit));
    if (commit_it != instance_it->second.end()) {
      image_name = commit_it->second;
      return true;
    }
  }
  error = "no image recorded for instance '" + std::string(instance_id) +
          "' environment commit '" + std::string(environment_commit) + "' in '" +
          path_.string() + "'; run `sweval build-images` for this dataset first";
  return false;
}

RecordStatus ImageMappingStore::Record(std::string_view instance_id,
                                       std::string_view environment_commit,
                                       std::string_view image_name, std::string& error) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  return RecordInto(mapping_, instance_id, environment_commit, image_name, error);
}

bool ImageMappingStore::Flush(std::string& error) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  return WriteMappingFile(mapping_, error);
}

bool ImageMappingStore::RecordBatch(const std::vector<ImageMappingEntry>& entries,
                                    BatchRecordResult& result, std::string& error) {
  result = BatchRecordResult{};

  std::unique_lock<std::shared_mutex> lock(mu_);
  core::ScopedFileLock file_lock;
  if (!file_lock.Lock(LockPathFor(path_), error)) {
    return false;
  }

  // Start from what other writers may have flushed since our Load().
  Mapping merged;
  if (!ReadMappingFile(path_, merged, error)) {
    return false;
  }
  for (const auto& [instance_id, by_commit] : mapping_) {
    for (const auto& [commit, image] : by_commit) {
      if (RecordInto(merged, instance_id, commit, image, error) == RecordStatus::kConflict) {
        result.conflict = true;
        return false;
      }
    }
  }

  for (const auto& entry : entries) {
    switch (RecordInto(merged, entry.instance_id, entry.environment_commit, entry.image_name,
                       error)) {
    case RecordStatus::kRecorded:
      ++result.recorded;
      break;
    case RecordStatus::kUnchanged:
      ++result.unchanged;
      break;
    case RecordStatus::kConflict:
      result.conflict = true;
      result.recorded = 0;
      result.unchanged = 0;
      return false;
    }
  }

  if (!WriteMappingFile(merged, error)) {
    result.recorded = 0;
    result.unchanged = 0;
    return false;
  }
  mapping_ = std::move(merged);
  return true;
}

std::size_t ImageMappingStore::Size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::size_t size = 0;
  for (const auto& [instance_id, by_commit] : mapping_) {
    size += by_commit.size();
  }
  return size;
}

} // namespace sweval::images
