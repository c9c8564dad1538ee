#pragma once

#include <filesystem>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sweval::images {

// Outcome of recording one (instance, environment commit) -> image entry.
enum class RecordStatus {
  // New entry stored in memory.
  kRecorded,
  // Entry already held the same image name; nothing changed.
  kUnchanged,
  // Entry already held a different image name; nothing changed. Callers must
  // treat this as fatal: evaluation would stop being reproducible.
  kConflict,
};

const char* ToString(RecordStatus status);

struct ImageMappingEntry {
  std::string instance_id;
  std::string environment_commit;
  std::string image_name;
};

struct BatchRecordResult {
  std::size_t recorded = 0;
  std::size_t unchanged = 0;
  // Filled when the batch was rejected because of a conflicting entry.
  bool conflict = false;
};

// Durable (instance id, environment commit) -> image name mapping.
//
// File layout: {"<instance_id>": {"<environment_commit>": "<image>"}}.
//
// One store object per process, injected by reference into the image builder
// and the provisioner. Resolve() takes a shared lock so many evaluations can
// read concurrently; Record()/Flush()/RecordBatch() are exclusive.
class ImageMappingStore {
public:
  explicit ImageMappingStore(std::filesystem::path path);

  ImageMappingStore(const ImageMappingStore&) = delete;
  ImageMappingStore& operator=(const ImageMappingStore&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

  // Replaces in-memory contents with the file contents. A missing file loads
  // as an empty store.
  bool Load(std::string& error);

  // Contract:
  // - true: `image_name` holds the recorded image.
  // - false: no entry; `error` tells the operator to run the image build.
  bool Resolve(std::string_view instance_id, std::string_view environment_commit,
               std::string& image_name, std::string& error) const;

  // In-memory only; call Flush() to persist. On kConflict `error` names the
  // key and both image names and the store is left untouched.
  RecordStatus Record(std::string_view instance_id, std::string_view environment_commit,
                      std::string_view image_name, std::string& error);

  // Writes the whole mapping atomically (temp sibling + rename).
  bool Flush(std::string& error);

  // Cross-process read-modify-write: takes `<path>.lock`, reloads the file,
  // merges `entries` and flushes. Any conflict rejects the whole batch and
  // neither the file nor memory changes.
  bool RecordBatch(const std::vector<ImageMappingEntry>& entries, BatchRecordResult& result,
                   std::string& error);

  std::size_t Size() const;

private:
  using Mapping = std::map<std::string, std::map<std::string, std::string>>;

  static bool ReadMappingFile(const std::filesystem::path& path, Mapping& mapping,
                              std::string& error);
  static RecordStatus RecordInto(Mapping& mapping, std::string_view instance_id,
                                 std::string_view environment_commit,
                                 std::string_view image_name, std::string& error);
  bool WriteMappingFile(const Mapping& mapping, std::string& error) const;

  std::filesystem::path path_;
  mutable std::shared_mutex mu_;
  Mapping mapping_;
};

} // namespace sweval::images
