#ifndef SWEVAL_CORE_FS_UTILS_HPP_
#define SWEVAL_CORE_FS_UTILS_HPP_

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace sweval::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(::getpid()) + "." +
         std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read text file: " + path.string();
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading text file: " + path.string();
    return false;
  }
  return true;
}

// Atomic text file write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// rename(2) within one directory replaces the destination atomically, so a
// crash mid-write leaves either the old or the new content, never a mix.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    out_file.flush();
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      std::error_code cleanup_ec;
      (void)std::filesystem::remove(temp_path, cleanup_ec);
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

// Exclusive advisory lock on a sidecar file, held for the object's lifetime.
// Serializes read-modify-write cycles between processes sharing one state
// file. Lock() blocks until the lock is granted.
class ScopedFileLock {
public:
  ScopedFileLock() = default;
  ScopedFileLock(const ScopedFileLock&) = delete;
  ScopedFileLock& operator=(const ScopedFileLock&) = delete;

  ~ScopedFileLock() {
    Unlock();
  }

  bool Lock(const std::filesystem::path& lock_path, std::string& error) {
    Unlock();
    if (!EnsureParentDirectory(lock_path, error)) {
      return false;
    }

    fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      error = "failed to open lock file '" + lock_path.string() + "'";
      return false;
    }
    while (::flock(fd_, LOCK_EX) != 0) {
      if (errno == EINTR) {
        continue;
      }
      error = "failed to acquire lock on '" + lock_path.string() + "'";
      ::close(fd_);
      fd_ = -1;
      return false;
    }
    return true;
  }

  void Unlock() {
    if (fd_ < 0) {
      return;
    }
    (void)::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }

  bool IsHeld() const {
    return fd_ >= 0;
  }

private:
  int fd_ = -1;
};

} // namespace sweval::core

#endif // SWEVAL_CORE_FS_UTILS_HPP_
