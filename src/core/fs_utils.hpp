#ifndef RECSYNC_CORE_FS_UTILS_HPP_
#define RECSYNC_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace recsync::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  std::filesystem::path temp_path = output_path;
  temp_path += ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
  return temp_path;
}

} // namespace detail

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read file: " + path.string();
    return false;
  }
  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading file: " + path.string();
    return false;
  }
  return true;
}

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
    error = "failed to create directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Returns true when `dir` exists as a directory with no entries. A missing
// path or a non-directory reports false with `ec` left clear.
inline bool IsEmptyDirectory(const std::filesystem::path& dir, std::error_code& ec) {
  ec.clear();
  if (!std::filesystem::is_directory(dir, ec) || ec) {
    return false;
  }
  return std::filesystem::directory_iterator(dir, ec) == std::filesystem::directory_iterator();
}

// Publishes `text` at `output_path` without ever exposing a partial file:
// the payload goes to a sibling temp file first and is renamed into place.
// If the rename cannot overwrite an existing target, the target is removed
// and the rename retried once. The temp file never survives a failure.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  std::error_code ec;
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp file '" + temp_path.string() + "'";
      return false;
    }
    out_file.write(text.data(), static_cast<std::streamsize>(text.size()));
    out_file.flush();
    if (!out_file) {
      out_file.close();
      std::filesystem::remove(temp_path, ec);
      error = "failed while writing temp file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::filesystem::rename(temp_path, output_path, ec);
  if (!ec) {
    return true;
  }

  std::error_code remove_ec;
  std::filesystem::remove(output_path, remove_ec);
  ec.clear();
  std::filesystem::rename(temp_path, output_path, ec);
  if (!ec) {
    return true;
  }

  std::filesystem::remove(temp_path, remove_ec);
  error = "failed to publish '" + output_path.string() + "': " + ec.message();
  return false;
}

// Removes a single regular file. Missing files count as success.
inline bool RemoveFileIfPresent(const std::filesystem::path& path, std::string& error) {
  std::error_code ec;
  const bool exists = std::filesystem::exists(path, ec);
  if (ec) {
    error = "failed to stat '" + path.string() + "': " + ec.message();
    return false;
  }
  if (!exists) {
    return true;
  }
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    error = "refusing to remove non-regular file '" + path.string() + "'";
    return false;
  }
  std::filesystem::remove(path, ec);
  if (ec) {
    error = "failed to remove '" + path.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Removes `dir` only when it holds no entries. Returns true when the directory
// was removed, false otherwise (non-empty, missing or an error).
inline bool RemoveDirectoryIfEmpty(const std::filesystem::path& dir) {
  std::error_code ec;
  if (!IsEmptyDirectory(dir, ec)) {
    return false;
  }
  return std::filesystem::remove(dir, ec) && !ec;
}

} // namespace recsync::core

#endif // RECSYNC_CORE_FS_UTILS_HPP_
