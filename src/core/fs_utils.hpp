#ifndef HWBRIDGE_CORE_FS_UTILS_HPP_
#define HWBRIDGE_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace hwbridge::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

// Creates the directory that will hold `output_path` (queue database, config
// file). A bare file name needs no directory and succeeds.
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

inline bool ReadTextFile(const std::filesystem::path& input_path, std::string& text,
                         std::string& error) {
  std::ifstream input(input_path, std::ios::binary);
  if (!input) {
    error = "unable to open file: " + input_path.string();
    return false;
  }
  text.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading file: " + input_path.string();
    return false;
  }
  return true;
}

// Writes to a temporary sibling then renames it into place so a crash never
// leaves a half-written config behind. Where rename cannot overwrite, the
// destination is removed first and the rename retried.
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
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace hwbridge::core

#endif // HWBRIDGE_CORE_FS_UTILS_HPP_
