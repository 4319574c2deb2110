#ifndef HWBRIDGE_TESTS_COMMON_ASSERTIONS_HPP_
#define HWBRIDGE_TESTS_COMMON_ASSERTIONS_HPP_

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <thread>

namespace hwbridge::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline std::string ReadFileToString(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open file: " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

// Polls `condition` every 10ms until it holds or `timeout` elapses.
inline bool WaitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

} // namespace hwbridge::tests::common

#endif // HWBRIDGE_TESTS_COMMON_ASSERTIONS_HPP_
