#ifndef HWBRIDGE_CORE_STRING_UTILS_HPP_
#define HWBRIDGE_CORE_STRING_UTILS_HPP_

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace hwbridge::core {

inline std::string Trim(std::string_view input) {
  std::size_t begin = 0;
  while (begin < input.size() && std::isspace(static_cast<unsigned char>(input[begin])) != 0) {
    ++begin;
  }

  std::size_t end = input.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
    --end;
  }
  return std::string(input.substr(begin, end - begin));
}

inline std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

inline bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
        std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}

// Splits on `delimiter` and trims each field. Quoting is not supported.
inline std::vector<std::string> SplitTrimmed(std::string_view line, char delimiter) {
  std::vector<std::string> fields;
  std::string current;
  current.reserve(line.size());
  for (const char c : line) {
    if (c == delimiter) {
      fields.push_back(Trim(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  fields.push_back(Trim(current));
  return fields;
}

} // namespace hwbridge::core

#endif // HWBRIDGE_CORE_STRING_UTILS_HPP_
