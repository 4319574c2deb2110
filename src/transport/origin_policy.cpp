#include "transport/origin_policy.hpp"

#include "core/string_utils.hpp"

namespace hwbridge::transport {

namespace {

// Strips "scheme://" and any ":port" so wildcard entries match on the host.
std::string OriginHost(std::string_view origin) {
  const std::size_t scheme_end = origin.find("://");
  if (scheme_end != std::string_view::npos) {
    origin.remove_prefix(scheme_end + 3);
  }
  const std::size_t port_start = origin.rfind(':');
  if (port_start != std::string_view::npos) {
    origin = origin.substr(0, port_start);
  }
  while (!origin.empty() && origin.back() == '/') {
    origin.remove_suffix(1);
  }
  return core::ToLower(std::string(origin));
}

bool MatchesEntry(const std::string& entry, const std::string& origin) {
  const std::string normalized = core::ToLower(core::Trim(entry));
  if (normalized.empty()) {
    return false;
  }
  if (normalized.rfind("*.", 0) == 0) {
    // "*.example.com" -> ".example.com" must end the origin host, with at
    // least one label in front of it.
    const std::string suffix = normalized.substr(1);
    const std::string host = OriginHost(origin);
    return host.size() > suffix.size() &&
           host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0;
  }
  return normalized == core::ToLower(origin);
}

} // namespace

bool AdmitsAnyOrigin(const std::vector<std::string>& allowed_origins) {
  if (allowed_origins.empty()) {
    return true;
  }
  for (const auto& entry : allowed_origins) {
    if (core::Trim(entry) == "*") {
      return true;
    }
  }
  return false;
}

bool IsOriginAllowed(const std::vector<std::string>& allowed_origins, std::string_view origin) {
  if (AdmitsAnyOrigin(allowed_origins)) {
    return true;
  }
  if (origin.empty()) {
    return false;
  }
  const std::string value(origin);
  for (const auto& entry : allowed_origins) {
    if (MatchesEntry(entry, value)) {
      return true;
    }
  }
  return false;
}

} // namespace hwbridge::transport
