#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace hwbridge::transport {

// True when the allow-list is empty or holds "*".
bool AdmitsAnyOrigin(const std::vector<std::string>& allowed_origins);

// Origin ACL for WebSocket upgrades.
// - entries compare case-insensitively against the full Origin value
// - "*.example.com" matches any subdomain origin such as
//   "https://app.example.com", but not "https://example.com" itself
// - a missing Origin header passes only when any origin is admitted
bool IsOriginAllowed(const std::vector<std::string>& allowed_origins, std::string_view origin);

} // namespace hwbridge::transport
