#pragma once
#include <expected>
#include <string>

namespace common {

struct UrlParts {
  std::string scheme;  // lower-cased
  std::string host;
  std::string path;    // as written, still percent-encoded
};

// Splits an absolute URL with libcurl's URL API. Any scheme is accepted here;
// callers decide which schemes they support.
std::expected<UrlParts, std::string> parseUrl(const std::string& url);

// Percent-encodes a query parameter value.
std::string escapeQueryValue(const std::string& value);

} // namespace common
