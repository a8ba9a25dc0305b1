#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <curl/curl.h>

namespace common {

namespace {

struct CurlUrlDeleter {
  void operator()(CURLU* u) const { curl_url_cleanup(u); }
};

struct CurlStringDeleter {
  void operator()(char* s) const { curl_free(s); }
};

using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;
using CurlStringPtr = std::unique_ptr<char, CurlStringDeleter>;

std::expected<std::string, std::string> getPart(CURLU* u, CURLUPart part) {
  char* raw = nullptr;
  auto rc = curl_url_get(u, part, &raw, 0);
  CurlStringPtr holder(raw);
  if (rc == CURLUE_NO_HOST || rc == CURLUE_NO_SCHEME) {
    return std::string{};
  }
  if (rc != CURLUE_OK) {
    return std::unexpected(curl_url_strerror(rc));
  }
  return std::string(holder.get());
}

} // namespace

std::expected<UrlParts, std::string> parseUrl(const std::string& url) {
  CurlUrlPtr u(curl_url());
  if (!u) {
    return std::unexpected("Failed to allocate URL handle");
  }

  auto rc = curl_url_set(u.get(), CURLUPART_URL, url.c_str(),
                         CURLU_NON_SUPPORT_SCHEME | CURLU_ALLOW_SPACE);
  if (rc != CURLUE_OK) {
    return std::unexpected(curl_url_strerror(rc));
  }

  auto scheme = getPart(u.get(), CURLUPART_SCHEME);
  if (!scheme) {
    return std::unexpected(scheme.error());
  }
  auto host = getPart(u.get(), CURLUPART_HOST);
  if (!host) {
    return std::unexpected(host.error());
  }
  auto path = getPart(u.get(), CURLUPART_PATH);
  if (!path) {
    return std::unexpected(path.error());
  }

  UrlParts parts{*scheme, *host, *path};
  std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return parts;
}

std::string escapeQueryValue(const std::string& value) {
  CurlStringPtr escaped(curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size())));
  if (!escaped) {
    return value;
  }
  return std::string(escaped.get());
}

} // namespace common
