#pragma once
#include <array>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <curl/curl.h>
#include "domain/http_transport.hpp"

namespace radio_service {
// Thread-safe: every request gets its own easy handle, while DNS and TLS
// session caches live in one share handle guarded by mutexes.
class CurlHttpTransport : public HttpTransport {
public:
  CurlHttpTransport();
  ~CurlHttpTransport() override;

  CurlHttpTransport(const CurlHttpTransport&) = delete;
  CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

  std::expected<HttpResponseHead, TransportError> head(
    const std::string& url, const HttpRequestOptions& options) override;

  std::expected<std::unique_ptr<HttpBodyStream>, TransportError> openGet(
    const std::string& url, const HttpRequestOptions& options) override;

  std::expected<HttpResponse, TransportError> get(
    const std::string& url, const HttpRequestOptions& options) override;

private:
  static void lockShare(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
  static void unlockShare(CURL* handle, curl_lock_data data, void* userptr);

  CURLSH* share_;
  std::array<std::mutex, CURL_LOCK_DATA_LAST> share_locks_;
};
}
