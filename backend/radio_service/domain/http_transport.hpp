#pragma once
#include <chrono>
#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace radio_service {

struct HttpRequestOptions {
  std::chrono::milliseconds timeout{std::chrono::seconds(10)};
  long max_redirects{5};
  std::string user_agent;
  std::vector<std::pair<std::string, std::string>> headers;
};

enum class TransportErrorKind {
  Timeout,
  TooManyRedirects,
  ConnectionFailure,
  Other
};

struct TransportError {
  TransportErrorKind kind{TransportErrorKind::Other};
  std::string message;
};

// Header names are stored lower-cased so lookups are case-insensitive.
struct HttpResponseHead {
  long status_code{0};
  std::map<std::string, std::string> headers;

  bool hasHeader(const std::string& lower_name) const {
    return headers.contains(lower_name);
  }

  std::string header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? std::string{} : it->second;
  }
};

struct HttpResponse {
  HttpResponseHead head;
  std::string body;
};

// An open GET response whose body has not been read yet.
class HttpBodyStream {
public:
  virtual ~HttpBodyStream() = default;

  virtual const HttpResponseHead& head() const = 0;

  // Returns once max_bytes are available, the body ends, or wait expires.
  // An expired wait with a partial chunk returns the partial chunk; with
  // nothing received it is a Timeout error. An empty string means end of body.
  virtual std::expected<std::string, TransportError> readSome(
    size_t max_bytes, std::chrono::milliseconds wait) = 0;

  // Idempotent. Also called from the destructor of implementations.
  virtual void close() = 0;
};

class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual std::expected<HttpResponseHead, TransportError> head(
    const std::string& url, const HttpRequestOptions& options) = 0;

  // Returns after the final response headers arrived; the body stays on the wire.
  virtual std::expected<std::unique_ptr<HttpBodyStream>, TransportError> openGet(
    const std::string& url, const HttpRequestOptions& options) = 0;

  // Buffers the complete body.
  virtual std::expected<HttpResponse, TransportError> get(
    const std::string& url, const HttpRequestOptions& options) = 0;
};

} // namespace radio_service
