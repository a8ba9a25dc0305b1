#include "stream_probe.hpp"
#include "common/url.hpp"
#include <algorithm>
#include <chrono>
#include <array>
#include <atomic>
#include <cctype>
#include <future>
#include <iostream>
#include <set>
#include <string_view>
#include <utility>

namespace radio_service {

namespace {

constexpr std::array<std::string_view, 25> kStreamContentTypes = {
  "audio/mpeg", "audio/mp3", "audio/aac", "audio/aacp",
  "audio/ogg", "audio/opus", "audio/flac", "audio/wav",
  "audio/x-wav", "audio/wave", "audio/vnd.wave",
  "audio/mp4", "audio/x-m4a", "audio/webm",
  "video/mp4", "video/webm", "video/ogg", "video/x-flv",
  "video/mp2t", "video/3gpp", "video/quicktime",
  "application/vnd.apple.mpegurl", "application/x-mpegurl",
  "application/dash+xml", "application/octet-stream"
};

struct ExtensionHint {
  std::string_view extension;
  std::optional<StreamKind> kind;
};

// .asx and .xspf are playlist containers without a kind of their own
constexpr std::array<ExtensionHint, 15> kStreamExtensions = {{
  {".m3u", StreamKind::HlsPlaylist}, {".m3u8", StreamKind::HlsPlaylist},
  {".pls", StreamKind::PlsPlaylist},
  {".asx", std::nullopt}, {".xspf", std::nullopt},
  {".mp3", StreamKind::Audio}, {".aac", StreamKind::Audio},
  {".ogg", StreamKind::Audio}, {".flac", StreamKind::Audio},
  {".wav", StreamKind::Audio}, {".m4a", StreamKind::Audio},
  {".mp4", StreamKind::Video}, {".webm", StreamKind::Video},
  {".flv", StreamKind::Video}, {".ts", StreamKind::Video}
}};

constexpr size_t kMarkupScanBytes = 200;

std::string toLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

bool hasIcyHeaders(const HttpResponseHead& head) {
  return head.hasHeader("icy-name") || head.hasHeader("icy-metaint");
}

std::optional<std::string> contentTypeOf(const HttpResponseHead& head) {
  if (!head.hasHeader("content-type")) {
    return std::nullopt;
  }
  return toLower(head.header("content-type"));
}

std::string describe(const TransportError& error) {
  switch (error.kind) {
    case TransportErrorKind::Timeout:           return "Request timeout";
    case TransportErrorKind::TooManyRedirects:  return "Too many redirects";
    case TransportErrorKind::ConnectionFailure: return "Connection error";
    case TransportErrorKind::Other:             break;
  }
  return "Request error: " + error.message;
}

ProbeResult success(std::string reason, const HttpResponseHead& head,
                    std::optional<std::string> content_type, StreamKind kind) {
  ProbeResult result;
  result.valid = true;
  result.reason = std::move(reason);
  result.content_type = std::move(content_type);
  result.status_code = head.status_code;
  result.stream_kind = kind;
  return result;
}

ProbeResult failedCheck(const std::string& reason) {
  ProbeResult result;
  result.reason = "Check failed: " + reason;
  return result;
}

constexpr std::chrono::milliseconds kMaxSniffTimeout = std::chrono::seconds(5);

config::ProbeConfig clamped(config::ProbeConfig config) {
  config.sniff_timeout = std::min(config.sniff_timeout, kMaxSniffTimeout);
  config.concurrent_probe_limit = std::max<size_t>(config.concurrent_probe_limit, 1);
  return config;
}

// Closes the response body on every exit path of the GET phase.
class BodyCloser {
public:
  explicit BodyCloser(HttpBodyStream& body) : body_(body) {}
  ~BodyCloser() { body_.close(); }

  BodyCloser(const BodyCloser&) = delete;
  BodyCloser& operator=(const BodyCloser&) = delete;

private:
  HttpBodyStream& body_;
};

} // namespace

const char* toString(SniffFailure failure) {
  switch (failure) {
    case SniffFailure::EmptyRead:   return "no data received";
    case SniffFailure::ReadTimeout: return "data read timed out";
    case SniffFailure::ReadError:   return "data read failed";
    case SniffFailure::Markup:      return "body looks like an HTML document";
  }
  return "unknown";
}

StreamProbe::StreamProbe(std::shared_ptr<HttpTransport> transport,
                         config::ProbeConfig config)
  : transport_(std::move(transport)),
    config_(clamped(std::move(config))) {}

StreamProbe::~StreamProbe() {
  std::lock_guard<std::mutex> lock(retired_mtx_);
  retired_.clear();
}

void StreamProbe::retire(std::unique_ptr<BatchPool> batch) {
  std::lock_guard<std::mutex> lock(retired_mtx_);
  std::erase_if(retired_, [](const std::unique_ptr<BatchPool>& pool) {
    return pool->outstanding.load(std::memory_order_acquire) == 0;
  });
  retired_.push_back(std::move(batch));
}

bool StreamProbe::isValidUrl(const std::string& url) {
  auto parts = common::parseUrl(url);
  if (!parts) {
    return false;
  }
  return (parts->scheme == "http" || parts->scheme == "https") && !parts->host.empty();
}

std::optional<StreamKind> StreamProbe::extensionHint(const std::string& url) {
  auto parts = common::parseUrl(url);
  if (!parts) {
    return std::nullopt;
  }
  auto path = toLower(parts->path);
  for (const auto& hint : kStreamExtensions) {
    if (path.ends_with(hint.extension)) {
      return hint.kind;
    }
  }
  return std::nullopt;
}

bool StreamProbe::isStreamContentType(const std::string& content_type) {
  return std::any_of(kStreamContentTypes.begin(), kStreamContentTypes.end(),
                     [&](std::string_view known) { return contains(content_type, known); });
}

StreamKind StreamProbe::categorize(const std::string& content_type) {
  if (contains(content_type, "audio")) {
    return StreamKind::Audio;
  } else if (contains(content_type, "video")) {
    return StreamKind::Video;
  } else if (contains(content_type, "mpegurl") || contains(content_type, "m3u")) {
    return StreamKind::HlsPlaylist;
  } else if (contains(content_type, "dash")) {
    return StreamKind::Dash;
  }
  return StreamKind::Unknown;
}

std::expected<void, SniffFailure> StreamProbe::inspectChunk(const std::string& chunk) {
  if (chunk.empty()) {
    return std::unexpected(SniffFailure::EmptyRead);
  }

  auto first = std::find_if_not(chunk.begin(), chunk.end(),
                                [](unsigned char c) { return std::isspace(c); });
  if (first != chunk.end() && *first == '<') {
    return std::unexpected(SniffFailure::Markup);
  }

  auto prefix = toLower(std::string_view(chunk).substr(0, kMarkupScanBytes));
  if (contains(prefix, "<!doctype html") || contains(prefix, "html")) {
    return std::unexpected(SniffFailure::Markup);
  }
  return {};
}

HttpRequestOptions StreamProbe::requestOptions() const {
  HttpRequestOptions options;
  options.timeout = config_.request_timeout;
  options.max_redirects = config_.max_redirects;
  options.user_agent = config_.user_agent;
  return options;
}

ProbeResult StreamProbe::probe(const std::string& url, bool check_playability) {
  ProbeResult result;

  if (!isValidUrl(url)) {
    result.reason = "Invalid URL format";
    return result;
  }

  auto hint = extensionHint(url);
  result.stream_kind = hint;

  try {
    auto head = checkWithHead(url);
    if (head) {
      return std::move(*head);
    }

    auto get = checkWithGet(url, check_playability);
    if (get) {
      return std::move(*get);
    }

    // status_code and content_type stay populated on a failed sniff
    auto& failure = get.error();
    result.reason = std::move(failure.reason);
    result.status_code = failure.status_code;
    result.content_type = std::move(failure.content_type);
    // the hint only outlives a GET that never got a response
    if (failure.status_code) {
      result.stream_kind = failure.stream_kind;
    }
  } catch (const std::exception& e) {
    result.reason = std::string("Unexpected error: ") + e.what();
  }

  return result;
}

PhaseOutcome StreamProbe::checkWithHead(const std::string& url) {
  auto response = transport_->head(url, requestOptions());
  if (!response) {
    return std::unexpected(PhaseFailure{.reason = "HEAD request failed: " + describe(response.error())});
  }

  PhaseFailure failure;
  failure.status_code = response->status_code;
  if (response->status_code != 200) {
    failure.reason = "HTTP " + std::to_string(response->status_code);
    return std::unexpected(std::move(failure));
  }

  auto content_type = contentTypeOf(*response);
  if (hasIcyHeaders(*response)) {
    return success("Valid ICY stream", *response, content_type, StreamKind::IcyShoutcast);
  }

  if (content_type && isStreamContentType(*content_type)) {
    return success("Valid stream (HEAD check)", *response, content_type, categorize(*content_type));
  }

  failure.content_type = content_type;
  failure.reason = "Content type not recognized as stream";
  return std::unexpected(std::move(failure));
}

PhaseOutcome StreamProbe::checkWithGet(const std::string& url, bool check_playability) {
  auto opened = transport_->openGet(url, requestOptions());
  if (!opened) {
    return std::unexpected(PhaseFailure{.reason = describe(opened.error())});
  }

  std::unique_ptr<HttpBodyStream> body = std::move(*opened);
  BodyCloser closer{*body};
  const auto& head = body->head();

  PhaseFailure failure;
  failure.status_code = head.status_code;
  if (head.status_code != 200) {
    failure.reason = "HTTP " + std::to_string(head.status_code);
    return std::unexpected(std::move(failure));
  }

  auto content_type = contentTypeOf(head);
  failure.content_type = content_type;

  if (hasIcyHeaders(head)) {
    return success("Valid ICY stream", head, content_type, StreamKind::IcyShoutcast);
  }

  if (content_type && isStreamContentType(*content_type)) {
    auto kind = categorize(*content_type);
    if (!check_playability) {
      return success("Valid stream (content type)", head, content_type, kind);
    }
    if (sniff(url, *body)) {
      return success("Valid and active stream", head, content_type, kind);
    }
    failure.stream_kind = kind;
    failure.reason = "Stream not providing data";
    return std::unexpected(std::move(failure));
  }

  // Some servers omit or mis-set Content-Type; live data still counts
  if (check_playability && sniff(url, *body)) {
    return success("Active stream (unrecognized type)", head, content_type, StreamKind::Unknown);
  }

  failure.reason = "Not recognized as a valid stream";
  return std::unexpected(std::move(failure));
}

std::expected<void, SniffFailure> StreamProbe::sniff(const std::string& url, HttpBodyStream& body) {
  auto chunk = body.readSome(config_.min_sniff_bytes, config_.sniff_timeout);

  std::expected<void, SniffFailure> verdict;
  if (!chunk) {
    verdict = std::unexpected(chunk.error().kind == TransportErrorKind::Timeout
                                ? SniffFailure::ReadTimeout
                                : SniffFailure::ReadError);
  } else {
    verdict = inspectChunk(*chunk);
  }

  if (!verdict) {
    std::cerr << "Sniff rejected " << url << ": " << toString(verdict.error()) << std::endl;
  }
  return verdict;
}

std::map<std::string, ProbeResult> StreamProbe::probeMany(
  const std::vector<std::string>& urls, bool check_playability) {

  struct PendingProbe {
    std::string url;
    std::future<ProbeResult> result;
    std::shared_ptr<std::atomic_bool> abandoned;
  };

  std::map<std::string, ProbeResult> results;
  std::vector<PendingProbe> pending;
  std::set<std::string> seen;

  auto batch = std::make_unique<BatchPool>(static_cast<unsigned int>(config_.concurrent_probe_limit));
  auto* outstanding = &batch->outstanding;

  for (const auto& url : urls) {
    if (!seen.insert(url).second) {
      continue;
    }

    auto abandoned = std::make_shared<std::atomic_bool>(false);
    outstanding->fetch_add(1, std::memory_order_acq_rel);
    try {
      auto future = batch->pool.commit([this, url, check_playability, abandoned, outstanding]() -> ProbeResult {
        struct Done {
          std::atomic_int* counter;
          ~Done() { counter->fetch_sub(1, std::memory_order_acq_rel); }
        } done{outstanding};

        if (abandoned->load(std::memory_order_acquire)) {
          return failedCheck("abandoned before start");
        }
        return probe(url, check_playability);
      });
      pending.push_back({url, std::move(future), abandoned});
    } catch (const std::exception& e) {
      outstanding->fetch_sub(1, std::memory_order_acq_rel);
      results[url] = failedCheck(e.what());
    }
  }

  const auto deadline = config_.request_timeout + config_.batch_deadline_slack;
  bool left_running = false;
  for (auto& job : pending) {
    if (job.result.wait_for(deadline) != std::future_status::ready) {
      job.abandoned->store(true, std::memory_order_release);
      left_running = true;
      std::cerr << "Probe of " << job.url << " missed its deadline" << std::endl;
      results[job.url] = failedCheck("timed out");
      continue;
    }

    try {
      results[job.url] = job.result.get();
    } catch (const std::exception& e) {
      results[job.url] = failedCheck(e.what());
    }
  }

  // A pool joins on destruction; workers still stuck in a request are joined
  // in the destructor instead of here.
  if (left_running) {
    retire(std::move(batch));
  }
  return results;
}

} // namespace radio_service
