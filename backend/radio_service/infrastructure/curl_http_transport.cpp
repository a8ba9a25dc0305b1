#include "curl_http_transport.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace radio_service {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kPauseThreshold = 64 * 1024;
constexpr auto kMaxPollInterval = std::chrono::milliseconds(100);

struct CurlEasyDeleter {
  void operator()(CURL* easy) const { curl_easy_cleanup(easy); }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

// Collects the headers of the last response in a redirect chain.
struct HeaderCollector {
  HttpResponseHead head;
  bool complete{false};

  void onLine(std::string_view line) {
    line = trim(line);

    if (line.starts_with("HTTP/") || line.starts_with("ICY ")) {
      head = {};
      complete = false;
      auto space = line.find(' ');
      if (space != std::string_view::npos) {
        auto code = trim(line.substr(space + 1)).substr(0, 3);
        long status = 0;
        for (char c : code) {
          if (!std::isdigit(static_cast<unsigned char>(c))) {
            break;
          }
          status = status * 10 + (c - '0');
        }
        head.status_code = status;
      }
      return;
    }

    if (line.empty()) {
      bool interim = head.status_code < 200;
      bool redirect = head.status_code >= 300 && head.status_code < 400 && head.hasHeader("location");
      if (!interim && !redirect) {
        complete = true;
      }
      return;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      return;
    }
    std::string name(trim(line.substr(0, colon)));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    head.headers[name] = std::string(trim(line.substr(colon + 1)));
  }

  static size_t onHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* self = static_cast<HeaderCollector*>(userdata);
    self->onLine(std::string_view(buffer, size * nitems));
    return size * nitems;
  }
};

TransportError mapError(CURLcode code, const char* errbuf) {
  std::string message = (errbuf && errbuf[0]) ? std::string(errbuf) : std::string(curl_easy_strerror(code));
  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
      return {TransportErrorKind::Timeout, message};
    case CURLE_TOO_MANY_REDIRECTS:
      return {TransportErrorKind::TooManyRedirects, message};
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
      return {TransportErrorKind::ConnectionFailure, message};
    default:
      return {TransportErrorKind::Other, message};
  }
}

// Lists handed to curl must outlive the transfer.
struct RequestLists {
  CurlSlistPtr headers;
  CurlSlistPtr aliases;
};

CurlSlistPtr appendAll(const std::vector<std::string>& lines) {
  CurlSlistPtr list;
  for (const auto& line : lines) {
    auto* appended = curl_slist_append(list.get(), line.c_str());
    if (appended) {
      list.release();
      list.reset(appended);
    }
  }
  return list;
}

RequestLists configure(CURL* easy, CURLSH* share, const std::string& url,
                       const HttpRequestOptions& options, HeaderCollector* headers,
                       char* errbuf) {
  curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
  curl_easy_setopt(easy, CURLOPT_SHARE, share);
  curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(easy, CURLOPT_MAXREDIRS, options.max_redirects);
  curl_easy_setopt(easy, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(easy, CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, HeaderCollector::onHeader);
  curl_easy_setopt(easy, CURLOPT_HEADERDATA, headers);
  if (!options.user_agent.empty()) {
    curl_easy_setopt(easy, CURLOPT_USERAGENT, options.user_agent.c_str());
  }

  RequestLists lists;
  // SHOUTcast v1 servers answer with this status line instead of HTTP/1.x
  lists.aliases = appendAll({"ICY 200 OK"});
  curl_easy_setopt(easy, CURLOPT_HTTP200ALIASES, lists.aliases.get());

  std::vector<std::string> lines;
  for (const auto& [name, value] : options.headers) {
    lines.push_back(name + ": " + value);
  }
  lists.headers = appendAll(lines);
  if (lists.headers) {
    curl_easy_setopt(easy, CURLOPT_HTTPHEADER, lists.headers.get());
  }
  return lists;
}

size_t appendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

long responseCode(CURL* easy) {
  long code = 0;
  curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &code);
  return code;
}

// GET response driven through a private multi handle so that the caller
// controls how long each read may block.
class CurlBodyStream final : public HttpBodyStream {
public:
  explicit CurlBodyStream(CURLSH* share) : share_(share) {}
  ~CurlBodyStream() override { close(); }

  CurlBodyStream(const CurlBodyStream&) = delete;
  CurlBodyStream& operator=(const CurlBodyStream&) = delete;

  std::expected<void, TransportError> open(const std::string& url, const HttpRequestOptions& options) {
    multi_ = curl_multi_init();
    easy_ = curl_easy_init();
    if (!multi_ || !easy_) {
      return std::unexpected(TransportError{TransportErrorKind::Other, "Failed to initialize CURL"});
    }

    request_lists_ = configure(easy_, share_, url, options, &headers_, errbuf_);
    curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, onWrite);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);

    auto mc = curl_multi_add_handle(multi_, easy_);
    if (mc != CURLM_OK) {
      return std::unexpected(TransportError{TransportErrorKind::Other, curl_multi_strerror(mc)});
    }

    auto pumped = pumpUntil([this]() { return headers_.complete; }, Clock::now() + options.timeout);
    if (!pumped) {
      return std::unexpected(pumped.error());
    }
    if (finished_ && result_ != CURLE_OK && !headers_.complete) {
      return std::unexpected(mapError(result_, errbuf_));
    }
    if (!*pumped) {
      return std::unexpected(TransportError{TransportErrorKind::Timeout, "Timed out waiting for response headers"});
    }

    if (auto code = responseCode(easy_); code != 0) {
      headers_.head.status_code = code;
    }
    return {};
  }

  const HttpResponseHead& head() const override { return headers_.head; }

  std::expected<std::string, TransportError> readSome(
    size_t max_bytes, std::chrono::milliseconds wait) override {
    if (!easy_) {
      return std::unexpected(TransportError{TransportErrorKind::Other, "Stream is closed"});
    }

    pause_threshold_ = std::max(pause_threshold_, max_bytes);
    resume();

    auto pumped = pumpUntil([this, max_bytes]() { return buffer_.size() >= max_bytes; },
                            Clock::now() + wait);
    if (!pumped) {
      return std::unexpected(pumped.error());
    }

    if (buffer_.empty()) {
      if (!*pumped) {
        return std::unexpected(TransportError{TransportErrorKind::Timeout, "Timed out waiting for body data"});
      }
      if (finished_ && result_ != CURLE_OK) {
        return std::unexpected(mapError(result_, errbuf_));
      }
      return std::string{};
    }

    auto n = std::min(max_bytes, buffer_.size());
    std::string chunk = buffer_.substr(0, n);
    buffer_.erase(0, n);
    resume();
    return chunk;
  }

  void close() override {
    if (multi_ && easy_) {
      curl_multi_remove_handle(multi_, easy_);
    }
    if (easy_) {
      curl_easy_cleanup(easy_);
      easy_ = nullptr;
    }
    if (multi_) {
      curl_multi_cleanup(multi_);
      multi_ = nullptr;
    }
    request_lists_ = {};
    buffer_.clear();
  }

private:
  static size_t onWrite(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlBodyStream*>(userdata);
    if (self->buffer_.size() >= self->pause_threshold_) {
      self->paused_ = true;
      return CURL_WRITEFUNC_PAUSE;
    }
    self->headers_.complete = true;
    self->buffer_.append(ptr, size * nmemb);
    return size * nmemb;
  }

  void resume() {
    if (paused_ && buffer_.size() < pause_threshold_) {
      paused_ = false;
      curl_easy_pause(easy_, CURLPAUSE_CONT);
    }
  }

  void drainMessages() {
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
      if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
        finished_ = true;
        result_ = msg->data.result;
      }
    }
  }

  // true once done() holds or the transfer finished, false when the deadline passed
  template <typename Pred>
  std::expected<bool, TransportError> pumpUntil(Pred done, Clock::time_point deadline) {
    while (true) {
      if (done() || finished_) {
        return true;
      }

      int running = 0;
      auto mc = curl_multi_perform(multi_, &running);
      if (mc != CURLM_OK) {
        return std::unexpected(TransportError{TransportErrorKind::Other, curl_multi_strerror(mc)});
      }
      drainMessages();
      if (done() || finished_) {
        return true;
      }

      auto now = Clock::now();
      if (now >= deadline) {
        return false;
      }
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      auto interval = std::min<std::chrono::milliseconds>(remaining, kMaxPollInterval);
      mc = curl_multi_poll(multi_, nullptr, 0, static_cast<int>(interval.count()), nullptr);
      if (mc != CURLM_OK) {
        return std::unexpected(TransportError{TransportErrorKind::Other, curl_multi_strerror(mc)});
      }
    }
  }

  CURLSH* share_;
  CURLM* multi_{nullptr};
  CURL* easy_{nullptr};
  RequestLists request_lists_;
  HeaderCollector headers_;
  std::string buffer_;
  size_t pause_threshold_{kPauseThreshold};
  bool paused_{false};
  bool finished_{false};
  CURLcode result_{CURLE_OK};
  char errbuf_[CURL_ERROR_SIZE]{};
};

} // namespace

CurlHttpTransport::CurlHttpTransport() {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  share_ = curl_share_init();
  if (!share_) {
    throw std::runtime_error("Failed to initialize CURL share handle");
  }
  curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, lockShare);
  curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, unlockShare);
  curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
  curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
  curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
}

CurlHttpTransport::~CurlHttpTransport() {
  curl_share_cleanup(share_);
  curl_global_cleanup();
}

void CurlHttpTransport::lockShare(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
  auto* self = static_cast<CurlHttpTransport*>(userptr);
  self->share_locks_[static_cast<size_t>(data)].lock();
}

void CurlHttpTransport::unlockShare(CURL*, curl_lock_data data, void* userptr) {
  auto* self = static_cast<CurlHttpTransport*>(userptr);
  self->share_locks_[static_cast<size_t>(data)].unlock();
}

std::expected<HttpResponseHead, TransportError> CurlHttpTransport::head(
  const std::string& url, const HttpRequestOptions& options) {
  CurlEasyPtr easy(curl_easy_init());
  if (!easy) {
    return std::unexpected(TransportError{TransportErrorKind::Other, "Failed to initialize CURL"});
  }

  HeaderCollector headers;
  char errbuf[CURL_ERROR_SIZE] = {0};
  auto request_lists = configure(easy.get(), share_, url, options, &headers, errbuf);
  curl_easy_setopt(easy.get(), CURLOPT_NOBODY, 1L);
  curl_easy_setopt(easy.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));

  auto res = curl_easy_perform(easy.get());
  if (res != CURLE_OK) {
    return std::unexpected(mapError(res, errbuf));
  }

  if (auto code = responseCode(easy.get()); code != 0) {
    headers.head.status_code = code;
  }
  return headers.head;
}

std::expected<std::unique_ptr<HttpBodyStream>, TransportError> CurlHttpTransport::openGet(
  const std::string& url, const HttpRequestOptions& options) {
  auto stream = std::make_unique<CurlBodyStream>(share_);
  auto opened = stream->open(url, options);
  if (!opened) {
    return std::unexpected(opened.error());
  }
  return std::unique_ptr<HttpBodyStream>(std::move(stream));
}

std::expected<HttpResponse, TransportError> CurlHttpTransport::get(
  const std::string& url, const HttpRequestOptions& options) {
  CurlEasyPtr easy(curl_easy_init());
  if (!easy) {
    return std::unexpected(TransportError{TransportErrorKind::Other, "Failed to initialize CURL"});
  }

  HeaderCollector headers;
  HttpResponse response;
  char errbuf[CURL_ERROR_SIZE] = {0};
  auto request_lists = configure(easy.get(), share_, url, options, &headers, errbuf);
  curl_easy_setopt(easy.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
  curl_easy_setopt(easy.get(), CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(easy.get(), CURLOPT_WRITEFUNCTION, appendBody);
  curl_easy_setopt(easy.get(), CURLOPT_WRITEDATA, &response.body);

  auto res = curl_easy_perform(easy.get());
  if (res != CURLE_OK) {
    return std::unexpected(mapError(res, errbuf));
  }

  response.head = std::move(headers.head);
  if (auto code = responseCode(easy.get()); code != 0) {
    response.head.status_code = code;
  }
  return response;
}

} // namespace radio_service
