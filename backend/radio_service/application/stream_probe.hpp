#pragma once

#include <atomic>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/config/config.hpp"
#include "common/thread_pool.hpp"
#include "domain/http_transport.hpp"
#include "domain/probe_result.hpp"

namespace radio_service {

// Failure arm of a single probe phase. The fields carry whatever the phase
// observed before it gave up.
struct PhaseFailure {
  std::string reason;
  std::optional<long> status_code;
  std::optional<std::string> content_type;
  std::optional<StreamKind> stream_kind;
};

using PhaseOutcome = std::expected<ProbeResult, PhaseFailure>;

enum class SniffFailure {
  EmptyRead,
  ReadTimeout,
  ReadError,
  Markup
};

const char* toString(SniffFailure failure);

/*
 * Classifies a URL as a playable media stream or not.
 *
 * A probe runs HEAD first and stops there when the headers are conclusive.
 * Otherwise it opens a GET and, when playability is checked, sniffs the
 * first bytes of the body under a deadline of its own. Every outcome is
 * reported as a ProbeResult; nothing is thrown past probe() or probeMany().
 */
class StreamProbe {
public:
  // sniff_timeout is capped at 5s and concurrent_probe_limit raised to 1
  StreamProbe(std::shared_ptr<HttpTransport> transport,
              config::ProbeConfig config);
  ~StreamProbe();

  StreamProbe(const StreamProbe&) = delete;
  StreamProbe& operator=(const StreamProbe&) = delete;

  ProbeResult probe(const std::string& url, bool check_playability = true);

  // Each call checks its urls on a pool of its own with concurrent_probe_limit
  // workers. Each url waits at most request_timeout + batch_deadline_slack;
  // every input url is a key of the returned map.
  std::map<std::string, ProbeResult> probeMany(
    const std::vector<std::string>& urls, bool check_playability = true);

  const config::ProbeConfig& probeConfig() const { return config_; }

  static bool isValidUrl(const std::string& url);
  static std::optional<StreamKind> extensionHint(const std::string& url);
  static bool isStreamContentType(const std::string& content_type);
  static StreamKind categorize(const std::string& content_type);
  static std::expected<void, SniffFailure> inspectChunk(const std::string& chunk);

private:
  HttpRequestOptions requestOptions() const;

  PhaseOutcome checkWithHead(const std::string& url);
  PhaseOutcome checkWithGet(const std::string& url, bool check_playability);
  std::expected<void, SniffFailure> sniff(const std::string& url, HttpBodyStream& body);

  struct BatchPool {
    explicit BatchPool(unsigned int size) : pool(size) {}
    std::atomic_int outstanding{0};
    common::ThreadPool pool;
  };

  // Keeps a batch pool whose abandoned tasks are still running.
  void retire(std::unique_ptr<BatchPool> batch);

  std::shared_ptr<HttpTransport> transport_;
  config::ProbeConfig config_;

  std::mutex retired_mtx_;
  std::vector<std::unique_ptr<BatchPool>> retired_;  // last member: joins before the others go away
};

} // namespace radio_service
