#include "config/config.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace config {

namespace {

template <typename Duration>
void readSeconds(const nlohmann::json& j, const char* key, Duration& out) {
  if (j.contains(key)) {
    out = std::chrono::duration_cast<Duration>(
      std::chrono::duration<double>(j.at(key).get<double>()));
  }
}

template <typename T>
void readValue(const nlohmann::json& j, const char* key, T& out) {
  if (j.contains(key)) {
    out = j.at(key).get<T>();
  }
}

std::string homeDirectory() {
  const char* home = std::getenv("HOME");
  return home ? std::string(home) : std::string(".");
}

} // namespace

  ProbeConfig Config::defaultProbe() {
    return {
      .request_timeout = std::chrono::seconds(10),
      .max_redirects = 5,
      .min_sniff_bytes = 1024,
      .concurrent_probe_limit = 5,
      .sniff_timeout = std::chrono::seconds(5),
      .batch_deadline_slack = std::chrono::seconds(5),
      .user_agent = "Mozilla/5.0 (compatible; StreamChecker/1.0)"
    };
  }

  Config::Config() {
    probe_ = defaultProbe();

    directory_ = {
      .discovery_host = "all.api.radio-browser.info",
      .fallback_base_url = "https://de1.api.radio-browser.info",
      .user_agent = "RadioBrowserPlayer/1.0",
      .timeout = std::chrono::seconds(10),
      .top_limit = 1000
    };

    http_ = {
      .host = "0.0.0.0",
      .port = 8090
    };

    favorites_path_ = homeDirectory() + "/.radio_favorites.json";
  }

  std::expected<void, std::string> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
      return std::unexpected("Failed to open settings file: " + path.string());
    }

    try {
      auto root = nlohmann::json::parse(in);

      if (root.contains("probe")) {
        const auto& p = root.at("probe");
        readSeconds(p, "request_timeout_seconds", probe_.request_timeout);
        readValue(p, "max_redirects", probe_.max_redirects);
        readValue(p, "min_sniff_bytes", probe_.min_sniff_bytes);
        readValue(p, "concurrent_probe_limit", probe_.concurrent_probe_limit);
        readSeconds(p, "sniff_timeout_seconds", probe_.sniff_timeout);
        readSeconds(p, "batch_deadline_slack_seconds", probe_.batch_deadline_slack);
        readValue(p, "user_agent", probe_.user_agent);
      }

      if (root.contains("directory")) {
        const auto& d = root.at("directory");
        readValue(d, "discovery_host", directory_.discovery_host);
        readValue(d, "fallback_base_url", directory_.fallback_base_url);
        readValue(d, "user_agent", directory_.user_agent);
        readSeconds(d, "timeout_seconds", directory_.timeout);
        readValue(d, "top_limit", directory_.top_limit);
      }

      if (root.contains("http")) {
        const auto& h = root.at("http");
        readValue(h, "host", http_.host);
        readValue(h, "port", http_.port);
      }

      readValue(root, "favorites_path", favorites_path_);
    } catch (const nlohmann::json::exception& e) {
      return std::unexpected("Invalid settings file " + path.string() + ": " + e.what());
    }

    return {};
  }
}
