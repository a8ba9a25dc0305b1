#pragma once

#include <cstddef>
#include <string>
#include <chrono>
#include <expected>
#include <filesystem>

namespace config {

struct ProbeConfig {
  std::chrono::milliseconds request_timeout;
  long max_redirects;
  size_t min_sniff_bytes;
  size_t concurrent_probe_limit;
  std::chrono::milliseconds sniff_timeout;
  std::chrono::milliseconds batch_deadline_slack;
  std::string user_agent;
};

struct DirectoryConfig {
  std::string discovery_host;
  std::string fallback_base_url;
  std::string user_agent;
  std::chrono::milliseconds timeout;
  unsigned int top_limit;
};

struct HttpServiceConfig {
  std::string host;
  int port;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Overrides only the keys present in the JSON settings file
std::expected<void, std::string> loadFromFile(const std::filesystem::path& path);

// Getters
const ProbeConfig& getProbe() const { return probe_; }
const DirectoryConfig& getDirectory() const { return directory_; }
const HttpServiceConfig& getHttp() const { return http_; }
const std::string& getFavoritesPath() const { return favorites_path_; }
std::string getHttpIpPort() const { return http_.host+":"+std::to_string(http_.port);}

static ProbeConfig defaultProbe();

private:
  Config();

  ProbeConfig probe_;
  DirectoryConfig directory_;
  HttpServiceConfig http_;
  std::string favorites_path_;
};

} // namespace config
