#pragma once
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/config/config.hpp"
#include "domain/http_transport.hpp"
#include "domain/station_directory.hpp"

namespace radio_service {
class RadioBrowserClient : public StationDirectory {
public:
  using QueryParams = std::vector<std::pair<std::string, std::string>>;

  RadioBrowserClient(std::shared_ptr<HttpTransport> transport,
                     config::DirectoryConfig config);

  // Uses base_url as is and never runs server discovery.
  RadioBrowserClient(std::shared_ptr<HttpTransport> transport,
                     config::DirectoryConfig config,
                     std::string base_url);

  std::expected<std::vector<Station>, std::string> search(const StationQuery& query) override;
  std::expected<std::vector<Station>, std::string> topVoted(unsigned int limit) override;
  std::expected<std::vector<std::string>, std::string> listCountries() override;
  std::expected<std::vector<std::string>, std::string> listLanguages() override;

  const std::string& baseUrl();

  // One station per name, the one with the highest bitrate, at the position
  // where the name first appeared.
  static std::vector<Station> keepHighestBitrate(const std::vector<Station>& stations);

private:
  std::vector<std::string> discoverServers();
  std::expected<nlohmann::json, std::string> request(const std::string& path,
                                                     const QueryParams& params = {});
  std::expected<std::vector<Station>, std::string> fetchStations(const std::string& path,
                                                                 const QueryParams& params = {});
  std::expected<std::vector<std::string>, std::string> fetchNames(const std::string& path);

  std::shared_ptr<HttpTransport> transport_;
  config::DirectoryConfig config_;
  std::once_flag discovery_once_;
  std::string base_url_;
};
}
