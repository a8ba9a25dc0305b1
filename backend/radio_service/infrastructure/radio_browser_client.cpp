#include "radio_browser_client.hpp"
#include "station_json.hpp"
#include "common/url.hpp"
#include <algorithm>
#include <iostream>
#include <random>
#include <unordered_map>
#include <boost/asio.hpp>

namespace radio_service {

RadioBrowserClient::RadioBrowserClient(std::shared_ptr<HttpTransport> transport,
                                       config::DirectoryConfig config)
  : transport_(std::move(transport)), config_(std::move(config)) {}

RadioBrowserClient::RadioBrowserClient(std::shared_ptr<HttpTransport> transport,
                                       config::DirectoryConfig config,
                                       std::string base_url)
  : transport_(std::move(transport)), config_(std::move(config)), base_url_(std::move(base_url)) {}

std::vector<std::string> RadioBrowserClient::discoverServers() {
  namespace net = boost::asio;
  using tcp = net::ip::tcp;

  std::vector<std::string> hosts;
  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    auto addresses = resolver.resolve(config_.discovery_host, "80");

    for (const auto& entry : addresses) {
      boost::system::error_code ec;
      auto names = resolver.resolve(entry.endpoint(), ec);
      if (ec || names.empty()) {
        continue;
      }
      auto name = names.begin()->host_name();
      // getnameinfo hands back the numeric address when there is no PTR record
      if (name == entry.endpoint().address().to_string()) {
        continue;
      }
      if (std::find(hosts.begin(), hosts.end(), name) == hosts.end()) {
        hosts.push_back(name);
      }
    }
  } catch (const boost::system::system_error& e) {
    std::cerr << "Error getting server list: " << e.what() << std::endl;
  }

  std::sort(hosts.begin(), hosts.end());
  for (auto& host : hosts) {
    host = "https://" + host;
  }
  return hosts;
}

const std::string& RadioBrowserClient::baseUrl() {
  std::call_once(discovery_once_, [this]() {
    if (!base_url_.empty()) {
      return;
    }
    auto servers = discoverServers();
    if (servers.empty()) {
      base_url_ = config_.fallback_base_url;
    } else {
      std::random_device rd;
      std::mt19937 gen(rd());
      std::uniform_int_distribution<size_t> pick(0, servers.size() - 1);
      base_url_ = servers[pick(gen)];
    }
    std::cout << "Using server: " << base_url_ << std::endl;
  });
  return base_url_;
}

std::expected<nlohmann::json, std::string> RadioBrowserClient::request(
  const std::string& path, const QueryParams& params) {
  std::string url = baseUrl() + path;
  char separator = '?';
  for (const auto& [key, value] : params) {
    url += separator + key + "=" + common::escapeQueryValue(value);
    separator = '&';
  }

  HttpRequestOptions options;
  options.timeout = config_.timeout;
  options.user_agent = config_.user_agent;
  options.headers = {{"Content-Type", "application/json"}};

  auto response = transport_->get(url, options);
  if (!response) {
    std::cerr << "Request error for " << url << ": " << response.error().message << std::endl;
    return std::unexpected("Request error: " + response.error().message);
  }
  if (response->head.status_code != 200) {
    return std::unexpected("HTTP error: " + std::to_string(response->head.status_code));
  }

  try {
    return nlohmann::json::parse(response->body);
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected("Invalid JSON from " + url + ": " + e.what());
  }
}

std::vector<Station> RadioBrowserClient::keepHighestBitrate(const std::vector<Station>& stations) {
  std::vector<Station> best;
  std::unordered_map<std::string, size_t> position;
  for (const auto& station : stations) {
    auto it = position.find(station.name);
    if (it == position.end()) {
      position.emplace(station.name, best.size());
      best.push_back(station);
    } else if (station.bitrate > best[it->second].bitrate) {
      best[it->second] = station;
    }
  }
  return best;
}

std::expected<std::vector<Station>, std::string> RadioBrowserClient::fetchStations(
  const std::string& path, const QueryParams& params) {
  auto data = request(path, params);
  if (!data) {
    return std::unexpected(data.error());
  }
  if (!data->is_array()) {
    return std::unexpected("Unexpected response shape from " + path);
  }

  std::vector<Station> stations;
  stations.reserve(data->size());
  for (const auto& item : *data) {
    if (item.is_object()) {
      stations.push_back(stationFromJson(item));
    }
  }
  return keepHighestBitrate(stations);
}

std::expected<std::vector<std::string>, std::string> RadioBrowserClient::fetchNames(
  const std::string& path) {
  auto data = request(path);
  if (!data) {
    return std::unexpected(data.error());
  }
  if (!data->is_array()) {
    return std::unexpected("Unexpected response shape from " + path);
  }

  std::vector<std::string> names;
  for (const auto& item : *data) {
    auto it = item.find("name");
    if (it != item.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
      names.push_back(it->get<std::string>());
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::expected<std::vector<Station>, std::string> RadioBrowserClient::search(const StationQuery& query) {
  QueryParams params = {
    {"offset", std::to_string(query.offset)},
    {"limit", std::to_string(query.limit)},
    {"order", "votes"},
    {"reverse", "true"}
  };
  if (!query.name.empty()) {
    params.emplace_back("name", query.name);
  }
  if (!query.country.empty()) {
    params.emplace_back("country", query.country);
  }
  if (!query.language.empty()) {
    params.emplace_back("language", query.language);
  }
  return fetchStations("/json/stations/search", params);
}

std::expected<std::vector<Station>, std::string> RadioBrowserClient::topVoted(unsigned int limit) {
  return fetchStations("/json/stations/topvote/" + std::to_string(limit));
}

std::expected<std::vector<std::string>, std::string> RadioBrowserClient::listCountries() {
  return fetchNames("/json/countries");
}

std::expected<std::vector<std::string>, std::string> RadioBrowserClient::listLanguages() {
  return fetchNames("/json/languages");
}

}
