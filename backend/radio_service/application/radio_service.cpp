#include "radio_service.hpp"
#include "continents.hpp"

namespace radio_service {
RadioService::RadioService(std::shared_ptr<StreamProbe> probe,
                           std::shared_ptr<StationDirectory> directory,
                           std::shared_ptr<FavoritesRepository> favorites,
                           unsigned int top_limit)
  : probe_(probe),
    directory_(directory),
    favorites_(favorites),
    top_limit_(top_limit) {}

ProbeResult RadioService::checkStream(const std::string& url, bool check_playability) {
  return probe_->probe(url, check_playability);
}

std::map<std::string, ProbeResult> RadioService::checkStreams(
  const std::vector<std::string>& urls,
  bool check_playability
) {
  return probe_->probeMany(urls, check_playability);
}

std::expected<std::vector<Station>, std::string> RadioService::searchStations(const StationQuery& query) {
  auto stations = directory_->search(query);
  if (!stations || query.continent.empty()) {
    return stations;
  }

  const auto* continent = findContinent(query.continent);
  if (continent) {
    std::erase_if(*stations, [continent](const Station& station) {
      return !isOnContinent(*continent, station.countrycode);
    });
  }
  return stations;
}

std::expected<std::vector<Station>, std::string> RadioService::topStations(unsigned int limit) {
  return directory_->topVoted(limit == 0 ? top_limit_ : limit);
}

std::expected<std::vector<std::string>, std::string> RadioService::countries() {
  return directory_->listCountries();
}

std::expected<std::vector<std::string>, std::string> RadioService::languages() {
  return directory_->listLanguages();
}

std::vector<std::string> RadioService::continents() const {
  std::vector<std::string> names;
  for (const auto& continent : listContinents()) {
    names.push_back(continent.name);
  }
  return names;
}

std::vector<Station> RadioService::listFavorites() {
  return favorites_->list();
}

std::expected<bool, std::string> RadioService::addFavorite(const Station& station) {
  if (station.url.empty()) {
    return std::unexpected("Station has no url");
  }
  return favorites_->add(station);
}

std::expected<bool, std::string> RadioService::removeFavorite(const std::string& url) {
  return favorites_->remove(url);
}

std::expected<Station, std::string> RadioService::addCustomStation(
  const std::string& url,
  const std::string& name
) {
  auto result = probe_->probe(url);
  if (!result.valid) {
    return std::unexpected("Stream is not valid: " + result.reason);
  }

  Station station;
  station.name = name.empty() ? "Custom Station" : "Custom station: " + name;
  station.url = url;
  station.country = "Unknown";
  station.language = "Unknown";
  station.codec = "Unknown";
  station.location = "Unknown";

  auto added = favorites_->add(station);
  if (!added) {
    return std::unexpected(added.error());
  }
  if (!*added) {
    return std::unexpected("Station already in favorites");
  }
  return station;
}

std::map<std::string, ProbeResult> RadioService::checkFavorites(bool check_playability) {
  std::vector<std::string> urls;
  for (const auto& station : favorites_->list()) {
    urls.push_back(station.url);
  }
  return probe_->probeMany(urls, check_playability);
}
}
