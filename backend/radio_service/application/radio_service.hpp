#pragma once

#include <map>
#include <memory>
#include <vector>
#include <expected>
#include "application/stream_probe.hpp"
#include "domain/station_directory.hpp"
#include "domain/favorites_repository.hpp"


namespace radio_service {
class RadioService {
public:
  RadioService(std::shared_ptr<StreamProbe> probe,
               std::shared_ptr<StationDirectory> directory,
               std::shared_ptr<FavoritesRepository> favorites,
               unsigned int top_limit);

  ProbeResult checkStream(const std::string& url, bool check_playability = true);

  std::map<std::string, ProbeResult> checkStreams(
    const std::vector<std::string>& urls,
    bool check_playability = true
  );

  // A known query.continent keeps only stations whose countrycode lies on it;
  // an unknown one filters nothing.
  std::expected<std::vector<Station>, std::string> searchStations(const StationQuery& query);

  // limit == 0 uses the configured default
  std::expected<std::vector<Station>, std::string> topStations(unsigned int limit = 0);

  std::expected<std::vector<std::string>, std::string> countries();
  std::expected<std::vector<std::string>, std::string> languages();
  std::vector<std::string> continents() const;

  std::vector<Station> listFavorites();
  std::expected<bool, std::string> addFavorite(const Station& station);
  std::expected<bool, std::string> removeFavorite(const std::string& url);

  // Probes the url and stores it as a favorite only when it is a live stream
  std::expected<Station, std::string> addCustomStation(
    const std::string& url,
    const std::string& name
  );

  std::map<std::string, ProbeResult> checkFavorites(bool check_playability = true);

private:
  std::shared_ptr<StreamProbe> probe_;
  std::shared_ptr<StationDirectory> directory_;
  std::shared_ptr<FavoritesRepository> favorites_;
  unsigned int top_limit_;
};
}
