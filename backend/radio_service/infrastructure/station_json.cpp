#include "station_json.hpp"
#include <cmath>
#include <cstdint>
#include <limits>

namespace radio_service {

namespace {

std::string stringField(const nlohmann::json& j, const char* key, const std::string& fallback) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

std::optional<double> numberField(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return std::nullopt;
  }
  return it->get<double>();
}

// 0 when the value is missing, not a number, negative or beyond int.
int bitrateField(const nlohmann::json& j) {
  constexpr auto kMax = std::numeric_limits<int>::max();
  auto it = j.find("bitrate");
  if (it == j.end()) {
    return 0;
  }
  if (it->is_number_unsigned()) {
    auto value = it->get<std::uint64_t>();
    return value <= static_cast<std::uint64_t>(kMax) ? static_cast<int>(value) : 0;
  }
  if (it->is_number_integer()) {
    auto value = it->get<std::int64_t>();
    return value >= 0 && value <= kMax ? static_cast<int>(value) : 0;
  }
  if (it->is_number_float()) {
    auto value = it->get<double>();
    return std::isfinite(value) && value >= 0 && value < static_cast<double>(kMax)
             ? static_cast<int>(value) : 0;
  }
  return 0;
}

std::string buildLocation(const std::string& state, const std::string& country) {
  std::string location;
  if (!state.empty()) {
    location = state;
  }
  if (!country.empty() && country != "Unknown") {
    location += location.empty() ? country : ", " + country;
  }
  return location.empty() ? "Unknown" : location;
}

} // namespace

Station stationFromJson(const nlohmann::json& j) {
  Station station;
  station.name = stringField(j, "name", "Unknown");
  station.url = stringField(j, "url_resolved", "");
  if (station.url.empty()) {
    station.url = stringField(j, "url", "");
  }
  station.country = stringField(j, "country", "Unknown");
  station.countrycode = stringField(j, "countrycode", "");
  station.state = stringField(j, "state", "");
  station.language = stringField(j, "language", "Unknown");
  station.tags = stringField(j, "tags", "");
  station.favicon = stringField(j, "favicon", "");
  station.bitrate = bitrateField(j);
  station.codec = stringField(j, "codec", "Unknown");
  station.geo_lat = numberField(j, "geo_lat");
  station.geo_long = numberField(j, "geo_long");
  station.location = buildLocation(station.state, station.country);
  return station;
}

nlohmann::json stationToJson(const Station& station) {
  nlohmann::json j = {
    {"name", station.name},
    {"url", station.url},
    {"country", station.country},
    {"countrycode", station.countrycode},
    {"state", station.state},
    {"language", station.language},
    {"bitrate", station.bitrate},
    {"codec", station.codec},
    {"tags", station.tags},
    {"favicon", station.favicon},
    {"geo_lat", nullptr},
    {"geo_long", nullptr}
  };
  if (station.geo_lat) {
    j["geo_lat"] = *station.geo_lat;
  }
  if (station.geo_long) {
    j["geo_long"] = *station.geo_long;
  }
  return j;
}

}
