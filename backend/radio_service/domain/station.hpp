#pragma once
#include <optional>
#include <string>

namespace radio_service {

struct Station {
  std::string name;
  std::string url;
  std::string country;
  std::string countrycode;
  std::string state;
  std::string language;
  std::string tags;
  std::string favicon;
  int bitrate{0};      // in kbps
  std::string codec;
  std::optional<double> geo_lat;
  std::optional<double> geo_long;
  std::string location;  // "state, country"
};

struct StationQuery {
  std::string name;
  std::string country;
  std::string language;
  std::string continent;  // filtered locally by countrycode, after offset/limit
  unsigned int offset{0};
  unsigned int limit{1000};
};

} // namespace radio_service
