#pragma once
#include "station.hpp"
#include <expected>
#include <string>
#include <vector>

namespace radio_service {
class StationDirectory {
public:
  virtual ~StationDirectory() = default;
  virtual std::expected<std::vector<Station>, std::string> search(const StationQuery& query) = 0;
  virtual std::expected<std::vector<Station>, std::string> topVoted(unsigned int limit) = 0;
  virtual std::expected<std::vector<std::string>, std::string> listCountries() = 0;
  virtual std::expected<std::vector<std::string>, std::string> listLanguages() = 0;
};
}
