#pragma once

// project
#include "station.hpp"

// std
#include <string>
#include <expected>
#include <vector>

namespace radio_service {

class FavoritesRepository {
public:
  virtual ~FavoritesRepository() = default;
  virtual std::vector<Station> list() = 0;
  // false when a favorite with the same url already exists
  virtual std::expected<bool, std::string> add(const Station& station) = 0;
  // false when no favorite has this url
  virtual std::expected<bool, std::string> remove(const std::string& url) = 0;
};

} // namespace radio_service
