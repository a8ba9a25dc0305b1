#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace radio_service {

struct Continent {
  std::string name;
  std::vector<std::string> country_codes;  // ISO 3166-1 alpha-2
};

// Fixed table, Africa first and Antarctica last.
const std::vector<Continent>& listContinents();

// nullptr for a name that is not in the table; the match is exact.
const Continent* findContinent(std::string_view name);

bool isOnContinent(const Continent& continent, std::string_view countrycode);

} // namespace radio_service
