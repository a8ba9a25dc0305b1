#include "continents.hpp"
#include <algorithm>
#include <cctype>

namespace radio_service {

const std::vector<Continent>& listContinents() {
  static const std::vector<Continent> continents = {
    {"Africa", {"DZ", "AO", "BJ", "BW", "BF", "BI", "CM", "CV", "CF", "TD", "KM", "CG",
                "CD", "CI", "DJ", "EG", "GQ", "ER", "ET", "GA", "GM", "GH", "GN", "GW",
                "KE", "LS", "LR", "LY", "MG", "MW", "ML", "MR", "MU", "YT", "MA", "MZ",
                "NA", "NE", "NG", "RE", "RW", "SH", "ST", "SN", "SC", "SL", "SO", "ZA",
                "SS", "SD", "SZ", "TZ", "TG", "TN", "UG", "EH", "ZM", "ZW"}},
    {"Asia", {"AF", "AM", "AZ", "BH", "BD", "BT", "BN", "KH", "CN", "GE", "HK", "IN",
              "ID", "IR", "IQ", "IL", "JP", "JO", "KZ", "KW", "KG", "LA", "LB", "MO",
              "MY", "MV", "MN", "MM", "NP", "KP", "OM", "PK", "PS", "PH", "QA", "SA",
              "SG", "KR", "LK", "SY", "TW", "TJ", "TH", "TL", "TR", "TM", "AE", "UZ",
              "VN", "YE"}},
    {"Europe", {"AX", "AL", "AD", "AT", "BY", "BE", "BA", "BG", "HR", "CY", "CZ", "DK",
                "EE", "FO", "FI", "FR", "DE", "GI", "GR", "GG", "HU", "IS", "IE", "IM",
                "IT", "JE", "XK", "LV", "LI", "LT", "LU", "MK", "MT", "MD", "MC", "ME",
                "NL", "NO", "PL", "PT", "RO", "RU", "SM", "RS", "SK", "SI", "ES", "SJ",
                "SE", "CH", "UA", "GB", "VA"}},
    {"North America", {"AI", "AG", "AW", "BS", "BB", "BZ", "BM", "BQ", "VG", "CA", "KY",
                       "CR", "CU", "CW", "DM", "DO", "SV", "GL", "GD", "GP", "GT", "HT",
                       "HN", "JM", "MQ", "MX", "MS", "NI", "PA", "PM", "PR", "BL", "KN",
                       "LC", "MF", "VC", "SX", "TT", "TC", "US", "VI"}},
    {"South America", {"AR", "BO", "BR", "CL", "CO", "EC", "FK", "GF", "GY", "PY", "PE",
                       "SR", "UY", "VE"}},
    {"Oceania", {"AS", "AU", "CK", "FJ", "PF", "GU", "KI", "MH", "FM", "NR", "NC", "NZ",
                 "NU", "NF", "MP", "PW", "PG", "PN", "WS", "SB", "TK", "TO", "TV", "VU",
                 "WF"}},
    {"Antarctica", {"AQ", "BV", "TF", "HM", "GS"}},
  };
  return continents;
}

const Continent* findContinent(std::string_view name) {
  const auto& continents = listContinents();
  auto it = std::find_if(continents.begin(), continents.end(),
                         [&](const Continent& c) { return c.name == name; });
  return it == continents.end() ? nullptr : &*it;
}

bool isOnContinent(const Continent& continent, std::string_view countrycode) {
  std::string code(countrycode);
  std::transform(code.begin(), code.end(), code.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return std::find(continent.country_codes.begin(), continent.country_codes.end(), code)
         != continent.country_codes.end();
}

} // namespace radio_service
