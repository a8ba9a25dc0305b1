#pragma once
#include <nlohmann/json.hpp>
#include "domain/station.hpp"

namespace radio_service {

// Maps a radio-browser.info station record (or a saved favorite, which uses
// the same field names) onto a Station.
Station stationFromJson(const nlohmann::json& j);

// Field set written to the favorites file and returned by the REST API.
nlohmann::json stationToJson(const Station& station);

}
