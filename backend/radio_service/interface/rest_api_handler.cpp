#include "rest_api_handler.hpp"
#include "application/continents.hpp"
#include "infrastructure/station_json.hpp"

namespace radio_service {

namespace {

std::string requireString(const nlohmann::json &body, const std::string &field) {
  auto it = body.find(field);
  if (it == body.end()) {
    throw common::BadRequestError("Missing field: " + field);
  }
  if (!it->is_string()) {
    throw common::BadRequestError("Field must be a string: " + field);
  }
  return it->get<std::string>();
}

std::string optionalString(const nlohmann::json &body, const std::string &field) {
  auto it = body.find(field);
  if (it == body.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    throw common::BadRequestError("Field must be a string: " + field);
  }
  return it->get<std::string>();
}

unsigned int optionalCount(const nlohmann::json &body, const std::string &field,
                           unsigned int fallback) {
  auto it = body.find(field);
  if (it == body.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_unsigned()) {
    throw common::BadRequestError("Field must be a non-negative integer: " + field);
  }
  return it->get<unsigned int>();
}

bool checkPlayability(const nlohmann::json &body) {
  auto it = body.find("check_playability");
  if (it == body.end()) {
    return true;
  }
  if (!it->is_boolean()) {
    throw common::BadRequestError("Field must be a boolean: check_playability");
  }
  return it->get<bool>();
}

nlohmann::json stationsToJson(const std::vector<Station> &stations) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto &station : stations) {
    auto j = stationToJson(station);
    j["location"] = station.location;
    list.push_back(std::move(j));
  }
  return list;
}

} // namespace

nlohmann::json probeResultToJson(const ProbeResult &result) {
  nlohmann::json j = {{"valid", result.valid},
                      {"reason", result.reason},
                      {"content_type", nullptr},
                      {"status_code", nullptr},
                      {"stream_type", nullptr}};
  if (result.content_type) {
    j["content_type"] = *result.content_type;
  }
  if (result.status_code) {
    j["status_code"] = *result.status_code;
  }
  if (result.stream_kind) {
    j["stream_type"] = toString(*result.stream_kind);
  }
  return j;
}

RestApiHandler::RestApiHandler(std::shared_ptr<RadioService> radio_service)
    : radio_service_(radio_service) {}

RestApiHandler::Response RestApiHandler::doHandleRequest(Request &&req) {
  auto target = requestPath(req);
  auto method = req.method();

  if (target == "/api/probe" && method == http::verb::post) {
    return handleProbe(parseRequestBody(req.body()));
  } else if (target == "/api/probe/batch" && method == http::verb::post) {
    return handleProbeBatch(parseRequestBody(req.body()));
  } else if (target == "/api/stations/search" && method == http::verb::post) {
    return handleSearchStations(parseRequestBody(req.body()));
  } else if (target == "/api/stations/top" && method == http::verb::post) {
    return handleTopStations(parseRequestBody(req.body()));
  } else if (target == "/api/countries" && method == http::verb::get) {
    return handleCountries();
  } else if (target == "/api/languages" && method == http::verb::get) {
    return handleLanguages();
  } else if (target == "/api/continents" && method == http::verb::get) {
    return handleContinents();
  } else if (target == "/api/favorites" && method == http::verb::get) {
    return handleListFavorites();
  } else if (target == "/api/favorites" && method == http::verb::post) {
    return handleAddFavorite(parseRequestBody(req.body()));
  } else if (target == "/api/favorites" && method == http::verb::delete_) {
    return handleRemoveFavorite(parseRequestBody(req.body()));
  } else if (target == "/api/favorites/custom" && method == http::verb::post) {
    return handleAddCustomStation(parseRequestBody(req.body()));
  } else if (target == "/api/favorites/check" && method == http::verb::post) {
    return handleCheckFavorites(parseRequestBody(req.body()));
  } else {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }
}

RestApiHandler::Response
RestApiHandler::handleProbe(const nlohmann::json &body) {
  auto url = requireString(body, "url");
  auto result = radio_service_->checkStream(url, checkPlayability(body));

  nlohmann::json response_json = {{"success", true},
                                  {"url", url},
                                  {"result", probeResultToJson(result)}};
  return createJsonResponse(http::status::ok, response_json);
}

RestApiHandler::Response
RestApiHandler::handleProbeBatch(const nlohmann::json &body) {
  auto it = body.find("urls");
  if (it == body.end() || !it->is_array()) {
    return createErrorResponse(http::status::bad_request, "Missing field: urls");
  }

  std::vector<std::string> urls;
  for (const auto &url : *it) {
    if (!url.is_string()) {
      return createErrorResponse(http::status::bad_request, "urls must contain strings");
    }
    urls.push_back(url.get<std::string>());
  }

  return probeMapResponse(radio_service_->checkStreams(urls, checkPlayability(body)));
}

RestApiHandler::Response RestApiHandler::probeMapResponse(
    const std::map<std::string, ProbeResult> &results) {
  nlohmann::json mapped = nlohmann::json::object();
  for (const auto &[url, result] : results) {
    mapped[url] = probeResultToJson(result);
  }
  nlohmann::json response_json = {{"success", true}, {"results", mapped}};
  return createJsonResponse(http::status::ok, response_json);
}

RestApiHandler::Response
RestApiHandler::handleSearchStations(const nlohmann::json &body) {
  StationQuery query;
  query.name = optionalString(body, "name");
  query.country = optionalString(body, "country");
  query.language = optionalString(body, "language");
  query.continent = optionalString(body, "continent");
  if (!query.continent.empty() && !findContinent(query.continent)) {
    throw common::BadRequestError("Unknown continent: " + query.continent);
  }
  query.offset = optionalCount(body, "offset", 0);
  query.limit = optionalCount(body, "limit", query.limit);

  auto stations = radio_service_->searchStations(query);
  if (!stations) {
    return createErrorResponse(http::status::bad_gateway, stations.error());
  }
  nlohmann::json response_json = {{"success", true},
                                  {"stations", stationsToJson(*stations)}};
  return createJsonResponse(http::status::ok, response_json);
}

RestApiHandler::Response
RestApiHandler::handleTopStations(const nlohmann::json &body) {
  auto stations = radio_service_->topStations(optionalCount(body, "limit", 0));
  if (!stations) {
    return createErrorResponse(http::status::bad_gateway, stations.error());
  }
  nlohmann::json response_json = {{"success", true},
                                  {"stations", stationsToJson(*stations)}};
  return createJsonResponse(http::status::ok, response_json);
}

RestApiHandler::Response RestApiHandler::handleCountries() {
  auto names = radio_service_->countries();
  if (!names) {
    return createErrorResponse(http::status::bad_gateway, names.error());
  }
  nlohmann::json response_json = {{"success", true}, {"countries", *names}};
  return createJsonResponse(http::status::ok, response_json);
}

RestApiHandler::Response RestApiHandler::handleLanguages() {
  auto names = radio_service_->languages();
  if (!names) {
    return createErrorResponse(http::status::bad_gateway, names.error());
  }
  nlohmann::json response_json = {{"success", true}, {"languages", *names}};
  return createJsonResponse(http::status::ok, response_json);
}

RestApiHandler::Response RestApiHandler::handleContinents() {
  nlohmann::json response_json = {{"success", true},
                                  {"continents", radio_service_->continents()}};
  return createJsonResponse(http::status::ok, response_json);
}

RestApiHandler::Response RestApiHandler::handleListFavorites() {
  nlohmann::json response_json = {
      {"success", true},
      {"favorites", stationsToJson(radio_service_->listFavorites())}};
  return createJsonResponse(http::status::ok, response_json);
}

RestApiHandler::Response
RestApiHandler::handleAddFavorite(const nlohmann::json &body) {
  auto it = body.find("station");
  if (it == body.end() || !it->is_object()) {
    return createErrorResponse(http::status::bad_request, "Missing field: station");
  }

  auto station = stationFromJson(*it);
  auto added = radio_service_->addFavorite(station);
  if (!added) {
    return createErrorResponse(http::status::bad_request, added.error());
  }
  if (!*added) {
    return createErrorResponse(http::status::conflict, "Station already in favorites");
  }
  nlohmann::json response_json = {{"success", true},
                                  {"message", "Added " + station.name + " to favorites"}};
  return createJsonResponse(http::status::ok, response_json);
}

RestApiHandler::Response
RestApiHandler::handleRemoveFavorite(const nlohmann::json &body) {
  auto url = requireString(body, "url");
  auto removed = radio_service_->removeFavorite(url);
  if (!removed) {
    return createErrorResponse(http::status::internal_server_error, removed.error());
  }
  if (!*removed) {
    return createErrorResponse(http::status::not_found, "No favorite with this url");
  }
  nlohmann::json response_json = {{"success", true}, {"message", "Favorite removed"}};
  return createJsonResponse(http::status::ok, response_json);
}

RestApiHandler::Response
RestApiHandler::handleAddCustomStation(const nlohmann::json &body) {
  auto url = requireString(body, "url");
  auto station = radio_service_->addCustomStation(url, optionalString(body, "name"));
  if (!station) {
    return createErrorResponse(http::status::unprocessable_entity, station.error());
  }
  nlohmann::json response_json = {{"success", true},
                                  {"station", stationToJson(*station)}};
  return createJsonResponse(http::status::ok, response_json);
}

RestApiHandler::Response
RestApiHandler::handleCheckFavorites(const nlohmann::json &body) {
  return probeMapResponse(radio_service_->checkFavorites(checkPlayability(body)));
}

} // namespace radio_service
