#pragma once
#include "application/radio_service.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace radio_service {

nlohmann::json probeResultToJson(const ProbeResult &result);

class RestApiHandler : public common::RestApiHandlerBase {
public:
  explicit RestApiHandler(std::shared_ptr<RadioService> radio_service);

protected:
  Response doHandleRequest(Request &&req) override;

private:
  std::shared_ptr<RadioService> radio_service_;

  Response handleProbe(const nlohmann::json &body);
  Response handleProbeBatch(const nlohmann::json &body);
  Response handleSearchStations(const nlohmann::json &body);
  Response handleTopStations(const nlohmann::json &body);
  Response handleCountries();
  Response handleLanguages();
  Response handleContinents();
  Response handleListFavorites();
  Response handleAddFavorite(const nlohmann::json &body);
  Response handleRemoveFavorite(const nlohmann::json &body);
  Response handleAddCustomStation(const nlohmann::json &body);
  Response handleCheckFavorites(const nlohmann::json &body);

  Response probeMapResponse(const std::map<std::string, ProbeResult> &results);
};

} // namespace radio_service
