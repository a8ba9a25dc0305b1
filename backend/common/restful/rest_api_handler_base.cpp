#include "rest_api_handler_base.hpp"

namespace common {

std::string_view RestApiHandlerBase::requestPath(const Request& req) {
  std::string_view target(req.target().data(), req.target().size());
  auto query = target.find('?');
  return query == std::string_view::npos ? target : target.substr(0, query);
}

RestApiHandlerBase::Response RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  Response res{status, 11};
  res.set(http::field::content_type, "application/json");
  res.body() = json.dump();
  res.prepare_payload();
  return res;
}

RestApiHandlerBase::Response RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {

  nlohmann::json error_json = {
    {"success", false},
    {"error", message}
  };
  return createJsonResponse(status, error_json);
}

nlohmann::json RestApiHandlerBase::parseRequestBody(const std::string& body) {
  try {
    if (body.empty()) {
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception& e) {
    throw BadRequestError("Invalid JSON in request body: " + std::string(e.what()));
  }
}

}
