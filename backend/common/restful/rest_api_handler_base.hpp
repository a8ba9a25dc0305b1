#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

// Malformed client input; answered with 400 instead of 500
class BadRequestError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class RestApiHandlerBase {
public:
  using Request = http::request<http::string_body, http::basic_fields<std::allocator<char>>>;
  using Response = http::response<http::string_body>;

  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  Response handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {

    auto addCorsHeaders = [](auto& res) {
      res.set(http::field::access_control_allow_origin, "*");
      res.set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
      res.set(http::field::access_control_allow_headers, "Content-Type");
    };

    if (req.method() == http::verb::options) {
      Response res{http::status::no_content, req.version()};
      addCorsHeaders(res);
      res.prepare_payload();
      return res;
    }

    auto keep_alive = req.keep_alive();
    Response response;
    try {
      response = doHandleRequest(std::move(req));
    } catch (const BadRequestError& e) {
      response = createErrorResponse(http::status::bad_request, e.what());
    } catch (const std::exception& e) {
      response = createErrorResponse(http::status::internal_server_error,
                                     "Internal server error: " + std::string(e.what()));
    }
    addCorsHeaders(response);
    response.keep_alive(keep_alive);
    return response;
  }

protected:
  virtual Response doHandleRequest(Request&& req) = 0;

  // Request target without its query string
  static std::string_view requestPath(const Request& req);

  Response createJsonResponse(http::status status, const nlohmann::json& json);

  Response createErrorResponse(http::status status, const std::string& message);

  // Throws BadRequestError on malformed JSON; an empty body is an empty object
  nlohmann::json parseRequestBody(const std::string& body);
};

}
