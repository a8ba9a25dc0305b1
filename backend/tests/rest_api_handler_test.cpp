#include "interface/rest_api_handler.hpp"
#include "common/config/config.hpp"
#include "fake_http_transport.hpp"
#include "fake_stores.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace std::chrono_literals;

namespace radio_service::test {
namespace {

const std::string kLive = "http://radio.test/live.mp3";
const std::string kDead = "http://radio.test/dead";

class RestApiHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    transport_ = std::make_shared<FakeHttpTransport>();
    transport_->onHead(kLive, makeHead(200, {{"content-type", "audio/mpeg"}}));
    transport_->onHead(kDead, makeHead(404));
    transport_->onGet(kDead, {makeHead(404), {}});

    auto cfg = config::Config::defaultProbe();
    cfg.sniff_timeout = 200ms;
    directory_ = std::make_shared<FakeStationDirectory>();
    favorites_ = std::make_shared<InMemoryFavorites>();
    auto service = std::make_shared<RadioService>(
      std::make_shared<StreamProbe>(transport_, cfg), directory_, favorites_, 1000);
    handler_ = std::make_shared<RestApiHandler>(service);
  }

  common::RestApiHandlerBase::Response send(http::verb method, const std::string& target,
                                            const std::string& body = "") {
    common::RestApiHandlerBase::Request req{method, target, 11};
    req.set(http::field::content_type, "application/json");
    req.body() = body;
    req.prepare_payload();
    return handler_->handleRequest(std::move(req));
  }

  static nlohmann::json json(const common::RestApiHandlerBase::Response& res) {
    return nlohmann::json::parse(res.body());
  }

  std::shared_ptr<FakeHttpTransport> transport_;
  std::shared_ptr<FakeStationDirectory> directory_;
  std::shared_ptr<InMemoryFavorites> favorites_;
  std::shared_ptr<RestApiHandler> handler_;
};

TEST_F(RestApiHandlerTest, ProbeReturnsResultObject) {
  auto res = send(http::verb::post, "/api/probe", nlohmann::json{{"url", kLive}}.dump());
  ASSERT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res[http::field::content_type], "application/json");
  EXPECT_EQ(res[http::field::access_control_allow_origin], "*");

  auto body = json(res);
  EXPECT_EQ(body.at("success"), true);
  EXPECT_EQ(body.at("url"), kLive);
  const auto& result = body.at("result");
  EXPECT_EQ(result.at("valid"), true);
  EXPECT_EQ(result.at("reason"), "Valid stream (HEAD check)");
  EXPECT_EQ(result.at("content_type"), "audio/mpeg");
  EXPECT_EQ(result.at("status_code"), 200);
  EXPECT_EQ(result.at("stream_type"), "Audio stream");
}

TEST_F(RestApiHandlerTest, InvalidProbeKeepsNullFields) {
  auto res = send(http::verb::post, "/api/probe", R"({"url": "ftp://radio.test/x"})");
  ASSERT_EQ(res.result(), http::status::ok);
  auto result = json(res).at("result");
  EXPECT_EQ(result.at("valid"), false);
  EXPECT_EQ(result.at("reason"), "Invalid URL format");
  EXPECT_TRUE(result.at("status_code").is_null());
  EXPECT_TRUE(result.at("content_type").is_null());
  EXPECT_TRUE(result.at("stream_type").is_null());
}

TEST_F(RestApiHandlerTest, QueryStringIsIgnoredForRouting) {
  auto res = send(http::verb::post, "/api/probe?verbose=1", nlohmann::json{{"url", kLive}}.dump());
  EXPECT_EQ(res.result(), http::status::ok);
}

TEST_F(RestApiHandlerTest, BadInputIsBadRequest) {
  auto missing = send(http::verb::post, "/api/probe", "{}");
  EXPECT_EQ(missing.result(), http::status::bad_request);
  EXPECT_EQ(json(missing).at("success"), false);
  EXPECT_EQ(json(missing).at("error"), "Missing field: url");

  auto malformed = send(http::verb::post, "/api/probe", "{\"url\": ");
  EXPECT_EQ(malformed.result(), http::status::bad_request);

  auto wrong_type = send(http::verb::post, "/api/probe", R"({"url": 42})");
  EXPECT_EQ(wrong_type.result(), http::status::bad_request);

  auto bad_flag = send(http::verb::post, "/api/probe", R"({"url": "http://radio.test/", "check_playability": "yes"})");
  EXPECT_EQ(bad_flag.result(), http::status::bad_request);

  auto batch = send(http::verb::post, "/api/probe/batch", R"({"urls": "http://radio.test/"})");
  EXPECT_EQ(batch.result(), http::status::bad_request);
}

TEST_F(RestApiHandlerTest, UnknownEndpointIsNotFound) {
  EXPECT_EQ(send(http::verb::get, "/api/nothing").result(), http::status::not_found);
  EXPECT_EQ(send(http::verb::get, "/api/probe").result(), http::status::not_found);
}

TEST_F(RestApiHandlerTest, PreflightIsAnswered) {
  auto res = send(http::verb::options, "/api/probe");
  EXPECT_EQ(res.result(), http::status::no_content);
  EXPECT_EQ(res[http::field::access_control_allow_methods], "GET, POST, DELETE, OPTIONS");
}

TEST_F(RestApiHandlerTest, BatchProbeReportsEveryUrl) {
  auto res = send(http::verb::post, "/api/probe/batch",
                  nlohmann::json{{"urls", {kLive, kDead, kLive}}}.dump());
  ASSERT_EQ(res.result(), http::status::ok);
  auto results = json(res).at("results");
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results.at(kLive).at("valid"), true);
  EXPECT_EQ(results.at(kDead).at("reason"), "HTTP 404");
}

TEST_F(RestApiHandlerTest, SearchPassesFilters) {
  directory_->stations = {makeStation("Jazz FM", "http://jazz.test/")};
  auto res = send(http::verb::post, "/api/stations/search",
                  R"({"name": "jazz", "country": "Germany", "limit": 10})");
  ASSERT_EQ(res.result(), http::status::ok);
  ASSERT_TRUE(directory_->last_query.has_value());
  EXPECT_EQ(directory_->last_query->name, "jazz");
  EXPECT_EQ(directory_->last_query->country, "Germany");
  EXPECT_EQ(directory_->last_query->limit, 10u);

  auto stations = json(res).at("stations");
  ASSERT_EQ(stations.size(), 1u);
  EXPECT_EQ(stations[0].at("name"), "Jazz FM");
  EXPECT_EQ(stations[0].at("location"), "Germany");
}

TEST_F(RestApiHandlerTest, SearchFiltersByContinent) {
  auto paris = makeStation("Paris", "http://paris.test/");
  paris.countrycode = "FR";
  auto quito = makeStation("Quito", "http://quito.test/");
  quito.countrycode = "EC";
  directory_->stations = {paris, quito};

  auto res = send(http::verb::post, "/api/stations/search", R"({"continent": "South America"})");
  ASSERT_EQ(res.result(), http::status::ok);
  auto stations = json(res).at("stations");
  ASSERT_EQ(stations.size(), 1u);
  EXPECT_EQ(stations[0].at("name"), "Quito");
  EXPECT_EQ(directory_->last_query->continent, "South America");

  auto unknown = send(http::verb::post, "/api/stations/search", R"({"continent": "Atlantis"})");
  EXPECT_EQ(unknown.result(), http::status::bad_request);
  EXPECT_EQ(json(unknown).at("error"), "Unknown continent: Atlantis");

  auto wrong_type = send(http::verb::post, "/api/stations/search", R"({"continent": 7})");
  EXPECT_EQ(wrong_type.result(), http::status::bad_request);
}

TEST_F(RestApiHandlerTest, ContinentsAreListed) {
  auto res = send(http::verb::get, "/api/continents");
  ASSERT_EQ(res.result(), http::status::ok);
  auto continents = json(res).at("continents");
  ASSERT_EQ(continents.size(), 7u);
  EXPECT_EQ(continents.front(), "Africa");
  EXPECT_EQ(continents.back(), "Antarctica");
}

TEST_F(RestApiHandlerTest, NegativeLimitIsBadRequest) {
  auto res = send(http::verb::post, "/api/stations/top", R"({"limit": -1})");
  EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(RestApiHandlerTest, DirectoryFailureIsBadGateway) {
  directory_->failure = "Request error: timed out";
  auto res = send(http::verb::get, "/api/countries");
  EXPECT_EQ(res.result(), http::status::bad_gateway);
  EXPECT_EQ(json(res).at("error"), "Request error: timed out");

  EXPECT_EQ(send(http::verb::post, "/api/stations/top").result(), http::status::bad_gateway);
}

TEST_F(RestApiHandlerTest, CountriesAndLanguages) {
  auto countries = json(send(http::verb::get, "/api/countries"));
  EXPECT_EQ(countries.at("countries"), nlohmann::json({"Austria", "Germany"}));
  auto languages = json(send(http::verb::get, "/api/languages"));
  EXPECT_EQ(languages.at("languages"), nlohmann::json({"english", "german"}));
}

TEST_F(RestApiHandlerTest, FavoritesLifecycle) {
  nlohmann::json station = {{"name", "Live"}, {"url", kLive}, {"bitrate", 128}};
  auto added = send(http::verb::post, "/api/favorites", nlohmann::json{{"station", station}}.dump());
  ASSERT_EQ(added.result(), http::status::ok);

  auto again = send(http::verb::post, "/api/favorites", nlohmann::json{{"station", station}}.dump());
  EXPECT_EQ(again.result(), http::status::conflict);

  auto listed = json(send(http::verb::get, "/api/favorites")).at("favorites");
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_EQ(listed[0].at("url"), kLive);
  EXPECT_EQ(listed[0].at("bitrate"), 128);

  auto checked = send(http::verb::post, "/api/favorites/check");
  ASSERT_EQ(checked.result(), http::status::ok);
  EXPECT_EQ(json(checked).at("results").at(kLive).at("valid"), true);

  auto removed = send(http::verb::delete_, "/api/favorites", nlohmann::json{{"url", kLive}}.dump());
  EXPECT_EQ(removed.result(), http::status::ok);
  auto gone = send(http::verb::delete_, "/api/favorites", nlohmann::json{{"url", kLive}}.dump());
  EXPECT_EQ(gone.result(), http::status::not_found);

  EXPECT_EQ(send(http::verb::post, "/api/favorites", "{}").result(), http::status::bad_request);
}

TEST_F(RestApiHandlerTest, CustomStationIsProbedFirst) {
  auto rejected = send(http::verb::post, "/api/favorites/custom",
                       nlohmann::json{{"url", kDead}, {"name", "Dead"}}.dump());
  EXPECT_EQ(rejected.result(), http::status::unprocessable_entity);
  EXPECT_EQ(json(rejected).at("error"), "Stream is not valid: HTTP 404");

  auto added = send(http::verb::post, "/api/favorites/custom",
                    nlohmann::json{{"url", kLive}, {"name", "Live"}}.dump());
  ASSERT_EQ(added.result(), http::status::ok);
  EXPECT_EQ(json(added).at("station").at("name"), "Custom station: Live");
  ASSERT_EQ(favorites_->favorites.size(), 1u);
}

} // namespace
} // namespace radio_service::test
