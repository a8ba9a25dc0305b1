#include "infrastructure/radio_browser_client.hpp"
#include "infrastructure/station_json.hpp"
#include "fake_http_transport.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace radio_service::test {
namespace {

const std::string kBase = "http://dir.test";

HttpResponse jsonResponse(const nlohmann::json& body, long status = 200) {
  HttpResponse response;
  response.head = makeHead(status, {{"content-type", "application/json"}});
  response.body = body.dump();
  return response;
}

nlohmann::json stationJson(const std::string& name, int bitrate, const std::string& url) {
  return {
    {"name", name},
    {"url", url},
    {"url_resolved", ""},
    {"country", "Germany"},
    {"countrycode", "DE"},
    {"state", "Berlin"},
    {"language", "german"},
    {"tags", "jazz,news"},
    {"favicon", ""},
    {"bitrate", bitrate},
    {"codec", "MP3"},
    {"geo_lat", nullptr},
    {"geo_long", nullptr}
  };
}

class RadioBrowserClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_ = {
      .discovery_host = "all.api.radio-browser.invalid",
      .fallback_base_url = "https://fallback.test",
      .user_agent = "RadioBrowserPlayer/1.0",
      .timeout = std::chrono::seconds(4),
      .top_limit = 1000
    };
    transport_ = std::make_shared<FakeHttpTransport>();
  }

  RadioBrowserClient makeClient() { return RadioBrowserClient(transport_, config_, kBase); }

  config::DirectoryConfig config_;
  std::shared_ptr<FakeHttpTransport> transport_;
};

TEST_F(RadioBrowserClientTest, SearchBuildsOrderedQuery) {
  const std::string url = kBase + "/json/stations/search?offset=0&limit=1000&order=votes"
                          "&reverse=true&name=Jazz%20FM&country=Germany";
  transport_->onBufferedGet(url, jsonResponse(nlohmann::json::array({stationJson("Jazz FM", 128, "http://jazz.test/live")})));
  auto client = makeClient();

  auto stations = client.search({.name = "Jazz FM", .country = "Germany"});
  ASSERT_TRUE(stations.has_value()) << stations.error();
  ASSERT_EQ(stations->size(), 1u);
  EXPECT_EQ((*stations)[0].name, "Jazz FM");
  EXPECT_EQ(transport_->requestedUrls().back(), url);
}

TEST_F(RadioBrowserClientTest, RequestsCarryDirectoryOptions) {
  transport_->onBufferedGet(kBase + "/json/countries", jsonResponse(nlohmann::json::array()));
  auto client = makeClient();

  ASSERT_TRUE(client.listCountries().has_value());
  auto options = transport_->lastOptions();
  EXPECT_EQ(options.user_agent, "RadioBrowserPlayer/1.0");
  EXPECT_EQ(options.timeout, std::chrono::seconds(4));
  ASSERT_EQ(options.headers.size(), 1u);
  EXPECT_EQ(options.headers[0].first, "Content-Type");
  EXPECT_EQ(options.headers[0].second, "application/json");
}

TEST_F(RadioBrowserClientTest, DuplicateNamesKeepHighestBitrate) {
  auto body = nlohmann::json::array({
    stationJson("Alpha", 64, "http://alpha.test/low"),
    stationJson("Beta", 128, "http://beta.test/live"),
    stationJson("Alpha", 320, "http://alpha.test/high"),
    stationJson("Alpha", 128, "http://alpha.test/mid")
  });
  transport_->onBufferedGet(kBase + "/json/stations/topvote/50", jsonResponse(body));
  auto client = makeClient();

  auto stations = client.topVoted(50);
  ASSERT_TRUE(stations.has_value());
  ASSERT_EQ(stations->size(), 2u);
  EXPECT_EQ((*stations)[0].name, "Alpha");
  EXPECT_EQ((*stations)[0].bitrate, 320);
  EXPECT_EQ((*stations)[0].url, "http://alpha.test/high");
  EXPECT_EQ((*stations)[1].name, "Beta");
}

TEST_F(RadioBrowserClientTest, StationMappingPrefersResolvedUrl) {
  auto resolved = stationJson("Gamma", 96, "http://gamma.test/playlist.pls");
  resolved["url_resolved"] = "http://gamma.test/stream";
  resolved["geo_lat"] = 52.5;
  resolved["geo_long"] = 13.4;
  auto station = stationFromJson(resolved);
  EXPECT_EQ(station.url, "http://gamma.test/stream");
  EXPECT_EQ(station.location, "Berlin, Germany");
  EXPECT_EQ(station.geo_lat, 52.5);
  EXPECT_EQ(station.geo_long, 13.4);

  auto sparse = stationFromJson({{"url", "http://delta.test/"}});
  EXPECT_EQ(sparse.name, "Unknown");
  EXPECT_EQ(sparse.url, "http://delta.test/");
  EXPECT_EQ(sparse.country, "Unknown");
  EXPECT_EQ(sparse.codec, "Unknown");
  EXPECT_EQ(sparse.bitrate, 0);
  EXPECT_EQ(sparse.location, "Unknown");
  EXPECT_FALSE(sparse.geo_lat.has_value());

  auto state_only = stationFromJson({{"state", "Bavaria"}});
  EXPECT_EQ(state_only.location, "Bavaria");
}

TEST_F(RadioBrowserClientTest, StationJsonKeepsEveryField) {
  auto station = stationFromJson(stationJson("Epsilon", 192, "http://eps.test/"));
  auto j = stationToJson(station);
  EXPECT_EQ(j.at("name"), "Epsilon");
  EXPECT_EQ(j.at("countrycode"), "DE");
  EXPECT_EQ(j.at("bitrate"), 192);
  EXPECT_TRUE(j.at("geo_lat").is_null());
  EXPECT_EQ(stationFromJson(j).location, station.location);
}

TEST_F(RadioBrowserClientTest, OutOfRangeBitrateBecomesZero) {
  auto bitrateOf = [](nlohmann::json value) {
    auto j = stationJson("Zeta", 0, "http://zeta.test/");
    j["bitrate"] = std::move(value);
    return stationFromJson(j).bitrate;
  };

  EXPECT_EQ(bitrateOf(320), 320);
  EXPECT_EQ(bitrateOf(127.9), 127);
  EXPECT_EQ(bitrateOf(1e300), 0);
  EXPECT_EQ(bitrateOf(-128), 0);
  EXPECT_EQ(bitrateOf(std::uint64_t{1} << 40), 0);
  EXPECT_EQ(bitrateOf("128"), 0);
  EXPECT_EQ(bitrateOf(nullptr), 0);
}

TEST_F(RadioBrowserClientTest, NamesAreSortedAndBlankOnesDropped) {
  auto body = nlohmann::json::array({
    {{"name", "Germany"}, {"stationcount", 10}},
    {{"name", ""}, {"stationcount", 3}},
    {{"name", "Austria"}, {"stationcount", 5}},
    {{"stationcount", 1}}
  });
  transport_->onBufferedGet(kBase + "/json/languages", jsonResponse(body));
  auto client = makeClient();

  auto names = client.listLanguages();
  ASSERT_TRUE(names.has_value());
  EXPECT_EQ(*names, (std::vector<std::string>{"Austria", "Germany"}));
}

TEST_F(RadioBrowserClientTest, HttpErrorsAreReported) {
  HttpResponse failure;
  failure.head = makeHead(500);
  transport_->onBufferedGet(kBase + "/json/countries", failure);
  auto client = makeClient();

  auto names = client.listCountries();
  ASSERT_FALSE(names.has_value());
  EXPECT_EQ(names.error(), "HTTP error: 500");
}

TEST_F(RadioBrowserClientTest, MalformedJsonIsReported) {
  HttpResponse garbage;
  garbage.head = makeHead(200);
  garbage.body = "<html>maintenance</html>";
  transport_->onBufferedGet(kBase + "/json/countries", garbage);
  auto client = makeClient();

  auto names = client.listCountries();
  ASSERT_FALSE(names.has_value());
  EXPECT_EQ(names.error().rfind("Invalid JSON from " + kBase + "/json/countries", 0), 0u);
}

TEST_F(RadioBrowserClientTest, UnexpectedShapeIsReported) {
  transport_->onBufferedGet(kBase + "/json/stations/topvote/10", jsonResponse({{"error", "nope"}}));
  auto client = makeClient();

  auto stations = client.topVoted(10);
  ASSERT_FALSE(stations.has_value());
  EXPECT_EQ(stations.error(), "Unexpected response shape from /json/stations/topvote/10");
}

TEST_F(RadioBrowserClientTest, TransportErrorsAreReported) {
  transport_->onBufferedGet(kBase + "/json/countries",
                            std::unexpected(transportError(TransportErrorKind::Timeout, "timed out")));
  auto client = makeClient();

  auto names = client.listCountries();
  ASSERT_FALSE(names.has_value());
  EXPECT_EQ(names.error(), "Request error: timed out");
}

TEST_F(RadioBrowserClientTest, PinnedBaseUrlSkipsDiscovery) {
  auto client = makeClient();
  EXPECT_EQ(client.baseUrl(), kBase);
}

} // namespace
} // namespace radio_service::test
