#include "application/radio_service.hpp"
#include "application/stream_probe.hpp"
#include "infrastructure/curl_http_transport.hpp"
#include "infrastructure/radio_browser_client.hpp"
#include "infrastructure/json_favorites_repository.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include "interface/rest_api_handler.hpp"
#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

int main(int argc, char** argv) {
  try {
    auto& cfg = config::Config::getInstance();

    const char* settings_path = argc > 1 ? argv[1] : std::getenv("RADIO_SERVICE_CONFIG");
    if (settings_path) {
      auto loaded = cfg.loadFromFile(settings_path);
      if (!loaded) {
        std::cerr << "Error: " << loaded.error() << std::endl;
        return 1;
      }
      std::cout << "Loaded settings from " << settings_path << std::endl;
    }

    std::shared_ptr<radio_service::HttpTransport> transport =
      std::make_shared<radio_service::CurlHttpTransport>();

    auto probe = std::make_shared<radio_service::StreamProbe>(transport, cfg.getProbe());

    std::shared_ptr<radio_service::StationDirectory> directory =
      std::make_shared<radio_service::RadioBrowserClient>(transport, cfg.getDirectory());

    std::shared_ptr<radio_service::FavoritesRepository> favorites =
      std::make_shared<radio_service::JsonFavoritesRepository>(cfg.getFavoritesPath());

    auto service = std::make_shared<radio_service::RadioService>(
      probe, directory, favorites, cfg.getDirectory().top_limit
    );

    // Start REST API server
    const auto& http_config = cfg.getHttp();
    const unsigned int io_threads = std::max(2u, std::thread::hardware_concurrency());
    boost::asio::io_context ioc{static_cast<int>(io_threads)};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(http_config.host),
      static_cast<unsigned short>(http_config.port)
    };

    auto api_handler = std::make_shared<radio_service::RestApiHandler>(service);
    common::HttpServer http_server{ioc, http_endpoint, api_handler};

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc, &http_server](const boost::system::error_code&, int signal_number) {
      std::cout << "Received signal " << signal_number << ", shutting down" << std::endl;
      http_server.stop();
      ioc.stop();
    });

    std::cout << "HTTP Server listening on " << cfg.getHttpIpPort() << std::endl;
    http_server.run();

    // Handlers block while probing, so several threads serve the io_context
    std::vector<std::jthread> workers;
    workers.reserve(io_threads - 1);
    for (unsigned int i = 0; i + 1 < io_threads; ++i) {
      workers.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();
    workers.clear();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
