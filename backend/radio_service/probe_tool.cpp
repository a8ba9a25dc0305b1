#include "application/stream_probe.hpp"
#include "infrastructure/curl_http_transport.hpp"
#include "common/config/config.hpp"
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// Checks stream urls from the command line, one result line per url.
// usage: probe_tool [--no-sniff] url...
int main(int argc, char** argv) {
  bool check_playability = true;
  std::vector<std::string> urls;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--no-sniff") == 0) {
      check_playability = false;
    } else {
      urls.emplace_back(argv[i]);
    }
  }

  if (urls.empty()) {
    std::cerr << "usage: " << argv[0] << " [--no-sniff] url..." << std::endl;
    return 2;
  }

  try {
    auto transport = std::make_shared<radio_service::CurlHttpTransport>();
    radio_service::StreamProbe probe(transport, config::Config::getInstance().getProbe());

    auto results = probe.probeMany(urls, check_playability);
    bool all_valid = true;
    for (const auto& [url, result] : results) {
      all_valid = all_valid && result.valid;
      std::cout << (result.valid ? "OK   " : "FAIL ") << url << "  " << result.reason;
      if (result.stream_kind) {
        std::cout << " [" << radio_service::toString(*result.stream_kind) << "]";
      }
      if (result.status_code) {
        std::cout << " (HTTP " << *result.status_code << ")";
      }
      std::cout << std::endl;
    }
    return all_valid ? 0 : 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
