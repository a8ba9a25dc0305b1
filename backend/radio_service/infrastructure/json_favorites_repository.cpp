#include "json_favorites_repository.hpp"
#include "station_json.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace radio_service {

JsonFavoritesRepository::JsonFavoritesRepository(std::filesystem::path path)
  : path_(std::move(path)) {
  load();
}

void JsonFavoritesRepository::load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return;
  }

  std::ifstream in(path_);
  if (!in) {
    std::cerr << "Error loading favorites: cannot open " << path_ << std::endl;
    return;
  }

  try {
    auto data = nlohmann::json::parse(in);
    if (!data.is_array()) {
      std::cerr << "Error loading favorites: " << path_ << " is not a JSON array" << std::endl;
      return;
    }
    for (const auto& item : data) {
      if (item.is_object()) {
        favorites_.push_back(stationFromJson(item));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "Error loading favorites: " << e.what() << std::endl;
  }
}

std::expected<void, std::string> JsonFavoritesRepository::save() {
  nlohmann::json data = nlohmann::json::array();
  for (const auto& station : favorites_) {
    data.push_back(stationToJson(station));
  }

  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    return std::unexpected("Failed to open favorites file: " + path_.string());
  }
  out << data.dump(2);
  if (!out) {
    return std::unexpected("Failed to write favorites file: " + path_.string());
  }
  return {};
}

std::vector<Station> JsonFavoritesRepository::list() {
  std::lock_guard<std::mutex> lock{mtx_};
  return favorites_;
}

std::expected<bool, std::string> JsonFavoritesRepository::add(const Station& station) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto exists = std::any_of(favorites_.begin(), favorites_.end(),
                            [&](const Station& fav) { return fav.url == station.url; });
  if (exists) {
    return false;
  }

  favorites_.push_back(station);
  if (auto saved = save(); !saved) {
    favorites_.pop_back();
    return std::unexpected(saved.error());
  }
  return true;
}

std::expected<bool, std::string> JsonFavoritesRepository::remove(const std::string& url) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = std::find_if(favorites_.begin(), favorites_.end(),
                         [&](const Station& fav) { return fav.url == url; });
  if (it == favorites_.end()) {
    return false;
  }

  auto removed = *it;
  auto index = it - favorites_.begin();
  favorites_.erase(it);
  if (auto saved = save(); !saved) {
    favorites_.insert(favorites_.begin() + index, removed);
    return std::unexpected(saved.error());
  }
  return true;
}

}
