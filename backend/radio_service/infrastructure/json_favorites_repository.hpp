#pragma once
#include "domain/favorites_repository.hpp"
#include <expected>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace radio_service {
class JsonFavoritesRepository : public FavoritesRepository {
public:
  // A missing file is an empty list; an unreadable one is logged and ignored.
  explicit JsonFavoritesRepository(std::filesystem::path path);

  std::vector<Station> list() override;
  std::expected<bool, std::string> add(const Station& station) override;
  std::expected<bool, std::string> remove(const std::string& url) override;

private:
  void load();
  std::expected<void, std::string> save();

  std::filesystem::path path_;
  std::mutex mtx_;
  std::vector<Station> favorites_;
};
}
