#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "item_source.hpp"
#include "log.hpp"

struct CatalogItem {
  std::string id;
  std::string name;
  std::string label;
  bool is_completed = false;
  std::string remote_directory;
  std::string content_hash;
};

bool operator==(const CatalogItem& a, const CatalogItem& b);

struct CatalogOptions {
  std::string view = "main";
  bool allow_cache = false;
  std::filesystem::path cache_file = "torrents_cache.json";
};

struct CatalogSnapshot {
  std::vector<CatalogItem> items;
  bool from_cache = false;
};

class ItemCatalog {
public:
  ItemCatalog(CatalogOptions options, std::shared_ptr<Logger> logger);

  // A non-empty cache (when enabled) replaces the live query. A failed live
  // query is logged and yields an empty snapshot.
  CatalogSnapshot snapshot(ItemSource& source);

  // Pushes a label to the client. Failures are logged and reported as false.
  bool set_label(ItemSource& source, const CatalogItem& item, const std::string& label);

  // Empty on any read, parse or checksum failure.
  std::vector<CatalogItem> load_cache() const;
  bool save_cache(const std::vector<CatalogItem>& items) const;

  const CatalogOptions& options() const { return options_; }

private:
  std::vector<CatalogItem> query(ItemSource& source);

  CatalogOptions options_;
  std::shared_ptr<Logger> logger_;
};
