#include "item_catalog.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

#include "utils.hpp"

namespace {

constexpr int kCacheVersion = 1;

nlohmann::json item_to_json(const CatalogItem& item) {
  return {
    {"id", item.id},
    {"name", item.name},
    {"label", item.label},
    {"is_completed", item.is_completed},
    {"directory", item.remote_directory},
    {"hash", item.content_hash}
  };
}

CatalogItem item_from_json(const nlohmann::json& j) {
  CatalogItem item;
  item.id = j.at("id").get<std::string>();
  item.name = j.at("name").get<std::string>();
  item.label = j.at("label").get<std::string>();
  item.is_completed = j.at("is_completed").get<bool>();
  item.remote_directory = j.at("directory").get<std::string>();
  item.content_hash = j.at("hash").get<std::string>();
  return item;
}

} // namespace

bool operator==(const CatalogItem& a, const CatalogItem& b) {
  return a.id == b.id && a.name == b.name && a.label == b.label &&
         a.is_completed == b.is_completed &&
         a.remote_directory == b.remote_directory &&
         a.content_hash == b.content_hash;
}

ItemCatalog::ItemCatalog(CatalogOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)), logger_(std::move(logger)) {}

CatalogSnapshot ItemCatalog::snapshot(ItemSource& source) {
  CatalogSnapshot snap;
  if(options_.allow_cache) {
    snap.items = load_cache();
    if(!snap.items.empty()) {
      snap.from_cache = true;
      logger_->warn("Loaded {} torrents from cache {}", snap.items.size(), options_.cache_file.string());
      return snap;
    }
  }

  try {
    snap.items = query(source);
  } catch(const std::exception& e) {
    logger_->clear_status();
    logger_->error("An error occurred while querying {}: {}", source.describe(), e.what());
    snap.items.clear();
    return snap;
  }

  if(options_.allow_cache) {
    if(save_cache(snap.items)) {
      logger_->info("Saved {} torrents to cache", snap.items.size());
    }
  }
  return snap;
}

std::vector<CatalogItem> ItemCatalog::query(ItemSource& source) {
  logger_->info("Connecting to {}", source.describe());
  auto ids = source.list_ids(options_.view);
  logger_->info("Found {} torrents", ids.size());

  std::vector<CatalogItem> items;
  items.reserve(ids.size());
  for(std::size_t i = 0; i < ids.size(); ++i) {
    logger_->status("Querying " + std::to_string(i + 1) + "/" + std::to_string(ids.size()));
    CatalogItem item;
    item.id = ids[i];
    item.name = source.name(item.id);
    item.label = source.label(item.id);
    item.is_completed = source.is_complete(item.id);
    item.remote_directory = source.directory(item.id);
    item.content_hash = source.hash(item.id);
    items.push_back(std::move(item));
  }
  logger_->clear_status();
  return items;
}

bool ItemCatalog::set_label(ItemSource& source, const CatalogItem& item, const std::string& label) {
  try {
    source.set_label(item.id, label);
    return true;
  } catch(const std::exception& e) {
    logger_->error("\t= Setting label '{}' on {} failed: {}", label, item.name, e.what());
    return false;
  }
}

std::vector<CatalogItem> ItemCatalog::load_cache() const {
  std::ifstream in(options_.cache_file);
  if(!in) return {};
  try {
    nlohmann::json doc;
    in >> doc;
    if(doc.value("version", 0) != kCacheVersion) {
      logger_->warn("Ignoring cache {}: unsupported version", options_.cache_file.string());
      return {};
    }
    const auto& items = doc.at("items");
    if(sha256_hex(items.dump()) != doc.at("checksum").get<std::string>()) {
      logger_->warn("Ignoring cache {}: checksum mismatch", options_.cache_file.string());
      return {};
    }
    std::vector<CatalogItem> out;
    out.reserve(items.size());
    for(const auto& entry : items) {
      out.push_back(item_from_json(entry));
    }
    return out;
  } catch(const std::exception& e) {
    logger_->warn("Ignoring cache {}: {}", options_.cache_file.string(), e.what());
    return {};
  }
}

bool ItemCatalog::save_cache(const std::vector<CatalogItem>& items) const {
  nlohmann::json array = nlohmann::json::array();
  for(const auto& item : items) array.push_back(item_to_json(item));

  nlohmann::json doc = {
    {"version", kCacheVersion},
    {"checksum", sha256_hex(array.dump())},
    {"items", array}
  };

  std::error_code ec;
  if(options_.cache_file.has_parent_path()) {
    std::filesystem::create_directories(options_.cache_file.parent_path(), ec);
  }
  auto staging = options_.cache_file;
  staging += ".tmp";
  {
    std::ofstream out(staging, std::ios::trunc);
    if(!out) {
      logger_->error("Unable to write cache {}", staging.string());
      return false;
    }
    out << doc.dump(2);
    if(!out) {
      logger_->error("Unable to write cache {}", staging.string());
      return false;
    }
  }
  std::filesystem::rename(staging, options_.cache_file, ec);
  if(ec) {
    logger_->error("Unable to replace cache {}: {}", options_.cache_file.string(), ec.message());
    return false;
  }
  return true;
}
