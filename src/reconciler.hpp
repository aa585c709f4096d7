#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "actions.hpp"
#include "app_config.hpp"
#include "item_catalog.hpp"
#include "item_source.hpp"
#include "log.hpp"
#include "remote_file_source.hpp"

struct ReconcileOptions {
  bool dry_run = false;
  bool overwrite = false;
};

struct RunSummary {
  std::size_t discovered = 0;
  std::size_t eligible = 0;
  std::size_t mirrored = 0;
  std::size_t failed = 0;
  std::size_t labels_set = 0;
  std::size_t actions_failed = 0;
  bool from_cache = false;
};

bool is_eligible(const CatalogItem& item,
                 const std::string& completed_label,
                 const std::map<std::string, LabelMapping>& mapping);

// Descending priority (unset sorts last), then label, then name.
void sort_for_display(std::vector<CatalogItem>& items,
                      const std::map<std::string, LabelMapping>& mapping);

// The item directory when it already contains the item name (multi-file
// torrents), otherwise directory/name. A plain substring test.
std::string source_path(const CatalogItem& item);

std::filesystem::path destination_path(const CatalogItem& item,
                                       const std::filesystem::path& root,
                                       const LabelMapping& mapping);

// Staging counterpart of destination_path under the temp root.
std::filesystem::path staging_path(const CatalogItem& item,
                                   const std::filesystem::path& temp,
                                   const LabelMapping& mapping);

// One poll: snapshot the catalog, mirror every eligible item, then mark it and
// run its actions. Items fail independently.
class Reconciler {
public:
  Reconciler(const AppConfig& config,
             ItemSource& items,
             RemoteFileSource& files,
             const ActionRegistry& actions,
             std::shared_ptr<Logger> logger,
             ReconcileOptions options = {});

  // Throws ConfigurationFatal when the library root is missing or the file
  // server can never be reached.
  RunSummary run_once();

private:
  void display(const std::vector<CatalogItem>& items) const;
  // Label update and actions after a successful (or simulated) mirror.
  void finish(const CatalogItem& item,
              const LabelMapping& mapping,
              bool from_cache,
              RunSummary& summary);

  const AppConfig& config_;
  ItemSource& items_;
  RemoteFileSource& files_;
  const ActionRegistry& actions_;
  std::shared_ptr<Logger> logger_;
  ReconcileOptions options_;
  ItemCatalog catalog_;
};
