#include "reconciler.hpp"

#include <algorithm>
#include <climits>
#include <tuple>

#include "errors.hpp"
#include "ownership_normalizer.hpp"
#include "transfer_engine.hpp"
#include "tree_mirror.hpp"

namespace {

int display_priority(const CatalogItem& item, const std::map<std::string, LabelMapping>& mapping) {
  auto it = mapping.find(item.label);
  if(it == mapping.end() || !it->second.priority) return INT_MIN;
  return *it->second.priority;
}

} // namespace

bool is_eligible(const CatalogItem& item,
                 const std::string& completed_label,
                 const std::map<std::string, LabelMapping>& mapping) {
  return item.is_completed &&
         item.label != completed_label &&
         mapping.count(item.label) > 0;
}

void sort_for_display(std::vector<CatalogItem>& items,
                      const std::map<std::string, LabelMapping>& mapping) {
  std::stable_sort(items.begin(), items.end(), [&](const CatalogItem& a, const CatalogItem& b){
    auto pa = display_priority(a, mapping);
    auto pb = display_priority(b, mapping);
    return std::tie(pb, a.label, a.name) < std::tie(pa, b.label, b.name);
  });
}

std::string source_path(const CatalogItem& item) {
  if(item.remote_directory.find(item.name) != std::string::npos) {
    return item.remote_directory;
  }
  return item.remote_directory + "/" + item.name;
}

std::filesystem::path destination_path(const CatalogItem& item,
                                       const std::filesystem::path& root,
                                       const LabelMapping& mapping) {
  return root / mapping.destination_subpath / item.name;
}

std::filesystem::path staging_path(const CatalogItem& item,
                                   const std::filesystem::path& temp,
                                   const LabelMapping& mapping) {
  return temp / mapping.destination_subpath / item.name;
}

Reconciler::Reconciler(const AppConfig& config,
                       ItemSource& items,
                       RemoteFileSource& files,
                       const ActionRegistry& actions,
                       std::shared_ptr<Logger> logger,
                       ReconcileOptions options)
  : config_(config),
    items_(items),
    files_(files),
    actions_(actions),
    logger_(std::move(logger)),
    options_(options),
    catalog_(config.catalog, logger_) {}

RunSummary Reconciler::run_once() {
  RunSummary summary;
  auto snapshot = catalog_.snapshot(items_);
  summary.discovered = snapshot.items.size();
  summary.from_cache = snapshot.from_cache;

  sort_for_display(snapshot.items, config_.label_mapping);
  display(snapshot.items);

  AdmissionFilter filter(config_.rules);
  OwnershipNormalizer normalizer(config_.permissions, logger_);
  TransferEngine engine(filter, normalizer, logger_);
  TreeMirror mirror(files_, engine, logger_);

  for(const auto& item : snapshot.items) {
    if(!is_eligible(item, config_.completed.label, config_.label_mapping)) continue;
    summary.eligible++;

    const auto& mapping = config_.label_mapping.at(item.label);
    logger_->info("{}", std::string(100, '-'));

    std::error_code ec;
    if(!std::filesystem::is_directory(config_.root, ec)) {
      logger_->critical("No root directory: {}", config_.root.string());
      throw ConfigurationFatal("library root " + config_.root.string() + " does not exist");
    }

    const auto source = source_path(item);
    const auto destination = destination_path(item, config_.root, mapping);
    const auto staging = staging_path(item, config_.temp, mapping);
    logger_->debug("Destination: {}", destination.string());
    logger_->info("=> {} ({})", item.name, item.label);

    if(options_.dry_run) {
      logger_->info("\t~ [dry run] mirror {} -> {} via {}", source, destination.string(), staging.string());
      finish(item, mapping, snapshot.from_cache, summary);
      continue;
    }

    try {
      auto report = mirror.mirror(source, destination, staging, options_.overwrite);
      logger_->debug("{}: {} downloaded, {} existing, {} skipped",
                     item.name, report.downloaded, report.existing, report.skipped);
    } catch(const ConfigurationFatal&) {
      throw;
    } catch(const std::runtime_error& e) {
      summary.failed++;
      logger_->error("\t! Mirror of {} failed: {}", item.name, e.what());
      continue;
    }
    summary.mirrored++;

    if(std::filesystem::exists(destination, ec)) {
      normalizer.normalize(destination);
    }
    finish(item, mapping, snapshot.from_cache, summary);
  }
  return summary;
}

void Reconciler::display(const std::vector<CatalogItem>& items) const {
  for(const auto& item : items) {
    if(item.is_completed) {
      logger_->info("[{:<15}] {}", item.label, item.name);
    } else {
      logger_->warn("[{:<14}*] {}", item.label, item.name);
    }
  }
}

void Reconciler::finish(const CatalogItem& item,
                        const LabelMapping& mapping,
                        bool from_cache,
                        RunSummary& summary) {
  if(!config_.completed.change_label) {
    logger_->warn("\t= Skipping setting label");
  } else if(from_cache) {
    logger_->error("\t= Cannot set label when caching is on");
  } else if(options_.dry_run) {
    logger_->info("\t~ [dry run] set label '{}' on {}", config_.completed.label, item.name);
  } else {
    logger_->info("\t= Setting label on {}", item.name);
    if(catalog_.set_label(items_, item, config_.completed.label)) summary.labels_set++;
  }

  for(const auto& action : mapping.actions) {
    if(options_.dry_run) {
      logger_->info("\t~ [dry run] {} at {}", action_kind_name(action.kind), import_path(action.base_path, item.name));
      continue;
    }
    if(!actions_.run(action, item.name)) summary.actions_failed++;
  }
}
