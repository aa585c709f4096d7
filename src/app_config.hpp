#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "actions.hpp"
#include "admission_filter.hpp"
#include "ftp_file_source.hpp"
#include "item_catalog.hpp"
#include "ownership_normalizer.hpp"
#include "rtorrent_client.hpp"

struct LabelMapping {
  std::string destination_subpath;
  std::optional<int> priority;
  std::vector<Action> actions;
};

struct CompletedPolicy {
  std::string label = "completed";
  bool change_label = true;
};

// One run's worth of configuration. Built from config.json and never
// modified while the run is in progress.
struct AppConfig {
  FtpConfig ftp;
  RTorrentConfig rtorrent;
  CatalogOptions catalog;
  std::chrono::seconds recheck_time{120};

  std::filesystem::path root;
  std::filesystem::path temp;
  CompletedPolicy completed;
  PermissionPolicy permissions;
  std::map<std::string, LabelMapping> label_mapping;

  TransferRule rules;

  std::optional<ArrEndpoint> radarr;
  std::optional<ArrEndpoint> sonarr;

  std::string log_severity = "INFO";
};

// Throws ConfigError naming the offending key.
AppConfig parse_app_config(const nlohmann::json& doc);
AppConfig load_app_config(const std::filesystem::path& path);
