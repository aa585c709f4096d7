#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "actions.hpp"
#include "app_config.hpp"
#include "item_source.hpp"
#include "log.hpp"
#include "reconciler.hpp"
#include "remote_file_source.hpp"

class SettingsManager;

// Re-reads the configuration, reconciles once, then counts down to the next
// poll. SIGINT/SIGTERM end the loop.
class PollEngine {
public:
  struct Options {
    std::filesystem::path config_path = "config.json";
    bool dry_run = false;
    bool one_shot = false;
    bool debug = false;
    bool overwrite = false;
    std::optional<uint64_t> min_file_size;
    std::optional<uint64_t> max_file_size;
  };

  static Options options_from_settings(const SettingsManager& settings);

  using ItemSourceFactory = std::function<std::unique_ptr<ItemSource>(const AppConfig&)>;
  using FileSourceFactory = std::function<std::unique_ptr<RemoteFileSource>(const AppConfig&)>;
  using TriggerFactory = std::function<void(const AppConfig&, ActionRegistry&)>;

  explicit PollEngine(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~PollEngine();

  // Defaults talk to rTorrent, FTP and the *arr APIs.
  void set_item_source_factory(ItemSourceFactory factory) { item_factory_ = std::move(factory); }
  void set_file_source_factory(FileSourceFactory factory) { file_factory_ = std::move(factory); }
  void set_trigger_factory(TriggerFactory factory) { trigger_factory_ = std::move(factory); }

  // Throws ConfigurationFatal (and ConfigError) for run-level failures.
  RunSummary run_once();

  // Blocks until one-shot completion, a signal, or a run-level failure
  // (rethrown to the caller).
  void run();
  void stop();

  std::shared_ptr<Logger> logger() const { return logger_; }
  const Options& options() const { return options_; }

private:
  AppConfig load_config() const;
  void poll();
  // SIGINT/SIGTERM are handled only while waiting between runs; during a run
  // they keep their default action and end the process.
  void arm_signals();
  void disarm_signals();
  void schedule_tick();
  void draw_countdown() const;

  Options options_;
  std::shared_ptr<Logger> logger_;
  ItemSourceFactory item_factory_;
  FileSourceFactory file_factory_;
  TriggerFactory trigger_factory_;

  asio::io_context io_;
  std::unique_ptr<asio::signal_set> signals_;
  std::unique_ptr<asio::steady_timer> timer_;
  std::chrono::seconds wait_total_{0};
  std::chrono::seconds wait_left_{0};
};
