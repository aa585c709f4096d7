#include "poll_engine.hpp"

#include <algorithm>
#include <csignal>

#include "ftp_file_source.hpp"
#include "rtorrent_client.hpp"
#include "settings_manager.hpp"

namespace {

constexpr std::size_t kCountdownBarWidth = 80;

std::optional<uint64_t> size_override(const SettingsManager& settings, const std::string& key) {
  auto value = settings.get<int64_t>(key);
  if(value < 0) return std::nullopt;
  return static_cast<uint64_t>(value);
}

} // namespace

PollEngine::Options PollEngine::options_from_settings(const SettingsManager& settings) {
  Options options;
  options.config_path = settings.get<std::string>("config");
  options.dry_run = settings.get<bool>("dry_run");
  options.one_shot = settings.get<bool>("one_shot");
  options.debug = settings.get<bool>("debug");
  options.overwrite = settings.get<bool>("overwrite");
  options.min_file_size = size_override(settings, "min_file_size");
  options.max_file_size = size_override(settings, "max_file_size");
  return options;
}

PollEngine::PollEngine(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>()) {
  item_factory_ = [this](const AppConfig& config) -> std::unique_ptr<ItemSource> {
    return std::make_unique<RTorrentClient>(config.rtorrent, logger_);
  };
  file_factory_ = [this](const AppConfig& config) -> std::unique_ptr<RemoteFileSource> {
    return std::make_unique<FtpFileSource>(config.ftp, logger_);
  };
  trigger_factory_ = [this](const AppConfig& config, ActionRegistry& registry) {
    if(config.radarr) {
      registry.register_trigger(ActionKind::NotifyRadarr,
        std::make_shared<ArrImportTrigger>(*config.radarr, "DownloadedMoviesScan", logger_));
    }
    if(config.sonarr) {
      registry.register_trigger(ActionKind::NotifySonarr,
        std::make_shared<ArrImportTrigger>(*config.sonarr, "DownloadedEpisodesScan", logger_));
    }
  };
}

PollEngine::~PollEngine() {
  stop();
}

AppConfig PollEngine::load_config() const {
  auto config = load_app_config(options_.config_path);
  if(options_.min_file_size) config.rules.min_size = *options_.min_file_size;
  if(options_.max_file_size) config.rules.max_size = *options_.max_file_size;
  return config;
}

RunSummary PollEngine::run_once() {
  const auto config = load_config();
  init(options_.debug ? spdlog::level::debug : level_from_name(config.log_severity));
  if(options_.dry_run) logger_->warn("Dry run: nothing will be downloaded, labelled or imported");

  auto items = item_factory_(config);
  auto files = file_factory_(config);
  ActionRegistry registry(logger_);
  trigger_factory_(config, registry);

  ReconcileOptions reconcile;
  reconcile.dry_run = options_.dry_run;
  reconcile.overwrite = options_.overwrite;

  Reconciler reconciler(config, *items, *files, registry, logger_, reconcile);
  auto summary = reconciler.run_once();
  logger_->debug("Run finished: {} items, {} eligible, {} mirrored, {} failed",
                 summary.discovered, summary.eligible, summary.mirrored, summary.failed);

  wait_total_ = config.recheck_time;
  return summary;
}

void PollEngine::run() {
  asio::post(io_, [this]{ poll(); });
  io_.run();
}

void PollEngine::arm_signals() {
  if(signals_) return;
  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
  signals_->async_wait([this](const std::error_code& ec, int signal_number){
    if(ec) return;
    logger_->clear_status();
    logger_->info("Received signal {}, exiting", signal_number);
    stop();
  });
}

void PollEngine::disarm_signals() {
  if(!signals_) return;
  std::error_code ec;
  signals_->cancel(ec);
  signals_->clear(ec);
  signals_.reset();
}

void PollEngine::stop() {
  if(timer_) {
    std::error_code ec;
    timer_->cancel(ec);
  }
  disarm_signals();
  io_.stop();
}

void PollEngine::poll() {
  disarm_signals();
  run_once();
  if(options_.one_shot) {
    stop();
    return;
  }
  arm_signals();
  wait_left_ = wait_total_;
  if(!timer_) timer_ = std::make_unique<asio::steady_timer>(io_);
  schedule_tick();
}

void PollEngine::schedule_tick() {
  timer_->expires_after(std::chrono::seconds(1));
  timer_->async_wait([this](const std::error_code& ec){
    if(ec) return;
    if(wait_left_.count() > 0) wait_left_ -= std::chrono::seconds(1);
    if(wait_left_.count() <= 0) {
      logger_->clear_status();
      poll();
      return;
    }
    draw_countdown();
    schedule_tick();
  });
}

void PollEngine::draw_countdown() const {
  const auto total = std::max<long long>(1, wait_total_.count());
  const auto done = total - wait_left_.count();
  const auto filled = static_cast<std::size_t>(static_cast<long long>(kCountdownBarWidth) * done / total);
  std::string bar(filled, '#');
  bar.append(kCountdownBarWidth - filled, '-');
  logger_->status(fmt::format("Wait {:>3}s for next check |{}| {:.1f}%",
                              wait_left_.count(), bar, 100.0 * done / total));
}
