#include "transfer_engine.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <system_error>

#include "errors.hpp"
#include "utils.hpp"

TransferProgress make_progress(uint64_t transferred, uint64_t declared, double elapsed_seconds) {
  TransferProgress p;
  p.transferred = transferred;
  p.declared = declared;
  p.elapsed_seconds = elapsed_seconds;
  if(declared == 0) {
    p.percent = transferred > 0 ? 100.0 : 0.0;
  } else {
    p.percent = std::min(100.0, 100.0 * static_cast<double>(transferred) / static_cast<double>(declared));
  }
  if(transferred > 0) {
    double eta = elapsed_seconds * (static_cast<double>(declared) / static_cast<double>(transferred)) - elapsed_seconds;
    p.eta_seconds = std::max(0.0, eta);
  }
  return p;
}

std::string describe_progress(const TransferProgress& progress) {
  return fmt::format("Downloaded {}/{} ({:.2f}%) ETA: {}",
                     format_size(progress.transferred),
                     format_size(progress.declared),
                     progress.percent,
                     progress.eta_seconds ? format_hms(*progress.eta_seconds) : std::string("unknown"));
}

TransferEngine::TransferEngine(const AdmissionFilter& filter,
                               const OwnershipNormalizer& normalizer,
                               std::shared_ptr<Logger> logger)
  : filter_(filter), normalizer_(normalizer), logger_(std::move(logger)) {
  progress_ = [this](const TransferProgress& p){
    logger_->status(describe_progress(p));
  };
}

void TransferEngine::set_progress_callback(ProgressCallback callback) {
  progress_ = std::move(callback);
}

TransferOutcome TransferEngine::transfer(RemoteFileSession& session,
                                         const std::string& remote_path,
                                         const std::filesystem::path& local_path,
                                         const std::filesystem::path& temp_path,
                                         bool overwrite) {
  const auto column = pad_name(remote_basename(remote_path));
  std::error_code ec;

  if(!overwrite && std::filesystem::exists(local_path, ec)) {
    logger_->debug("Already exists: {}", local_path.string());
    normalizer_.normalize(local_path);
    logger_->info("\t+ {} [EXISTS]", column);
    return {TransferStatus::AlreadyExists, std::nullopt, 0};
  }

  uint64_t declared = 0;
  try {
    declared = session.size(remote_path);
  } catch(const RemoteError& e) {
    throw TransferFailure(remote_path, e.what());
  }

  auto admission = filter_.admit(remote_path, declared);
  if(!admission.accepted()) {
    logger_->warn("\t- {} [SKIPPED: {}]", column, skip_reason_label(*admission.rejected));
    return {TransferStatus::Skipped, admission.rejected, 0};
  }
  logger_->info("\t+ {} [OK]", column);

  ensure_directory(remote_path, temp_path.parent_path(), false);
  logger_->debug("Downloading file {} to {}", remote_path, temp_path.string());

  uint64_t transferred = 0;
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if(!out) {
      throw TransferFailure(remote_path, "cannot open " + temp_path.string());
    }

    const auto start = std::chrono::steady_clock::now();
    auto next_report = start;
    auto elapsed = [&start]{
      return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    try {
      session.read(remote_path, [&](const char* data, std::size_t length){
        out.write(data, static_cast<std::streamsize>(length));
        if(!out) return false;
        transferred += length;
        auto now = std::chrono::steady_clock::now();
        if(progress_ && now >= next_report) {
          progress_(make_progress(transferred, declared, elapsed()));
          next_report = now + progress_interval_;
        }
        return true;
      });
    } catch(const RemoteError& e) {
      logger_->clear_status();
      throw TransferFailure(remote_path, e.what());
    }

    out.flush();
    if(!out) {
      logger_->clear_status();
      throw TransferFailure(remote_path, "write to " + temp_path.string() + " failed");
    }
    if(progress_) progress_(make_progress(transferred, declared, elapsed()));
  }
  logger_->clear_status();

  if(transferred != declared) {
    logger_->warn("{}: received {} bytes, server declared {}", remote_path, transferred, declared);
  }

  ensure_directory(remote_path, local_path.parent_path(), true);
  publish(remote_path, temp_path, local_path);
  logger_->debug("Moved to: {}", local_path.string());

  normalizer_.normalize(local_path);
  return {TransferStatus::Downloaded, std::nullopt, transferred};
}

void TransferEngine::ensure_directory(const std::string& remote_path,
                                      const std::filesystem::path& dir,
                                      bool normalize_created) {
  if(dir.empty()) return;
  std::error_code ec;
  if(std::filesystem::is_directory(dir, ec)) return;

  // Topmost ancestor that does not exist yet.
  auto created_root = dir;
  while(created_root.has_parent_path() && created_root.parent_path() != created_root &&
        !std::filesystem::exists(created_root.parent_path(), ec)) {
    created_root = created_root.parent_path();
  }

  std::filesystem::create_directories(dir, ec);
  if(ec) {
    throw TransferFailure(remote_path, "cannot create " + dir.string() + ": " + ec.message());
  }
  logger_->debug("Created directory: {}", dir.string());
  if(normalize_created) normalizer_.normalize(created_root);
}

void TransferEngine::discard(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if(ec) logger_->warn("Unable to remove {}: {}", path.string(), ec.message());
}

void TransferEngine::publish(const std::string& remote_path,
                             const std::filesystem::path& temp_path,
                             const std::filesystem::path& local_path) {
  std::error_code ec;
  std::filesystem::rename(temp_path, local_path, ec);
  if(!ec) return;
  if(ec != std::errc::cross_device_link) {
    throw TransferFailure(remote_path, "rename to " + local_path.string() + " failed: " + ec.message());
  }

  logger_->warn("{} and {} are on different filesystems; publishing by copy, the rename is no longer atomic",
                temp_path.parent_path().string(), local_path.parent_path().string());

  // Copy next to the destination, verify, then rename within the destination filesystem.
  auto partial = local_path;
  partial += ".partial";
  std::filesystem::copy_file(temp_path, partial, std::filesystem::copy_options::overwrite_existing, ec);
  if(ec) {
    discard(partial);
    throw TransferFailure(remote_path, "copy to " + partial.string() + " failed: " + ec.message());
  }
  auto expected = std::filesystem::file_size(temp_path, ec);
  auto copied = ec ? 0 : std::filesystem::file_size(partial, ec);
  if(ec || copied != expected) {
    discard(partial);
    throw TransferFailure(remote_path, "copy verification failed for " + partial.string());
  }
  std::filesystem::rename(partial, local_path, ec);
  if(ec) {
    throw TransferFailure(remote_path, "rename to " + local_path.string() + " failed: " + ec.message());
  }
  discard(temp_path);
}
