#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "admission_filter.hpp"
#include "log.hpp"
#include "ownership_normalizer.hpp"
#include "remote_file_source.hpp"

enum class TransferStatus {
  Downloaded,
  Skipped,
  AlreadyExists
};

struct TransferOutcome {
  TransferStatus status = TransferStatus::Downloaded;
  std::optional<SkipReason> reason; // set when Skipped
  uint64_t bytes = 0;
};

struct TransferProgress {
  uint64_t transferred = 0;
  uint64_t declared = 0;
  double percent = 0.0;              // clamped to [0, 100]
  double elapsed_seconds = 0.0;
  std::optional<double> eta_seconds; // empty while nothing has arrived
};

TransferProgress make_progress(uint64_t transferred, uint64_t declared, double elapsed_seconds);

// "Downloaded 1.00 MB/4.00 MB (25.00%) ETA: 00:00:03"
std::string describe_progress(const TransferProgress& progress);

// Fetches one remote file into a staging path and publishes it with a rename.
class TransferEngine {
public:
  using ProgressCallback = std::function<void(const TransferProgress&)>;

  TransferEngine(const AdmissionFilter& filter,
                 const OwnershipNormalizer& normalizer,
                 std::shared_ptr<Logger> logger);

  // Replaces the default in-place status line.
  void set_progress_callback(ProgressCallback callback);
  void set_progress_interval(std::chrono::milliseconds interval) { progress_interval_ = interval; }

  // Throws TransferFailure when the file cannot be fetched or published. The
  // destination is never touched before the staging file is complete.
  TransferOutcome transfer(RemoteFileSession& session,
                           const std::string& remote_path,
                           const std::filesystem::path& local_path,
                           const std::filesystem::path& temp_path,
                           bool overwrite);

private:
  void publish(const std::string& remote_path,
               const std::filesystem::path& temp_path,
               const std::filesystem::path& local_path);
  void discard(const std::filesystem::path& path);
  void ensure_directory(const std::string& remote_path,
                        const std::filesystem::path& dir,
                        bool normalize_created);

  const AdmissionFilter& filter_;
  const OwnershipNormalizer& normalizer_;
  std::shared_ptr<Logger> logger_;
  ProgressCallback progress_;
  std::chrono::milliseconds progress_interval_{200};
};
