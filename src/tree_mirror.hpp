#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <set>
#include <string>

#include "log.hpp"
#include "remote_file_source.hpp"
#include "transfer_engine.hpp"

struct MirrorReport {
  std::size_t downloaded = 0;
  std::size_t skipped = 0;
  std::size_t existing = 0;
  std::size_t failed = 0;
  uint64_t bytes = 0;
};

// Recursively copies a remote tree into local_root through temp_root, one
// remote session per call.
class TreeMirror {
public:
  static constexpr std::size_t kMaxDepth = 64;

  TreeMirror(RemoteFileSource& source, TransferEngine& engine, std::shared_ptr<Logger> logger);

  // Throws MirrorFailure when any file failed or a listing broke, and
  // ConfigurationFatal when no session can be opened.
  MirrorReport mirror(const std::string& remote_root,
                      const std::filesystem::path& local_root,
                      const std::filesystem::path& temp_root,
                      bool overwrite);

private:
  struct Walk {
    RemoteFileSession& session;
    bool overwrite;
    MirrorReport report;
    std::set<std::string> visited;
  };

  void walk_directory(Walk& walk,
                      const std::string& remote_dir,
                      const std::vector<RemoteEntry>& entries,
                      const std::filesystem::path& local_dir,
                      const std::filesystem::path& temp_dir,
                      std::size_t depth);
  void transfer_file(Walk& walk,
                     const std::string& remote_path,
                     const std::filesystem::path& local_path,
                     const std::filesystem::path& temp_path);
  static void ensure_directory(const std::string& remote_root, const std::filesystem::path& dir);

  RemoteFileSource& source_;
  TransferEngine& engine_;
  std::shared_ptr<Logger> logger_;
};

// Collapses repeated and trailing slashes so loops are detected by path.
std::string normalize_remote_path(const std::string& path);
