#include "tree_mirror.hpp"

#include "errors.hpp"

std::string normalize_remote_path(const std::string& path) {
  std::string out;
  out.reserve(path.size());
  for(char c : path) {
    if(c == '/' && !out.empty() && out.back() == '/') continue;
    out += c;
  }
  while(out.size() > 1 && out.back() == '/') out.pop_back();
  return out;
}

TreeMirror::TreeMirror(RemoteFileSource& source, TransferEngine& engine, std::shared_ptr<Logger> logger)
  : source_(source), engine_(engine), logger_(std::move(logger)) {}

MirrorReport TreeMirror::mirror(const std::string& remote_root,
                                const std::filesystem::path& local_root,
                                const std::filesystem::path& temp_root,
                                bool overwrite) {
  std::unique_ptr<RemoteFileSession> session;
  try {
    session = source_.open_session();
  } catch(const RemoteError& e) {
    throw MirrorFailure(remote_root, e.what());
  }

  Walk walk{*session, overwrite, {}, {}};

  std::vector<RemoteEntry> entries;
  bool is_directory = true;
  try {
    entries = session->list(remote_root);
    logger_->debug("Found {} items in {}", entries.size(), remote_root);
  } catch(const ListingRefused&) {
    is_directory = false;
  } catch(const RemoteError& e) {
    throw MirrorFailure(remote_root, e.what());
  }

  if(is_directory) {
    walk.visited.insert(normalize_remote_path(remote_root));
    walk_directory(walk, remote_root, entries, local_root, temp_root, 0);
  } else {
    const auto name = remote_basename(remote_root);
    transfer_file(walk, remote_root, local_root / name, temp_root / name);
  }

  if(walk.report.failed > 0) {
    throw MirrorFailure(remote_root,
                        std::to_string(walk.report.failed) + " file(s) failed",
                        walk.report.failed);
  }
  return walk.report;
}

void TreeMirror::walk_directory(Walk& walk,
                                const std::string& remote_dir,
                                const std::vector<RemoteEntry>& entries,
                                const std::filesystem::path& local_dir,
                                const std::filesystem::path& temp_dir,
                                std::size_t depth) {
  for(const auto& entry : entries) {
    const auto local_path = local_dir / entry.name;
    const auto temp_path = temp_dir / entry.name;

    if(!entry.is_directory()) {
      transfer_file(walk, entry.path, local_path, temp_path);
      continue;
    }

    if(depth + 1 >= kMaxDepth) {
      throw MirrorFailure(remote_dir, "directory depth exceeds " + std::to_string(kMaxDepth));
    }
    if(!walk.visited.insert(normalize_remote_path(entry.path)).second) {
      logger_->warn("Skipping {}: already visited", entry.path);
      continue;
    }

    ensure_directory(entry.path, local_path);
    ensure_directory(entry.path, temp_path);

    std::vector<RemoteEntry> children;
    try {
      children = walk.session.list(entry.path);
      logger_->debug("Found {} items in {}", children.size(), entry.path);
    } catch(const RemoteError& e) {
      throw MirrorFailure(entry.path, e.what());
    }
    walk_directory(walk, entry.path, children, local_path, temp_path, depth + 1);
  }
}

void TreeMirror::transfer_file(Walk& walk,
                               const std::string& remote_path,
                               const std::filesystem::path& local_path,
                               const std::filesystem::path& temp_path) {
  try {
    auto outcome = engine_.transfer(walk.session, remote_path, local_path, temp_path, walk.overwrite);
    switch(outcome.status) {
      case TransferStatus::Downloaded:
        walk.report.downloaded++;
        walk.report.bytes += outcome.bytes;
        break;
      case TransferStatus::Skipped:
        walk.report.skipped++;
        break;
      case TransferStatus::AlreadyExists:
        walk.report.existing++;
        break;
    }
  } catch(const TransferFailure& e) {
    walk.report.failed++;
    logger_->error("\t! {}", e.what());
  }
}

void TreeMirror::ensure_directory(const std::string& remote_root, const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if(ec) {
    throw MirrorFailure(remote_root, "cannot create " + dir.string() + ": " + ec.message());
  }
}
