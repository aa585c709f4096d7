#pragma once

#include "actions.hpp"
#include "errors.hpp"
#include "item_catalog.hpp"
#include "item_source.hpp"
#include "log.hpp"
#include "remote_file_source.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace downloadarr::test {

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline void write_json(const std::filesystem::path& path, const nlohmann::json& content) {
  write_file(path, content.dump(2));
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
  explicit ScratchDir(const std::string& name)
    : root_(std::filesystem::temp_directory_path() / "downloadarr_test_runner" / name) {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
  }

  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path operator/(const std::string& rel) const { return root_ / rel; }

private:
  std::filesystem::path root_;
};

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this](void*,
             const std::string& channel,
             spdlog::level::level_enum,
             const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.emplace_back(channel + ": " + message);
        return false;
      },
      nullptr);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    for(auto& attachment : attachments_) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
    attachments_.clear();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::vector<Attachment> attachments_;
};

// In-memory torrent client.
class FakeItemSource : public ItemSource {
public:
  std::vector<CatalogItem> items;
  std::vector<std::pair<std::string, std::string>> label_calls;
  std::set<std::string> refuse_label_for;
  std::size_t list_calls = 0;
  bool fail_listing = false;

  std::vector<std::string> list_ids(const std::string&) override {
    list_calls++;
    if(fail_listing) throw RemoteError("connection refused");
    std::vector<std::string> ids;
    for(const auto& item : items) ids.push_back(item.id);
    return ids;
  }

  std::string name(const std::string& id) override { return find(id).name; }
  std::string label(const std::string& id) override { return find(id).label; }
  bool is_complete(const std::string& id) override { return find(id).is_completed; }
  std::string directory(const std::string& id) override { return find(id).remote_directory; }
  std::string hash(const std::string& id) override { return find(id).content_hash; }

  void set_label(const std::string& id, const std::string& label) override {
    if(refuse_label_for.count(id)) throw RemoteError("fault: label refused");
    label_calls.emplace_back(id, label);
  }

  std::string describe() const override { return "fake://items"; }

private:
  const CatalogItem& find(const std::string& id) const {
    for(const auto& item : items) {
      if(item.id == id) return item;
    }
    throw RemoteError("unknown id " + id);
  }
};

// In-memory file server. Directories are implied by file paths and by
// add_directory(); anything else cannot be listed.
class FakeFileSource : public RemoteFileSource {
public:
  struct Counters {
    std::size_t sessions_opened = 0;
    std::size_t sessions_open = 0;
    std::map<std::string, std::size_t> body_reads;
    std::size_t list_calls = 0;
  };

  void add_file(const std::string& path, const std::string& content) {
    files_[path] = content;
    auto parent = path.substr(0, path.find_last_of('/'));
    while(!parent.empty()) {
      directories_.insert(parent);
      auto pos = parent.find_last_of('/');
      if(pos == std::string::npos || pos == 0) break;
      parent = parent.substr(0, pos);
    }
  }

  void add_directory(const std::string& path) { directories_.insert(path); }

  // Breaks the stream of path after bytes have been delivered.
  void fail_read_after(const std::string& path, std::size_t bytes) { fail_after_[path] = bytes; }
  void fail_listing(const std::string& path) { broken_listings_.insert(path); }
  void fail_open_with(std::function<void()> thrower) { open_failure_ = std::move(thrower); }

  std::size_t chunk_size = 4;
  Counters counters;

  std::unique_ptr<RemoteFileSession> open_session() override {
    if(open_failure_) open_failure_();
    counters.sessions_opened++;
    counters.sessions_open++;
    return std::make_unique<Session>(*this);
  }

  std::string describe() const override { return "fake://files"; }

private:
  class Session : public RemoteFileSession {
  public:
    explicit Session(FakeFileSource& owner) : owner_(owner) {}
    ~Session() override { owner_.counters.sessions_open--; }

    std::vector<RemoteEntry> list(const std::string& path) override {
      owner_.counters.list_calls++;
      if(owner_.broken_listings_.count(path)) throw RemoteError("421 service not available");
      if(!owner_.directories_.count(path)) throw ListingRefused(path);
      std::vector<RemoteEntry> out;
      const std::string prefix = path + "/";
      for(const auto& dir : owner_.directories_) {
        if(is_child(prefix, dir)) {
          RemoteEntry entry;
          entry.path = dir;
          entry.name = dir.substr(prefix.size());
          entry.kind = RemoteEntry::Kind::Directory;
          out.push_back(entry);
        }
      }
      for(const auto& file : owner_.files_) {
        if(is_child(prefix, file.first)) {
          RemoteEntry entry;
          entry.path = file.first;
          entry.name = file.first.substr(prefix.size());
          entry.size = file.second.size();
          out.push_back(entry);
        }
      }
      return out;
    }

    uint64_t size(const std::string& path) override {
      auto it = owner_.files_.find(path);
      if(it == owner_.files_.end()) throw RemoteError("550 " + path + ": no such file");
      return it->second.size();
    }

    void read(const std::string& path, const ChunkSink& sink) override {
      owner_.counters.body_reads[path]++;
      auto it = owner_.files_.find(path);
      if(it == owner_.files_.end()) throw RemoteError("550 " + path + ": no such file");
      const auto& body = it->second;
      auto limit = owner_.fail_after_.find(path);
      for(std::size_t offset = 0; offset < body.size(); offset += owner_.chunk_size) {
        if(limit != owner_.fail_after_.end() && offset >= limit->second) {
          throw RemoteError("426 connection closed; transfer aborted");
        }
        auto length = std::min(owner_.chunk_size, body.size() - offset);
        if(!sink(body.data() + offset, length)) throw RemoteError("local write aborted");
      }
    }

  private:
    static bool is_child(const std::string& prefix, const std::string& candidate) {
      return candidate.size() > prefix.size() &&
             candidate.compare(0, prefix.size(), prefix) == 0 &&
             candidate.find('/', prefix.size()) == std::string::npos;
    }

    FakeFileSource& owner_;
  };

  std::map<std::string, std::string> files_;
  std::set<std::string> directories_;
  std::map<std::string, std::size_t> fail_after_;
  std::set<std::string> broken_listings_;
  std::function<void()> open_failure_;
};

class FakeImportTrigger : public ImportTrigger {
public:
  std::vector<std::pair<std::string, std::string>> calls;
  bool fail = false;

  void notify(const std::string& base_path, const std::string& item_path) override {
    if(fail) throw RemoteError("HTTP 500");
    calls.emplace_back(base_path, item_path);
  }
};

} // namespace downloadarr::test
