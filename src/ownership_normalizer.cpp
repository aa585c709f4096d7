#include "ownership_normalizer.hpp"

#include <grp.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace {

std::string mode_string(std::filesystem::perms mode) {
  return fmt::format("{:o}", static_cast<unsigned>(mode));
}

} // namespace

std::filesystem::perms parse_octal_mode(const std::string& text) {
  if(text.empty() || text.size() > 4 || text.find_first_not_of("01234567") != std::string::npos) {
    throw std::invalid_argument("'" + text + "' is not an octal mode");
  }
  return static_cast<std::filesystem::perms>(std::stoul(text, nullptr, 8));
}

OwnershipNormalizer::OwnershipNormalizer(PermissionPolicy policy, std::shared_ptr<Logger> logger)
  : policy_(std::move(policy)), logger_(std::move(logger)), gid_(getgid()) {
  if(!policy_.enabled || policy_.group.empty()) return;

  std::vector<char> buffer(16384);
  struct group entry{};
  struct group* found = nullptr;
  int rc = getgrnam_r(policy_.group.c_str(), &entry, buffer.data(), buffer.size(), &found);
  if(rc == 0 && found) {
    gid_ = found->gr_gid;
  } else {
    logger_->warn("Group '{}' not found. Using current group.", policy_.group);
  }
}

void OwnershipNormalizer::normalize(const std::filesystem::path& path) const {
  std::error_code ec;
  auto status = std::filesystem::symlink_status(path, ec);
  if(ec || !std::filesystem::exists(status)) {
    throw std::logic_error("normalize: " + path.string() + " does not exist");
  }
  if(!policy_.enabled) {
    logger_->debug("Skipping permissions and group for {}", path.string());
    return;
  }
  if(std::filesystem::is_symlink(status)) return;

  if(!std::filesystem::is_directory(status)) {
    apply(path, false);
    return;
  }

  apply(path, true);
  std::filesystem::recursive_directory_iterator it(path, std::filesystem::directory_options::none, ec);
  if(ec) {
    logger_->warn("Cannot walk {}: {}", path.string(), ec.message());
    return;
  }
  for(std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if(ec) {
      logger_->warn("Cannot walk {}: {}", path.string(), ec.message());
      break;
    }
    auto node_status = it->symlink_status(ec);
    if(ec) {
      logger_->warn("Cannot stat {}: {}", it->path().string(), ec.message());
      ec.clear();
      continue;
    }
    if(std::filesystem::is_symlink(node_status)) continue;
    apply(it->path(), std::filesystem::is_directory(node_status));
  }
}

void OwnershipNormalizer::apply(const std::filesystem::path& path, bool directory) const {
  const auto mode = directory ? policy_.folder_mode : policy_.file_mode;
  std::error_code ec;
  std::filesystem::permissions(path, mode, std::filesystem::perm_options::replace, ec);
  if(ec) {
    logger_->warn("chmod {} {}: {}", mode_string(mode), path.string(), ec.message());
  }
  if(lchown(path.c_str(), static_cast<uid_t>(-1), gid_) != 0) {
    logger_->warn("chgrp {} {}: {}", gid_, path.string(), std::strerror(errno));
  }
  logger_->debug("[PERMS {}] Set permissions {} and group {} for {}",
                 directory ? "DIR" : "FILE", mode_string(mode), policy_.group, path.string());
}
