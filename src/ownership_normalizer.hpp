#pragma once

#include <sys/types.h>

#include <filesystem>
#include <memory>
#include <string>

#include "log.hpp"

struct PermissionPolicy {
  bool enabled = true;
  std::filesystem::perms folder_mode = static_cast<std::filesystem::perms>(0775);
  std::filesystem::perms file_mode = static_cast<std::filesystem::perms>(0664);
  std::string group;
};

// Applies modes and group ownership to a published tree. The owner is left
// alone and symbolic links are not followed. Per-node failures are logged.
class OwnershipNormalizer {
public:
  // Resolves the group once; an unknown group falls back to the process group.
  OwnershipNormalizer(PermissionPolicy policy, std::shared_ptr<Logger> logger);

  // Throws std::logic_error when path does not exist.
  void normalize(const std::filesystem::path& path) const;

  bool enabled() const { return policy_.enabled; }
  gid_t gid() const { return gid_; }

private:
  void apply(const std::filesystem::path& path, bool directory) const;

  PermissionPolicy policy_;
  std::shared_ptr<Logger> logger_;
  gid_t gid_ = 0;
};

// Parses an octal mode string such as "775". Throws std::invalid_argument.
std::filesystem::perms parse_octal_mode(const std::string& text);
