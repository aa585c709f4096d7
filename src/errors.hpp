#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// Run-level failure: missing library root, unusable configuration, a remote
// session that can never be established. Terminates the process.
class ConfigurationFatal : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public ConfigurationFatal {
public:
  ConfigError(const std::string& key, const std::string& message)
    : ConfigurationFatal("config '" + key + "': " + message), key_(key) {}

  const std::string& key() const { return key_; }

private:
  std::string key_;
};

// Transport or protocol failure talking to a remote endpoint.
class RemoteError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The remote side refused to list a path. The mirror reads this as "is a file".
class ListingRefused : public RemoteError {
public:
  explicit ListingRefused(const std::string& path)
    : RemoteError("cannot list " + path), path_(path) {}

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

// One file could not be fetched or published.
class TransferFailure : public std::runtime_error {
public:
  TransferFailure(const std::string& remote_path, const std::string& reason)
    : std::runtime_error(remote_path + ": " + reason), remote_path_(remote_path) {}

  const std::string& remote_path() const { return remote_path_; }

private:
  std::string remote_path_;
};

// An item's tree could not be mirrored completely.
class MirrorFailure : public std::runtime_error {
public:
  MirrorFailure(const std::string& remote_root, const std::string& reason, std::size_t failed_files = 0)
    : std::runtime_error(remote_root + ": " + reason),
      remote_root_(remote_root),
      failed_files_(failed_files) {}

  const std::string& remote_root() const { return remote_root_; }
  std::size_t failed_files() const { return failed_files_; }

private:
  std::string remote_root_;
  std::size_t failed_files_ = 0;
};
