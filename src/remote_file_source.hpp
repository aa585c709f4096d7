#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct RemoteEntry {
  enum class Kind { File, Directory };

  std::string path;  // full remote path
  std::string name;  // last path component
  Kind kind = Kind::File;
  uint64_t size = 0; // files only

  bool is_directory() const { return kind == Kind::Directory; }
};

// Receives one block of a streamed file. Returning false aborts the read.
using ChunkSink = std::function<bool(const char* data, std::size_t length)>;

// One authenticated connection to the file server. Released when destroyed.
class RemoteFileSession {
public:
  virtual ~RemoteFileSession() = default;

  // Children of a directory. Throws ListingRefused when the server will not
  // list the path (it is a file, or does not exist), RemoteError otherwise.
  virtual std::vector<RemoteEntry> list(const std::string& path) = 0;

  virtual uint64_t size(const std::string& path) = 0;

  // Streams the file body in bounded blocks. Throws RemoteError on failure.
  virtual void read(const std::string& path, const ChunkSink& sink) = 0;
};

class RemoteFileSource {
public:
  virtual ~RemoteFileSource() = default;

  // Throws ConfigurationFatal when the session can never succeed (bad host,
  // rejected credentials), RemoteError for anything transient.
  virtual std::unique_ptr<RemoteFileSession> open_session() = 0;

  virtual std::string describe() const = 0;
};

std::string remote_join(const std::string& dir, const std::string& name);
std::string remote_basename(const std::string& path);
