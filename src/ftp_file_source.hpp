#pragma once

#include <memory>
#include <string>
#include <vector>

#include "curl_handle.hpp"
#include "log.hpp"
#include "remote_file_source.hpp"

struct FtpConfig {
  std::string host;
  int port = 21;
  std::string user;
  std::string password;
  bool tls = false;        // explicit FTPS (AUTH TLS) on the control and data channels
  bool verify_tls = true;
  long timeout_seconds = 0; // 0 = no overall limit; large files take as long as they take
};

class FtpSession : public RemoteFileSession {
public:
  FtpSession(const FtpConfig& config, std::shared_ptr<Logger> logger);

  std::vector<RemoteEntry> list(const std::string& path) override;
  uint64_t size(const std::string& path) override;
  void read(const std::string& path, const ChunkSink& sink) override;

  // Parsers are public so they can be exercised without a server.
  static std::vector<RemoteEntry> parse_mlsd(const std::string& dir, const std::string& body);
  static std::vector<RemoteEntry> parse_unix_list(const std::string& dir, const std::string& body);

  // Absolute paths are addressed from the server root, anything else from
  // the login directory.
  static std::string url_for(const FtpConfig& config, const std::string& path, bool directory);

  // True for the replies that mean the server does not know a command.
  static bool is_command_unsupported(long reply);

private:
  void prepare(const std::string& url);
  std::string fetch_listing(const std::string& path, const char* command, CURLcode& code);
  [[noreturn]] void fail(const std::string& what, CURLcode code);

  FtpConfig config_;
  std::shared_ptr<Logger> logger_;
  CurlEasy curl_;
  bool mlsd_supported_ = true;
};

class FtpFileSource : public RemoteFileSource {
public:
  FtpFileSource(FtpConfig config, std::shared_ptr<Logger> logger);

  std::unique_ptr<RemoteFileSession> open_session() override;
  std::string describe() const override;

private:
  FtpConfig config_;
  std::shared_ptr<Logger> logger_;
};
