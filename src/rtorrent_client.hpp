#pragma once

#include <memory>
#include <string>
#include <vector>

#include "item_source.hpp"
#include "log.hpp"
#include "xmlrpc.hpp"

struct RTorrentConfig {
  std::string scheme = "https";
  std::string host;
  int port = 443;
  std::string path = "/RPC2";
  std::string user;
  std::string password;
  bool verify_tls = true;
  long timeout_seconds = 60;
};

// rTorrent over XML-RPC/HTTP(S). One POST per call.
class RTorrentClient : public ItemSource {
public:
  RTorrentClient(RTorrentConfig config, std::shared_ptr<Logger> logger);

  std::vector<std::string> list_ids(const std::string& view) override;

  std::string name(const std::string& id) override;
  std::string label(const std::string& id) override;
  bool is_complete(const std::string& id) override;
  std::string directory(const std::string& id) override;
  std::string hash(const std::string& id) override;

  void set_label(const std::string& id, const std::string& label) override;

  // Endpoint URL with the password masked.
  std::string describe() const override;

  XmlRpcValue call(const std::string& method, const std::vector<XmlRpcValue>& params);

private:
  std::string endpoint() const;
  std::string string_field(const char* method, const std::string& id);

  RTorrentConfig config_;
  std::shared_ptr<Logger> logger_;
};
