#include "rtorrent_client.hpp"

#include "errors.hpp"
#include "http_client.hpp"

RTorrentClient::RTorrentClient(RTorrentConfig config, std::shared_ptr<Logger> logger)
  : config_(std::move(config)), logger_(std::move(logger)) {}

std::string RTorrentClient::endpoint() const {
  std::string path = config_.path;
  if(path.empty() || path.front() != '/') path.insert(path.begin(), '/');
  return config_.scheme + "://" + config_.host + ":" + std::to_string(config_.port) + path;
}

std::string RTorrentClient::describe() const {
  std::string url = config_.scheme + "://";
  if(!config_.user.empty()) url += config_.user + ":" + (config_.password.empty() ? "" : "***") + "@";
  return url + config_.host + ":" + std::to_string(config_.port) + config_.path;
}

XmlRpcValue RTorrentClient::call(const std::string& method, const std::vector<XmlRpcValue>& params) {
  HttpRequest request;
  request.url = endpoint();
  request.body = xmlrpc_encode_call(method, params);
  request.content_type = "text/xml";
  request.user = config_.user;
  request.password = config_.password;
  request.verify_tls = config_.verify_tls;
  request.timeout_seconds = config_.timeout_seconds;

  auto response = http_post(request);
  if(!response.ok()) {
    throw RemoteError(method + " failed: " + mask_credentials(response.describe(), config_.password));
  }
  return xmlrpc_decode_response(response.body);
}

std::vector<std::string> RTorrentClient::list_ids(const std::string& view) {
  auto result = call("download_list", {XmlRpcValue(""), XmlRpcValue(view)});
  std::vector<std::string> ids;
  for(const auto& entry : result.as_array()) {
    ids.push_back(entry.as_string());
  }
  if(logger_) logger_->debug("download_list({}) returned {} ids", view, ids.size());
  return ids;
}

std::string RTorrentClient::string_field(const char* method, const std::string& id) {
  return call(method, {XmlRpcValue(id)}).as_string();
}

std::string RTorrentClient::name(const std::string& id) {
  return string_field("d.name", id);
}

std::string RTorrentClient::label(const std::string& id) {
  return string_field("d.custom1", id);
}

bool RTorrentClient::is_complete(const std::string& id) {
  return call("d.complete", {XmlRpcValue(id)}).as_int() != 0;
}

std::string RTorrentClient::directory(const std::string& id) {
  return string_field("d.directory", id);
}

std::string RTorrentClient::hash(const std::string& id) {
  return string_field("d.hash", id);
}

void RTorrentClient::set_label(const std::string& id, const std::string& label) {
  call("d.custom1.set", {XmlRpcValue(id), XmlRpcValue(label)});
}
