#pragma once

#include <string>
#include <utility>
#include <vector>

#include "curl_handle.hpp"

struct HttpRequest {
  std::string url;
  std::string body;
  std::string content_type = "application/json";
  std::vector<std::pair<std::string, std::string>> headers;
  std::string user;
  std::string password;
  bool verify_tls = true;
  long timeout_seconds = 60;
};

// Blocking POST. Transport errors are reported in the response, never thrown.
HttpResponse http_post(const HttpRequest& request);
