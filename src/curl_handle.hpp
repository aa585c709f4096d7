#pragma once

#include <curl/curl.h>

#include <string>
#include <vector>

void ensure_curl_global_init();

// RAII owner of a CURL easy handle. A handle kept alive across requests keeps
// its connection (and FTP login) cached.
class CurlEasy {
public:
  CurlEasy();
  ~CurlEasy();

  CurlEasy(const CurlEasy&) = delete;
  CurlEasy& operator=(const CurlEasy&) = delete;

  operator CURL*() { return h_; }
  CURL* get() { return h_; }

  // Clears per-request options while keeping the connection cache.
  void reset();

  const char* error_buffer() const { return error_; }

private:
  void apply_defaults();

  CURL* h_ = nullptr;
  char error_[CURL_ERROR_SIZE] = {};
};

class SList {
public:
  SList() = default;
  ~SList();

  SList(const SList&) = delete;
  SList& operator=(const SList&) = delete;

  void add(std::string s);
  curl_slist* get() const { return head_; }

private:
  std::vector<std::string> store_;
  curl_slist* head_ = nullptr;
};

struct HttpResponse {
  CURLcode curl = CURLE_OK;
  long http = 0;
  std::string body;
  std::string error;

  bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
  std::string describe() const;
};

std::string mask_credentials(const std::string& text, const std::string& secret);
