#include "curl_handle.hpp"

#include <mutex>
#include <stdexcept>

void ensure_curl_global_init() {
  static std::once_flag once;
  std::call_once(once, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlEasy::CurlEasy() {
  ensure_curl_global_init();
  h_ = curl_easy_init();
  if(!h_) throw std::runtime_error("curl_easy_init failed");
  apply_defaults();
}

CurlEasy::~CurlEasy() {
  if(h_) curl_easy_cleanup(h_);
}

void CurlEasy::reset() {
  curl_easy_reset(h_);
  apply_defaults();
}

void CurlEasy::apply_defaults() {
  error_[0] = '\0';
  curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
  curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h_, CURLOPT_ERRORBUFFER, error_);
  curl_easy_setopt(h_, CURLOPT_CONNECTTIMEOUT, 30L);
}

SList::~SList() {
  curl_slist_free_all(head_);
}

void SList::add(std::string s) {
  store_.push_back(std::move(s));
  head_ = curl_slist_append(head_, store_.back().c_str());
}

std::string HttpResponse::describe() const {
  if(curl != CURLE_OK) {
    std::string out = curl_easy_strerror(curl);
    if(!error.empty()) out += " (" + error + ")";
    return out;
  }
  return "HTTP " + std::to_string(http);
}

std::string mask_credentials(const std::string& text, const std::string& secret) {
  if(secret.empty()) return text;
  std::string out = text;
  std::size_t pos = 0;
  while((pos = out.find(secret, pos)) != std::string::npos) {
    out.replace(pos, secret.size(), "***");
    pos += 3;
  }
  return out;
}
