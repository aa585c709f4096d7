#include "ftp_file_source.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "errors.hpp"

namespace {

bool is_safe_entry_name(const std::string& name) {
  if(name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos;
}

std::string strip_cr(std::string line) {
  while(!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
  return line;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

bool is_session_fatal(CURLcode code) {
  switch(code) {
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_LOGIN_DENIED:
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
    case CURLE_USE_SSL_FAILED:
      return true;
    default:
      return false;
  }
}

} // namespace

FtpSession::FtpSession(const FtpConfig& config, std::shared_ptr<Logger> logger)
  : config_(config), logger_(std::move(logger)) {
  prepare(url_for(config_, "", true));
  curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
  CURLcode code = curl_easy_perform(curl_);
  if(code != CURLE_OK) {
    std::string detail = curl_easy_strerror(code);
    if(curl_.error_buffer()[0] != '\0') detail += std::string(" (") + curl_.error_buffer() + ")";
    if(is_session_fatal(code)) {
      throw ConfigurationFatal("FTP session to " + config_.host + " failed: " + detail);
    }
    throw RemoteError("FTP session to " + config_.host + " failed: " + detail);
  }
  if(logger_) logger_->debug("FTP session open: {}@{}:{}", config_.user, config_.host, config_.port);
}

void FtpSession::prepare(const std::string& url) {
  curl_.reset();
  curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_, CURLOPT_USERNAME, config_.user.c_str());
  curl_easy_setopt(curl_, CURLOPT_PASSWORD, config_.password.c_str());
  curl_easy_setopt(curl_, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_SINGLECWD));
  if(config_.timeout_seconds > 0) {
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, config_.timeout_seconds);
  }
  if(config_.tls) {
    curl_easy_setopt(curl_, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    if(!config_.verify_tls) {
      curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 0L);
      curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 0L);
    }
  }
}

std::string FtpSession::url_for(const FtpConfig& config, const std::string& path, bool directory) {
  std::string encoded;
  std::size_t start = 0;
  while(start <= path.size()) {
    auto slash = path.find('/', start);
    std::string segment = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    if(!segment.empty()) {
      char* escaped = curl_easy_escape(nullptr, segment.c_str(), static_cast<int>(segment.size()));
      if(!encoded.empty()) encoded += "/";
      encoded += escaped ? escaped : segment.c_str();
      curl_free(escaped);
    }
    if(slash == std::string::npos) break;
    start = slash + 1;
  }
  // A plain URL path is relative to the login directory; %2F makes the first CWD absolute.
  std::string url = "ftp://" + config.host + ":" + std::to_string(config.port) + "/";
  if(!path.empty() && path.front() == '/') url += "%2F";
  url += encoded;
  if(directory && url.back() != '/') url += "/";
  return url;
}

bool FtpSession::is_command_unsupported(long reply) {
  return reply == 500 || reply == 502;
}

void FtpSession::fail(const std::string& what, CURLcode code) {
  std::string detail = curl_easy_strerror(code);
  if(curl_.error_buffer()[0] != '\0') detail += std::string(" (") + curl_.error_buffer() + ")";
  throw RemoteError(what + ": " + detail);
}

std::string FtpSession::fetch_listing(const std::string& path, const char* command, CURLcode& code) {
  std::string body;
  prepare(url_for(config_, path, true));
  if(command) curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, command);
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, +[](char* p, size_t s, size_t n, void* ud){
    static_cast<std::string*>(ud)->append(p, s * n);
    return s * n;
  });
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &body);
  code = curl_easy_perform(curl_);
  return body;
}

std::vector<RemoteEntry> FtpSession::list(const std::string& path) {
  CURLcode code = CURLE_OK;
  if(mlsd_supported_) {
    auto body = fetch_listing(path, "MLSD", code);
    if(code == CURLE_OK) return parse_mlsd(path, body);
    if(code == CURLE_REMOTE_ACCESS_DENIED) throw ListingRefused(path);
    long reply = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &reply);
    if(is_command_unsupported(reply)) {
      mlsd_supported_ = false;
      if(logger_) logger_->debug("Server does not support MLSD ({}), using LIST", reply);
    } else if(logger_) {
      logger_->debug("MLSD on {} failed ({}), retrying with LIST", path, curl_easy_strerror(code));
    }
  }
  auto body = fetch_listing(path, nullptr, code);
  if(code == CURLE_REMOTE_ACCESS_DENIED) throw ListingRefused(path);
  if(code != CURLE_OK) fail("LIST " + path, code);
  return parse_unix_list(path, body);
}

uint64_t FtpSession::size(const std::string& path) {
  prepare(url_for(config_, path, false));
  curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
  CURLcode code = curl_easy_perform(curl_);
  if(code != CURLE_OK) fail("SIZE " + path, code);
  curl_off_t length = -1;
  curl_easy_getinfo(curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
  if(length < 0) throw RemoteError("SIZE " + path + ": server did not report a size");
  return static_cast<uint64_t>(length);
}

void FtpSession::read(const std::string& path, const ChunkSink& sink) {
  prepare(url_for(config_, path, false));
  struct Context {
    const ChunkSink* sink;
  } ctx{&sink};
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, +[](char* p, size_t s, size_t n, void* ud) -> size_t {
    auto* c = static_cast<Context*>(ud);
    const size_t length = s * n;
    if(!(*c->sink)(p, length)) return 0;
    return length;
  });
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &ctx);
  CURLcode code = curl_easy_perform(curl_);
  if(code == CURLE_WRITE_ERROR) throw RemoteError("RETR " + path + ": local write aborted");
  if(code != CURLE_OK) fail("RETR " + path, code);
}

std::vector<RemoteEntry> FtpSession::parse_mlsd(const std::string& dir, const std::string& body) {
  std::vector<RemoteEntry> out;
  std::istringstream in(body);
  std::string line;
  while(std::getline(in, line)) {
    line = strip_cr(line);
    auto space = line.find(' ');
    if(space == std::string::npos) continue;
    std::string facts = line.substr(0, space);
    std::string name = line.substr(space + 1);
    if(!is_safe_entry_name(name)) continue;

    std::string type;
    uint64_t size = 0;
    std::istringstream fact_stream(facts);
    std::string fact;
    while(std::getline(fact_stream, fact, ';')) {
      auto eq = fact.find('=');
      if(eq == std::string::npos) continue;
      auto key = to_lower(fact.substr(0, eq));
      auto value = fact.substr(eq + 1);
      if(key == "type") {
        type = to_lower(value);
      } else if(key == "size") {
        try {
          size = std::stoull(value);
        } catch(const std::exception&) {
          size = 0;
        }
      }
    }

    RemoteEntry entry;
    entry.name = name;
    entry.path = remote_join(dir, name);
    if(type == "dir") {
      entry.kind = RemoteEntry::Kind::Directory;
    } else if(type == "file") {
      entry.kind = RemoteEntry::Kind::File;
      entry.size = size;
    } else {
      continue; // cdir, pdir, and links are not mirrored
    }
    out.push_back(std::move(entry));
  }
  return out;
}

std::vector<RemoteEntry> FtpSession::parse_unix_list(const std::string& dir, const std::string& body) {
  std::vector<RemoteEntry> out;
  std::istringstream in(body);
  std::string line;
  while(std::getline(in, line)) {
    line = strip_cr(line);
    if(line.empty() || line.rfind("total ", 0) == 0) continue;

    std::istringstream fields(line);
    std::string perms, links, owner, group, size_text, month, day, time_or_year;
    if(!(fields >> perms >> links >> owner >> group >> size_text >> month >> day >> time_or_year)) continue;
    std::string name;
    std::getline(fields, name);
    name.erase(0, name.find_first_not_of(' '));
    if(perms.empty()) continue;

    RemoteEntry entry;
    const char kind = perms[0];
    if(kind == 'd') {
      entry.kind = RemoteEntry::Kind::Directory;
    } else if(kind == '-' || kind == 'l') {
      entry.kind = RemoteEntry::Kind::File;
      if(kind == 'l') {
        auto arrow = name.find(" -> ");
        if(arrow != std::string::npos) name.erase(arrow);
      }
      try {
        entry.size = std::stoull(size_text);
      } catch(const std::exception&) {
        entry.size = 0;
      }
    } else {
      continue;
    }
    if(!is_safe_entry_name(name)) continue;
    entry.name = name;
    entry.path = remote_join(dir, name);
    out.push_back(std::move(entry));
  }
  return out;
}

FtpFileSource::FtpFileSource(FtpConfig config, std::shared_ptr<Logger> logger)
  : config_(std::move(config)), logger_(std::move(logger)) {}

std::unique_ptr<RemoteFileSession> FtpFileSource::open_session() {
  return std::make_unique<FtpSession>(config_, logger_);
}

std::string FtpFileSource::describe() const {
  return std::string(config_.tls ? "ftps://" : "ftp://") + config_.user + "@" + config_.host + ":" + std::to_string(config_.port);
}
