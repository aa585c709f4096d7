#include "remote_file_source.hpp"

std::string remote_join(const std::string& dir, const std::string& name) {
  if(dir.empty()) return name;
  if(dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

std::string remote_basename(const std::string& path) {
  std::string trimmed = path;
  while(trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
  auto pos = trimmed.find_last_of('/');
  if(pos == std::string::npos) return trimmed;
  return trimmed.substr(pos + 1);
}
