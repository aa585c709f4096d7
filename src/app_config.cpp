#include "app_config.hpp"

#include <fstream>
#include <limits>
#include <regex>

#include "errors.hpp"

namespace {

// A JSON object plus its dotted location, for error messages.
class Section {
public:
  Section(const nlohmann::json& node, std::string path)
    : node_(node), path_(std::move(path)) {
    if(!node_.is_object()) throw ConfigError(path_, "expected an object");
  }

  std::string key(const std::string& name) const {
    return path_.empty() ? name : path_ + "." + name;
  }

  bool has(const std::string& name) const { return node_.contains(name) && !node_.at(name).is_null(); }

  Section section(const std::string& name) const {
    if(!has(name)) throw ConfigError(key(name), "missing section");
    return Section(node_.at(name), key(name));
  }

  std::optional<Section> optional_section(const std::string& name) const {
    if(!has(name)) return std::nullopt;
    return Section(node_.at(name), key(name));
  }

  const nlohmann::json& raw(const std::string& name) const { return node_.at(name); }

  template<typename T>
  T get(const std::string& name) const {
    if(!has(name)) throw ConfigError(key(name), "missing value");
    return convert<T>(name);
  }

  template<typename T>
  T get(const std::string& name, T fallback) const {
    if(!has(name)) return fallback;
    return convert<T>(name);
  }

  const nlohmann::json& node() const { return node_; }
  const std::string& path() const { return path_; }

private:
  template<typename T>
  T convert(const std::string& name) const {
    try {
      return node_.at(name).get<T>();
    } catch(const nlohmann::json::exception& e) {
      throw ConfigError(key(name), e.what());
    }
  }

  const nlohmann::json& node_;
  std::string path_;
};

uint64_t size_value(const Section& s, const std::string& name, uint64_t fallback) {
  if(!s.has(name)) return fallback;
  const auto& v = s.raw(name);
  if(v.is_number_unsigned()) return v.get<uint64_t>();
  if(v.is_number_integer() && v.get<int64_t>() >= 0) return static_cast<uint64_t>(v.get<int64_t>());
  if(v.is_number_float() && v.get<double>() >= 0) {
    double d = v.get<double>();
    if(d >= static_cast<double>(std::numeric_limits<uint64_t>::max())) return std::numeric_limits<uint64_t>::max();
    return static_cast<uint64_t>(d);
  }
  throw ConfigError(s.key(name), "expected a non-negative size in bytes");
}

int port_value(const Section& s, const std::string& name, int fallback) {
  int port = s.get<int>(name, fallback);
  if(port <= 0 || port > 65535) throw ConfigError(s.key(name), "port out of range");
  return port;
}

std::filesystem::perms mode_value(const Section& s, const std::string& name, const std::string& fallback) {
  std::string text = fallback;
  if(s.has(name)) {
    const auto& v = s.raw(name);
    if(v.is_string()) text = v.get<std::string>();
    else if(v.is_number_integer()) text = std::to_string(v.get<int64_t>());
    else throw ConfigError(s.key(name), "expected an octal mode string");
  }
  try {
    return parse_octal_mode(text);
  } catch(const std::invalid_argument& e) {
    throw ConfigError(s.key(name), e.what());
  }
}

std::optional<ArrEndpoint> arr_endpoint(const Section& root, const std::string& name) {
  auto section = root.optional_section(name);
  if(!section) return std::nullopt;
  ArrEndpoint endpoint;
  endpoint.baseurl = section->get<std::string>("baseurl");
  endpoint.api_key = section->get<std::string>("api_key");
  endpoint.verify_tls = section->get<bool>("verify_tls", true);
  if(endpoint.baseurl.empty()) throw ConfigError(section->key("baseurl"), "must not be empty");
  return endpoint;
}

Action parse_action(const Section& s) {
  auto name = s.get<std::string>("name");
  auto kind = action_kind_from_name(name);
  if(!kind) throw ConfigError(s.key("name"), "unknown action '" + name + "'");

  Action action;
  action.kind = *kind;
  const char* base_key = (*kind == ActionKind::NotifyRadarr) ? "radarr_import_base_path" : "sonarr_import_base_path";
  if(s.has(base_key)) {
    action.base_path = s.get<std::string>(base_key);
  } else {
    action.base_path = s.get<std::string>("base_path");
  }
  while(action.base_path.size() > 1 && action.base_path.back() == '/') action.base_path.pop_back();
  return action;
}

LabelMapping parse_mapping(const Section& s) {
  LabelMapping mapping;
  mapping.destination_subpath = s.get<std::string>("path");
  if(auto options = s.optional_section("options")) {
    if(options->has("priority")) mapping.priority = options->get<int>("priority");
  }
  if(s.has("actions")) {
    const auto& actions = s.raw("actions");
    if(!actions.is_array()) throw ConfigError(s.key("actions"), "expected a list");
    for(std::size_t i = 0; i < actions.size(); ++i) {
      mapping.actions.push_back(parse_action(Section(actions[i], s.key("actions") + "[" + std::to_string(i) + "]")));
    }
  }
  return mapping;
}

std::vector<std::string> string_list(const Section& s, const std::string& name) {
  return s.get<std::vector<std::string>>(name, {});
}

} // namespace

AppConfig parse_app_config(const nlohmann::json& doc) {
  Section root(doc, "");
  AppConfig config;

  auto ftp = root.section("ftp");
  config.ftp.host = ftp.get<std::string>("host");
  config.ftp.port = port_value(ftp, "port", 21);
  config.ftp.user = ftp.get<std::string>("user");
  config.ftp.password = ftp.get<std::string>("pass");
  config.ftp.tls = ftp.get<bool>("tls", false);
  config.ftp.verify_tls = ftp.get<bool>("verify_tls", true);
  config.ftp.timeout_seconds = ftp.get<long>("timeout", 0);

  auto rt = root.section("rtorrent");
  config.rtorrent.scheme = rt.get<std::string>("scheme", "https");
  config.rtorrent.host = rt.get<std::string>("host");
  config.rtorrent.port = port_value(rt, "port", config.rtorrent.scheme == "http" ? 80 : 443);
  config.rtorrent.path = rt.get<std::string>("path", "/RPC2");
  config.rtorrent.user = rt.get<std::string>("user", "");
  config.rtorrent.password = rt.get<std::string>("pass", "");
  config.rtorrent.verify_tls = rt.get<bool>("verify_tls", true);
  config.catalog.view = rt.get<std::string>("view", "main");
  config.catalog.allow_cache = rt.get<bool>("allow_xmlrpc_cache", false);
  config.catalog.cache_file = rt.get<std::string>("cache_file", "torrents_cache.json");
  int recheck = rt.get<int>("recheck_time", 120);
  if(recheck <= 0) throw ConfigError(rt.key("recheck_time"), "must be positive");
  config.recheck_time = std::chrono::seconds(recheck);

  auto folders = root.section("folders");
  config.root = folders.get<std::string>("root");
  config.temp = folders.get<std::string>("temp");
  if(config.root.empty()) throw ConfigError(folders.key("root"), "must not be empty");
  if(config.temp.empty()) throw ConfigError(folders.key("temp"), "must not be empty");

  auto completed = folders.section("completed");
  config.completed.label = completed.get<std::string>("label");
  config.completed.change_label = completed.get<bool>("change_label", true);

  if(auto perms = folders.optional_section("permissions")) {
    config.permissions.enabled = perms->get<bool>("change_permissions", true);
    config.permissions.folder_mode = mode_value(*perms, "folders", "775");
    config.permissions.file_mode = mode_value(*perms, "files", "664");
    config.permissions.group = perms->get<std::string>("group", "");
  } else {
    config.permissions.enabled = false;
  }

  auto mapping = folders.section("label_mapping");
  for(const auto& entry : mapping.node().items()) {
    config.label_mapping.emplace(entry.key(), parse_mapping(Section(entry.value(), mapping.key(entry.key()))));
  }

  if(auto rules = root.optional_section("rules")) {
    config.rules.min_size = size_value(*rules, "min_file_size", 0);
    config.rules.max_size = size_value(*rules, "max_file_size", std::numeric_limits<uint64_t>::max());
    config.rules.skip_regex = string_list(*rules, "skip_regex");
    config.rules.skip_extensions = string_list(*rules, "skip_extensions");
    for(const auto& pattern : config.rules.skip_regex) {
      try {
        std::regex probe(pattern, std::regex::ECMAScript);
      } catch(const std::regex_error& e) {
        throw ConfigError(rules->key("skip_regex"), "invalid pattern '" + pattern + "': " + e.what());
      }
    }
  }

  config.radarr = arr_endpoint(root, "radarr");
  config.sonarr = arr_endpoint(root, "sonarr");
  for(const auto& entry : config.label_mapping) {
    for(const auto& action : entry.second.actions) {
      if(action.kind == ActionKind::NotifyRadarr && !config.radarr) {
        throw ConfigError("radarr", "required by label '" + entry.first + "'");
      }
      if(action.kind == ActionKind::NotifySonarr && !config.sonarr) {
        throw ConfigError("sonarr", "required by label '" + entry.first + "'");
      }
    }
  }

  if(auto logging = root.optional_section("logging")) {
    config.log_severity = logging->get<std::string>("severity", "INFO");
  }
  return config;
}

AppConfig load_app_config(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) throw ConfigError(path.string(), "cannot open configuration file");
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw ConfigError(path.string(), e.what());
  }
  return parse_app_config(doc);
}
