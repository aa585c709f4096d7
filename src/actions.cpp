#include "actions.hpp"

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "http_client.hpp"

const char* action_kind_name(ActionKind kind) {
  switch(kind) {
    case ActionKind::NotifyRadarr: return "notify_radarr";
    case ActionKind::NotifySonarr: return "notify_sonarr";
  }
  return "unknown";
}

std::optional<ActionKind> action_kind_from_name(const std::string& name) {
  if(name == "notify_radarr") return ActionKind::NotifyRadarr;
  if(name == "notify_sonarr") return ActionKind::NotifySonarr;
  return std::nullopt;
}

std::string import_path(const std::string& base_path, const std::string& item_name) {
  return base_path + "/" + item_name + "/";
}

ArrImportTrigger::ArrImportTrigger(ArrEndpoint endpoint, std::string command, std::shared_ptr<Logger> logger)
  : endpoint_(std::move(endpoint)), command_(std::move(command)), logger_(std::move(logger)) {}

void ArrImportTrigger::notify(const std::string& base_path, const std::string& item_path) {
  std::string base = endpoint_.baseurl;
  while(!base.empty() && base.back() == '/') base.pop_back();

  HttpRequest request;
  request.url = base + "/api/v3/command";
  request.body = nlohmann::json{{"name", command_}, {"path", item_path}}.dump();
  request.headers.emplace_back("X-Api-Key", endpoint_.api_key);
  request.verify_tls = endpoint_.verify_tls;

  logger_->debug("\t\t= Importing {} (base {})", item_path, base_path);
  auto response = http_post(request);
  if(!response.ok()) {
    std::string detail = response.describe();
    if(!response.body.empty()) detail += ": " + response.body.substr(0, 200);
    throw RemoteError(command_ + " at " + request.url + " failed: " + mask_credentials(detail, endpoint_.api_key));
  }
}

ActionRegistry::ActionRegistry(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

void ActionRegistry::register_trigger(ActionKind kind, std::shared_ptr<ImportTrigger> trigger) {
  triggers_[kind] = std::move(trigger);
}

bool ActionRegistry::has_trigger(ActionKind kind) const {
  auto it = triggers_.find(kind);
  return it != triggers_.end() && it->second;
}

bool ActionRegistry::run(const Action& action, const std::string& item_name) const {
  logger_->info("\t= Executing action: {} ({})", action_kind_name(action.kind), action.base_path);
  auto it = triggers_.find(action.kind);
  if(it == triggers_.end() || !it->second) {
    logger_->error("\t= No trigger registered for {}", action_kind_name(action.kind));
    return false;
  }
  try {
    it->second->notify(action.base_path, import_path(action.base_path, item_name));
    return true;
  } catch(const std::exception& e) {
    logger_->error("\t= Action {} failed for {}: {}", action_kind_name(action.kind), item_name, e.what());
    return false;
  }
}
