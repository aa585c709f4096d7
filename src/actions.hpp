#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"

enum class ActionKind {
  NotifyRadarr,
  NotifySonarr
};

const char* action_kind_name(ActionKind kind);
std::optional<ActionKind> action_kind_from_name(const std::string& name);

struct Action {
  ActionKind kind = ActionKind::NotifyRadarr;
  std::string base_path;
};

// Asks a media library to import a finished download.
class ImportTrigger {
public:
  virtual ~ImportTrigger() = default;

  // Throws RemoteError when the library does not acknowledge the command.
  virtual void notify(const std::string& base_path, const std::string& item_path) = 0;
};

struct ArrEndpoint {
  std::string baseurl;
  std::string api_key;
  bool verify_tls = true;
};

// Radarr/Sonarr v3 command API: POST {baseurl}/api/v3/command.
class ArrImportTrigger : public ImportTrigger {
public:
  ArrImportTrigger(ArrEndpoint endpoint, std::string command, std::shared_ptr<Logger> logger);

  void notify(const std::string& base_path, const std::string& item_path) override;

  const std::string& command() const { return command_; }

private:
  ArrEndpoint endpoint_;
  std::string command_;
  std::shared_ptr<Logger> logger_;
};

// "{base_path}/{item_name}/"
std::string import_path(const std::string& base_path, const std::string& item_name);

class ActionRegistry {
public:
  explicit ActionRegistry(std::shared_ptr<Logger> logger);

  void register_trigger(ActionKind kind, std::shared_ptr<ImportTrigger> trigger);
  bool has_trigger(ActionKind kind) const;

  // Runs one action for an item. Failures are logged and reported as false.
  bool run(const Action& action, const std::string& item_name) const;

private:
  std::map<ActionKind, std::shared_ptr<ImportTrigger>> triggers_;
  std::shared_ptr<Logger> logger_;
};
