#pragma once

#include <string>
#include <vector>

// Torrent client capability used by the catalog. Every call is one round trip;
// failures throw (RemoteError, XmlRpcError).
class ItemSource {
public:
  virtual ~ItemSource() = default;

  virtual std::vector<std::string> list_ids(const std::string& view) = 0;

  virtual std::string name(const std::string& id) = 0;
  virtual std::string label(const std::string& id) = 0;
  virtual bool is_complete(const std::string& id) = 0;
  virtual std::string directory(const std::string& id) = 0;
  virtual std::string hash(const std::string& id) = 0;

  virtual void set_label(const std::string& id, const std::string& label) = 0;

  virtual std::string describe() const = 0;
};
