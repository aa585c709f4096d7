#pragma once

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>

struct TransferRule {
  uint64_t min_size = 0;
  uint64_t max_size = UINT64_MAX;
  std::vector<std::string> skip_regex;
  std::vector<std::string> skip_extensions;
};

enum class SkipReason {
  TooBig,
  TooSmall,
  Regex,
  Extension
};

const char* skip_reason_label(SkipReason reason);

struct Admission {
  std::optional<SkipReason> rejected;

  bool accepted() const { return !rejected.has_value(); }
};

// Decides whether a remote file is transferred. Rules are checked in the order
// max size, min size, skip patterns, skip extensions; the first one that fails wins.
class AdmissionFilter {
public:
  // Throws std::regex_error when a pattern does not compile.
  explicit AdmissionFilter(TransferRule rule);

  Admission admit(const std::string& remote_path, uint64_t size) const;

  const TransferRule& rule() const { return rule_; }

private:
  TransferRule rule_;
  std::vector<std::regex> patterns_;
};
