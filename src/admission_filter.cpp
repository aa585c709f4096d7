#include "admission_filter.hpp"

#include <algorithm>

const char* skip_reason_label(SkipReason reason) {
  switch(reason) {
    case SkipReason::TooBig: return "too big";
    case SkipReason::TooSmall: return "too small";
    case SkipReason::Regex: return "regex";
    case SkipReason::Extension: return "extension";
  }
  return "unknown";
}

AdmissionFilter::AdmissionFilter(TransferRule rule)
  : rule_(std::move(rule)) {
  patterns_.reserve(rule_.skip_regex.size());
  for(const auto& pattern : rule_.skip_regex) {
    patterns_.emplace_back(pattern, std::regex::ECMAScript);
  }
}

Admission AdmissionFilter::admit(const std::string& remote_path, uint64_t size) const {
  if(size > rule_.max_size) return {SkipReason::TooBig};
  if(size < rule_.min_size) return {SkipReason::TooSmall};

  bool pattern_hit = std::any_of(patterns_.begin(), patterns_.end(),
    [&](const std::regex& re){ return std::regex_search(remote_path, re); });
  if(pattern_hit) return {SkipReason::Regex};

  bool extension_hit = std::any_of(rule_.skip_extensions.begin(), rule_.skip_extensions.end(),
    [&](const std::string& ext){
      return remote_path.size() >= ext.size() &&
             remote_path.compare(remote_path.size() - ext.size(), ext.size(), ext) == 0;
    });
  if(extension_hit) return {SkipReason::Extension};

  return {};
}
