// Copyright 2026 Global Phasing Ltd.
//
// String helpers used when matching reflection column labels.

#ifndef CIFMILL_UTIL_HPP_
#define CIFMILL_UTIL_HPP_

#include <string>
#include <gemmi/util.hpp>  // for ends_with

namespace cifmill {

inline bool contains(const std::string& str, const std::string& part) {
  return str.find(part) != std::string::npos;
}

// Replaces all non-overlapping occurrences of old, left to right.
inline std::string replace_all(std::string str, const std::string& old,
                               const std::string& new_) {
  if (old.empty())
    return str;
  for (size_t pos = str.find(old); pos != std::string::npos;
       pos = str.find(old, pos + new_.size()))
    str.replace(pos, old.size(), new_);
  return str;
}

inline std::string rstrip_suffix(const std::string& str, const std::string& suffix) {
  if (!suffix.empty() && gemmi::ends_with(str, suffix))
    return str.substr(0, str.size() - suffix.size());
  return str;
}

} // namespace cifmill
#endif
