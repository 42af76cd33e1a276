#pragma once

#include "commitas/common/result.hpp"
#include <string>
#include <unordered_map>

namespace commitas::common {

// Flat view of a TOML file: section keys are joined as "section.key".
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace commitas::common
