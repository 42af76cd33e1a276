#pragma once

#include <string>

namespace commitas::config {

struct StoreConfig {
  // Empty means <home>/commit-as.sqlite3.
  std::string path;
  std::string on_duplicate = "allow";
};

struct GitConfig {
  std::string executable = "git";
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  StoreConfig store;
  GitConfig git;
  ObservabilityConfig observability;
};

} // namespace commitas::config
