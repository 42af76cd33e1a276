#include "commitas/config/config.hpp"

#include "commitas/common/fs.hpp"
#include "commitas/common/toml.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace commitas::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".commit-as";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *DEFAULT_DB_FILENAME = "commit-as.sqlite3";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("COMMITAS_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(env);
  }
  return std::nullopt;
}

bool is_known_duplicate_policy(const std::string &value) {
  const std::string policy = common::to_lower(common::trim(value));
  return policy == "allow" || policy == "reject" || policy == "overwrite";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::Result<std::filesystem::path>::success(candidate);
    }
    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory", common::ErrorKind::Config);
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure_from(home);
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure_from(cfg_dir);
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *db = std::getenv("COMMITAS_DB"); db != nullptr && *db) {
    config.store.path = db;
  }
  if (const char *git = std::getenv("COMMITAS_GIT"); git != nullptr && *git) {
    config.git.executable = git;
  }
  if (const char *backend = std::getenv("COMMITAS_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> load_config() {
  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure_from(cfg_path_result);
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                           common::ErrorKind::Config);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  const auto parsed = common::parse_toml(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(),
                                           common::ErrorKind::Config);
  }

  const auto &doc = parsed.value();
  // Only file values are expanded; command line and environment paths arrive
  // already expanded by the shell and are used verbatim.
  if (doc.has("store.path")) {
    config.store.path = common::expand_path(doc.get_string("store.path"));
  }
  config.store.on_duplicate = doc.get_string("store.on_duplicate", config.store.on_duplicate);
  config.git.executable = doc.get_string("git.executable", config.git.executable);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (!is_known_duplicate_policy(config.store.on_duplicate)) {
    return common::Result<std::vector<std::string>>::failure(
        "Invalid store.on_duplicate: " + config.store.on_duplicate +
            " (expected allow, reject or overwrite)",
        common::ErrorKind::Config);
  }

  if (common::trim(config.git.executable).empty()) {
    return common::Result<std::vector<std::string>>::failure("git.executable must not be empty",
                                                              common::ErrorKind::Config);
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty() && backend != "none" && backend != "noop" && backend != "log") {
    return common::Result<std::vector<std::string>>::failure(
        "Invalid observability.backend: " + config.observability.backend,
        common::ErrorKind::Config);
  }

  if (!config.store.path.empty() &&
      std::filesystem::path(config.store.path).is_relative()) {
    warnings.push_back("store.path is relative and depends on the working directory");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

common::Result<std::filesystem::path> store_path(const Config &config) {
  if (!common::trim(config.store.path).empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(config.store.path));
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure_from(home);
  }
  return common::Result<std::filesystem::path>::success(home.value() / DEFAULT_DB_FILENAME);
}

} // namespace commitas::config
