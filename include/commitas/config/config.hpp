#pragma once

#include "commitas/common/result.hpp"
#include "commitas/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace commitas::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

// Location of the identity database. store.path is used verbatim when set.
[[nodiscard]] common::Result<std::filesystem::path> store_path(const Config &config);

} // namespace commitas::config
