#include "test_framework.hpp"

#include "commitas/common/toml.hpp"
#include "commitas/config/config.hpp"
#include "commitas/observability/factory.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <optional>

namespace {

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = commitas::config::config_path_override();
    if (next.has_value()) {
      commitas::config::set_config_path_override(*next);
    } else {
      commitas::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      commitas::config::set_config_path_override(*old_override);
    } else {
      commitas::config::clear_config_path_override();
    }
  }
};

// Isolates HOME and every COMMITAS_* variable the loader reads.
struct IsolatedEnv {
  commitas::testing::TempWorkspace home;
  commitas::testing::EnvGuard env_home{"HOME", home.path().string()};
  commitas::testing::EnvGuard env_cfg{"COMMITAS_CONFIG_PATH", std::nullopt};
  commitas::testing::EnvGuard env_db{"COMMITAS_DB", std::nullopt};
  commitas::testing::EnvGuard env_git{"COMMITAS_GIT", std::nullopt};
  commitas::testing::EnvGuard env_obs{"COMMITAS_OBSERVABILITY", std::nullopt};
  ConfigOverrideGuard cfg_override;
};

} // namespace

void register_config_tests(std::vector<commitas::tests::TestCase> &tests) {
  using commitas::tests::require;
  namespace cfg = commitas::config;
  using commitas::testing::EnvGuard;

  tests.push_back({"config_path_defaults_under_home", [] {
                     IsolatedEnv env;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == env.home.path() / ".commit-as" / "config.toml",
                             "unexpected config path: " + path.value().string());
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     IsolatedEnv env;
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().store.path.empty(), "store path should default empty");
                     require(loaded.value().store.on_duplicate == "allow",
                             "duplicates should be allowed by default");
                     require(loaded.value().git.executable == "git", "git executable default");
                     require(loaded.value().observability.backend == "none",
                             "observability should be off by default");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     IsolatedEnv env;
                     env.home.create_file(".commit-as/config.toml", R"(
# identity store
[store]
path = "~/identities.db"
on_duplicate = "reject"

[git]
executable = "/usr/local/bin/git"

[observability]
backend = "log"
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().store.path == (env.home.path() / "identities.db").string(),
                             "~ in the file should expand to HOME: " + loaded.value().store.path);
                     require(loaded.value().store.on_duplicate == "reject", "policy mismatch");
                     require(loaded.value().git.executable == "/usr/local/bin/git",
                             "executable mismatch");
                     require(loaded.value().observability.backend == "log", "backend mismatch");

                     const auto db = cfg::store_path(loaded.value());
                     require(db.ok(), db.error());
                     require(db.value() == env.home.path() / "identities.db",
                             "~ should expand to HOME: " + db.value().string());
                   }});

  tests.push_back({"partial_toml_fills_defaults", [] {
                     IsolatedEnv env;
                     env.home.create_file(".commit-as/config.toml",
                                          "[store]\non_duplicate = \"overwrite\"\n");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().store.on_duplicate == "overwrite", "policy should load");
                     require(loaded.value().git.executable == "git", "git default should remain");
                   }});

  tests.push_back({"load_config_malformed_toml_is_config_error", [] {
                     IsolatedEnv env;
                     env.home.create_file(".commit-as/config.toml", "[store\npath = \"x\"\n");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "malformed config should fail");
                     require(loaded.kind() == commitas::common::ErrorKind::Config,
                             "malformed config should be a config error");
                     require(loaded.error().find("config.toml") != std::string::npos,
                             "error should name the file: " + loaded.error());
                   }});

  tests.push_back({"env_override_precedence", [] {
                     IsolatedEnv env;
                     env.home.create_file(".commit-as/config.toml",
                                          "[store]\npath = \"/from/file.db\"\n");
                     const EnvGuard db("COMMITAS_DB", std::optional<std::string>("/from/env.db"));
                     const EnvGuard git("COMMITAS_GIT", std::optional<std::string>("git-env"));
                     const EnvGuard obs("COMMITAS_OBSERVABILITY", std::optional<std::string>("log"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().store.path == "/from/env.db", "env should beat file");
                     require(loaded.value().git.executable == "git-env", "git env override failed");
                     require(loaded.value().observability.backend == "log",
                             "observability env override failed");
                   }});

  tests.push_back({"env_store_path_is_used_verbatim", [] {
                     IsolatedEnv env;
                     const std::string literal = env.home.path().string() + "/$HOME/~db$x.sqlite3";
                     const EnvGuard db("COMMITAS_DB", literal);

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto path = cfg::store_path(loaded.value());
                     require(path.ok(), path.error());
                     require(path.value().string() == literal,
                             "environment path must not be expanded: " + path.value().string());
                   }});

  tests.push_back({"file_store_path_expands_variables", [] {
                     IsolatedEnv env;
                     env.home.create_file(".commit-as/config.toml",
                                          "[store]\npath = \"$HOME/ids.sqlite3\"\n");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().store.path ==
                                 (env.home.path() / "ids.sqlite3").string(),
                             "$HOME in the file should expand: " + loaded.value().store.path);
                   }});

  tests.push_back({"config_path_override_supports_custom_file", [] {
                     IsolatedEnv env;
                     const auto custom = env.home.path() / "alt" / "commit-as.toml";
                     env.home.create_file("alt/commit-as.toml",
                                          "[git]\nexecutable = \"custom-git\"\n");
                     const ConfigOverrideGuard override_guard(custom);

                     const auto path = cfg::config_path();
                     require(path.ok() && path.value() == custom, "override path should be used");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().git.executable == "custom-git",
                             "override file should be loaded");
                   }});

  tests.push_back({"config_path_env_variable_is_honored", [] {
                     IsolatedEnv env;
                     const auto custom = env.home.path() / "env-config.toml";
                     const EnvGuard cfg_env("COMMITAS_CONFIG_PATH",
                                            std::optional<std::string>(custom.string()));
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == custom, "COMMITAS_CONFIG_PATH should be used");
                   }});

  tests.push_back({"store_path_defaults_to_home_database", [] {
                     IsolatedEnv env;
                     const cfg::Config config{};
                     const auto db = cfg::store_path(config);
                     require(db.ok(), db.error());
                     require(db.value() == env.home.path() / "commit-as.sqlite3",
                             "default database should live in HOME");
                   }});

  tests.push_back({"validate_default_config_has_no_warnings", [] {
                     const cfg::Config config{};
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().empty(), "defaults should not warn");
                   }});

  tests.push_back({"validate_rejects_unknown_duplicate_policy", [] {
                     cfg::Config config;
                     config.store.on_duplicate = "merge";
                     const auto result = cfg::validate_config(config);
                     require(!result.ok(), "unknown policy should fail");
                     require(result.error().find("on_duplicate") != std::string::npos,
                             "error should name the setting");
                   }});

  tests.push_back({"validate_rejects_empty_executable_and_bad_backend", [] {
                     cfg::Config config;
                     config.git.executable = "  ";
                     require(!cfg::validate_config(config).ok(), "empty executable should fail");

                     config.git.executable = "git";
                     config.observability.backend = "prometheus";
                     require(!cfg::validate_config(config).ok(), "unknown backend should fail");
                   }});

  tests.push_back({"validate_relative_store_path_warns", [] {
                     cfg::Config config;
                     config.store.path = "ids.sqlite3";
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 1, "relative path should warn once");
                   }});

  tests.push_back({"observer_factory_selects_backend", [] {
                     cfg::Config config;
                     require(commitas::observability::create_observer(config)->name() == "noop",
                             "default observer should be noop");
                     config.observability.backend = "log";
                     require(commitas::observability::create_observer(config)->name() == "log",
                             "log backend should create the log observer");
                   }});

  tests.push_back({"toml_reader_handles_sections_and_comments", [] {
                     const auto parsed = commitas::common::parse_toml(R"(
[store]
path = "a # not a comment" # trailing
[observability]
backend = log
)");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().get_string("store.path") == "a # not a comment",
                             "quoted hash should be kept");
                     require(parsed.value().get_string("observability.backend") == "log",
                             "bare value should be read as is");
                     require(!parsed.value().has("store.missing"), "missing key should be absent");
                   }});
}
