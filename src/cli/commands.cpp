#include "commitas/cli/commands.hpp"

#include "commitas/common/fs.hpp"
#include "commitas/config/config.hpp"
#include "commitas/identity/store.hpp"
#include "commitas/observability/factory.hpp"
#include "commitas/observability/global.hpp"

#include <charconv>
#include <iostream>
#include <string>
#include <vector>

namespace commitas::cli {

namespace {

std::string version_string() {
#ifdef COMMITAS_VERSION
  std::string version = COMMITAS_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "commit-as " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool is_option(const std::string &token) { return token.size() > 1 && token.front() == '-'; }

common::Status usage_error(const std::string &message) {
  return common::Status::error(message, common::ErrorKind::Usage);
}

// Reads "--name value" or "--name=value" at args[i]. Returns false when args[i]
// is not this option; advances i past the value when it is.
bool take_value(const std::vector<std::string> &args, std::size_t &i, const std::string &name,
                std::optional<std::string> &out_value, common::Status &status) {
  const std::string &token = args[i];
  if (token == name) {
    if (i + 1 >= args.size()) {
      status = usage_error("missing value for " + name);
      return true;
    }
    out_value = args[i + 1];
    i += 2;
    return true;
  }
  if (common::starts_with(token, name + "=")) {
    const auto value = token.substr(name.size() + 1);
    if (value.empty()) {
      status = usage_error("missing value for " + name);
      return true;
    }
    out_value = value;
    i += 1;
    return true;
  }
  return false;
}

// Consumes one global option at args[i]. Returns false when args[i] is not one.
bool take_global(const std::vector<std::string> &args, std::size_t &i, GlobalOptions &globals,
                 common::Status &status) {
  if (take_value(args, i, "--db", globals.db_path, status)) {
    return true;
  }
  if (take_value(args, i, "--config", globals.config_path, status)) {
    return true;
  }
  if (args[i] == "--raw-user" || args[i] == "-r") {
    globals.raw_user = true;
    ++i;
    return true;
  }
  if (args[i] == "--verbose" || args[i] == "-v") {
    globals.verbose = true;
    ++i;
    return true;
  }
  return false;
}

common::Result<std::int64_t> parse_id(const std::string &text) {
  std::int64_t parsed = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (text.empty() || ec != std::errc() || ptr != last || parsed <= 0) {
    return common::Result<std::int64_t>::failure("invalid identity id: " + text,
                                                 common::ErrorKind::Usage);
  }
  return common::Result<std::int64_t>::success(parsed);
}

common::Status parse_identity_command(const std::vector<std::string> &args, std::size_t i,
                                      CommandLine &line) {
  common::Status status = common::Status::success();
  while (i < args.size() && is_option(args[i])) {
    if (!take_global(args, i, line.globals, status)) {
      return usage_error("unknown option before identity: " + args[i]);
    }
    if (!status.ok()) {
      return status;
    }
  }
  if (i >= args.size()) {
    return usage_error("missing identity for " + std::string(action_name(line.invocation.action)));
  }
  line.invocation.operands.push_back(args[i++]);
  line.invocation.passthrough.assign(args.begin() + static_cast<long>(i), args.end());
  return common::Status::success();
}

common::Status parse_store_command(const std::vector<std::string> &args, std::size_t i,
                                   CommandLine &line) {
  common::Status status = common::Status::success();
  while (i < args.size()) {
    if (args[i] == "--") {
      line.invocation.operands.insert(line.invocation.operands.end(),
                                      args.begin() + static_cast<long>(i) + 1, args.end());
      break;
    }
    if (!is_option(args[i])) {
      line.invocation.operands.push_back(args[i++]);
      continue;
    }
    if (take_global(args, i, line.globals, status)) {
      if (!status.ok()) {
        return status;
      }
      continue;
    }

    std::optional<std::string> value;
    if (line.invocation.action == Action::Add &&
        take_value(args, i, "--on-duplicate", value, status)) {
      if (!status.ok()) {
        return status;
      }
      auto policy = identity::parse_duplicate_policy(*value);
      if (!policy.ok()) {
        return usage_error(policy.error());
      }
      line.invocation.on_duplicate = policy.value();
      continue;
    }
    if (line.invocation.action == Action::Remove && take_value(args, i, "--id", value, status)) {
      if (!status.ok()) {
        return status;
      }
      auto id = parse_id(*value);
      if (!id.ok()) {
        return usage_error(id.error());
      }
      line.invocation.id = id.value();
      continue;
    }
    return usage_error("unknown option for " + std::string(action_name(line.invocation.action)) +
                       ": " + args[i]);
  }
  return common::Status::success();
}

int report(std::ostream &err, const common::ErrorKind kind, const std::string &message) {
  observability::record_error(std::string(common::error_kind_name(kind)), message);
  err << "commit-as: " << message << "\n";
  if (kind == common::ErrorKind::Usage) {
    err << "Run 'commit-as help' for usage.\n";
  }
  return exit_code_for(kind);
}

} // namespace

common::Result<CommandLine> parse_command_line(const std::vector<std::string> &args) {
  CommandLine line;
  common::Status status = common::Status::success();

  std::size_t i = 0;
  while (i < args.size() && is_option(args[i])) {
    const std::string &token = args[i];
    if (token == "--help" || token == "-h") {
      line.kind = CommandLine::Kind::Help;
      return common::Result<CommandLine>::success(std::move(line));
    }
    if (token == "--version" || token == "-V") {
      line.kind = CommandLine::Kind::Version;
      return common::Result<CommandLine>::success(std::move(line));
    }
    if (!take_global(args, i, line.globals, status)) {
      return common::Result<CommandLine>::failure("unknown option: " + token,
                                                  common::ErrorKind::Usage);
    }
    if (!status.ok()) {
      return common::Result<CommandLine>::failure_from(status);
    }
  }

  if (i >= args.size()) {
    line.kind = CommandLine::Kind::Help;
    return common::Result<CommandLine>::success(std::move(line));
  }

  const std::string subcommand = args[i++];
  if (subcommand == "help") {
    line.kind = CommandLine::Kind::Help;
    return common::Result<CommandLine>::success(std::move(line));
  }
  if (subcommand == "version") {
    line.kind = CommandLine::Kind::Version;
    return common::Result<CommandLine>::success(std::move(line));
  }
  if (subcommand == "config-path") {
    line.kind = CommandLine::Kind::ConfigPath;
    return common::Result<CommandLine>::success(std::move(line));
  }

  auto action = parse_action(subcommand);
  if (!action.ok()) {
    return common::Result<CommandLine>::failure_from(action);
  }
  line.kind = CommandLine::Kind::Run;
  line.invocation.action = action.value();

  if (line.invocation.action == Action::Commit || line.invocation.action == Action::Set) {
    status = parse_identity_command(args, i, line);
  } else {
    status = parse_store_command(args, i, line);
  }
  if (!status.ok()) {
    return common::Result<CommandLine>::failure_from(status);
  }

  if (line.globals.raw_user) {
    line.invocation.mode = identity::ResolveMode::Raw;
  }
  return common::Result<CommandLine>::success(std::move(line));
}

int exit_code_for(const common::ErrorKind kind) {
  switch (kind) {
  case common::ErrorKind::None:
    return 0;
  case common::ErrorKind::Usage:
    return 2;
  case common::ErrorKind::ExternalProcess:
    return 127;
  case common::ErrorKind::Validation:
  case common::ErrorKind::NotFound:
  case common::ErrorKind::Duplicate:
  case common::ErrorKind::Config:
  case common::ErrorKind::Store:
    return 1;
  }
  return 1;
}

void print_help(std::ostream &out) {
  out << version_string() << "\n";
  out << "Commit as one of several stored git identities.\n\n";
  out << "usage: commit-as [--db PATH] [--config PATH] [-r|--raw-user] [-v] <command> [args]\n\n";
  out << "commands:\n";
  out << "  commit <key> [git-args...]   Commit once with the identity's name and email\n";
  out << "  set <key>                    Write the identity to git's global config\n";
  out << "  add <key> <name> <email>     Store a new identity\n";
  out << "      --on-duplicate MODE      allow, reject or overwrite an existing key\n";
  out << "  remove <key>                 Delete every identity stored under key\n";
  out << "  remove --id <id>             Delete one identity by id\n";
  out << "  list                         Show stored identities\n";
  out << "  config-path                  Print the config file location\n";
  out << "  version                      Show version\n\n";
  out << "options:\n";
  out << "  --db PATH      Identity database (default ~/commit-as.sqlite3)\n";
  out << "  --config PATH  Config file (default ~/.commit-as/config.toml)\n";
  out << "  -r, --raw-user Treat <key> as \"name;email\" or \"key;name;email\"\n";
  out << "  -v, --verbose  Log actions to stderr\n";
  out << "  --             End options for add and remove; later tokens are operands\n";
}

int run_cli(const std::vector<std::string> &args, std::ostream &out, std::ostream &err,
            std::shared_ptr<git::IGitRunner> runner) {
  auto parsed = parse_command_line(args);
  if (!parsed.ok()) {
    return report(err, parsed.kind(), parsed.error());
  }
  const CommandLine &line = parsed.value();

  if (line.kind == CommandLine::Kind::Help) {
    print_help(out);
    return 0;
  }
  if (line.kind == CommandLine::Kind::Version) {
    out << version_string() << "\n";
    return 0;
  }

  if (line.globals.config_path.has_value()) {
    config::set_config_path_override(std::filesystem::path(*line.globals.config_path));
  } else {
    config::clear_config_path_override();
  }
  if (line.kind == CommandLine::Kind::ConfigPath) {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      return report(err, path_result.kind(), path_result.error());
    }
    out << path_result.value().string() << "\n";
    return 0;
  }

  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return report(err, common::ErrorKind::Config, loaded.error());
  }
  config::Config cfg = loaded.value();
  if (line.globals.db_path.has_value()) {
    cfg.store.path = *line.globals.db_path;
  }
  if (line.globals.verbose) {
    cfg.observability.backend = "log";
  }

  auto validated = config::validate_config(cfg);
  if (!validated.ok()) {
    return report(err, common::ErrorKind::Config, validated.error());
  }
  for (const auto &warning : validated.value()) {
    err << "commit-as: warning: " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg));

  auto db_path = config::store_path(cfg);
  if (!db_path.ok()) {
    return report(err, db_path.kind(), db_path.error());
  }
  auto policy = identity::parse_duplicate_policy(cfg.store.on_duplicate);
  if (!policy.ok()) {
    return report(err, common::ErrorKind::Config, policy.error());
  }

  // Released on every return below.
  identity::IdentityStore store(db_path.value(), policy.value());
  if (auto schema = store.ensure_schema(); !schema.ok()) {
    return report(err, schema.kind(), schema.error());
  }

  if (runner == nullptr) {
    runner = std::make_shared<git::GitCliRunner>(cfg.git.executable);
  }
  git::GitInvoker invoker(std::move(runner));
  ActionDispatcher dispatcher(store, invoker, out);

  auto result = dispatcher.dispatch(line.invocation);
  if (!result.ok()) {
    return report(err, result.kind(), result.error());
  }
  if (result.value() != 0) {
    observability::record_error("git", "exited with status " + std::to_string(result.value()));
  }
  return result.value();
}

int run_cli(int argc, char **argv) {
  const std::vector<std::string> args = argc > 1 ? collect_args(argc - 1, argv + 1)
                                                 : std::vector<std::string>{};
  return run_cli(args, std::cout, std::cerr);
}

} // namespace commitas::cli
