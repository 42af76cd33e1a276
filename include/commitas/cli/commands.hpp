#pragma once

#include "commitas/cli/dispatcher.hpp"
#include "commitas/common/result.hpp"
#include "commitas/git/runner.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace commitas::cli {

struct GlobalOptions {
  std::optional<std::string> db_path;
  std::optional<std::string> config_path;
  bool raw_user = false;
  bool verbose = false;
};

struct CommandLine {
  enum class Kind { Run, Help, Version, ConfigPath };

  Kind kind = Kind::Help;
  GlobalOptions globals;
  Invocation invocation;
};

// Global options are accepted before the command and, for commit and set,
// before the identity argument. Everything after the identity argument of
// commit is passed through.
[[nodiscard]] common::Result<CommandLine> parse_command_line(const std::vector<std::string> &args);

[[nodiscard]] int exit_code_for(common::ErrorKind kind);

void print_help(std::ostream &out);

int run_cli(int argc, char **argv);

// Same as above with injectable streams and external tool runner. A null
// runner spawns the configured git executable.
int run_cli(const std::vector<std::string> &args, std::ostream &out, std::ostream &err,
            std::shared_ptr<git::IGitRunner> runner = nullptr);

} // namespace commitas::cli
