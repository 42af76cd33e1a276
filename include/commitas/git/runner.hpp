#pragma once

#include "commitas/common/result.hpp"

#include <string>
#include <vector>

namespace commitas::git {

class IGitRunner {
public:
  virtual ~IGitRunner() = default;

  // Runs the external tool with args and returns its exit status. Only a failure
  // to start the process is an error; a non-zero exit is a successful result.
  [[nodiscard]] virtual common::Result<int> run(const std::vector<std::string> &args) = 0;
};

// Spawns the executable with the caller's stdin, stdout and stderr and blocks
// until it exits. A child killed by a signal reports 128 + signal number; an
// executable that cannot be exec'd reports 127.
class GitCliRunner final : public IGitRunner {
public:
  explicit GitCliRunner(std::string executable = "git");

  [[nodiscard]] common::Result<int> run(const std::vector<std::string> &args) override;
  [[nodiscard]] const std::string &executable() const { return executable_; }

private:
  std::string executable_;
};

} // namespace commitas::git
