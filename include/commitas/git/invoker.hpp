#pragma once

#include "commitas/common/result.hpp"
#include "commitas/git/runner.hpp"
#include "commitas/identity/identity.hpp"

#include <memory>
#include <string>
#include <vector>

namespace commitas::git {

[[nodiscard]] std::vector<std::string>
build_commit_args(const identity::IdentityRecord &identity,
                  const std::vector<std::string> &extra_args);

[[nodiscard]] std::vector<std::vector<std::string>>
build_set_global_args(const identity::IdentityRecord &identity);

class GitInvoker {
public:
  explicit GitInvoker(std::shared_ptr<IGitRunner> runner = std::make_shared<GitCliRunner>());

  // One commit with author name and email overridden for this invocation only.
  [[nodiscard]] common::Result<int> commit(const identity::IdentityRecord &identity,
                                           const std::vector<std::string> &extra_args);

  // Writes user.name then user.email to the global git config, stopping at the
  // first non-zero exit.
  [[nodiscard]] common::Result<int> set_global(const identity::IdentityRecord &identity);

private:
  [[nodiscard]] common::Result<int> run_logged(const std::vector<std::string> &args);

  std::shared_ptr<IGitRunner> runner_;
};

} // namespace commitas::git
