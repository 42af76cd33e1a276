#include "commitas/git/invoker.hpp"

#include "commitas/observability/global.hpp"

namespace commitas::git {

std::vector<std::string> build_commit_args(const identity::IdentityRecord &identity,
                                           const std::vector<std::string> &extra_args) {
  std::vector<std::string> args = {
      "-c", "user.name=" + identity.name, "-c", "user.email=" + identity.email, "commit",
  };
  args.insert(args.end(), extra_args.begin(), extra_args.end());
  return args;
}

std::vector<std::vector<std::string>>
build_set_global_args(const identity::IdentityRecord &identity) {
  return {
      {"config", "--global", "user.name", identity.name},
      {"config", "--global", "user.email", identity.email},
  };
}

GitInvoker::GitInvoker(std::shared_ptr<IGitRunner> runner) : runner_(std::move(runner)) {}

common::Result<int> GitInvoker::run_logged(const std::vector<std::string> &args) {
  auto result = runner_->run(args);
  if (!result.ok()) {
    observability::record_error("git", result.error());
    return result;
  }
  observability::record_git_invoked(args, result.value());
  return result;
}

common::Result<int> GitInvoker::commit(const identity::IdentityRecord &identity,
                                       const std::vector<std::string> &extra_args) {
  return run_logged(build_commit_args(identity, extra_args));
}

common::Result<int> GitInvoker::set_global(const identity::IdentityRecord &identity) {
  for (const auto &args : build_set_global_args(identity)) {
    auto result = run_logged(args);
    if (!result.ok() || result.value() != 0) {
      return result;
    }
  }
  return common::Result<int>::success(0);
}

} // namespace commitas::git
