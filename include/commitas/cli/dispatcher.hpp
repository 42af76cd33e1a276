#pragma once

#include "commitas/common/result.hpp"
#include "commitas/git/invoker.hpp"
#include "commitas/identity/resolver.hpp"
#include "commitas/identity/store.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace commitas::cli {

enum class Action { Commit, Set, Add, Remove, List };

[[nodiscard]] common::Result<Action> parse_action(const std::string &name);
[[nodiscard]] std::string_view action_name(Action action);

struct Invocation {
  Action action = Action::List;
  std::vector<std::string> operands;
  // Tokens after the identity argument of `commit`, forwarded to git untouched.
  std::vector<std::string> passthrough;
  identity::ResolveMode mode = identity::ResolveMode::Key;
  std::optional<std::int64_t> id;
  std::optional<identity::DuplicatePolicy> on_duplicate;
};

// Runs exactly one action. The returned value is the exit status for the
// process: 0 for store actions, the external tool's status for commit and set.
class ActionDispatcher {
public:
  ActionDispatcher(identity::IdentityStore &store, git::GitInvoker &invoker, std::ostream &out);

  [[nodiscard]] common::Result<int> dispatch(const Invocation &invocation);

private:
  [[nodiscard]] common::Result<int> run_commit(const Invocation &invocation);
  [[nodiscard]] common::Result<int> run_set(const Invocation &invocation);
  [[nodiscard]] common::Result<int> run_add(const Invocation &invocation);
  [[nodiscard]] common::Result<int> run_remove(const Invocation &invocation);
  [[nodiscard]] common::Result<int> run_list(const Invocation &invocation);

  identity::IdentityStore &store_;
  git::GitInvoker &invoker_;
  std::ostream &out_;
};

} // namespace commitas::cli
