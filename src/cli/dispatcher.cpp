#include "commitas/cli/dispatcher.hpp"

#include <ostream>

namespace commitas::cli {

namespace {

common::Result<int> usage(const std::string &message) {
  return common::Result<int>::failure(message, common::ErrorKind::Usage);
}

} // namespace

common::Result<Action> parse_action(const std::string &name) {
  if (name == "commit") {
    return common::Result<Action>::success(Action::Commit);
  }
  if (name == "set") {
    return common::Result<Action>::success(Action::Set);
  }
  if (name == "add") {
    return common::Result<Action>::success(Action::Add);
  }
  if (name == "remove") {
    return common::Result<Action>::success(Action::Remove);
  }
  if (name == "list") {
    return common::Result<Action>::success(Action::List);
  }
  return common::Result<Action>::failure("unknown command: " + name, common::ErrorKind::Usage);
}

std::string_view action_name(const Action action) {
  switch (action) {
  case Action::Commit:
    return "commit";
  case Action::Set:
    return "set";
  case Action::Add:
    return "add";
  case Action::Remove:
    return "remove";
  case Action::List:
    return "list";
  }
  return "unknown";
}

ActionDispatcher::ActionDispatcher(identity::IdentityStore &store, git::GitInvoker &invoker,
                                   std::ostream &out)
    : store_(store), invoker_(invoker), out_(out) {}

common::Result<int> ActionDispatcher::dispatch(const Invocation &invocation) {
  if (invocation.mode == identity::ResolveMode::Raw && invocation.action != Action::Commit &&
      invocation.action != Action::Set) {
    return usage("--raw-user only applies to commit and set");
  }

  switch (invocation.action) {
  case Action::Commit:
    return run_commit(invocation);
  case Action::Set:
    return run_set(invocation);
  case Action::Add:
    return run_add(invocation);
  case Action::Remove:
    return run_remove(invocation);
  case Action::List:
    return run_list(invocation);
  }
  return usage("unknown command");
}

common::Result<int> ActionDispatcher::run_commit(const Invocation &invocation) {
  if (invocation.operands.size() != 1) {
    return usage("usage: commit-as commit <key> [git-commit-args...]");
  }
  const identity::IdentityResolver resolver(store_);
  auto resolved = resolver.resolve(invocation.operands[0], invocation.mode);
  if (!resolved.ok()) {
    return common::Result<int>::failure_from(resolved);
  }
  return invoker_.commit(resolved.value(), invocation.passthrough);
}

common::Result<int> ActionDispatcher::run_set(const Invocation &invocation) {
  if (invocation.operands.size() != 1 || !invocation.passthrough.empty()) {
    return usage("usage: commit-as set <key>");
  }
  const identity::IdentityResolver resolver(store_);
  auto resolved = resolver.resolve(invocation.operands[0], invocation.mode);
  if (!resolved.ok()) {
    return common::Result<int>::failure_from(resolved);
  }
  auto status = invoker_.set_global(resolved.value());
  if (status.ok() && status.value() == 0) {
    out_ << "Global git identity set to " << resolved.value().name << " <"
         << resolved.value().email << ">\n";
  }
  return status;
}

common::Result<int> ActionDispatcher::run_add(const Invocation &invocation) {
  if (invocation.operands.size() != 3) {
    return usage("usage: commit-as add [--on-duplicate allow|reject|overwrite] <key> <name> "
                 "<email>");
  }
  if (invocation.on_duplicate.has_value()) {
    store_.set_duplicate_policy(*invocation.on_duplicate);
  }

  const auto &key = invocation.operands[0];
  auto added = store_.add(key, invocation.operands[1], invocation.operands[2]);
  if (!added.ok()) {
    return common::Result<int>::failure_from(added);
  }
  out_ << "Added identity '" << key << "' (id " << added.value() << ")\n";
  return common::Result<int>::success(0);
}

common::Result<int> ActionDispatcher::run_remove(const Invocation &invocation) {
  if (invocation.id.has_value()) {
    if (!invocation.operands.empty()) {
      return usage("usage: commit-as remove <key> | remove --id <id>");
    }
    auto removed = store_.delete_by_id(*invocation.id);
    if (!removed.ok()) {
      return common::Result<int>::failure_from(removed);
    }
    if (removed.value()) {
      out_ << "Removed identity with id " << *invocation.id << "\n";
    } else {
      out_ << "No identity with id " << *invocation.id << "\n";
    }
    return common::Result<int>::success(0);
  }

  if (invocation.operands.size() != 1) {
    return usage("usage: commit-as remove <key> | remove --id <id>");
  }
  const auto &key = invocation.operands[0];
  auto removed = store_.delete_by_key(key);
  if (!removed.ok()) {
    return common::Result<int>::failure_from(removed);
  }
  if (removed.value() == 0) {
    out_ << "No identities matching '" << key << "'\n";
  } else {
    out_ << "Removed " << removed.value() << (removed.value() == 1 ? " identity" : " identities")
         << " matching '" << key << "'\n";
  }
  return common::Result<int>::success(0);
}

common::Result<int> ActionDispatcher::run_list(const Invocation &invocation) {
  if (!invocation.operands.empty()) {
    return usage("usage: commit-as list");
  }
  auto records = store_.list_all();
  if (!records.ok()) {
    return common::Result<int>::failure_from(records);
  }
  if (records.value().empty()) {
    out_ << "No identities stored in " << store_.path().string() << "\n";
    return common::Result<int>::success(0);
  }
  for (const auto &record : records.value()) {
    out_ << record.id << " | " << record.key << " | " << record.name << " | " << record.email
         << "\n";
  }
  return common::Result<int>::success(0);
}

} // namespace commitas::cli
