#include "test_framework.hpp"

#include "commitas/git/invoker.hpp"
#include "commitas/git/runner.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

void register_git_tests(std::vector<commitas::tests::TestCase> &tests) {
  using commitas::tests::require;
  namespace git = commitas::git;
  using commitas::identity::IdentityRecord;
  using commitas::testing::RecordingGitRunner;

  tests.push_back({"git_commit_args_override_identity_and_keep_extras", [] {
                     const IdentityRecord identity{.id = 0, .key = "a", .name = "A", .email = "a@x"};
                     const auto args =
                         git::build_commit_args(identity, {"-m", "fix: typo", "--amend", "--", "a b"});
                     const std::vector<std::string> expected = {
                         "-c", "user.name=A", "-c", "user.email=a@x", "commit",
                         "-m", "fix: typo",   "--amend", "--", "a b"};
                     require(args == expected, "commit argv mismatch");
                   }});

  tests.push_back({"git_commit_args_without_extras_end_with_commit", [] {
                     const IdentityRecord identity{.id = 3, .key = "kc", .name = "K C", .email = "kc@x"};
                     const auto args = git::build_commit_args(identity, {});
                     require(args.size() == 5, "no extras should leave five arguments");
                     require(args.back() == "commit", "last argument should be commit");
                     require(args[1] == "user.name=K C", "names with spaces stay one argument");
                   }});

  tests.push_back({"git_set_global_args_write_name_then_email", [] {
                     const IdentityRecord identity{.id = 0, .key = "a", .name = "A", .email = "a@x"};
                     const auto calls = git::build_set_global_args(identity);
                     require(calls.size() == 2, "two config invocations expected");
                     require(calls[0] == std::vector<std::string>{"config", "--global", "user.name", "A"},
                             "first call should set user.name");
                     require(calls[1] ==
                                 std::vector<std::string>{"config", "--global", "user.email", "a@x"},
                             "second call should set user.email");
                   }});

  tests.push_back({"git_invoker_commit_returns_external_exit_code", [] {
                     auto runner = std::make_shared<RecordingGitRunner>();
                     runner->push_exit_code(1);
                     git::GitInvoker invoker(runner);
                     const IdentityRecord identity{.id = 0, .key = "a", .name = "A", .email = "a@x"};

                     auto result = invoker.commit(identity, {"-m", "msg"});
                     require(result.ok(), result.error());
                     require(result.value() == 1, "exit code should be propagated");
                     require(runner->calls.size() == 1, "one git call expected");
                     require(runner->calls[0].back() == "msg", "extras should be forwarded");
                   }});

  tests.push_back({"git_invoker_set_global_stops_at_first_failure", [] {
                     auto runner = std::make_shared<RecordingGitRunner>();
                     runner->push_exit_code(4);
                     git::GitInvoker invoker(runner);
                     const IdentityRecord identity{.id = 0, .key = "a", .name = "A", .email = "a@x"};

                     auto result = invoker.set_global(identity);
                     require(result.ok(), result.error());
                     require(result.value() == 4, "first failure should be returned");
                     require(runner->calls.size() == 1, "email should not be written after a failure");
                   }});

  tests.push_back({"git_invoker_set_global_runs_both_on_success", [] {
                     auto runner = std::make_shared<RecordingGitRunner>();
                     git::GitInvoker invoker(runner);
                     const IdentityRecord identity{.id = 0, .key = "a", .name = "A", .email = "a@x"};

                     auto result = invoker.set_global(identity);
                     require(result.ok() && result.value() == 0, "set_global should succeed");
                     require(runner->calls.size() == 2, "name and email should both be written");
                   }});

  tests.push_back({"git_invoker_spawn_failure_is_external_process_error", [] {
                     auto runner = std::make_shared<RecordingGitRunner>();
                     runner->fail_spawn("failed to fork git");
                     git::GitInvoker invoker(runner);
                     const IdentityRecord identity{.id = 0, .key = "a", .name = "A", .email = "a@x"};

                     auto result = invoker.commit(identity, {});
                     require(!result.ok(), "spawn failure should be an error");
                     require(result.kind() == commitas::common::ErrorKind::ExternalProcess,
                             "spawn failure kind mismatch");
                   }});

  tests.push_back({"git_cli_runner_reports_child_exit_status", [] {
                     git::GitCliRunner succeed("true");
                     auto ok = succeed.run({"-c", "user.name=A", "commit"});
                     require(ok.ok(), ok.error());
                     require(ok.value() == 0, "true should exit 0");

                     git::GitCliRunner fail("false");
                     auto failed = fail.run({"commit"});
                     require(failed.ok(), failed.error());
                     require(failed.value() != 0, "false should exit non-zero");
                   }});

  tests.push_back({"git_cli_runner_defaults_to_git_on_path", [] {
                     const git::GitCliRunner runner;
                     require(runner.executable() == "git", "default executable should be git");
                   }});

  tests.push_back({"git_cli_runner_missing_executable_exits_127", [] {
                     git::GitCliRunner runner("commit-as-definitely-not-a-real-binary");
                     auto result = runner.run({"commit"});
                     require(result.ok(), result.error());
                     require(result.value() == 127, "exec failure should exit 127");
                   }});
}
