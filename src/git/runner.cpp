#include "commitas/git/runner.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace commitas::git {

namespace {

// Ignores SIGINT and SIGQUIT in this process while a child owns the terminal,
// the way system(3) does, and restores the previous handlers on scope exit.
class SignalShield {
public:
  SignalShield() {
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    (void)sigaction(SIGINT, &ignore, &old_int_);
    (void)sigaction(SIGQUIT, &ignore, &old_quit_);
  }

  ~SignalShield() {
    (void)sigaction(SIGINT, &old_int_, nullptr);
    (void)sigaction(SIGQUIT, &old_quit_, nullptr);
  }

  SignalShield(const SignalShield &) = delete;
  SignalShield &operator=(const SignalShield &) = delete;

private:
  struct sigaction old_int_ {};
  struct sigaction old_quit_ {};
};

} // namespace

GitCliRunner::GitCliRunner(std::string executable) : executable_(std::move(executable)) {}

common::Result<int> GitCliRunner::run(const std::vector<std::string> &args) {
  if (executable_.empty()) {
    return common::Result<int>::failure("git executable is empty",
                                        common::ErrorKind::ExternalProcess);
  }

  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(executable_.c_str()));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const SignalShield shield;
  const pid_t pid = fork();
  if (pid < 0) {
    return common::Result<int>::failure(std::string("failed to fork ") + executable_ + ": " +
                                            std::strerror(errno),
                                        common::ErrorKind::ExternalProcess);
  }

  if (pid == 0) {
    (void)signal(SIGINT, SIG_DFL);
    (void)signal(SIGQUIT, SIG_DFL);
    execvp(executable_.c_str(), argv.data());
    _exit(127);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return common::Result<int>::failure(std::string("failed to wait for ") + executable_ +
                                              ": " + std::strerror(errno),
                                          common::ErrorKind::ExternalProcess);
    }
  }

  if (WIFEXITED(status)) {
    return common::Result<int>::success(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return common::Result<int>::success(128 + WTERMSIG(status));
  }
  return common::Result<int>::success(1);
}

} // namespace commitas::git
