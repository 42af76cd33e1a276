#pragma once

#include "commitas/git/runner.hpp"
#include "commitas/observability/observer.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace commitas::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

// Sets (or unsets) an environment variable and restores the old value on scope exit.
class EnvGuard {
public:
  EnvGuard(std::string key, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;

private:
  std::string key_;
  std::optional<std::string> old_value_;
};

// Records every argv it is asked to run and answers with scripted exit codes.
class RecordingGitRunner final : public git::IGitRunner {
public:
  [[nodiscard]] common::Result<int> run(const std::vector<std::string> &args) override;

  void push_exit_code(int code) { exit_codes_.push_back(code); }
  void fail_spawn(std::string message) { spawn_error_ = std::move(message); }

  std::vector<std::vector<std::string>> calls;

private:
  std::vector<int> exit_codes_;
  std::optional<std::string> spawn_error_;
};

// Copies every event into a vector the test keeps after handing the observer over.
class RecordingObserver final : public observability::IObserver {
public:
  explicit RecordingObserver(std::shared_ptr<std::vector<observability::ObserverEvent>> events)
      : events_(std::move(events)) {}

  void record_event(const observability::ObserverEvent &event) override {
    events_->push_back(event);
  }
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<std::vector<observability::ObserverEvent>> events_;
};

} // namespace commitas::testing
