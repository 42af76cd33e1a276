#include "commitas/observability/log_observer.hpp"

#include "commitas/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace commitas::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, StoreOpenedEvent>) {
          log_line(*out_, "DEBUG", "store.open path=" + evt.path);
        } else if constexpr (std::is_same_v<T, IdentityResolvedEvent>) {
          log_line(*out_, "INFO", "identity.resolve key=" + evt.key +
                                      " source=" + (evt.raw ? std::string("raw") : std::string("store")));
        } else if constexpr (std::is_same_v<T, IdentityAddedEvent>) {
          log_line(*out_, "INFO", "identity.add key=" + evt.key + " id=" + std::to_string(evt.id));
        } else if constexpr (std::is_same_v<T, IdentitiesRemovedEvent>) {
          log_line(*out_, "INFO",
                   "identity.remove key=" + evt.key + " count=" + std::to_string(evt.count));
        } else if constexpr (std::is_same_v<T, GitInvokedEvent>) {
          log_line(*out_, evt.exit_code == 0 ? "INFO" : "WARN",
                   "git.run args=[" + common::join(evt.args, " ") +
                       "] exit_code=" + std::to_string(evt.exit_code));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(*out_, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::flush() { out_->flush(); }

} // namespace commitas::observability
