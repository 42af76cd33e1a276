#include "commitas/observability/global.hpp"

#include <mutex>

namespace commitas::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_store_opened(const std::string &path) {
  record_event(StoreOpenedEvent{.path = path});
}

void record_identity_resolved(const std::string &key, const bool raw) {
  record_event(IdentityResolvedEvent{.key = key, .raw = raw});
}

void record_identity_added(const std::string &key, const std::int64_t id) {
  record_event(IdentityAddedEvent{.key = key, .id = id});
}

void record_identities_removed(const std::string &key, const std::size_t count) {
  record_event(IdentitiesRemovedEvent{.key = key, .count = count});
}

void record_git_invoked(const std::vector<std::string> &args, const int exit_code) {
  record_event(GitInvokedEvent{.args = args, .exit_code = exit_code});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace commitas::observability
