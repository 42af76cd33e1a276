#pragma once

#include "commitas/observability/observer.hpp"

#include <memory>

namespace commitas::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);

void record_store_opened(const std::string &path);
void record_identity_resolved(const std::string &key, bool raw);
void record_identity_added(const std::string &key, std::int64_t id);
void record_identities_removed(const std::string &key, std::size_t count);
void record_git_invoked(const std::vector<std::string> &args, int exit_code);
void record_error(const std::string &component, const std::string &message);

} // namespace commitas::observability
