#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace commitas::observability {

struct StoreOpenedEvent {
  std::string path;
};

struct IdentityResolvedEvent {
  std::string key;
  bool raw = false;
};

struct IdentityAddedEvent {
  std::string key;
  std::int64_t id = 0;
};

struct IdentitiesRemovedEvent {
  std::string key;
  std::size_t count = 0;
};

struct GitInvokedEvent {
  std::vector<std::string> args;
  int exit_code = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<StoreOpenedEvent, IdentityResolvedEvent, IdentityAddedEvent,
                                   IdentitiesRemovedEvent, GitInvokedEvent, ErrorEvent>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace commitas::observability
