#pragma once

#include "commitas/observability/observer.hpp"

namespace commitas::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace commitas::observability
