#pragma once

#include <cstdint>
#include <string>

namespace commitas::identity {

// A (key, name, email) triple. Records parsed from raw literals keep id == 0
// and are never written to the store.
struct IdentityRecord {
  std::int64_t id = 0;
  std::string key;
  std::string name;
  std::string email;

  [[nodiscard]] bool persisted() const { return id != 0; }
};

} // namespace commitas::identity
