#pragma once

#include "commitas/common/result.hpp"
#include "commitas/identity/identity.hpp"
#include "commitas/identity/store.hpp"

#include <string>

namespace commitas::identity {

inline constexpr char kRawFieldDelimiter = ';';

enum class ResolveMode { Key, Raw };

// Parses "name;email" (key = name) or "key;name;email". The result has id == 0.
[[nodiscard]] common::Result<IdentityRecord> parse_raw_identity(const std::string &text);

class IdentityResolver {
public:
  explicit IdentityResolver(IdentityStore &store);

  [[nodiscard]] common::Result<IdentityRecord> resolve(const std::string &reference,
                                                       ResolveMode mode) const;

private:
  [[nodiscard]] common::Result<IdentityRecord> resolve_key(const std::string &key) const;

  IdentityStore &store_;
};

} // namespace commitas::identity
