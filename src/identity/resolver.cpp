#include "commitas/identity/resolver.hpp"

#include "commitas/common/fs.hpp"
#include "commitas/observability/global.hpp"

#include <sstream>

namespace commitas::identity {

namespace {

std::string describe_tokens(const std::vector<std::string> &tokens) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << '\'' << tokens[i] << '\'';
  }
  out << ']';
  return out.str();
}

} // namespace

common::Result<IdentityRecord> parse_raw_identity(const std::string &text) {
  const auto tokens = common::split(text, kRawFieldDelimiter);

  IdentityRecord record;
  if (tokens.size() == 2) {
    record.key = tokens[0];
    record.name = tokens[0];
    record.email = tokens[1];
    return common::Result<IdentityRecord>::success(std::move(record));
  }
  if (tokens.size() == 3) {
    record.key = tokens[0];
    record.name = tokens[1];
    record.email = tokens[2];
    return common::Result<IdentityRecord>::success(std::move(record));
  }

  return common::Result<IdentityRecord>::failure(
      "expected 2 or 3 fields (name;email or key;name;email), found " +
          std::to_string(tokens.size()) + (tokens.size() == 1 ? " field: " : " fields: ") +
          describe_tokens(tokens),
      common::ErrorKind::Validation);
}

IdentityResolver::IdentityResolver(IdentityStore &store) : store_(store) {}

common::Result<IdentityRecord> IdentityResolver::resolve(const std::string &reference,
                                                         const ResolveMode mode) const {
  if (mode == ResolveMode::Raw) {
    auto parsed = parse_raw_identity(reference);
    if (parsed.ok()) {
      observability::record_identity_resolved(parsed.value().key, true);
    }
    return parsed;
  }
  return resolve_key(reference);
}

common::Result<IdentityRecord> IdentityResolver::resolve_key(const std::string &key) const {
  auto found = store_.get_by_key(key);
  if (!found.ok()) {
    return common::Result<IdentityRecord>::failure_from(found);
  }
  if (!found.value().has_value()) {
    return common::Result<IdentityRecord>::failure("cannot find identity '" + key +
                                                       "' in the identity store (" +
                                                       store_.path().string() + ")",
                                                   common::ErrorKind::NotFound);
  }
  observability::record_identity_resolved(key, false);
  return common::Result<IdentityRecord>::success(std::move(*found.value()));
}

} // namespace commitas::identity
