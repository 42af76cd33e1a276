#pragma once

#include "commitas/common/result.hpp"
#include "commitas/identity/identity.hpp"

#include <filesystem>
#include <optional>
#include <sqlite3.h>
#include <string_view>
#include <vector>

namespace commitas::identity {

// What add() does when the key is already stored.
enum class DuplicatePolicy { Allow, Reject, Overwrite };

[[nodiscard]] common::Result<DuplicatePolicy> parse_duplicate_policy(const std::string &value);
[[nodiscard]] std::string_view duplicate_policy_name(DuplicatePolicy policy);

/// Persistent identities in a single SQLite file.
///
/// The connection is opened by the constructor and closed by the destructor, so a
/// store living on the stack is released on every return path. A failed open is
/// reported by ensure_schema() and every later call.
class IdentityStore {
public:
  explicit IdentityStore(std::filesystem::path db_path,
                         DuplicatePolicy policy = DuplicatePolicy::Allow);
  ~IdentityStore();

  IdentityStore(const IdentityStore &) = delete;
  IdentityStore &operator=(const IdentityStore &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }
  [[nodiscard]] DuplicatePolicy duplicate_policy() const { return policy_; }
  void set_duplicate_policy(DuplicatePolicy policy) { policy_ = policy; }

  /// Creates the identities table and its key index when missing. Safe to repeat.
  [[nodiscard]] common::Status ensure_schema();

  /// Inserts a record and returns its id. Existing records with the same key are
  /// kept, rejected or replaced according to the duplicate policy.
  [[nodiscard]] common::Result<std::int64_t> add(const std::string &key, const std::string &name,
                                                 const std::string &email);

  /// First record with this key in storage order.
  [[nodiscard]] common::Result<std::optional<IdentityRecord>> get_by_key(const std::string &key);
  [[nodiscard]] common::Result<std::optional<IdentityRecord>> get_by_id(std::int64_t id);

  /// Removes every record with this key and returns how many were removed.
  [[nodiscard]] common::Result<std::size_t> delete_by_key(const std::string &key);
  [[nodiscard]] common::Result<bool> delete_by_id(std::int64_t id);

  [[nodiscard]] common::Result<std::vector<IdentityRecord>> list_all();

private:
  [[nodiscard]] common::Status not_open() const;
  [[nodiscard]] common::Result<std::int64_t> insert(const std::string &key, const std::string &name,
                                                    const std::string &email);
  [[nodiscard]] common::Result<std::size_t> count_key(const std::string &key);
  [[nodiscard]] common::Result<std::size_t> remove_key(const std::string &key);
  [[nodiscard]] common::Result<std::int64_t> add_in_transaction(const std::string &key,
                                                                const std::string &name,
                                                                const std::string &email);
  [[nodiscard]] common::Result<std::optional<IdentityRecord>> fetch_one(sqlite3_stmt *stmt);
  [[nodiscard]] static IdentityRecord row_to_record(sqlite3_stmt *stmt);

  std::filesystem::path db_path_;
  DuplicatePolicy policy_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
};

} // namespace commitas::identity
