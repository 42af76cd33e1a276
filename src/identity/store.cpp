#include "commitas/identity/store.hpp"

#include "commitas/common/fs.hpp"
#include "commitas/observability/global.hpp"

namespace commitas::identity {

namespace {

constexpr const char *SELECT_COLUMNS = "SELECT id, key, name, email_address FROM identities";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message, common::ErrorKind::Store);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? std::string() : std::string(text);
}

} // namespace

common::Result<DuplicatePolicy> parse_duplicate_policy(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "allow") {
    return common::Result<DuplicatePolicy>::success(DuplicatePolicy::Allow);
  }
  if (normalized == "reject") {
    return common::Result<DuplicatePolicy>::success(DuplicatePolicy::Reject);
  }
  if (normalized == "overwrite") {
    return common::Result<DuplicatePolicy>::success(DuplicatePolicy::Overwrite);
  }
  return common::Result<DuplicatePolicy>::failure(
      "unknown duplicate policy '" + value + "' (expected allow, reject or overwrite)",
      common::ErrorKind::Usage);
}

std::string_view duplicate_policy_name(const DuplicatePolicy policy) {
  switch (policy) {
  case DuplicatePolicy::Allow:
    return "allow";
  case DuplicatePolicy::Reject:
    return "reject";
  case DuplicatePolicy::Overwrite:
    return "overwrite";
  }
  return "allow";
}

IdentityStore::IdentityStore(std::filesystem::path db_path, const DuplicatePolicy policy)
    : db_path_(std::move(db_path)), policy_(policy) {
  if (db_path_.has_parent_path()) {
    if (auto dir = common::ensure_dir(db_path_.parent_path()); !dir.ok()) {
      open_error_ = dir.error();
      return;
    }
  }

  const int rc = sqlite3_open_v2(db_path_.string().c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    open_error_ = "cannot open identity store " + db_path_.string() + ": " +
                  (db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    return;
  }
  observability::record_store_opened(db_path_.string());
}

IdentityStore::~IdentityStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status IdentityStore::not_open() const {
  return common::Status::error(open_error_.empty() ? "identity store is not open" : open_error_,
                               common::ErrorKind::Store);
}

common::Status IdentityStore::ensure_schema() {
  if (db_ == nullptr) {
    return not_open();
  }
  auto status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS identities (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  key TEXT NOT NULL,
  name TEXT NOT NULL,
  email_address TEXT NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }
  return exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_identities_key ON identities(key);");
}

common::Result<std::int64_t> IdentityStore::insert(const std::string &key, const std::string &name,
                                                   const std::string &email) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO identities(key, name, email_address) VALUES(?1, ?2, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::int64_t>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, email.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::int64_t>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::int64_t>::success(sqlite3_last_insert_rowid(db_));
}

common::Result<std::size_t> IdentityStore::count_key(const std::string &key) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM identities WHERE key = ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt) != SQLITE_ROW) {
    sqlite3_finalize(stmt);
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  const auto count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(count);
}

common::Result<std::int64_t> IdentityStore::add(const std::string &key, const std::string &name,
                                                const std::string &email) {
  if (db_ == nullptr) {
    return common::Result<std::int64_t>::failure_from(not_open());
  }

  if (policy_ == DuplicatePolicy::Allow) {
    auto inserted = insert(key, name, email);
    if (inserted.ok()) {
      observability::record_identity_added(key, inserted.value());
    }
    return inserted;
  }
  return add_in_transaction(key, name, email);
}

// Reject and overwrite read existing rows before writing, so both hold the write
// lock from the check to the commit. Events are recorded only once committed.
common::Result<std::int64_t> IdentityStore::add_in_transaction(const std::string &key,
                                                               const std::string &name,
                                                               const std::string &email) {
  auto status = exec_sql(db_, "BEGIN IMMEDIATE");
  if (!status.ok()) {
    return common::Result<std::int64_t>::failure_from(status);
  }

  std::size_t removed = 0;
  if (policy_ == DuplicatePolicy::Reject) {
    auto existing = count_key(key);
    if (!existing.ok()) {
      (void)exec_sql(db_, "ROLLBACK");
      return common::Result<std::int64_t>::failure_from(existing);
    }
    if (existing.value() > 0) {
      (void)exec_sql(db_, "ROLLBACK");
      return common::Result<std::int64_t>::failure("identity '" + key + "' already exists",
                                                   common::ErrorKind::Duplicate);
    }
  } else {
    auto deleted = remove_key(key);
    if (!deleted.ok()) {
      (void)exec_sql(db_, "ROLLBACK");
      return common::Result<std::int64_t>::failure_from(deleted);
    }
    removed = deleted.value();
  }

  auto inserted = insert(key, name, email);
  if (!inserted.ok()) {
    (void)exec_sql(db_, "ROLLBACK");
    return inserted;
  }
  status = exec_sql(db_, "COMMIT");
  if (!status.ok()) {
    (void)exec_sql(db_, "ROLLBACK");
    return common::Result<std::int64_t>::failure_from(status);
  }

  if (removed > 0) {
    observability::record_identities_removed(key, removed);
  }
  observability::record_identity_added(key, inserted.value());
  return inserted;
}

IdentityRecord IdentityStore::row_to_record(sqlite3_stmt *stmt) {
  IdentityRecord record;
  record.id = sqlite3_column_int64(stmt, 0);
  record.key = column_text(stmt, 1);
  record.name = column_text(stmt, 2);
  record.email = column_text(stmt, 3);
  return record;
}

common::Result<std::optional<IdentityRecord>> IdentityStore::fetch_one(sqlite3_stmt *stmt) {
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    IdentityRecord record = row_to_record(stmt);
    sqlite3_finalize(stmt);
    return common::Result<std::optional<IdentityRecord>>::success(std::move(record));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::optional<IdentityRecord>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::optional<IdentityRecord>>::success(std::nullopt);
}

common::Result<std::optional<IdentityRecord>> IdentityStore::get_by_key(const std::string &key) {
  if (db_ == nullptr) {
    return common::Result<std::optional<IdentityRecord>>::failure_from(not_open());
  }
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string(SELECT_COLUMNS) + " WHERE key = ?1 ORDER BY id ASC LIMIT 1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::optional<IdentityRecord>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  return fetch_one(stmt);
}

common::Result<std::optional<IdentityRecord>> IdentityStore::get_by_id(const std::int64_t id) {
  if (db_ == nullptr) {
    return common::Result<std::optional<IdentityRecord>>::failure_from(not_open());
  }
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string(SELECT_COLUMNS) + " WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::optional<IdentityRecord>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, id);
  return fetch_one(stmt);
}

common::Result<std::size_t> IdentityStore::remove_key(const std::string &key) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM identities WHERE key = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::size_t>::success(static_cast<std::size_t>(sqlite3_changes(db_)));
}

common::Result<std::size_t> IdentityStore::delete_by_key(const std::string &key) {
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure_from(not_open());
  }
  auto removed = remove_key(key);
  if (removed.ok()) {
    observability::record_identities_removed(key, removed.value());
  }
  return removed;
}

common::Result<bool> IdentityStore::delete_by_id(const std::int64_t id) {
  if (db_ == nullptr) {
    return common::Result<bool>::failure_from(not_open());
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM identities WHERE id = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, id);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<std::vector<IdentityRecord>> IdentityStore::list_all() {
  if (db_ == nullptr) {
    return common::Result<std::vector<IdentityRecord>>::failure_from(not_open());
  }
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string(SELECT_COLUMNS) + " ORDER BY id ASC";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<IdentityRecord>>::failure(sqlite3_errmsg(db_));
  }

  std::vector<IdentityRecord> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(row_to_record(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<IdentityRecord>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<IdentityRecord>>::success(std::move(out));
}

} // namespace commitas::identity
