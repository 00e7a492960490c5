#include "sqlite_util.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <spdlog/spdlog.h>

namespace sitewatch {

void throw_sqlite_error(sqlite3 *db, int rc, const std::string &what) {
  std::string msg = what;
  const char *detail = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  if (detail != nullptr && detail[0] != '\0') {
    msg += ": ";
    msg += detail;
  }
  throw StorageError(rc, msg);
}

void exec_sql(sqlite3 *db, const char *sql) {
  char *err = nullptr;
  int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw StorageError(rc, "SQL failed: " + msg);
  }
}

Statement::Statement(sqlite3 *db, const char *sql) : db_(db) {
  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw_sqlite_error(db_, rc, "Failed to prepare statement");
  }
}

Statement::~Statement() { sqlite3_finalize(stmt_); }

void Statement::bind(int index, std::int64_t value) {
  int rc = sqlite3_bind_int64(stmt_, index, value);
  if (rc != SQLITE_OK) {
    throw_sqlite_error(db_, rc, "Failed to bind integer");
  }
}

void Statement::bind(int index, const std::string &value) {
  int rc = sqlite3_bind_text(stmt_, index, value.data(),
                             static_cast<int>(value.size()), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) {
    throw_sqlite_error(db_, rc, "Failed to bind text");
  }
}

void Statement::bind(int index, const std::optional<std::string> &value) {
  if (value) {
    bind(index, *value);
  } else {
    bind_null(index);
  }
}

void Statement::bind_null(int index) {
  int rc = sqlite3_bind_null(stmt_, index);
  if (rc != SQLITE_OK) {
    throw_sqlite_error(db_, rc, "Failed to bind null");
  }
}

bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw_sqlite_error(db_, rc, "Failed to execute statement");
}

void Statement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

std::int64_t Statement::column_int64(int column) const {
  return sqlite3_column_int64(stmt_, column);
}

std::string Statement::column_text(int column) const {
  const auto *text = sqlite3_column_text(stmt_, column);
  if (text == nullptr) {
    return {};
  }
  int size = sqlite3_column_bytes(stmt_, column);
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<std::size_t>(size));
}

bool Statement::column_is_null(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Transaction::Transaction(sqlite3 *db) : db_(db) {
  exec_sql(db_, "BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
  if (done_) {
    return;
  }
  char *err = nullptr;
  if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
    category_logger("store")->error("Rollback failed: {}",
                                    err ? err : "unknown error");
  }
  sqlite3_free(err);
}

void Transaction::commit() {
  exec_sql(db_, "COMMIT");
  done_ = true;
}

} // namespace sitewatch
