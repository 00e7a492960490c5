/**
 * @file sqlite_util.hpp
 * @brief RAII helpers around the SQLite C API.
 */
#ifndef SITEWATCH_SQLITE_UTIL_HPP
#define SITEWATCH_SQLITE_UTIL_HPP

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>

namespace sitewatch {

/**
 * Throw a StorageError describing a failed SQLite call.
 *
 * @param db Connection used to fetch the error message (may be null).
 * @param rc Result code returned by SQLite.
 * @param what Short description of the failed operation.
 */
[[noreturn]] void throw_sqlite_error(sqlite3 *db, int rc,
                                     const std::string &what);

/// Run one or more statements without results.
/// @throws StorageError on failure.
void exec_sql(sqlite3 *db, const char *sql);

/**
 * Prepared statement finalized on destruction, even when an exception
 * leaves the scope mid-step.
 */
class Statement {
public:
  /// @throws StorageError when the SQL cannot be prepared.
  Statement(sqlite3 *db, const char *sql);
  ~Statement();
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  sqlite3_stmt *get() const { return stmt_; }

  void bind(int index, std::int64_t value);
  void bind(int index, const std::string &value);
  void bind(int index, const std::optional<std::string> &value);
  void bind_null(int index);

  /**
   * Advance the statement.
   *
   * @return true while a row is available, false once done.
   * @throws StorageError on any other result.
   */
  bool step();

  /// Rewind the statement and clear bindings.
  void reset();

  std::int64_t column_int64(int column) const;
  std::string column_text(int column) const;
  bool column_is_null(int column) const;

private:
  sqlite3 *db_;
  sqlite3_stmt *stmt_{nullptr};
};

/**
 * `BEGIN IMMEDIATE` transaction rolled back on destruction unless
 * committed.
 */
class Transaction {
public:
  /// @throws StorageError when the transaction cannot be started.
  explicit Transaction(sqlite3 *db);
  ~Transaction();
  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  /// @throws StorageError when the commit fails.
  void commit();

private:
  sqlite3 *db_;
  bool done_{false};
};

} // namespace sitewatch

#endif // SITEWATCH_SQLITE_UTIL_HPP
