#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace agentwatch::storage {

// Owns one sqlite3 connection handle. Connections are never shared between
// concurrent callers; `ConnectionPool` hands each caller its own.
class SqliteConnection {
public:
  ~SqliteConnection();

  SqliteConnection(const SqliteConnection&) = delete;
  SqliteConnection& operator=(const SqliteConnection&) = delete;

  // Opens (creating if needed) the database file and applies the per
  // connection pragmas: WAL journal, NORMAL sync, busy timeout.
  static std::unique_ptr<SqliteConnection> Open(const std::filesystem::path& db_path,
                                                std::string& error);

  // Executes one or more statements without result rows.
  bool Exec(std::string_view sql, std::string& error);

  std::string LastErrorMessage() const;

  sqlite3* Raw() const {
    return db_;
  }

private:
  explicit SqliteConnection(sqlite3* db) : db_(db) {}

  sqlite3* db_ = nullptr;
};

// Prepared statement bound to one connection. Finalized on destruction.
class SqliteStatement {
public:
  SqliteStatement() = default;
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement&) = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  bool Prepare(SqliteConnection& connection, std::string_view sql, std::string& error);

  // Parameter indexes are 1-based, as in the SQLite C API.
  bool BindText(int index, std::string_view value);
  bool BindDouble(int index, double value);
  bool BindInt64(int index, std::int64_t value);

  enum class StepResult {
    kRow,
    kDone,
    kError,
  };

  StepResult Step(std::string& error);

  // Column indexes are 0-based. NULL columns read as "" / 0.
  std::string ColumnText(int column) const;
  double ColumnDouble(int column) const;
  std::int64_t ColumnInt64(int column) const;
  bool ColumnIsNull(int column) const;

private:
  SqliteConnection* connection_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace agentwatch::storage
