#include "storage/sqlite_handle.hpp"

#include <sqlite3.h>

namespace agentwatch::storage {

namespace {

constexpr int kBusyTimeoutMs = 5000;

} // namespace

SqliteConnection::~SqliteConnection() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

std::unique_ptr<SqliteConnection> SqliteConnection::Open(const std::filesystem::path& db_path,
                                                         std::string& error) {
  sqlite3* db = nullptr;
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
  const int rc = sqlite3_open_v2(db_path.string().c_str(), &db, flags, nullptr);
  if (rc != SQLITE_OK) {
    error = "failed to open database '" + db_path.string() + "': " +
            (db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return nullptr;
  }

  std::unique_ptr<SqliteConnection> connection(new SqliteConnection(db));
  sqlite3_busy_timeout(db, kBusyTimeoutMs);

  // WAL lets readers proceed while another connection holds the write lock.
  if (!connection->Exec("PRAGMA journal_mode=WAL;", error) ||
      !connection->Exec("PRAGMA synchronous=NORMAL;", error)) {
    return nullptr;
  }
  return connection;
}

bool SqliteConnection::Exec(std::string_view sql, std::string& error) {
  char* message = nullptr;
  const std::string statement(sql);
  const int rc = sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &message);
  if (rc != SQLITE_OK) {
    error = "sqlite exec failed: " + std::string(message != nullptr ? message : sqlite3_errstr(rc));
    sqlite3_free(message);
    return false;
  }
  return true;
}

std::string SqliteConnection::LastErrorMessage() const {
  return db_ != nullptr ? sqlite3_errmsg(db_) : "connection closed";
}

SqliteStatement::~SqliteStatement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

bool SqliteStatement::Prepare(SqliteConnection& connection, std::string_view sql,
                              std::string& error) {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
  connection_ = &connection;
  const int rc = sqlite3_prepare_v2(connection.Raw(), sql.data(), static_cast<int>(sql.size()),
                                    &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    error = "failed to prepare statement: " + connection.LastErrorMessage();
    stmt_ = nullptr;
    return false;
  }
  return true;
}

bool SqliteStatement::BindText(const int index, std::string_view value) {
  return sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                           SQLITE_TRANSIENT) == SQLITE_OK;
}

bool SqliteStatement::BindDouble(const int index, const double value) {
  return sqlite3_bind_double(stmt_, index, value) == SQLITE_OK;
}

bool SqliteStatement::BindInt64(const int index, const std::int64_t value) {
  return sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) == SQLITE_OK;
}

SqliteStatement::StepResult SqliteStatement::Step(std::string& error) {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return StepResult::kRow;
  }
  if (rc == SQLITE_DONE) {
    return StepResult::kDone;
  }
  error = "sqlite step failed: " +
          (connection_ != nullptr ? connection_->LastErrorMessage() : std::string(sqlite3_errstr(rc)));
  return StepResult::kError;
}

std::string SqliteStatement::ColumnText(const int column) const {
  const unsigned char* text = sqlite3_column_text(stmt_, column);
  if (text == nullptr) {
    return "";
  }
  const int size = sqlite3_column_bytes(stmt_, column);
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(size));
}

double SqliteStatement::ColumnDouble(const int column) const {
  return sqlite3_column_double(stmt_, column);
}

std::int64_t SqliteStatement::ColumnInt64(const int column) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

bool SqliteStatement::ColumnIsNull(const int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

} // namespace agentwatch::storage
