#pragma once

#include "storage/sqlite_handle.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace agentwatch::storage {

class ConnectionPool;

// Scoped ownership of one pooled connection. The connection is used by exactly
// one caller for the lease lifetime and goes back to the pool on destruction.
class ConnectionLease {
public:
  ConnectionLease() = default;
  ~ConnectionLease();

  ConnectionLease(ConnectionLease&& other) noexcept;
  ConnectionLease& operator=(ConnectionLease&& other) noexcept;

  ConnectionLease(const ConnectionLease&) = delete;
  ConnectionLease& operator=(const ConnectionLease&) = delete;

  SqliteConnection& operator*() const {
    return *connection_;
  }

  SqliteConnection* operator->() const {
    return connection_.get();
  }

  explicit operator bool() const {
    return connection_ != nullptr;
  }

private:
  friend class ConnectionPool;

  ConnectionLease(ConnectionPool* pool, std::unique_ptr<SqliteConnection> connection)
      : pool_(pool), connection_(std::move(connection)) {}

  void Release();

  ConnectionPool* pool_ = nullptr;
  std::unique_ptr<SqliteConnection> connection_;
};

// Connection-per-caller pool for one database file. Idle connections are
// reused; a new one is opened whenever every existing connection is leased,
// so concurrent callers never share a handle.
class ConnectionPool {
public:
  explicit ConnectionPool(std::filesystem::path db_path) : db_path_(std::move(db_path)) {}

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  bool Acquire(ConnectionLease& lease, std::string& error);

  // Drops idle connections. Until Reopen(), every lease that ends closes its
  // connection instead of returning it to the pool.
  void Close();

  void Reopen();

  std::size_t IdleCount() const;

  const std::filesystem::path& DbPath() const {
    return db_path_;
  }

private:
  friend class ConnectionLease;

  void Return(std::unique_ptr<SqliteConnection> connection);

  std::filesystem::path db_path_;
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<SqliteConnection>> idle_;
  bool closed_ = false;
};

} // namespace agentwatch::storage
