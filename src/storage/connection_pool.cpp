#include "storage/connection_pool.hpp"

namespace agentwatch::storage {

ConnectionLease::~ConnectionLease() {
  Release();
}

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)) {
  other.pool_ = nullptr;
}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
  if (this != &other) {
    Release();
    pool_ = other.pool_;
    connection_ = std::move(other.connection_);
    other.pool_ = nullptr;
  }
  return *this;
}

void ConnectionLease::Release() {
  if (pool_ != nullptr && connection_ != nullptr) {
    pool_->Return(std::move(connection_));
  }
  connection_.reset();
  pool_ = nullptr;
}

bool ConnectionPool::Acquire(ConnectionLease& lease, std::string& error) {
  std::unique_ptr<SqliteConnection> connection;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!idle_.empty()) {
      connection = std::move(idle_.back());
      idle_.pop_back();
    }
  }

  // Opening happens outside the lock so a slow open never stalls callers that
  // can reuse an idle connection.
  if (connection == nullptr) {
    connection = SqliteConnection::Open(db_path_, error);
    if (connection == nullptr) {
      return false;
    }
  }

  lease = ConnectionLease(this, std::move(connection));
  return true;
}

void ConnectionPool::Close() {
  std::vector<std::unique_ptr<SqliteConnection>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    to_close.swap(idle_);
  }
}

void ConnectionPool::Reopen() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = false;
}

std::size_t ConnectionPool::IdleCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

void ConnectionPool::Return(std::unique_ptr<SqliteConnection> connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  idle_.push_back(std::move(connection));
}

} // namespace agentwatch::storage
