#include "media_core/db/connection_pool.hpp"

#include <sqlite3.h>

#include "media_core/errors.hpp"

namespace media_core {

ConnectionPool::ConnectionPool(const std::filesystem::path &db_file, int pool_size)
    : db_file_(db_file), size_(pool_size) {
  if (pool_size <= 0) {
    throw InvalidArgumentError("Connection pool size must be positive, got " +
                               std::to_string(pool_size));
  }
  idle_.reserve(static_cast<size_t>(pool_size));
  for (int i = 0; i < pool_size; ++i) {
    idle_.push_back(open_connection(db_file_));
  }
}

ConnectionPool::~ConnectionPool() {
  close();
}

std::unique_ptr<sqlite::database> ConnectionPool::open_connection(
    const std::filesystem::path &db_file) {
  auto db = std::make_unique<sqlite::database>(db_file.string());

  // Writers queue on the lock instead of failing with SQLITE_BUSY
  sqlite3_busy_timeout(db->connection().get(), BUSY_TIMEOUT_MS);

  std::string journal_mode;
  *db << "PRAGMA journal_mode = WAL;" >> journal_mode;
  if (journal_mode != "wal") {
    throw StorageIOError("Store file " + db_file.string() + " cannot use WAL journaling (got '" +
                         journal_mode + "')");
  }
  *db << "PRAGMA synchronous = NORMAL;";
  *db << "PRAGMA foreign_keys = ON;";
  return db;
}

std::unique_ptr<sqlite::database> ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_available_.wait(lock, [this] { return closed_ || !idle_.empty(); });
  if (closed_) {
    throw StorageIOError("Store " + db_file_.string() + " is closed");
  }

  std::unique_ptr<sqlite::database> conn = std::move(idle_.back());
  idle_.pop_back();
  return conn;
}

void ConnectionPool::release(std::unique_ptr<sqlite::database> conn) {
  if (!conn) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    idle_.push_back(std::move(conn));
  }
  idle_available_.notify_one();
}

void ConnectionPool::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    idle_.clear();
  }
  idle_available_.notify_all();
}

int ConnectionPool::idle_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(idle_.size());
}

}  // namespace media_core
