#pragma once
#include <sqlite_modern_cpp.h>

#include <memory>

#include "media_core/db/database_manager.hpp"

namespace media_core {

// One borrowed store connection, handed back to the manager's pool when the guard is destroyed.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager &manager)
      : manager_(manager), conn_(manager.acquire_connection()) {}

  ~PooledConnection() {
    manager_.release_connection(std::move(conn_));
  }

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;

  sqlite::database &operator*() const {
    return *conn_;
  }
  sqlite::database *operator->() const {
    return conn_.get();
  }

 private:
  DatabaseManager &manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace media_core
