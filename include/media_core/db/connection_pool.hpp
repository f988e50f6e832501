#pragma once
#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace media_core {

// Fixed set of connections to one store file, all in WAL mode so readers never wait on the
// single writer.
class ConnectionPool {
 public:
  static constexpr int BUSY_TIMEOUT_MS = 5000;

  ConnectionPool(const std::filesystem::path &db_file, int pool_size);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool &) = delete;
  ConnectionPool &operator=(const ConnectionPool &) = delete;

  // Blocks until a connection is idle. Throws StorageIOError once the pool is closed.
  std::unique_ptr<sqlite::database> acquire();
  void release(std::unique_ptr<sqlite::database> conn);

  // Wakes blocked borrowers. Connections still out are dropped when released.
  void close();

  int size() const {
    return size_;
  }
  int idle_count() const;

 private:
  static std::unique_ptr<sqlite::database> open_connection(const std::filesystem::path &db_file);

  const std::filesystem::path db_file_;
  const int size_;
  std::vector<std::unique_ptr<sqlite::database>> idle_;
  bool closed_ = false;
  mutable std::mutex mutex_;
  std::condition_variable idle_available_;
};

}  // namespace media_core
