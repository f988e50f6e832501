#pragma once

#include "media_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace media_core {

struct TableHandle {
    std::string name;
    // True when this call created the relation, false when it already existed.
    bool created = false;
};

struct SchemaHandles {
    TableHandle assets;
    TableHandle projects;
};

/**
 * Owns the canonical store directory and the SQLite connection pool over its
 * media.db file. One instance per open store.
 */
class DatabaseManager {
public:
    static constexpr const char* DB_FILENAME = "media.db";

    DatabaseManager() = default;
    ~DatabaseManager();

    // Creates the store directory if needed, ensures the schema and opens the pool.
    // Calling it again on an initialized manager is a no-op.
    void initialize(const std::filesystem::path& store_dir, int pool_size);

    // Idempotent. Creates missing relations with a fully typed schema.
    SchemaHandles ensure_tables();

    // Folds the write-ahead log into media.db so a plain directory copy is complete.
    void checkpoint();

    const std::filesystem::path& store_dir() const { return store_dir_; }
    std::filesystem::path db_path() const { return store_dir_ / DB_FILENAME; }
    bool is_initialized() const { return is_initialized_; }

    // Prefer the PooledConnection guard over calling these directly.
    std::unique_ptr<sqlite::database> acquire_connection();
    void release_connection(std::unique_ptr<sqlite::database> conn);
    int idle_connections() const;

    void shutdown();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    std::filesystem::path store_dir_;
    std::unique_ptr<ConnectionPool> pool_;
    bool is_initialized_ = false;
};

} // namespace media_core
