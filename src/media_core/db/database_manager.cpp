#include "media_core/db/database_manager.hpp"

#include <iostream>

#include "media_core/db/pooled_connection.hpp"
#include "media_core/db/sqlite_error_utils.hpp"
#include "media_core/db/transaction.hpp"

namespace media_core {

namespace {

bool table_exists(sqlite::database& db, const std::string& name) {
  int count = 0;
  db << "SELECT count(*) FROM sqlite_master WHERE type = 'table' AND name = ?" << name >> count;
  return count > 0;
}

// Every column carries an explicit type so that columns which are NULL in every row
// (e.g. thumbnail_bytes on an image-only collection) are still typed.
constexpr const char* kCreateAssetsSql = R"(
    CREATE TABLE IF NOT EXISTS assets (
        seq INTEGER PRIMARY KEY AUTOINCREMENT,
        id TEXT NOT NULL UNIQUE,
        filename TEXT NOT NULL,
        media_type TEXT NOT NULL CHECK (media_type IN ('image', 'video')),
        image_bytes BLOB,
        video_bytes BLOB,
        thumbnail_bytes BLOB,
        embedding BLOB,
        embedding_status TEXT NOT NULL CHECK (embedding_status IN ('COMPUTED', 'UNAVAILABLE')),
        embedding_model TEXT NOT NULL,
        source TEXT NOT NULL,
        generation_prompt TEXT,
        generation_model TEXT,
        generation_time_seconds REAL,
        generation_cost_usd REAL,
        width INTEGER,
        height INTEGER,
        duration_seconds REAL,
        file_size_bytes INTEGER NOT NULL,
        format TEXT NOT NULL,
        content_sha256 TEXT NOT NULL,
        content_type TEXT,
        subjects TEXT NOT NULL DEFAULT '[]',
        style_tags TEXT NOT NULL DEFAULT '[]',
        quality_rating INTEGER CHECK (quality_rating IS NULL OR quality_rating BETWEEN 1 AND 10),
        quality_notes TEXT,
        episode_assignments TEXT NOT NULL DEFAULT '[]',
        use_count INTEGER NOT NULL DEFAULT 0 CHECK (use_count >= 0),
        created_at TEXT NOT NULL,
        last_used_at TEXT,
        CHECK ((media_type = 'image' AND image_bytes IS NOT NULL AND video_bytes IS NULL
                AND thumbnail_bytes IS NULL)
            OR (media_type = 'video' AND video_bytes IS NOT NULL AND image_bytes IS NULL)),
        CHECK ((embedding_status = 'COMPUTED') = (embedding IS NOT NULL))
    ) STRICT
  )";

constexpr const char* kCreateProjectsSql = R"(
    CREATE TABLE IF NOT EXISTS projects (
        seq INTEGER PRIMARY KEY AUTOINCREMENT,
        id TEXT NOT NULL UNIQUE,
        project_name TEXT NOT NULL,
        theme TEXT,
        asset_ids TEXT NOT NULL DEFAULT '[]',
        created_at TEXT NOT NULL,
        published_at TEXT,
        engagement_likes INTEGER NOT NULL DEFAULT 0,
        engagement_comments INTEGER NOT NULL DEFAULT 0,
        engagement_shares INTEGER NOT NULL DEFAULT 0
    ) STRICT
  )";

}  // namespace

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& store_dir, int pool_size) {
  if (is_initialized_) {
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(store_dir, ec);
  if (ec) {
    throw StorageIOError("Cannot create store directory " + store_dir.string() + ": " +
                         ec.message());
  }
  store_dir_ = store_dir;

  try {
    pool_ = std::make_unique<ConnectionPool>(db_path(), pool_size);
  } catch (const sqlite::sqlite_exception& e) {
    throw MetadataStoreError("open_store", e);
  }

  try {
    ensure_tables();
  } catch (const MediaError&) {
    pool_->close();
    pool_.reset();
    throw;
  }
  is_initialized_ = true;
}

SchemaHandles DatabaseManager::ensure_tables() {
  SchemaHandles handles{{"assets", false}, {"projects", false}};
  try {
    PooledConnection conn(*this);
    Transaction tx(*conn, TransactionMode::Immediate);

    handles.assets.created = !table_exists(*conn, handles.assets.name);
    handles.projects.created = !table_exists(*conn, handles.projects.name);

    *conn << kCreateAssetsSql;
    *conn << kCreateProjectsSql;
    *conn << "CREATE INDEX IF NOT EXISTS idx_assets_media_type ON assets(media_type)";
    *conn << "CREATE INDEX IF NOT EXISTS idx_assets_source ON assets(source)";

    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw MetadataStoreError("ensure_tables", e);
  }

  if (handles.assets.created) {
    std::cout << "[Schema] Created table 'assets' in " << db_path() << std::endl;
  }
  if (handles.projects.created) {
    std::cout << "[Schema] Created table 'projects' in " << db_path() << std::endl;
  }
  return handles;
}

void DatabaseManager::checkpoint() {
  try {
    PooledConnection conn(*this);
    *conn << "PRAGMA wal_checkpoint(TRUNCATE);" >> [&](int busy, int log_frames, int checkpointed) {
      if (busy != 0) {
        std::cerr << "[Backup] WAL checkpoint could not complete (" << checkpointed << "/"
                  << log_frames << " frames); a writer is active" << std::endl;
      }
    };
  } catch (const sqlite::sqlite_exception& e) {
    throw MetadataStoreError("checkpoint", e);
  }
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->close();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::acquire_connection() {
  if (!pool_) {
    throw StorageIOError("Store is not open" +
                         (store_dir_.empty() ? std::string() : ": " + store_dir_.string()));
  }
  return pool_->acquire();
}

void DatabaseManager::release_connection(std::unique_ptr<sqlite::database> conn) {
  if (pool_) {
    pool_->release(std::move(conn));
  }
}

int DatabaseManager::idle_connections() const {
  return pool_ ? pool_->idle_count() : 0;
}

}  // namespace media_core
