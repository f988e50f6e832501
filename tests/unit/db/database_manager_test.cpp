#include <gtest/gtest.h>

#include "../../common/utilities_test.hpp"
#include "media_core/db/database_manager.hpp"
#include "media_core/db/pooled_connection.hpp"
#include "media_core/db/sqlite_error_utils.hpp"

namespace media_core {

class DatabaseManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    base_dir_ = media_tests::TestUtilities::create_temp_dir("schema");
    store_dir_ = base_dir_ / "nested" / "media_assets.store";
  }

  void TearDown() override {
    mgr_.shutdown();
    media_tests::TestUtilities::cleanup_temp_dir(base_dir_);
  }

  std::vector<std::string> table_names() {
    std::vector<std::string> names;
    PooledConnection conn(mgr_);
    *conn << "SELECT name FROM sqlite_master WHERE type = 'table' AND name NOT LIKE 'sqlite_%' "
             "ORDER BY name" >>
        [&](std::string name) { names.push_back(name); };
    return names;
  }

  std::filesystem::path base_dir_;
  std::filesystem::path store_dir_;
  DatabaseManager mgr_;
};

TEST_F(DatabaseManagerTest, InitializeCreatesStoreDirectoryAndTables) {
  mgr_.initialize(store_dir_, 2);

  EXPECT_TRUE(mgr_.is_initialized());
  EXPECT_TRUE(std::filesystem::is_directory(store_dir_));
  EXPECT_TRUE(std::filesystem::exists(store_dir_ / DatabaseManager::DB_FILENAME));
  EXPECT_EQ(table_names(), (std::vector<std::string>{"assets", "projects"}));
}

TEST_F(DatabaseManagerTest, EnsureTablesIsIdempotentAndReportsCreation) {
  mgr_.initialize(store_dir_, 2);

  // initialize() already created both relations
  SchemaHandles again = mgr_.ensure_tables();
  EXPECT_EQ(again.assets.name, "assets");
  EXPECT_EQ(again.projects.name, "projects");
  EXPECT_FALSE(again.assets.created);
  EXPECT_FALSE(again.projects.created);

  PooledConnection conn(mgr_);
  *conn << "DROP TABLE projects";
  SchemaHandles recreated = mgr_.ensure_tables();
  EXPECT_FALSE(recreated.assets.created);
  EXPECT_TRUE(recreated.projects.created);
}

TEST_F(DatabaseManagerTest, ReopeningAnExistingStoreKeepsItsRows) {
  mgr_.initialize(store_dir_, 2);
  {
    PooledConnection conn(mgr_);
    *conn << "INSERT INTO projects (id, project_name, created_at) VALUES ('p1', 'pilot', "
             "'2024-01-01T00:00:00Z')";
  }
  mgr_.shutdown();

  DatabaseManager reopened;
  reopened.initialize(store_dir_, 2);
  SchemaHandles handles = reopened.ensure_tables();
  EXPECT_FALSE(handles.projects.created);

  int count = 0;
  PooledConnection conn(reopened);
  *conn << "SELECT COUNT(*) FROM projects" >> count;
  EXPECT_EQ(count, 1);
}

TEST_F(DatabaseManagerTest, AssetsTableRejectsIllTypedRows) {
  mgr_.initialize(store_dir_, 2);
  PooledConnection conn(mgr_);

  const std::string base =
      "INSERT INTO assets (id, filename, media_type, image_bytes, video_bytes, embedding, "
      "embedding_status, embedding_model, source, file_size_bytes, format, content_sha256, "
      "quality_rating, created_at) VALUES ";

  // Rating outside [1, 10]
  EXPECT_THROW(*conn << base + "('a', 'a.png', 'image', x'00', NULL, NULL, 'UNAVAILABLE', 'm', "
                               "'s', 1, 'png', 'h', 11, '2024-01-01T00:00:00Z')",
               sqlite::sqlite_exception);
  // Both payloads present
  EXPECT_THROW(*conn << base + "('b', 'b.png', 'image', x'00', x'00', NULL, 'UNAVAILABLE', 'm', "
                               "'s', 1, 'png', 'h', NULL, '2024-01-01T00:00:00Z')",
               sqlite::sqlite_exception);
  // COMPUTED without a vector
  EXPECT_THROW(*conn << base + "('c', 'c.png', 'image', x'00', NULL, NULL, 'COMPUTED', 'm', "
                               "'s', 1, 'png', 'h', NULL, '2024-01-01T00:00:00Z')",
               sqlite::sqlite_exception);
  // STRICT: text in an integer column
  EXPECT_THROW(*conn << base + "('d', 'd.png', 'image', x'00', NULL, NULL, 'UNAVAILABLE', 'm', "
                               "'s', 'big', 'png', 'h', NULL, '2024-01-01T00:00:00Z')",
               sqlite::sqlite_exception);
  // Unknown media type
  EXPECT_THROW(*conn << base + "('e', 'e.wav', 'audio', x'00', NULL, NULL, 'UNAVAILABLE', 'm', "
                               "'s', 1, 'wav', 'h', NULL, '2024-01-01T00:00:00Z')",
               sqlite::sqlite_exception);

  int count = 0;
  *conn << "SELECT COUNT(*) FROM assets" >> count;
  EXPECT_EQ(count, 0);
}

TEST_F(DatabaseManagerTest, CheckpointSucceedsOnIdleStore) {
  mgr_.initialize(store_dir_, 2);
  EXPECT_NO_THROW(mgr_.checkpoint());
}

TEST_F(DatabaseManagerTest, FailedSchemaSetupLeavesManagerUninitialized) {
  std::filesystem::create_directories(store_dir_);
  {
    // An assets table without the indexed columns makes CREATE INDEX fail
    sqlite::database legacy((store_dir_ / DatabaseManager::DB_FILENAME).string());
    legacy << "CREATE TABLE assets (legacy INTEGER)";
  }

  EXPECT_THROW(mgr_.initialize(store_dir_, 2), MetadataStoreError);
  EXPECT_FALSE(mgr_.is_initialized());
  EXPECT_THROW(PooledConnection conn(mgr_), StorageIOError);
}

TEST(SqliteErrorUtilsTest, ClassifiesResultCodes) {
  EXPECT_EQ(classify_sqlite_error(SQLITE_CONSTRAINT, SQLITE_CONSTRAINT_UNIQUE),
            DbErrorKind::DuplicateKey);
  EXPECT_EQ(classify_sqlite_error(SQLITE_CONSTRAINT, SQLITE_CONSTRAINT_CHECK),
            DbErrorKind::CheckViolation);
  EXPECT_EQ(classify_sqlite_error(SQLITE_CONSTRAINT, SQLITE_CONSTRAINT_FOREIGNKEY),
            DbErrorKind::Constraint);
  EXPECT_EQ(classify_sqlite_error(SQLITE_BUSY, SQLITE_BUSY), DbErrorKind::BusyOrLocked);
  EXPECT_EQ(classify_sqlite_error(SQLITE_LOCKED, SQLITE_LOCKED), DbErrorKind::BusyOrLocked);
  EXPECT_EQ(classify_sqlite_error(SQLITE_IOERR, SQLITE_IOERR_WRITE), DbErrorKind::Io);
  EXPECT_EQ(classify_sqlite_error(SQLITE_NOMEM, SQLITE_NOMEM), DbErrorKind::Generic);
  EXPECT_EQ(to_string(DbErrorKind::DuplicateKey), "duplicate");
}

TEST_F(DatabaseManagerTest, DuplicateIdIsReportedAsIoFailure) {
  mgr_.initialize(store_dir_, 2);
  PooledConnection conn(mgr_);
  *conn << "INSERT INTO projects (id, project_name, created_at) VALUES ('dup', 'a', 'x')";
  try {
    *conn << "INSERT INTO projects (id, project_name, created_at) VALUES ('dup', 'b', 'y')";
    FAIL() << "duplicate id was accepted";
  } catch (const sqlite::sqlite_exception &e) {
    MetadataStoreError error("insert_project", e);
    EXPECT_EQ(error.kind(), ErrorKind::IOFailure);
    EXPECT_EQ(error.db_kind(), DbErrorKind::DuplicateKey);
    EXPECT_EQ(std::string(error.what()).rfind("insert_project: duplicate (", 0), 0u);
  }
}

TEST_F(DatabaseManagerTest, RatingOutsideRangeIsACheckViolation) {
  mgr_.initialize(store_dir_, 2);
  PooledConnection conn(mgr_);
  try {
    *conn << "INSERT INTO assets (id, filename, media_type, image_bytes, embedding_status, "
             "embedding_model, source, file_size_bytes, format, content_sha256, quality_rating, "
             "created_at) VALUES ('r', 'r.png', 'image', x'00', 'UNAVAILABLE', 'm', 's', 1, "
             "'png', 'h', 0, '2024-01-01T00:00:00Z')";
    FAIL() << "rating 0 was accepted";
  } catch (const sqlite::sqlite_exception &e) {
    EXPECT_EQ(MetadataStoreError("insert_asset", e).db_kind(), DbErrorKind::CheckViolation);
  }
}

}  // namespace media_core
