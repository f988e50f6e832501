#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "media_core/db/database_manager.hpp"
#include "media_core/db/metadata_store.hpp"
#include "media_core/types/media_asset.hpp"

namespace media_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Fresh, unique directory under the system temp dir. The caller removes it.
  static std::filesystem::path create_temp_dir(const std::string &prefix = "store");
  static void cleanup_temp_dir(const std::filesystem::path &dir);

  // Deterministic unit vector of EMBEDDING_DIMENSION components derived from `seed`.
  static std::vector<float> seeded_unit_vector(const std::string &seed);

  // cos(theta) * e0 + sin(theta) * e1: squared L2 distance to e0 grows with theta on [0, pi].
  static std::vector<float> angle_vector(double theta);

  // Encoded images produced with OpenCV, so dimension probing sees real files.
  static std::vector<char> create_png_bytes(int width, int height, int shade = 128);
  static std::vector<char> create_jpeg_bytes(int width, int height, int shade = 128);

  static void write_file(const std::filesystem::path &path, const std::vector<char> &bytes);
  static std::vector<char> read_file(const std::filesystem::path &path);

  // Metadata for a direct MetadataStore insert. Provenance fields are filled with test values.
  static media_core::MediaAsset create_test_asset(const std::string &filename,
                                                  media_core::MediaType media_type,
                                                  media_core::Embedding embedding,
                                                  const std::string &source = "midjourney");

  // Inserts an image asset whose bytes are `filename` itself; returns the new id.
  static std::string insert_image(media_core::MetadataStore &store,
                                  const std::string &filename,
                                  const std::vector<float> &vector,
                                  const std::string &source = "midjourney");
};

/**
 * Base test fixture that provides a freshly initialised store directory with a MetadataStore
 */
class MediaStoreTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    store_dir_ = TestUtilities::create_temp_dir();
    db_manager_ = std::make_unique<media_core::DatabaseManager>();
    db_manager_->initialize(store_dir_, /*pool_size*/ 4);
    metadata_store_ = std::make_shared<media_core::MetadataStore>(*db_manager_);
  }

  void TearDown() override {
    metadata_store_.reset();
    if (db_manager_) {
      db_manager_->shutdown();
      db_manager_.reset();
    }
    TestUtilities::cleanup_temp_dir(store_dir_);
  }

  std::filesystem::path store_dir_;
  std::unique_ptr<media_core::DatabaseManager> db_manager_;
  std::shared_ptr<media_core::MetadataStore> metadata_store_;
};

}  // namespace media_tests
