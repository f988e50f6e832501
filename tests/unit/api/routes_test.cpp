#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "media_api/routes.hpp"
#include "media_core/services/asset_info_service.hpp"
#include "media_core/services/backup_service.hpp"
#include "media_core/services/curation_service.hpp"
#include "media_core/services/ingestion_service.hpp"
#include "media_core/services/search_service.hpp"
#include "media_core/services/stats_service.hpp"
#include "media_core/utils/crypto_utils.hpp"

namespace media_core {

using media_tests::TestUtilities;
using ::testing::NiceMock;

class RoutesTest : public media_tests::MediaStoreTestBase {
 protected:
  void SetUp() override {
    MediaStoreTestBase::SetUp();
    backup_dir_ = TestUtilities::create_temp_dir("backup");
    provider_ = std::make_shared<NiceMock<media_tests::MockEmbeddingProvider>>();
    extractor_ = std::make_shared<NiceMock<media_tests::MockFrameExtractor>>();

    routes_ = std::make_unique<media_api::Routes>(
        std::make_shared<IngestionService>(metadata_store_, provider_, extractor_),
        std::make_shared<SearchService>(metadata_store_, provider_),
        std::make_shared<AssetInfoService>(metadata_store_),
        std::make_shared<CurationService>(metadata_store_),
        std::make_shared<StatsService>(metadata_store_),
        std::make_shared<BackupService>(*db_manager_), backup_dir_ / "media_assets.store");
  }

  void TearDown() override {
    routes_.reset();
    TestUtilities::cleanup_temp_dir(backup_dir_);
    MediaStoreTestBase::TearDown();
  }

  static crow::request post(const nlohmann::json &body) {
    crow::request req;
    req.body = body.dump();
    return req;
  }

  static crow::request get(const std::string &query = "") {
    crow::request req;
    req.url_params = crow::query_string("?" + query);
    return req;
  }

  static nlohmann::json body_of(const crow::response &resp) {
    return nlohmann::json::parse(resp.body);
  }

  std::string upload_png(const std::string &filename, int width, int height) {
    auto resp = routes_->handle_add_image(
        post({{"image_base64", base64_encode(TestUtilities::create_png_bytes(width, height))},
              {"filename", filename},
              {"source", "midjourney"},
              {"subjects", {"robot"}}}));
    EXPECT_EQ(resp.code, 200) << resp.body;
    return body_of(resp)["asset_id"].get<std::string>();
  }

  std::filesystem::path backup_dir_;
  std::shared_ptr<NiceMock<media_tests::MockEmbeddingProvider>> provider_;
  std::shared_ptr<NiceMock<media_tests::MockFrameExtractor>> extractor_;
  std::unique_ptr<media_api::Routes> routes_;
};

TEST_F(RoutesTest, HealthCheckReportsHealthy) {
  auto resp = routes_->handle_health_check(get());
  ASSERT_EQ(resp.code, 200);
  auto json = body_of(resp);
  EXPECT_TRUE(json["success"].get<bool>());
  EXPECT_EQ(json["status"], "healthy");
}

TEST_F(RoutesTest, AddImageThenGetAsset) {
  std::string id = upload_png("hero.png", 120, 80);

  auto resp = routes_->handle_get_asset(get(), id);
  ASSERT_EQ(resp.code, 200);
  auto json = body_of(resp);
  EXPECT_EQ(json["filename"], "hero.png");
  EXPECT_EQ(json["width"], 120);
  EXPECT_EQ(json["height"], 80);
  EXPECT_EQ(json["subjects"], nlohmann::json({"robot"}));
  EXPECT_EQ(json["embedding_status"], "COMPUTED");
}

TEST_F(RoutesTest, MalformedUploadsAreBadRequests) {
  auto bad_base64 =
      routes_->handle_add_image(post({{"image_base64", "!!not base64!!"}, {"filename", "a.png"},
                                      {"source", "midjourney"}}));
  EXPECT_EQ(bad_base64.code, 400);
  EXPECT_FALSE(body_of(bad_base64)["success"].get<bool>());

  crow::request not_json;
  not_json.body = "{ nope";
  EXPECT_EQ(routes_->handle_add_image(not_json).code, 400);

  auto missing_filename = routes_->handle_add_image(
      post({{"image_base64", base64_encode(TestUtilities::create_png_bytes(4, 4))}}));
  EXPECT_EQ(missing_filename.code, 400);
  EXPECT_EQ(routes_->handle_stats(get()).code, 200);
  EXPECT_EQ(body_of(routes_->handle_stats(get()))["total_assets"], 0);
}

TEST_F(RoutesTest, UnknownAssetIsNotFound) {
  EXPECT_EQ(routes_->handle_get_asset(get(), "no-such-id").code, 404);
  EXPECT_EQ(routes_->handle_get_content(get(), "no-such-id").code, 404);
  EXPECT_EQ(routes_->handle_rate(post({{"asset_id", "no-such-id"}, {"rating", 5}})).code, 404);
}

TEST_F(RoutesTest, RatingOutOfRangeIsRejected) {
  std::string id = upload_png("a.png", 10, 10);

  EXPECT_EQ(routes_->handle_rate(post({{"asset_id", id}, {"rating", 11}})).code, 400);
  EXPECT_TRUE(body_of(routes_->handle_get_asset(get(), id))["quality_rating"].is_null());

  auto ok = routes_->handle_rate(post({{"asset_id", id}, {"rating", 9}, {"notes", "keeper"}}));
  ASSERT_EQ(ok.code, 200);
  auto json = body_of(routes_->handle_get_asset(get(), id));
  EXPECT_EQ(json["quality_rating"], 9);
  EXPECT_EQ(json["quality_notes"], "keeper");
}

TEST_F(RoutesTest, OversizedIntegersAreRejectedNotNarrowed) {
  std::string id = upload_png("a.png", 10, 10);

  // 4294967301 would wrap to 5 if narrowed to int
  EXPECT_EQ(routes_->handle_rate(post({{"asset_id", id}, {"rating", 4294967301LL}})).code, 400);
  EXPECT_TRUE(body_of(routes_->handle_get_asset(get(), id))["quality_rating"].is_null());

  EXPECT_EQ(
      routes_->handle_assign_episode(post({{"asset_id", id}, {"episode", 4294967298LL}})).code,
      400);
  EXPECT_EQ(body_of(routes_->handle_get_asset(get(), id))["episode_assignments"],
            nlohmann::json::array());

  auto similar = routes_->handle_search_similar(
      post({{"image_base64", base64_encode(TestUtilities::create_png_bytes(4, 4))},
            {"limit", 4294967297LL}}));
  EXPECT_EQ(similar.code, 400);
}

TEST_F(RoutesTest, AssignEpisodeReturnsAssignments) {
  std::string id = upload_png("a.png", 10, 10);

  auto resp = routes_->handle_assign_episode(post({{"asset_id", id}, {"episode", 3}}));
  ASSERT_EQ(resp.code, 200);
  EXPECT_EQ(body_of(resp)["episode_assignments"], nlohmann::json({3}));

  EXPECT_EQ(routes_->handle_assign_episode(post({{"asset_id", id}, {"episode", 9}})).code, 400);

  auto episode = routes_->handle_search_episode(get(), 3);
  ASSERT_EQ(episode.code, 200);
  EXPECT_EQ(body_of(episode).size(), 1u);
}

TEST_F(RoutesTest, ContentIsServedByteIdenticalWithMediaContentType) {
  std::vector<char> png = TestUtilities::create_png_bytes(32, 16);
  auto upload = routes_->handle_add_image(post(
      {{"image_base64", base64_encode(png)}, {"filename", "shot.png"}, {"source", "dalle"}}));
  ASSERT_EQ(upload.code, 200);
  std::string id = body_of(upload)["asset_id"];

  auto resp = routes_->handle_get_content(get(), id);
  ASSERT_EQ(resp.code, 200);
  EXPECT_EQ(resp.body, std::string(png.begin(), png.end()));
  EXPECT_EQ(resp.get_header_value("Content-Type"), "image/png");
}

TEST_F(RoutesTest, ContentDispositionNeutralisesQuotesAndLineBreaks) {
  std::string id = upload_png("we\"ird\r\nSet-Cookie: x.png", 12, 12);

  auto resp = routes_->handle_get_content(get(), id);
  ASSERT_EQ(resp.code, 200);
  EXPECT_EQ(resp.get_header_value("Content-Disposition"),
            "attachment; filename=\"we_ird__Set-Cookie: x.png\"");
  // The stored filename itself is untouched
  EXPECT_EQ(body_of(routes_->handle_get_asset(get(), id))["filename"],
            "we\"ird\r\nSet-Cookie: x.png");
}

TEST_F(RoutesTest, SimilarSearchRanksTheSameImageFirst) {
  std::string first = upload_png("first.png", 20, 20);
  upload_png("second.png", 40, 30);

  auto resp = routes_->handle_get_content(get(), first);
  ASSERT_EQ(resp.code, 200);
  std::vector<char> bytes(resp.body.begin(), resp.body.end());

  auto similar =
      routes_->handle_search_similar(post({{"image_base64", base64_encode(bytes)}, {"limit", 2}}));
  ASSERT_EQ(similar.code, 200);
  auto results = body_of(similar);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0]["id"], first);
  EXPECT_NEAR(results[0]["distance"].get<double>(), 0.0, 1e-4);
}

TEST_F(RoutesTest, ThemeSearchRequiresQuery) {
  upload_png("a.png", 10, 10);

  EXPECT_EQ(routes_->handle_search_theme(get()).code, 400);
  EXPECT_EQ(routes_->handle_search_theme(get("query=city&limit=abc")).code, 400);
  EXPECT_EQ(routes_->handle_search_theme(get("query=city&media_type=audio")).code, 400);

  auto resp = routes_->handle_search_theme(get("query=city&limit=5"));
  ASSERT_EQ(resp.code, 200);
  EXPECT_EQ(body_of(resp).size(), 1u);
}

TEST_F(RoutesTest, ListAssetsPaginates) {
  for (int i = 0; i < 5; ++i) {
    upload_png("img" + std::to_string(i) + ".png", 8, 8);
  }

  auto resp = routes_->handle_list_assets(get("limit=2&offset=4"));
  ASSERT_EQ(resp.code, 200);
  auto json = body_of(resp);
  EXPECT_EQ(json["total"], 5);
  EXPECT_EQ(json["offset"], 4);
  ASSERT_EQ(json["assets"].size(), 1u);
  EXPECT_EQ(json["assets"][0]["filename"], "img4.png");

  auto rest = routes_->handle_list_assets(get("limit=2147483647&offset=1"));
  ASSERT_EQ(rest.code, 200);
  EXPECT_EQ(body_of(rest)["assets"].size(), 4u);

  EXPECT_EQ(routes_->handle_list_assets(get("limit=0")).code, 400);
  EXPECT_EQ(body_of(routes_->handle_list_assets(get("source=runway")))["total"], 0);
}

TEST_F(RoutesTest, BackupUsesDefaultDestination) {
  upload_png("a.png", 10, 10);

  auto resp = routes_->handle_backup(crow::request{});
  ASSERT_EQ(resp.code, 200);
  EXPECT_TRUE(std::filesystem::exists(backup_dir_ / "media_assets.store" /
                                      DatabaseManager::DB_FILENAME));

  EXPECT_EQ(routes_->handle_backup(post({{"dest", store_dir_.string()}})).code, 400);
}

TEST_F(RoutesTest, ImportMissingDirectoryIsNotFound) {
  auto resp = routes_->handle_import(post({{"path", "/nonexistent/media"}, {"source", "x"}}));
  EXPECT_EQ(resp.code, 404);
}

}  // namespace media_core
