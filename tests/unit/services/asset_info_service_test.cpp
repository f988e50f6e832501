#include <gtest/gtest.h>

#include <limits>

#include "../../common/utilities_test.hpp"
#include "media_core/services/asset_info_service.hpp"

namespace media_core {

using media_tests::TestUtilities;

class AssetInfoServiceTest : public media_tests::MediaStoreTestBase {
 protected:
  void SetUp() override {
    MediaStoreTestBase::SetUp();
    out_dir_ = TestUtilities::create_temp_dir("export");
    service_ = std::make_unique<AssetInfoService>(metadata_store_);
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_dir(out_dir_);
    MediaStoreTestBase::TearDown();
  }

  std::filesystem::path out_dir_;
  std::unique_ptr<AssetInfoService> service_;
};

TEST_F(AssetInfoServiceTest, ExportIsByteIdentical) {
  const auto png = TestUtilities::create_png_bytes(120, 80);
  auto asset = TestUtilities::create_test_asset("hero.png", MediaType::Image,
                                                Embedding::computed(TestUtilities::angle_vector(0.1)));
  metadata_store_->insert_asset(asset, ImageContent{png});

  const auto out = out_dir_ / "hero_copy.png";
  service_->export_asset(asset.id, out);
  EXPECT_EQ(TestUtilities::read_file(out), png);
}

TEST_F(AssetInfoServiceTest, ExportOfVideoWritesTheVideoNotTheThumbnail) {
  const std::vector<char> video_bytes = {'\0', 'm', 'p', '4', '\xff'};
  auto asset = TestUtilities::create_test_asset("clip.mp4", MediaType::Video, Embedding::unavailable());
  metadata_store_->insert_asset(asset, VideoContent{video_bytes, std::vector<char>{'j', 'p', 'g'}});

  const auto out = out_dir_ / "clip.mp4";
  service_->export_asset(asset.id, out);
  EXPECT_EQ(TestUtilities::read_file(out), video_bytes);
}

TEST_F(AssetInfoServiceTest, ExportErrors) {
  EXPECT_THROW(service_->export_asset("missing", out_dir_ / "x.png"), NotFoundError);

  std::string id =
      TestUtilities::insert_image(*metadata_store_, "a.png", TestUtilities::angle_vector(0.1));
  EXPECT_THROW(service_->export_asset(id, out_dir_ / "no" / "such" / "dir" / "a.png"),
               StorageIOError);
}

TEST_F(AssetInfoServiceTest, GetAssetAndContent) {
  std::string id =
      TestUtilities::insert_image(*metadata_store_, "a.png", TestUtilities::angle_vector(0.1));

  EXPECT_EQ(service_->get_asset(id)->filename, "a.png");
  EXPECT_TRUE(std::holds_alternative<ImageContent>(*service_->get_content(id)));
  EXPECT_FALSE(service_->get_asset("missing").has_value());
}

TEST_F(AssetInfoServiceTest, ListAssetsPaginatesAfterFiltering) {
  for (int i = 0; i < 5; ++i) {
    TestUtilities::insert_image(*metadata_store_, "mj" + std::to_string(i) + ".png",
                                TestUtilities::angle_vector(0.1 * i), "midjourney");
  }
  TestUtilities::insert_image(*metadata_store_, "dalle.png", TestUtilities::angle_vector(0.9), "dalle");
  auto video = TestUtilities::create_test_asset("clip.mp4", MediaType::Video, Embedding::unavailable());
  metadata_store_->insert_asset(video, VideoContent{{'v'}, std::nullopt});

  auto first = service_->list_assets(std::nullopt, std::nullopt, 3, 0);
  EXPECT_EQ(first.total, 7);
  ASSERT_EQ(first.assets.size(), 3u);
  EXPECT_EQ(first.assets[0].filename, "mj0.png");

  auto last = service_->list_assets(std::nullopt, std::nullopt, 3, 6);
  ASSERT_EQ(last.assets.size(), 1u);
  EXPECT_EQ(last.assets[0].filename, "clip.mp4");

  auto beyond = service_->list_assets(std::nullopt, std::nullopt, 3, 50);
  EXPECT_EQ(beyond.total, 7);
  EXPECT_TRUE(beyond.assets.empty());

  auto mj = service_->list_assets(MediaType::Image, std::string("midjourney"), 2, 1);
  EXPECT_EQ(mj.total, 5);
  ASSERT_EQ(mj.assets.size(), 2u);
  EXPECT_EQ(mj.assets[0].filename, "mj1.png");
  EXPECT_EQ(mj.assets[1].filename, "mj2.png");

  EXPECT_EQ(service_->list_assets(MediaType::Video).total, 1);
}

TEST_F(AssetInfoServiceTest, ListAssetsWithMaximalLimitReturnsTheRest) {
  for (int i = 0; i < 3; ++i) {
    TestUtilities::insert_image(*metadata_store_, "img" + std::to_string(i) + ".png",
                                TestUtilities::angle_vector(0.2 * i));
  }

  auto page = service_->list_assets(std::nullopt, std::nullopt,
                                    std::numeric_limits<int>::max(), 1);
  EXPECT_EQ(page.total, 3);
  ASSERT_EQ(page.assets.size(), 2u);
  EXPECT_EQ(page.assets[0].filename, "img1.png");
  EXPECT_EQ(page.assets[1].filename, "img2.png");

  auto far = service_->list_assets(std::nullopt, std::nullopt, std::numeric_limits<int>::max(),
                                   std::numeric_limits<int>::max());
  EXPECT_TRUE(far.assets.empty());
}

TEST_F(AssetInfoServiceTest, ListAssetsValidatesPaging) {
  EXPECT_THROW(service_->list_assets(std::nullopt, std::nullopt, 0, 0), InvalidArgumentError);
  EXPECT_THROW(service_->list_assets(std::nullopt, std::nullopt, 10, -1), InvalidArgumentError);
}

}  // namespace media_core
