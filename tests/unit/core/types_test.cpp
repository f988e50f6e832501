#include <gtest/gtest.h>

#include <cmath>

#include "media_core/errors.hpp"
#include "media_core/types/embedding.hpp"
#include "media_core/types/media_asset.hpp"
#include "media_core/utils/time_utils.hpp"

namespace media_core {

TEST(MediaTypeTest, StringConversions) {
  EXPECT_EQ(to_string(MediaType::Image), "image");
  EXPECT_EQ(to_string(MediaType::Video), "video");
  EXPECT_EQ(media_type_from_string("image"), MediaType::Image);
  EXPECT_EQ(media_type_from_string("video"), MediaType::Video);
  EXPECT_THROW(media_type_from_string("audio"), InvalidArgumentError);
  EXPECT_THROW(media_type_from_string("Image"), InvalidArgumentError);
}

TEST(MediaTypeTest, ClassifiesByExtensionCaseInsensitively) {
  EXPECT_EQ(media_type_for_extension("a/hero.png"), MediaType::Image);
  EXPECT_EQ(media_type_for_extension("HERO.JPG"), MediaType::Image);
  EXPECT_EQ(media_type_for_extension("x.webp"), MediaType::Image);
  EXPECT_EQ(media_type_for_extension("clip.MP4"), MediaType::Video);
  EXPECT_EQ(media_type_for_extension("clip.mov"), MediaType::Video);
  EXPECT_FALSE(media_type_for_extension("notes.txt").has_value());
  EXPECT_FALSE(media_type_for_extension("no_extension").has_value());
}

TEST(MediaTypeTest, NormalizesFormat) {
  EXPECT_EQ(normalize_format("hero.PNG"), "png");
  EXPECT_EQ(normalize_format("photo.jpg"), "jpeg");
  EXPECT_EQ(normalize_format("photo.JPEG"), "jpeg");
  EXPECT_EQ(normalize_format("clip.mp4"), "mp4");
}

TEST(MediaContentTest, VariantReportsItsMediaType) {
  MediaContent image = ImageContent{{'a', 'b'}};
  MediaContent video = VideoContent{{'v'}, std::vector<char>{'t'}};

  EXPECT_EQ(media_type_of(image), MediaType::Image);
  EXPECT_EQ(media_type_of(video), MediaType::Video);
  EXPECT_EQ(primary_bytes(image), (std::vector<char>{'a', 'b'}));
  EXPECT_EQ(primary_bytes(video), (std::vector<char>{'v'}));
}

TEST(EmbeddingTest, ComputedRequiresDimensionAndUnitNorm) {
  std::vector<float> unit(EMBEDDING_DIMENSION, 0.0f);
  unit[3] = 1.0f;

  Embedding embedding = Embedding::computed(unit);
  EXPECT_TRUE(embedding.is_computed());
  EXPECT_EQ(embedding.status(), EmbeddingStatus::COMPUTED);
  EXPECT_EQ(embedding.values().size(), static_cast<size_t>(EMBEDDING_DIMENSION));

  std::vector<float> too_short(EMBEDDING_DIMENSION - 1, 0.0f);
  too_short[0] = 1.0f;
  EXPECT_THROW(Embedding::computed(too_short), InvalidArgumentError);

  std::vector<float> not_unit(EMBEDDING_DIMENSION, 0.0f);
  not_unit[0] = 2.0f;
  EXPECT_THROW(Embedding::computed(not_unit), InvalidArgumentError);

  // The old zero-vector fallback is rejected outright
  EXPECT_THROW(Embedding::computed(std::vector<float>(EMBEDDING_DIMENSION, 0.0f)),
               InvalidArgumentError);
}

TEST(EmbeddingTest, UnavailableCarriesNoValues) {
  Embedding embedding = Embedding::unavailable();
  EXPECT_FALSE(embedding.is_computed());
  EXPECT_EQ(embedding.status(), EmbeddingStatus::UNAVAILABLE);
  EXPECT_TRUE(embedding.values().empty());

  EXPECT_EQ(to_string(EmbeddingStatus::UNAVAILABLE), "UNAVAILABLE");
  EXPECT_EQ(embedding_status_from_string("COMPUTED"), EmbeddingStatus::COMPUTED);
  EXPECT_THROW(embedding_status_from_string("ZERO"), std::invalid_argument);
}

TEST(EmbeddingTest, NormalizeL2ScalesToUnitLength) {
  std::vector<float> values = {3.0f, 4.0f};
  normalize_l2(values);
  EXPECT_NEAR(values[0], 0.6f, 1e-6);
  EXPECT_NEAR(values[1], 0.8f, 1e-6);
  EXPECT_NEAR(l2_norm(values), 1.0f, 1e-6);

  std::vector<float> zeros(4, 0.0f);
  EXPECT_THROW(normalize_l2(zeros), InvalidArgumentError);
}

TEST(TimeUtilsTest, RoundTripsUtcSeconds) {
  const std::string stamp = "2024-03-09T17:45:12Z";
  EXPECT_EQ(time_point_to_string(string_to_time_point(stamp)), stamp);
  EXPECT_THROW(string_to_time_point("yesterday"), std::runtime_error);
}

TEST(ErrorsTest, KindsAreCarriedByTheHierarchy) {
  EXPECT_EQ(NotFoundError("x").kind(), ErrorKind::NotFound);
  EXPECT_EQ(InvalidArgumentError("x").kind(), ErrorKind::InvalidArgument);
  EXPECT_EQ(ExternalServiceError("x").kind(), ErrorKind::ExternalServiceFailure);
  EXPECT_EQ(StorageIOError("x").kind(), ErrorKind::IOFailure);
  EXPECT_STREQ(NotFoundError("missing asset").what(), "missing asset");
  EXPECT_EQ(to_string(ErrorKind::IOFailure), "IO_FAILURE");
}

}  // namespace media_core
