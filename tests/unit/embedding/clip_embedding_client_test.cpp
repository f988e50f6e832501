#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "media_core/embedding/clip_embedding_client.hpp"

namespace media_core {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

TEST(SniffImageMimeTest, RecognisesCommonFormats) {
  EXPECT_EQ(sniff_image_mime(media_tests::TestUtilities::create_png_bytes(4, 4)), "image/png");
  EXPECT_EQ(sniff_image_mime(media_tests::TestUtilities::create_jpeg_bytes(4, 4)), "image/jpeg");
  EXPECT_EQ(sniff_image_mime({'G', 'I', 'F', '8', '9', 'a'}), "image/gif");
  EXPECT_EQ(sniff_image_mime({'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P'}), "image/webp");
  EXPECT_EQ(sniff_image_mime({'?', '?'}), "application/octet-stream");
  EXPECT_EQ(sniff_image_mime({}), "application/octet-stream");
}

TEST(ClipEmbeddingClientTest, UnreachableServerIsAnEmbeddingError) {
  // Port 1 is never served in the test environment
  ClipEmbeddingClient client("http://127.0.0.1:1/", "openai/clip-vit-base-patch32", 2);

  EXPECT_EQ(client.model_name(), "openai/clip-vit-base-patch32");
  EXPECT_FALSE(client.is_server_available());
  EXPECT_THROW(client.encode_text("a cat"), EmbeddingError);
  EXPECT_THROW(client.encode_image(media_tests::TestUtilities::create_png_bytes(4, 4)),
               EmbeddingError);
}

TEST(ClipEmbeddingClientTest, EmptyInputsAreRejectedLocally) {
  ClipEmbeddingClient client("http://127.0.0.1:1", "m", 2);
  EXPECT_THROW(client.encode_text(""), InvalidArgumentError);
  EXPECT_THROW(client.encode_image({}), InvalidArgumentError);
}

TEST(EmbedHelpersTest, WrapProviderFailures) {
  NiceMock<media_tests::MockEmbeddingProvider> provider;
  EXPECT_CALL(provider, encode_text(_))
      .WillOnce(Throw(std::runtime_error("socket closed")))
      .WillOnce(Return(std::vector<float>(EMBEDDING_DIMENSION, 1.0f)))
      .WillOnce(Return(media_tests::TestUtilities::seeded_unit_vector("x")));

  EXPECT_THROW(embed_text(provider, "x"), EmbeddingError);
  // Right dimension but not unit length
  EXPECT_THROW(embed_text(provider, "x"), EmbeddingError);

  Embedding ok = embed_text(provider, "x");
  EXPECT_TRUE(ok.is_computed());
}

TEST(EmbedHelpersTest, MediaErrorsPassThroughUnchanged) {
  NiceMock<media_tests::MockEmbeddingProvider> provider;
  EXPECT_CALL(provider, encode_image(_)).WillOnce(Throw(InvalidArgumentError("empty image")));
  EXPECT_THROW(embed_image(provider, {'x'}), InvalidArgumentError);
}

}  // namespace media_core
