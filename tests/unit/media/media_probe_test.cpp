#include <gtest/gtest.h>

#include "../../common/utilities_test.hpp"
#include "media_core/media/image_probe.hpp"
#include "media_core/media/opencv_frame_extractor.hpp"

namespace media_core {

TEST(ImageProbeTest, ReadsDimensionsOfEncodedImages) {
  ImageDimensions png = probe_image_dimensions(media_tests::TestUtilities::create_png_bytes(300, 200));
  EXPECT_EQ(png.width, 300);
  EXPECT_EQ(png.height, 200);

  ImageDimensions jpeg = probe_image_dimensions(media_tests::TestUtilities::create_jpeg_bytes(17, 9));
  EXPECT_EQ(jpeg.width, 17);
  EXPECT_EQ(jpeg.height, 9);
}

TEST(ImageProbeTest, RejectsUndecodableBytes) {
  EXPECT_THROW(probe_image_dimensions({}), MediaDecodeError);
  EXPECT_THROW(probe_image_dimensions({'n', 'o', 'p', 'e'}), MediaDecodeError);
  // MediaDecodeError is an InvalidArgument-kind failure
  EXPECT_THROW(probe_image_dimensions({'n', 'o', 'p', 'e'}), InvalidArgumentError);
}

TEST(OpenCvFrameExtractorTest, UnreadableVideoYieldsNothing) {
  auto dir = media_tests::TestUtilities::create_temp_dir("video");
  auto fake = dir / "fake.mp4";
  media_tests::TestUtilities::write_file(fake, std::vector<char>{'n', 'o', 't', 'v', 'i', 'd'});

  OpenCvFrameExtractor extractor;
  EXPECT_FALSE(extractor.extract_frame(dir / "missing.mp4", 1.0).has_value());
  EXPECT_FALSE(extractor.probe_duration(dir / "missing.mp4").has_value());
  EXPECT_FALSE(extractor.extract_frame(fake, 1.0).has_value());
  EXPECT_FALSE(extractor.probe_duration(fake).has_value());

  media_tests::TestUtilities::cleanup_temp_dir(dir);
}

}  // namespace media_core
