#include "media_core/media/image_probe.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace media_core {

ImageDimensions probe_image_dimensions(const std::vector<char> &image_bytes) {
  if (image_bytes.empty()) {
    throw MediaDecodeError("Image is empty");
  }
  cv::Mat image;
  try {
    cv::Mat buf(1, static_cast<int>(image_bytes.size()), CV_8UC1,
                const_cast<char *>(image_bytes.data()));
    image = cv::imdecode(buf, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception &e) {
    throw MediaDecodeError(std::string("Cannot decode image: ") + e.what());
  }
  if (image.empty()) {
    throw MediaDecodeError("Cannot decode image: unsupported or corrupt data");
  }
  return {image.cols, image.rows};
}

}  // namespace media_core
