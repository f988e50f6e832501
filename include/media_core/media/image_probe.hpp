#pragma once

#include <vector>

#include "media_core/errors.hpp"

namespace media_core {

class MediaDecodeError : public InvalidArgumentError {
 public:
  explicit MediaDecodeError(const std::string &message) : InvalidArgumentError(message) {}
};

struct ImageDimensions {
  int width;
  int height;
};

// Decodes the encoded image just far enough to learn its size.
// Throws MediaDecodeError when the bytes are not a readable image.
ImageDimensions probe_image_dimensions(const std::vector<char> &image_bytes);

}  // namespace media_core
