#include <algorithm>
#include <cctype>
#include <cmath>

#include "media_core/errors.hpp"
#include "media_core/types/embedding.hpp"
#include "media_core/types/media_asset.hpp"

namespace media_core {

namespace {

std::string lowercase_extension(const std::filesystem::path &file_path) {
  std::string ext = file_path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

}  // namespace

std::string to_string(MediaType type) {
  switch (type) {
    case MediaType::Image:
      return "image";
    case MediaType::Video:
      return "video";
    default:
      return "unknown";
  }
}

MediaType media_type_from_string(const std::string &str) {
  if (str == "image")
    return MediaType::Image;
  if (str == "video")
    return MediaType::Video;
  throw InvalidArgumentError("Unknown media type: '" + str + "'. Expected 'image' or 'video'.");
}

std::optional<MediaType> media_type_for_extension(const std::filesystem::path &file_path) {
  static const std::set<std::string> image_extensions = {".png", ".jpg", ".jpeg", ".webp",
                                                         ".gif"};
  static const std::set<std::string> video_extensions = {".mp4", ".mov", ".webm", ".avi"};

  const std::string ext = lowercase_extension(file_path);
  if (image_extensions.count(ext))
    return MediaType::Image;
  if (video_extensions.count(ext))
    return MediaType::Video;
  return std::nullopt;
}

std::string normalize_format(const std::filesystem::path &file_path) {
  std::string ext = lowercase_extension(file_path);
  if (!ext.empty() && ext.front() == '.') {
    ext.erase(0, 1);
  }
  if (ext == "jpg") {
    return "jpeg";
  }
  return ext;
}

MediaType media_type_of(const MediaContent &content) {
  return std::holds_alternative<ImageContent>(content) ? MediaType::Image : MediaType::Video;
}

const std::vector<char> &primary_bytes(const MediaContent &content) {
  if (const auto *image = std::get_if<ImageContent>(&content)) {
    return image->bytes;
  }
  return std::get<VideoContent>(content).bytes;
}

float l2_norm(const std::vector<float> &values) {
  double sum = 0.0;
  for (float v : values) {
    sum += static_cast<double>(v) * v;
  }
  return static_cast<float>(std::sqrt(sum));
}

void normalize_l2(std::vector<float> &values) {
  const float norm = l2_norm(values);
  if (norm == 0.0f || !std::isfinite(norm)) {
    throw InvalidArgumentError("Cannot normalize a zero or non-finite vector");
  }
  for (float &v : values) {
    v /= norm;
  }
}

Embedding Embedding::computed(std::vector<float> values) {
  if (values.size() != EMBEDDING_DIMENSION) {
    throw InvalidArgumentError("Embedding dimension mismatch. Expected " +
                               std::to_string(EMBEDDING_DIMENSION) + ", got " +
                               std::to_string(values.size()));
  }
  const float norm = l2_norm(values);
  if (std::fabs(norm - 1.0f) > UNIT_NORM_TOLERANCE) {
    throw InvalidArgumentError("Embedding is not unit length (norm=" + std::to_string(norm) +
                               ")");
  }
  Embedding embedding;
  embedding.status_ = EmbeddingStatus::COMPUTED;
  embedding.values_ = std::move(values);
  return embedding;
}

}  // namespace media_core
