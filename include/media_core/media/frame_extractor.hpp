#pragma once

#include <filesystem>
#include <optional>
#include <vector>

namespace media_core {

// Representative still frame and duration of a video file. Both operations are best-effort:
// they return nullopt on any failure and never throw.
class FrameExtractor {
 public:
  virtual ~FrameExtractor() = default;

  // Encoded still (JPEG) taken `offset_seconds` into the video.
  virtual std::optional<std::vector<char>> extract_frame(const std::filesystem::path &video_path,
                                                         double offset_seconds) = 0;
  virtual std::optional<double> probe_duration(const std::filesystem::path &video_path) = 0;
};

}  // namespace media_core
