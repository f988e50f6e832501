#pragma once

#include "media_core/media/frame_extractor.hpp"

namespace media_core {

class OpenCvFrameExtractor : public FrameExtractor {
 public:
  std::optional<std::vector<char>> extract_frame(const std::filesystem::path &video_path,
                                                 double offset_seconds) override;
  std::optional<double> probe_duration(const std::filesystem::path &video_path) override;
};

}  // namespace media_core
