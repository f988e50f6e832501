#include "media_core/media/opencv_frame_extractor.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>

#include <iostream>

namespace media_core {

std::optional<std::vector<char>> OpenCvFrameExtractor::extract_frame(
    const std::filesystem::path &video_path, double offset_seconds) {
  try {
    cv::VideoCapture cap(video_path.string());
    if (!cap.isOpened()) {
      std::cerr << "[Ingest] Could not open video " << video_path << std::endl;
      return std::nullopt;
    }

    cap.set(cv::CAP_PROP_POS_MSEC, offset_seconds * 1000.0);
    cv::Mat frame;
    if (!cap.read(frame) || frame.empty()) {
      // Shorter than the offset: fall back to the first frame
      cap.set(cv::CAP_PROP_POS_FRAMES, 0);
      if (!cap.read(frame) || frame.empty()) {
        return std::nullopt;
      }
    }

    std::vector<uchar> encoded;
    if (!cv::imencode(".jpg", frame, encoded)) {
      return std::nullopt;
    }
    return std::vector<char>(encoded.begin(), encoded.end());
  } catch (const cv::Exception &e) {
    std::cerr << "[Ingest] Frame extraction failed for " << video_path << ": " << e.what()
              << std::endl;
    return std::nullopt;
  }
}

std::optional<double> OpenCvFrameExtractor::probe_duration(const std::filesystem::path &video_path) {
  try {
    cv::VideoCapture cap(video_path.string());
    if (!cap.isOpened()) {
      return std::nullopt;
    }
    const double frame_count = cap.get(cv::CAP_PROP_FRAME_COUNT);
    const double fps = cap.get(cv::CAP_PROP_FPS);
    if (frame_count <= 0 || fps <= 0) {
      return std::nullopt;
    }
    return frame_count / fps;
  } catch (const cv::Exception &e) {
    std::cerr << "[Ingest] Duration probe failed for " << video_path << ": " << e.what()
              << std::endl;
    return std::nullopt;
  }
}

}  // namespace media_core
