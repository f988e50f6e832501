#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "media_core/db/metadata_store.hpp"
#include "media_core/embedding/embedding_provider.hpp"
#include "media_core/media/frame_extractor.hpp"

namespace media_core {

// Caller-supplied descriptive fields, set once at ingestion.
struct IngestOptions {
  std::string source;
  std::optional<std::string> generation_prompt;
  std::optional<std::string> generation_model;
  std::optional<double> generation_time_seconds;
  std::optional<double> generation_cost_usd;

  std::optional<std::string> content_type;
  std::set<std::string> subjects;
  std::set<std::string> style_tags;

  std::optional<int> quality_rating;
  std::optional<std::string> quality_notes;
  std::vector<int> episode_assignments;

  // Videos only. Image dimensions always come from decoding the file.
  std::optional<int> width;
  std::optional<int> height;
  // Replaces frame extraction when present.
  std::optional<std::vector<char>> thumbnail;
};

class IngestionService {
 public:
  static constexpr double DEFAULT_FRAME_OFFSET_SECONDS = 1.0;

  IngestionService(std::shared_ptr<MetadataStore> metadata_store,
                   std::shared_ptr<EmbeddingProvider> embedding_provider,
                   std::shared_ptr<FrameExtractor> frame_extractor,
                   double frame_offset_seconds = DEFAULT_FRAME_OFFSET_SECONDS);

  virtual ~IngestionService() = default;

  // Returns the new asset id. NotFoundError if the file is missing, MediaDecodeError if it is not
  // a readable image, EmbeddingError if the provider fails.
  virtual std::string add_image(const std::filesystem::path &path, const IngestOptions &options);

  // Returns the new asset id. NotFoundError if the file is missing. Frame extraction or embedding
  // failures store the video with an unavailable embedding instead of failing.
  virtual std::string add_video(const std::filesystem::path &path, const IngestOptions &options);

  // Ingests every recognised image/video under `dir` in path order with the shared options.
  // Per-file failures are logged and skipped. Returns the number of assets added.
  virtual int import_directory(const std::filesystem::path &dir,
                               const IngestOptions &shared_options,
                               bool recursive = true);

 private:
  std::shared_ptr<MetadataStore> metadata_store_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<FrameExtractor> frame_extractor_;
  double frame_offset_seconds_;

  static IngestOptions validated(const IngestOptions &options);
  static std::vector<char> read_media_file(const std::filesystem::path &path);
  MediaAsset create_asset(const std::filesystem::path &path,
                          MediaType media_type,
                          const std::vector<char> &bytes,
                          const IngestOptions &options) const;
};

}  // namespace media_core
