#include "media_core/services/ingestion_service.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

#include "media_core/media/image_probe.hpp"
#include "media_core/utils/crypto_utils.hpp"

namespace media_core {

IngestionService::IngestionService(std::shared_ptr<MetadataStore> metadata_store,
                                   std::shared_ptr<EmbeddingProvider> embedding_provider,
                                   std::shared_ptr<FrameExtractor> frame_extractor,
                                   double frame_offset_seconds)
    : metadata_store_(metadata_store),
      embedding_provider_(embedding_provider),
      frame_extractor_(frame_extractor),
      frame_offset_seconds_(frame_offset_seconds) {}

IngestOptions IngestionService::validated(const IngestOptions &options) {
  if (options.source.empty()) {
    throw InvalidArgumentError("source must not be empty");
  }
  if (options.quality_rating &&
      (*options.quality_rating < MIN_QUALITY_RATING || *options.quality_rating > MAX_QUALITY_RATING)) {
    throw InvalidArgumentError("Rating must be between 1 and 10, got " +
                               std::to_string(*options.quality_rating));
  }

  IngestOptions result = options;
  result.episode_assignments.clear();
  for (int episode : options.episode_assignments) {
    if (episode < MIN_EPISODE || episode > MAX_EPISODE) {
      throw InvalidArgumentError("Episode must be between 1 and 8, got " + std::to_string(episode));
    }
    if (std::find(result.episode_assignments.begin(), result.episode_assignments.end(), episode) ==
        result.episode_assignments.end()) {
      result.episode_assignments.push_back(episode);
    }
  }
  if ((options.width && *options.width <= 0) || (options.height && *options.height <= 0)) {
    throw InvalidArgumentError("width and height must be positive");
  }
  return result;
}

std::vector<char> IngestionService::read_media_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw NotFoundError("File not found: " + path.string());
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw InvalidArgumentError("Not a regular file: " + path.string());
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw StorageIOError("Cannot open file: " + path.string());
  }
  std::vector<char> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw StorageIOError("Failed to read file: " + path.string());
  }
  return bytes;
}

MediaAsset IngestionService::create_asset(const std::filesystem::path &path,
                                          MediaType media_type,
                                          const std::vector<char> &bytes,
                                          const IngestOptions &options) const {
  MediaAsset asset;
  asset.id = generate_uuid_v4();
  asset.filename = path.filename().string();
  asset.media_type = media_type;
  asset.embedding_model = embedding_provider_->model_name();

  asset.source = options.source;
  asset.generation_prompt = options.generation_prompt;
  asset.generation_model = options.generation_model;
  asset.generation_time_seconds = options.generation_time_seconds;
  asset.generation_cost_usd = options.generation_cost_usd;

  asset.file_size_bytes = static_cast<long long>(bytes.size());
  asset.format = normalize_format(path);
  asset.content_sha256 = sha256_hex(bytes);

  asset.content_type = options.content_type;
  asset.subjects = options.subjects;
  asset.style_tags = options.style_tags;
  asset.quality_rating = options.quality_rating;
  asset.quality_notes = options.quality_notes;
  asset.episode_assignments = options.episode_assignments;

  asset.created_at = std::chrono::system_clock::now();
  return asset;
}

std::string IngestionService::add_image(const std::filesystem::path &path,
                                        const IngestOptions &options) {
  const IngestOptions opts = validated(options);
  std::vector<char> bytes = read_media_file(path);

  const ImageDimensions dims = probe_image_dimensions(bytes);
  Embedding embedding = embed_image(*embedding_provider_, bytes);

  MediaAsset asset = create_asset(path, MediaType::Image, bytes, opts);
  asset.width = dims.width;
  asset.height = dims.height;
  asset.embedding = std::move(embedding);

  metadata_store_->insert_asset(asset, ImageContent{std::move(bytes)});
  std::cout << "[Ingest] Added image " << asset.filename << " (" << asset.id.substr(0, 8) << ", "
            << dims.width << "x" << dims.height << ")" << std::endl;
  return asset.id;
}

std::string IngestionService::add_video(const std::filesystem::path &path,
                                        const IngestOptions &options) {
  const IngestOptions opts = validated(options);
  std::vector<char> bytes = read_media_file(path);

  // An empty thumbnail counts as no thumbnail, whether supplied or extracted
  std::optional<std::vector<char>> thumbnail = opts.thumbnail;
  if (!thumbnail || thumbnail->empty()) {
    thumbnail = frame_extractor_->extract_frame(path, frame_offset_seconds_);
  }
  if (thumbnail && thumbnail->empty()) {
    thumbnail.reset();
  }

  Embedding embedding = Embedding::unavailable();
  if (thumbnail) {
    try {
      embedding = embed_image(*embedding_provider_, *thumbnail);
    } catch (const MediaError &e) {
      std::cerr << "[Ingest] WARNING: could not embed the representative frame of "
                << path.filename() << " (" << e.what()
                << "); storing it with an UNAVAILABLE embedding, excluded from similarity search"
                << std::endl;
    }
  } else {
    std::cerr << "[Ingest] WARNING: no frame could be extracted from " << path.filename()
              << " at " << frame_offset_seconds_
              << "s; storing it with an UNAVAILABLE embedding, excluded from similarity search"
              << std::endl;
  }

  MediaAsset asset = create_asset(path, MediaType::Video, bytes, opts);
  asset.embedding = std::move(embedding);
  asset.duration_seconds = frame_extractor_->probe_duration(path);
  asset.width = opts.width;
  asset.height = opts.height;
  asset.has_thumbnail = thumbnail.has_value();
  if (thumbnail && (!asset.width || !asset.height)) {
    try {
      const ImageDimensions dims = probe_image_dimensions(*thumbnail);
      if (!asset.width)
        asset.width = dims.width;
      if (!asset.height)
        asset.height = dims.height;
    } catch (const MediaDecodeError &) {
      // Dimensions stay unknown
    }
  }

  metadata_store_->insert_asset(asset, VideoContent{std::move(bytes), std::move(thumbnail)});
  std::cout << "[Ingest] Added video " << asset.filename << " (" << asset.id.substr(0, 8)
            << ", embedding " << to_string(asset.embedding.status()) << ")" << std::endl;
  return asset.id;
}

int IngestionService::import_directory(const std::filesystem::path &dir,
                                       const IngestOptions &shared_options,
                                       bool recursive) {
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) {
    throw NotFoundError("Directory not found: " + dir.string());
  }
  if (!std::filesystem::is_directory(dir, ec)) {
    throw InvalidArgumentError("Not a directory: " + dir.string());
  }

  std::vector<std::pair<std::filesystem::path, MediaType>> candidates;
  auto consider = [&](const std::filesystem::directory_entry &entry) {
    if (!entry.is_regular_file()) {
      return;
    }
    if (auto type = media_type_for_extension(entry.path())) {
      candidates.emplace_back(entry.path(), *type);
    }
  };
  try {
    if (recursive) {
      for (const auto &entry : std::filesystem::recursive_directory_iterator(dir)) {
        consider(entry);
      }
    } else {
      for (const auto &entry : std::filesystem::directory_iterator(dir)) {
        consider(entry);
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    throw StorageIOError("Cannot enumerate " + dir.string() + ": " + e.what());
  }
  std::sort(candidates.begin(), candidates.end());

  int added = 0;
  for (const auto &[path, type] : candidates) {
    try {
      if (type == MediaType::Image) {
        add_image(path, shared_options);
      } else {
        add_video(path, shared_options);
      }
      ++added;
    } catch (const std::exception &e) {
      std::cerr << "[Ingest] Skipping " << path << ": " << e.what() << std::endl;
    }
  }

  std::cout << "[Ingest] Imported " << added << " of " << candidates.size() << " files from "
            << dir << std::endl;
  return added;
}

}  // namespace media_core
