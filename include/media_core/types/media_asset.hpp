#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "media_core/types/embedding.hpp"

namespace media_core {

inline constexpr int MIN_QUALITY_RATING = 1;
inline constexpr int MAX_QUALITY_RATING = 10;
inline constexpr int MIN_EPISODE = 1;
inline constexpr int MAX_EPISODE = 8;

enum class MediaType { Image, Video };

std::string to_string(MediaType type);
// Accepts "image" / "video". Throws InvalidArgumentError otherwise.
MediaType media_type_from_string(const std::string &str);

// Classification by extension, case-insensitive. nullopt for unsupported files.
std::optional<MediaType> media_type_for_extension(const std::filesystem::path &file_path);

// Lower-cased extension without the dot; "jpg" becomes "jpeg".
std::string normalize_format(const std::filesystem::path &file_path);

struct ImageContent {
  std::vector<char> bytes;
};

struct VideoContent {
  std::vector<char> bytes;
  std::optional<std::vector<char>> thumbnail;
};

// Exactly one kind of binary payload per asset.
using MediaContent = std::variant<ImageContent, VideoContent>;

MediaType media_type_of(const MediaContent &content);
const std::vector<char> &primary_bytes(const MediaContent &content);

struct MediaAsset {
  std::string id;
  std::string filename;
  MediaType media_type = MediaType::Image;

  Embedding embedding;
  std::string embedding_model;

  // Provenance
  std::string source;
  std::optional<std::string> generation_prompt;
  std::optional<std::string> generation_model;
  std::optional<double> generation_time_seconds;
  std::optional<double> generation_cost_usd;

  // Technical specs
  std::optional<int> width;
  std::optional<int> height;
  std::optional<double> duration_seconds;
  long long file_size_bytes = 0;
  std::string format;
  std::string content_sha256;
  bool has_thumbnail = false;

  // Classification
  std::optional<std::string> content_type;
  std::set<std::string> subjects;
  std::set<std::string> style_tags;

  // Curation
  std::optional<int> quality_rating;
  std::optional<std::string> quality_notes;
  std::vector<int> episode_assignments;

  // Usage tracking, persisted but not updated by any operation yet
  int use_count = 0;
  std::chrono::system_clock::time_point created_at;
  std::optional<std::chrono::system_clock::time_point> last_used_at;
};

struct AssetSearchResult {
  float distance;
  MediaAsset asset;
};

}  // namespace media_core
