#include "media_api/json_mapping.hpp"

#include <cstdint>
#include <limits>

#include "media_core/utils/crypto_utils.hpp"
#include "media_core/utils/time_utils.hpp"

namespace media_api {

namespace {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T> &value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template <typename T>
std::optional<T> optional_field(const nlohmann::json &body, const char *key) {
  if (!body.contains(key) || body.at(key).is_null()) {
    return std::nullopt;
  }
  try {
    return body.at(key).get<T>();
  } catch (const nlohmann::json::exception &) {
    throw media_core::InvalidArgumentError(std::string("Field '") + key + "' has the wrong type");
  }
}

std::optional<int> optional_int(const nlohmann::json &body, const char *key) {
  if (!body.contains(key) || body.at(key).is_null()) {
    return std::nullopt;
  }
  return checked_int(body.at(key), key);
}

std::vector<int> int_list(const nlohmann::json &body, const char *key) {
  std::vector<int> values;
  if (!body.contains(key) || body.at(key).is_null()) {
    return values;
  }
  if (!body.at(key).is_array()) {
    throw media_core::InvalidArgumentError(std::string("Field '") + key + "' must be an array");
  }
  for (const auto &element : body.at(key)) {
    values.push_back(checked_int(element, key));
  }
  return values;
}

}  // namespace

int checked_int(const nlohmann::json &value, const std::string &field) {
  bool in_range = false;
  long long parsed = 0;
  if (value.is_number_unsigned()) {
    const auto raw = value.get<std::uint64_t>();
    in_range = raw <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    parsed = static_cast<long long>(in_range ? raw : 0);
  } else if (value.is_number_integer()) {
    parsed = value.get<std::int64_t>();
    in_range = parsed >= std::numeric_limits<int>::min() &&
               parsed <= std::numeric_limits<int>::max();
  } else {
    throw media_core::InvalidArgumentError("Field '" + field + "' must be an integer");
  }
  if (!in_range) {
    throw media_core::InvalidArgumentError("Field '" + field + "' is out of range");
  }
  return static_cast<int>(parsed);
}

nlohmann::json asset_to_json(const media_core::MediaAsset &asset) {
  nlohmann::json j;
  j["id"] = asset.id;
  j["filename"] = asset.filename;
  j["media_type"] = media_core::to_string(asset.media_type);
  j["embedding_status"] = media_core::to_string(asset.embedding.status());
  j["embedding_model"] = asset.embedding_model;

  j["source"] = asset.source;
  j["generation_prompt"] = optional_to_json(asset.generation_prompt);
  j["generation_model"] = optional_to_json(asset.generation_model);
  j["generation_time_seconds"] = optional_to_json(asset.generation_time_seconds);
  j["generation_cost_usd"] = optional_to_json(asset.generation_cost_usd);

  j["width"] = optional_to_json(asset.width);
  j["height"] = optional_to_json(asset.height);
  j["duration_seconds"] = optional_to_json(asset.duration_seconds);
  j["file_size_bytes"] = asset.file_size_bytes;
  j["format"] = asset.format;
  j["content_sha256"] = asset.content_sha256;
  j["has_thumbnail"] = asset.has_thumbnail;

  j["content_type"] = optional_to_json(asset.content_type);
  j["subjects"] = asset.subjects;
  j["style_tags"] = asset.style_tags;

  j["quality_rating"] = optional_to_json(asset.quality_rating);
  j["quality_notes"] = optional_to_json(asset.quality_notes);
  j["episode_assignments"] = asset.episode_assignments;
  j["use_count"] = asset.use_count;

  j["created_at"] = media_core::time_point_to_string(asset.created_at);
  j["last_used_at"] = asset.last_used_at
                          ? nlohmann::json(media_core::time_point_to_string(*asset.last_used_at))
                          : nlohmann::json(nullptr);
  return j;
}

nlohmann::json search_result_to_json(const media_core::AssetSearchResult &result) {
  nlohmann::json j = asset_to_json(result.asset);
  j["distance"] = result.distance;
  return j;
}

nlohmann::json stats_to_json(const media_core::CollectionStats &stats) {
  nlohmann::json j;
  j["total_assets"] = stats.total_assets;
  j["images"] = stats.images;
  j["videos"] = stats.videos;
  j["total_size_mb"] = stats.total_size_mb;
  j["sources"] = stats.sources;
  j["avg_quality"] = optional_to_json(stats.avg_quality);
  j["rated_count"] = stats.rated_count;
  j["unrated_count"] = stats.unrated_count;
  j["embedding_unavailable_count"] = stats.embedding_unavailable_count;
  return j;
}

nlohmann::json page_to_json(const media_core::AssetPage &page) {
  nlohmann::json assets = nlohmann::json::array();
  for (const auto &asset : page.assets) {
    assets.push_back(asset_to_json(asset));
  }
  nlohmann::json j;
  j["total"] = page.total;
  j["offset"] = page.offset;
  j["limit"] = page.limit;
  j["assets"] = assets;
  return j;
}

media_core::IngestOptions ingest_options_from_json(const nlohmann::json &body,
                                                   media_core::MediaType media_type) {
  if (!body.is_object()) {
    throw media_core::InvalidArgumentError("Request body must be a JSON object");
  }

  media_core::IngestOptions options;
  options.source = optional_field<std::string>(body, "source").value_or("");
  options.generation_prompt = optional_field<std::string>(body, "generation_prompt");
  options.generation_model = optional_field<std::string>(body, "generation_model");
  options.generation_time_seconds = optional_field<double>(body, "generation_time_seconds");
  options.generation_cost_usd = optional_field<double>(body, "generation_cost_usd");

  options.content_type = optional_field<std::string>(body, "content_type");
  options.subjects =
      optional_field<std::set<std::string>>(body, "subjects").value_or(std::set<std::string>{});
  options.style_tags =
      optional_field<std::set<std::string>>(body, "style_tags").value_or(std::set<std::string>{});

  options.quality_rating = optional_int(body, "quality_rating");
  options.quality_notes = optional_field<std::string>(body, "quality_notes");
  options.episode_assignments =
      int_list(body, "episode_assignments");

  if (media_type == media_core::MediaType::Video) {
    options.width = optional_int(body, "width");
    options.height = optional_int(body, "height");
    if (auto thumbnail = optional_field<std::string>(body, "thumbnail_base64")) {
      options.thumbnail = media_core::base64_decode(*thumbnail);
    }
  }
  return options;
}

std::optional<media_core::MediaType> optional_media_type(const char *value) {
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return media_core::media_type_from_string(value);
}

int http_status_for(media_core::ErrorKind kind) {
  switch (kind) {
    case media_core::ErrorKind::NotFound:
      return 404;
    case media_core::ErrorKind::InvalidArgument:
      return 400;
    case media_core::ErrorKind::ExternalServiceFailure:
      return 502;
    case media_core::ErrorKind::IOFailure:
    default:
      return 500;
  }
}

}  // namespace media_api
