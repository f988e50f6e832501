#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

#include "media_core/errors.hpp"
#include "media_core/services/asset_info_service.hpp"
#include "media_core/services/ingestion_service.hpp"
#include "media_core/services/stats_service.hpp"

namespace media_api {

// Asset metadata as exposed over HTTP: no binary content and no raw vector.
nlohmann::json asset_to_json(const media_core::MediaAsset &asset);
nlohmann::json search_result_to_json(const media_core::AssetSearchResult &result);
nlohmann::json stats_to_json(const media_core::CollectionStats &stats);
nlohmann::json page_to_json(const media_core::AssetPage &page);

// Reads the optional ingestion fields shared by the image, video and import endpoints.
// `thumbnail_base64` is honoured only when `media_type` is Video. Type errors in the body throw
// InvalidArgumentError.
media_core::IngestOptions ingest_options_from_json(const nlohmann::json &body,
                                                   media_core::MediaType media_type);

// An integral JSON number that fits in int. Anything else, including values that would narrow,
// throws InvalidArgumentError naming `field`.
int checked_int(const nlohmann::json &value, const std::string &field);

// Absent or empty strings mean "no filter".
std::optional<media_core::MediaType> optional_media_type(const char *value);

int http_status_for(media_core::ErrorKind kind);

}  // namespace media_api
