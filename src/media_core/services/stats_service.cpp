#include "media_core/services/stats_service.hpp"

#include <cmath>

namespace media_core {

namespace {

double round_to(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

}  // namespace

StatsService::StatsService(std::shared_ptr<MetadataStore> metadata_store)
    : metadata_store_(metadata_store) {}

CollectionStats StatsService::stats() {
  CollectionStats stats;
  long long total_bytes = 0;
  long long rating_sum = 0;

  for (const auto &asset : metadata_store_->list_assets()) {
    ++stats.total_assets;
    if (asset.media_type == MediaType::Image) {
      ++stats.images;
    } else {
      ++stats.videos;
    }
    total_bytes += asset.file_size_bytes;
    ++stats.sources[asset.source];

    if (asset.quality_rating) {
      ++stats.rated_count;
      rating_sum += *asset.quality_rating;
    } else {
      ++stats.unrated_count;
    }
    if (!asset.embedding.is_computed()) {
      ++stats.embedding_unavailable_count;
    }
  }

  stats.total_size_mb = round_to(static_cast<double>(total_bytes) / (1024.0 * 1024.0), 2);
  if (stats.rated_count > 0) {
    stats.avg_quality = round_to(static_cast<double>(rating_sum) / stats.rated_count, 1);
  }
  return stats;
}

}  // namespace media_core
