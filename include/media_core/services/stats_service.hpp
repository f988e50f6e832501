#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "media_core/db/metadata_store.hpp"

namespace media_core {

struct CollectionStats {
  int total_assets = 0;
  int images = 0;
  int videos = 0;
  // Rounded to 2 decimals
  double total_size_mb = 0.0;
  std::map<std::string, int> sources;
  // Rounded to 1 decimal; absent when nothing is rated
  std::optional<double> avg_quality;
  int rated_count = 0;
  int unrated_count = 0;
  int embedding_unavailable_count = 0;
};

class StatsService {
 public:
  explicit StatsService(std::shared_ptr<MetadataStore> metadata_store);

  CollectionStats stats();

 private:
  std::shared_ptr<MetadataStore> metadata_store_;
};

}  // namespace media_core
