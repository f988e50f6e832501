#include "media_core/services/curation_service.hpp"

#include <iostream>

namespace media_core {

CurationService::CurationService(std::shared_ptr<MetadataStore> metadata_store)
    : metadata_store_(metadata_store) {}

void CurationService::rate_asset(const std::string &id,
                                 int rating,
                                 const std::optional<std::string> &notes) {
  if (rating < MIN_QUALITY_RATING || rating > MAX_QUALITY_RATING) {
    throw InvalidArgumentError("Rating must be between 1 and 10, got " + std::to_string(rating));
  }
  if (!metadata_store_->update_quality(id, rating, notes)) {
    throw NotFoundError("Asset not found: " + id);
  }
  std::cout << "[Store] Rated " << id.substr(0, 8) << ": " << rating << "/10" << std::endl;
}

std::vector<int> CurationService::assign_to_episode(const std::string &id, int episode) {
  if (episode < MIN_EPISODE || episode > MAX_EPISODE) {
    throw InvalidArgumentError("Episode must be between 1 and 8, got " + std::to_string(episode));
  }
  auto episodes = metadata_store_->add_episode_assignment(id, episode);
  if (!episodes) {
    throw NotFoundError("Asset not found: " + id);
  }
  std::cout << "[Store] Assigned " << id.substr(0, 8) << " to episode " << episode << std::endl;
  return *episodes;
}

}  // namespace media_core
