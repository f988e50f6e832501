#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "media_core/db/metadata_store.hpp"

namespace media_core {

// The only post-ingestion mutations: quality rating and episode assignment.
class CurationService {
 public:
  explicit CurationService(std::shared_ptr<MetadataStore> metadata_store);

  virtual ~CurationService() = default;

  // InvalidArgumentError for a rating outside [1, 10] (nothing is written),
  // NotFoundError for an unknown id.
  virtual void rate_asset(const std::string &id,
                          int rating,
                          const std::optional<std::string> &notes = std::nullopt);

  // Idempotent. Returns the asset's assignments after the call.
  // InvalidArgumentError for an episode outside [1, 8], NotFoundError for an unknown id.
  virtual std::vector<int> assign_to_episode(const std::string &id, int episode);

 private:
  std::shared_ptr<MetadataStore> metadata_store_;
};

}  // namespace media_core
