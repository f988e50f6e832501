#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "media_core/db/metadata_store.hpp"
#include "media_core/embedding/embedding_provider.hpp"

namespace media_core {

class SearchService {
 public:
  SearchService(std::shared_ptr<MetadataStore> metadata_store,
                std::shared_ptr<EmbeddingProvider> embedding_provider);

  virtual ~SearchService() = default;

  // Assets nearest to the reference image, ascending distance. An already-ingested copy of the
  // reference ranks first.
  virtual std::vector<AssetSearchResult> find_similar(
      const std::vector<char> &reference_image_bytes,
      int limit = 10,
      std::optional<MediaType> media_type = std::nullopt);

  // Cross-modal: the text is embedded into the same space as the images.
  virtual std::vector<AssetSearchResult> find_by_theme(
      const std::string &text,
      int limit = 20,
      std::optional<int> min_quality = std::nullopt,
      std::optional<MediaType> media_type = std::nullopt);

  // Insertion order, no ranking.
  virtual std::vector<MediaAsset> find_by_subject(
      const std::string &subject, std::optional<MediaType> media_type = std::nullopt);
  virtual std::vector<MediaAsset> find_for_episode(int episode, bool unassigned_only = false);

 private:
  std::shared_ptr<MetadataStore> metadata_store_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
};

}  // namespace media_core
