#include "media_core/services/search_service.hpp"

#include <iostream>

namespace media_core {

namespace {

void check_limit(int limit) {
  if (limit <= 0) {
    throw InvalidArgumentError("limit must be positive, got " + std::to_string(limit));
  }
}

AssetPredicate media_type_filter(std::optional<MediaType> media_type) {
  return media_type ? predicates::has_media_type(*media_type) : AssetPredicate{};
}

}  // namespace

SearchService::SearchService(std::shared_ptr<MetadataStore> metadata_store,
                             std::shared_ptr<EmbeddingProvider> embedding_provider)
    : metadata_store_(metadata_store), embedding_provider_(embedding_provider) {}

std::vector<AssetSearchResult> SearchService::find_similar(
    const std::vector<char> &reference_image_bytes, int limit, std::optional<MediaType> media_type) {
  check_limit(limit);
  if (reference_image_bytes.empty()) {
    throw InvalidArgumentError("Reference image is empty");
  }

  Embedding query = embed_image(*embedding_provider_, reference_image_bytes);
  auto results =
      metadata_store_->search_nearest(query.values(), limit, media_type_filter(media_type));
  std::cout << "[Search] Similarity search returned " << results.size() << " results" << std::endl;
  return results;
}

std::vector<AssetSearchResult> SearchService::find_by_theme(const std::string &text,
                                                            int limit,
                                                            std::optional<int> min_quality,
                                                            std::optional<MediaType> media_type) {
  check_limit(limit);
  if (text.empty()) {
    throw InvalidArgumentError("Theme query must not be empty");
  }

  Embedding query = embed_text(*embedding_provider_, text);
  AssetPredicate predicate = predicates::all_of(
      {media_type_filter(media_type),
       min_quality ? predicates::min_quality(*min_quality) : AssetPredicate{}});
  auto results = metadata_store_->search_nearest(query.values(), limit, predicate);
  std::cout << "[Search] Theme '" << text << "' returned " << results.size() << " results"
            << std::endl;
  return results;
}

std::vector<MediaAsset> SearchService::find_by_subject(const std::string &subject,
                                                       std::optional<MediaType> media_type) {
  return metadata_store_->list_assets(
      predicates::all_of({predicates::has_subject(subject), media_type_filter(media_type)}));
}

std::vector<MediaAsset> SearchService::find_for_episode(int episode, bool unassigned_only) {
  if (episode < MIN_EPISODE || episode > MAX_EPISODE) {
    throw InvalidArgumentError("Episode must be between 1 and 8, got " + std::to_string(episode));
  }
  return metadata_store_->list_assets(unassigned_only ? predicates::not_in_episode(episode)
                                                      : predicates::in_episode(episode));
}

}  // namespace media_core
