#pragma once
#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>
#include <sqlite_modern_cpp.h>

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "media_core/db/asset_predicates.hpp"
#include "media_core/db/database_manager.hpp"
#include "media_core/db/sqlite_error_utils.hpp"
#include "media_core/types/media_asset.hpp"

namespace media_core {

/**
 * Typed access to the assets relation.
 *
 * SQLite is the source of truth. Every COMPUTED embedding is additionally projected into an
 * in-memory FAISS index keyed by the row's integer `seq`, rebuilt on construction and appended to
 * after each committed insert. Unavailable embeddings never enter the index.
 */
class MetadataStore {
 public:
  static constexpr int VECTOR_DIMENSION = EMBEDDING_DIMENSION;

  explicit MetadataStore(DatabaseManager &db_manager);
  ~MetadataStore();

  MetadataStore(const MetadataStore &) = delete;
  MetadataStore &operator=(const MetadataStore &) = delete;
  MetadataStore(MetadataStore &&) = delete;
  MetadataStore &operator=(MetadataStore &&) = delete;

  // Appends one row atomically. The asset's media_type must match the content variant.
  void insert_asset(const MediaAsset &asset, const MediaContent &content);

  std::optional<MediaAsset> get_asset(const std::string &id);
  std::optional<MediaContent> get_asset_content(const std::string &id);

  // Full scan in insertion order, without binary content.
  std::vector<MediaAsset> list_assets(const AssetPredicate &predicate = {});

  // Nearest neighbours of `query` by ascending squared L2 distance, keeping only rows that satisfy
  // `predicate`. The candidate set is widened until `limit` matches are found or the index is
  // exhausted.
  std::vector<AssetSearchResult> search_nearest(const std::vector<float> &query,
                                                int limit,
                                                const AssetPredicate &predicate = {});

  // Returns false if no asset has this id.
  bool update_quality(const std::string &id, int rating, const std::optional<std::string> &notes);

  // Adds `episode` to the asset's assignments unless already present, as one serialised
  // read-modify-write. Returns the resulting assignments, or nullopt if the id is unknown.
  std::optional<std::vector<int>> add_episode_assignment(const std::string &id, int episode);

  // Distinct models that produced the stored COMPUTED embeddings.
  std::vector<std::string> embedding_models_in_use();

  void rebuild_vector_index();
  long long indexed_vector_count() const;

 private:
  DatabaseManager &db_manager_;

  std::unique_ptr<faiss::IndexIDMap> faiss_index_;
  mutable std::shared_mutex index_mutex_;

  static std::unique_ptr<faiss::IndexIDMap> create_base_index();
  // Returns the number of labels actually filled (-1 labels excluded).
  int search_faiss_index(const std::vector<float> &query_vector,
                         int k,
                         std::vector<float> &distances,
                         std::vector<faiss::idx_t> &labels) const;
  static std::string int_vector_to_comma_string(const std::vector<long long> &vector);
};

}  // namespace media_core
