#include "media_core/db/metadata_store.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <sstream>
#include <unordered_map>

#include "media_core/db/pooled_connection.hpp"
#include "media_core/db/transaction.hpp"
#include "media_core/utils/time_utils.hpp"

namespace media_core {

namespace {

// Column list shared by every query that materialises a MediaAsset. Must stay in sync with
// AssetRowReader::operator().
constexpr const char *kAssetColumns =
    "seq, id, filename, media_type, embedding, embedding_status, embedding_model, source, "
    "generation_prompt, generation_model, generation_time_seconds, generation_cost_usd, "
    "width, height, duration_seconds, file_size_bytes, format, content_sha256, "
    "thumbnail_bytes IS NOT NULL, content_type, subjects, style_tags, quality_rating, "
    "quality_notes, episode_assignments, use_count, created_at, last_used_at";

std::vector<char> vector_to_blob(const std::vector<float> &values) {
  std::vector<char> blob(values.size() * sizeof(float));
  std::memcpy(blob.data(), values.data(), blob.size());
  return blob;
}

std::string string_set_to_json(const std::set<std::string> &values) {
  return nlohmann::json(values).dump();
}

std::set<std::string> json_to_string_set(const std::string &text) {
  return nlohmann::json::parse(text).get<std::set<std::string>>();
}

std::vector<int> json_to_int_list(const std::string &text) {
  return nlohmann::json::parse(text).get<std::vector<int>>();
}

// Builds a MediaAsset from one row selected with kAssetColumns.
struct AssetRowReader {
  std::function<void(long long, MediaAsset)> sink;

  void operator()(long long seq,
                  std::string id,
                  std::string filename,
                  std::string media_type,
                  std::optional<std::vector<char>> embedding_blob,
                  std::string embedding_status,
                  std::string embedding_model,
                  std::string source,
                  std::optional<std::string> generation_prompt,
                  std::optional<std::string> generation_model,
                  std::optional<double> generation_time_seconds,
                  std::optional<double> generation_cost_usd,
                  std::optional<int> width,
                  std::optional<int> height,
                  std::optional<double> duration_seconds,
                  long long file_size_bytes,
                  std::string format,
                  std::string content_sha256,
                  int has_thumbnail,
                  std::optional<std::string> content_type,
                  std::string subjects,
                  std::string style_tags,
                  std::optional<int> quality_rating,
                  std::optional<std::string> quality_notes,
                  std::string episode_assignments,
                  int use_count,
                  std::string created_at,
                  std::optional<std::string> last_used_at) const {
    MediaAsset asset;
    asset.id = std::move(id);
    asset.filename = std::move(filename);
    asset.media_type = media_type_from_string(media_type);

    if (embedding_status_from_string(embedding_status) == EmbeddingStatus::COMPUTED &&
        embedding_blob &&
        embedding_blob->size() == MetadataStore::VECTOR_DIMENSION * sizeof(float)) {
      const float *data = reinterpret_cast<const float *>(embedding_blob->data());
      asset.embedding =
          Embedding::computed(std::vector<float>(data, data + MetadataStore::VECTOR_DIMENSION));
    } else if (embedding_blob) {
      std::cerr << "[Store] Warning: asset " << asset.id.substr(0, 8)
                << " has an embedding of unexpected size " << embedding_blob->size()
                << " bytes; treating it as unavailable" << std::endl;
    }
    asset.embedding_model = std::move(embedding_model);

    asset.source = std::move(source);
    asset.generation_prompt = std::move(generation_prompt);
    asset.generation_model = std::move(generation_model);
    asset.generation_time_seconds = generation_time_seconds;
    asset.generation_cost_usd = generation_cost_usd;

    asset.width = width;
    asset.height = height;
    asset.duration_seconds = duration_seconds;
    asset.file_size_bytes = file_size_bytes;
    asset.format = std::move(format);
    asset.content_sha256 = std::move(content_sha256);
    asset.has_thumbnail = has_thumbnail != 0;

    asset.content_type = std::move(content_type);
    asset.subjects = json_to_string_set(subjects);
    asset.style_tags = json_to_string_set(style_tags);

    asset.quality_rating = quality_rating;
    asset.quality_notes = std::move(quality_notes);
    asset.episode_assignments = json_to_int_list(episode_assignments);
    asset.use_count = use_count;

    asset.created_at = string_to_time_point(created_at);
    if (last_used_at) {
      asset.last_used_at = string_to_time_point(*last_used_at);
    }

    sink(seq, std::move(asset));
  }
};

}  // namespace

MetadataStore::MetadataStore(DatabaseManager &db_manager) : db_manager_(db_manager) {
  rebuild_vector_index();
}

MetadataStore::~MetadataStore() = default;

void MetadataStore::insert_asset(const MediaAsset &asset, const MediaContent &content) {
  if (asset.media_type != media_type_of(content)) {
    throw InvalidArgumentError("Asset " + asset.id + " is declared as " +
                               to_string(asset.media_type) + " but carries " +
                               to_string(media_type_of(content)) + " content");
  }

  std::optional<std::vector<char>> image_bytes;
  std::optional<std::vector<char>> video_bytes;
  std::optional<std::vector<char>> thumbnail_bytes;
  if (const auto *image = std::get_if<ImageContent>(&content)) {
    image_bytes = image->bytes;
  } else {
    const auto &video = std::get<VideoContent>(content);
    video_bytes = video.bytes;
    thumbnail_bytes = video.thumbnail;
  }

  std::optional<std::vector<char>> embedding_blob;
  if (asset.embedding.is_computed()) {
    embedding_blob = vector_to_blob(asset.embedding.values());
  }

  std::optional<std::string> last_used_at;
  if (asset.last_used_at) {
    last_used_at = time_point_to_string(*asset.last_used_at);
  }

  long long seq = 0;
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO assets (id, filename, media_type, image_bytes, video_bytes, "
             "thumbnail_bytes, embedding, embedding_status, embedding_model, source, "
             "generation_prompt, generation_model, generation_time_seconds, generation_cost_usd, "
             "width, height, duration_seconds, file_size_bytes, format, content_sha256, "
             "content_type, subjects, style_tags, quality_rating, quality_notes, "
             "episode_assignments, use_count, created_at, last_used_at) "
             "VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)"
          << asset.id << asset.filename << to_string(asset.media_type) << image_bytes
          << video_bytes << thumbnail_bytes << embedding_blob
          << to_string(asset.embedding.status()) << asset.embedding_model << asset.source
          << asset.generation_prompt << asset.generation_model << asset.generation_time_seconds
          << asset.generation_cost_usd << asset.width << asset.height << asset.duration_seconds
          << asset.file_size_bytes << asset.format << asset.content_sha256 << asset.content_type
          << string_set_to_json(asset.subjects) << string_set_to_json(asset.style_tags)
          << asset.quality_rating << asset.quality_notes
          << nlohmann::json(asset.episode_assignments).dump() << asset.use_count
          << time_point_to_string(asset.created_at) << last_used_at;
    seq = conn->last_insert_rowid();
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError("insert_asset", e);
  }

  if (asset.embedding.is_computed()) {
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    faiss::idx_t label = static_cast<faiss::idx_t>(seq);
    faiss_index_->add_with_ids(1, asset.embedding.values().data(), &label);
  }
}

std::optional<MediaAsset> MetadataStore::get_asset(const std::string &id) {
  try {
    std::optional<MediaAsset> result;
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + kAssetColumns + " FROM assets WHERE id = ?" << id >>
        AssetRowReader{[&](long long, MediaAsset asset) { result = std::move(asset); }};
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError("get_asset", e);
  }
}

std::optional<MediaContent> MetadataStore::get_asset_content(const std::string &id) {
  try {
    std::optional<MediaContent> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT media_type, image_bytes, video_bytes, thumbnail_bytes FROM assets "
             "WHERE id = ?"
          << id >>
        [&](std::string media_type, std::optional<std::vector<char>> image_bytes,
            std::optional<std::vector<char>> video_bytes,
            std::optional<std::vector<char>> thumbnail_bytes) {
          if (media_type_from_string(media_type) == MediaType::Image) {
            result = ImageContent{image_bytes.value_or(std::vector<char>{})};
          } else {
            result = VideoContent{video_bytes.value_or(std::vector<char>{}),
                                  std::move(thumbnail_bytes)};
          }
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError("get_asset_content", e);
  }
}

std::vector<MediaAsset> MetadataStore::list_assets(const AssetPredicate &predicate) {
  std::vector<MediaAsset> assets;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + kAssetColumns + " FROM assets ORDER BY seq" >>
        AssetRowReader{[&](long long, MediaAsset asset) {
          if (!predicate || predicate(asset)) {
            assets.push_back(std::move(asset));
          }
        }};
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError("list_assets", e);
  }
  return assets;
}

std::vector<AssetSearchResult> MetadataStore::search_nearest(const std::vector<float> &query,
                                                             int limit,
                                                             const AssetPredicate &predicate) {
  if (limit <= 0) {
    throw InvalidArgumentError("Search limit must be positive, got " + std::to_string(limit));
  }
  if (query.size() != VECTOR_DIMENSION) {
    throw InvalidArgumentError("Query vector dimension mismatch. Expected " +
                               std::to_string(VECTOR_DIMENSION) + ", got " +
                               std::to_string(query.size()));
  }

  const long long total = indexed_vector_count();
  if (total == 0) {
    return {};
  }

  // Post-filtering discards candidates, so over-fetch when a predicate is present
  long long fetch_k = std::min<long long>(total, predicate ? 4LL * limit : limit);

  while (true) {
    std::vector<float> distances(fetch_k);
    std::vector<faiss::idx_t> labels(fetch_k);
    const int found = search_faiss_index(query, static_cast<int>(fetch_k), distances, labels);

    std::vector<long long> seqs;
    seqs.reserve(found);
    for (int i = 0; i < found; ++i) {
      seqs.push_back(static_cast<long long>(labels[i]));
    }

    std::unordered_map<long long, MediaAsset> seq_to_asset;
    if (!seqs.empty()) {
      try {
        PooledConnection conn(db_manager_);
        *conn << std::string("SELECT ") + kAssetColumns + " FROM assets WHERE seq IN (" +
                     int_vector_to_comma_string(seqs) + ")" >>
            AssetRowReader{[&](long long seq, MediaAsset asset) {
              seq_to_asset.emplace(seq, std::move(asset));
            }};
      } catch (const sqlite::sqlite_exception &e) {
        throw MetadataStoreError("search_nearest", e);
      }
    }

    // Assemble results in label order, which is ascending distance
    std::vector<AssetSearchResult> results;
    for (int i = 0; i < found && static_cast<int>(results.size()) < limit; ++i) {
      auto it = seq_to_asset.find(seqs[i]);
      if (it == seq_to_asset.end()) {
        std::cerr << "[Search] Warning: index returned seq " << seqs[i]
                  << " but no corresponding row exists" << std::endl;
        continue;
      }
      if (predicate && !predicate(it->second)) {
        continue;
      }
      results.push_back({distances[i], std::move(it->second)});
    }

    if (static_cast<int>(results.size()) >= limit || fetch_k >= total) {
      return results;
    }
    fetch_k = std::min(total, fetch_k * 2);
  }
}

bool MetadataStore::update_quality(const std::string &id,
                                   int rating,
                                   const std::optional<std::string> &notes) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE assets SET quality_rating = ?, quality_notes = ? WHERE id = ?" << rating
          << notes << id;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError("update_quality", e);
  }
}

std::optional<std::vector<int>> MetadataStore::add_episode_assignment(const std::string &id,
                                                                      int episode) {
  try {
    PooledConnection conn(db_manager_);
    // IMMEDIATE takes the write lock before the read so concurrent assignments serialise
    Transaction tx(*conn, TransactionMode::Immediate);

    std::optional<std::string> current;
    *conn << "SELECT episode_assignments FROM assets WHERE id = ?" << id >>
        [&](std::string episodes) { current = std::move(episodes); };
    if (!current) {
      return std::nullopt;
    }

    std::vector<int> episodes = json_to_int_list(*current);
    if (std::find(episodes.begin(), episodes.end(), episode) == episodes.end()) {
      episodes.push_back(episode);
      *conn << "UPDATE assets SET episode_assignments = ? WHERE id = ?"
            << nlohmann::json(episodes).dump() << id;
    }
    tx.commit();
    return episodes;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError("add_episode_assignment", e);
  }
}

std::vector<std::string> MetadataStore::embedding_models_in_use() {
  std::vector<std::string> models;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT DISTINCT embedding_model FROM assets WHERE embedding_status = 'COMPUTED' "
             "ORDER BY embedding_model" >>
        [&](std::string model) { models.push_back(std::move(model)); };
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError("embedding_models_in_use", e);
  }
  return models;
}

void MetadataStore::rebuild_vector_index() {
  auto index = create_base_index();

  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> all_vectors_flat;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT seq, embedding FROM assets WHERE embedding_status = 'COMPUTED'" >>
        [&](long long seq, std::vector<char> vector_blob) {
          if (vector_blob.size() == VECTOR_DIMENSION * sizeof(float)) {
            faiss_ids.push_back(static_cast<faiss::idx_t>(seq));
            const float *vec_ptr = reinterpret_cast<const float *>(vector_blob.data());
            all_vectors_flat.insert(all_vectors_flat.end(), vec_ptr, vec_ptr + VECTOR_DIMENSION);
          } else {
            std::cerr << "[Store] Warning: skipping seq " << seq
                      << " during index rebuild due to mismatched vector dimension. Expected "
                      << VECTOR_DIMENSION * sizeof(float) << " bytes, got " << vector_blob.size()
                      << " bytes." << std::endl;
          }
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError("rebuild_vector_index", e);
  }

  if (!faiss_ids.empty()) {
    index->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()), all_vectors_flat.data(),
                        faiss_ids.data());
  }

  std::unique_lock<std::shared_mutex> lock(index_mutex_);
  faiss_index_ = std::move(index);
  std::cout << "[Store] Vector index rebuilt with " << faiss_index_->ntotal << " embeddings"
            << std::endl;
}

long long MetadataStore::indexed_vector_count() const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  return faiss_index_ ? static_cast<long long>(faiss_index_->ntotal) : 0;
}

int MetadataStore::search_faiss_index(const std::vector<float> &query_vector,
                                      int k,
                                      std::vector<float> &distances,
                                      std::vector<faiss::idx_t> &labels) const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  if (!faiss_index_ || faiss_index_->ntotal == 0 || k <= 0) {
    return 0;
  }
  faiss_index_->search(1, query_vector.data(), k, distances.data(), labels.data());

  // Labels come back sorted; unfilled slots are -1 and only appear at the tail
  int found = 0;
  while (found < k && labels[found] != -1) {
    ++found;
  }
  return found;
}

std::unique_ptr<faiss::IndexIDMap> MetadataStore::create_base_index() {
  // Exact search, so an ingested file queried with its own bytes always ranks first
  auto index = std::make_unique<faiss::IndexIDMap>(new faiss::IndexFlatL2(VECTOR_DIMENSION));
  index->own_fields = true;
  return index;
}

std::string MetadataStore::int_vector_to_comma_string(const std::vector<long long> &vector) {
  std::stringstream ss;
  for (size_t i = 0; i < vector.size(); ++i) {
    ss << vector[i];
    if (i < vector.size() - 1)
      ss << ",";
  }
  return ss.str();
}

}  // namespace media_core
