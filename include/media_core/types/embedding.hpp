#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace media_core {

// Dimension of the shared image/text embedding space (CLIP ViT-B/32).
inline constexpr int EMBEDDING_DIMENSION = 512;

// Allowed deviation of a computed embedding's L2 norm from 1.0
inline constexpr float UNIT_NORM_TOLERANCE = 1e-3f;

enum class EmbeddingStatus { COMPUTED, UNAVAILABLE };

inline std::string to_string(EmbeddingStatus status) {
  switch (status) {
    case EmbeddingStatus::COMPUTED:
      return "COMPUTED";
    case EmbeddingStatus::UNAVAILABLE:
      return "UNAVAILABLE";
    default:
      return "UNKNOWN";
  }
}

inline EmbeddingStatus embedding_status_from_string(const std::string &str) {
  if (str == "COMPUTED")
    return EmbeddingStatus::COMPUTED;
  if (str == "UNAVAILABLE")
    return EmbeddingStatus::UNAVAILABLE;
  throw std::invalid_argument("Unknown EmbeddingStatus: " + str);
}

float l2_norm(const std::vector<float> &values);

// Scales values to unit length in place. Throws InvalidArgumentError on a zero vector.
void normalize_l2(std::vector<float> &values);

/**
 * A vector in the shared embedding space, or the explicit absence of one.
 *
 * A computed embedding always has EMBEDDING_DIMENSION components and unit L2 norm.
 * Unavailable embeddings (a video whose representative frame could not be embedded)
 * carry no values and never take part in similarity ranking.
 */
class Embedding {
 public:
  Embedding() = default;

  // Throws InvalidArgumentError if the vector has the wrong dimension or is not unit length.
  static Embedding computed(std::vector<float> values);
  static Embedding unavailable() {
    return Embedding();
  }

  bool is_computed() const {
    return status_ == EmbeddingStatus::COMPUTED;
  }
  EmbeddingStatus status() const {
    return status_;
  }
  // Empty when unavailable.
  const std::vector<float> &values() const {
    return values_;
  }

 private:
  EmbeddingStatus status_ = EmbeddingStatus::UNAVAILABLE;
  std::vector<float> values_;
};

}  // namespace media_core
