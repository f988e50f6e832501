#pragma once

#include <string>
#include <vector>

#include "media_core/errors.hpp"
#include "media_core/types/embedding.hpp"

namespace media_core {

class EmbeddingError : public ExternalServiceError {
 public:
  explicit EmbeddingError(const std::string &message) : ExternalServiceError(message) {}
};

/**
 * Maps images and text into one shared, unit-norm embedding space.
 *
 * Constructed once at startup and handed to the services that need it; the same instance must
 * serve ingestion and queries so that corpus and query vectors come from one model.
 */
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // Raw encoded image bytes (png, jpeg, ...) in, EMBEDDING_DIMENSION floats out.
  virtual std::vector<float> encode_image(const std::vector<char> &image_bytes) = 0;
  virtual std::vector<float> encode_text(const std::string &text) = 0;

  // Recorded next to every stored vector.
  virtual std::string model_name() const = 0;
};

// The single call path used by both ingestion and search. Provider failures and vectors that
// break the dimension or unit-norm contract surface as EmbeddingError.
Embedding embed_image(EmbeddingProvider &provider, const std::vector<char> &image_bytes);
Embedding embed_text(EmbeddingProvider &provider, const std::string &text);

}  // namespace media_core
