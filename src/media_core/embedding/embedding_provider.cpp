#include "media_core/embedding/embedding_provider.hpp"

namespace media_core {

namespace {

template <typename EncodeFn>
Embedding checked_embedding(const std::string &what, EncodeFn &&encode) {
  std::vector<float> values;
  try {
    values = encode();
  } catch (const MediaError &) {
    throw;
  } catch (const std::exception &e) {
    throw EmbeddingError("Embedding provider failed on " + what + ": " + e.what());
  }

  try {
    return Embedding::computed(std::move(values));
  } catch (const InvalidArgumentError &e) {
    throw EmbeddingError("Embedding provider returned an invalid vector for " + what + ": " +
                         e.what());
  }
}

}  // namespace

Embedding embed_image(EmbeddingProvider &provider, const std::vector<char> &image_bytes) {
  return checked_embedding("image", [&] { return provider.encode_image(image_bytes); });
}

Embedding embed_text(EmbeddingProvider &provider, const std::string &text) {
  return checked_embedding("text", [&] { return provider.encode_text(text); });
}

}  // namespace media_core
