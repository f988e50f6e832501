#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "media_core/embedding/embedding_provider.hpp"

namespace media_core {

/**
 * EmbeddingProvider backed by an OpenAI-compatible CLIP embedding server
 * (POST {base_url}/embeddings with a "modality" field, e.g. infinity-emb).
 *
 * Images are sent as base64 data URIs. Returned vectors are L2-normalised here,
 * so a server that skips normalisation still satisfies the unit-norm contract.
 */
class ClipEmbeddingClient : public EmbeddingProvider {
 public:
  ClipEmbeddingClient(const std::string &base_url,
                      const std::string &model,
                      long timeout_seconds = 60);

  ClipEmbeddingClient(const ClipEmbeddingClient &) = delete;
  ClipEmbeddingClient &operator=(const ClipEmbeddingClient &) = delete;

  std::vector<float> encode_image(const std::vector<char> &image_bytes) override;
  std::vector<float> encode_text(const std::string &text) override;
  std::string model_name() const override {
    return model_;
  }

  bool is_server_available();

 private:
  std::string base_url_;
  std::string model_;
  long timeout_seconds_;

  std::vector<float> request_embedding(const std::string &input, const std::string &modality);
  std::string perform_request(const std::string &url, const std::string *post_body, long &status);

  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

// "image/png", "image/jpeg", "image/gif" or "image/webp" from the leading magic bytes;
// "application/octet-stream" when unrecognised.
std::string sniff_image_mime(const std::vector<char> &bytes);

}  // namespace media_core
