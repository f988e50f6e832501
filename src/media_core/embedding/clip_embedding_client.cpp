#include "media_core/embedding/clip_embedding_client.hpp"

#include <curl/curl.h>

#include <cstring>
#include <memory>

#include "media_core/utils/crypto_utils.hpp"

namespace media_core {

namespace {

bool starts_with(const std::vector<char> &bytes, const char *magic, size_t offset = 0) {
  const size_t n = std::strlen(magic);
  return bytes.size() >= offset + n && std::memcmp(bytes.data() + offset, magic, n) == 0;
}

}  // namespace

std::string sniff_image_mime(const std::vector<char> &bytes) {
  if (starts_with(bytes, "\x89PNG"))
    return "image/png";
  if (starts_with(bytes, "\xFF\xD8\xFF"))
    return "image/jpeg";
  if (starts_with(bytes, "GIF8"))
    return "image/gif";
  if (starts_with(bytes, "RIFF") && starts_with(bytes, "WEBP", 8))
    return "image/webp";
  return "application/octet-stream";
}

ClipEmbeddingClient::ClipEmbeddingClient(const std::string &base_url,
                                         const std::string &model,
                                         long timeout_seconds)
    : base_url_(base_url), model_(model), timeout_seconds_(timeout_seconds) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

size_t ClipEmbeddingClient::write_callback(void *contents,
                                           size_t size,
                                           size_t nmemb,
                                           std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string ClipEmbeddingClient::perform_request(const std::string &url,
                                                 const std::string *post_body,
                                                 long &status) {
  // One handle per request; the client is shared between HTTP handler threads
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw EmbeddingError("Failed to initialize CURL");
  }

  std::string response;
  struct curl_slist *headers = nullptr;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  if (post_body) {
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, post_body->c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
  }

  CURLcode res = curl_easy_perform(curl.get());
  if (headers) {
    curl_slist_free_all(headers);
  }
  if (res != CURLE_OK) {
    throw EmbeddingError("Embedding server request to " + url +
                         " failed: " + curl_easy_strerror(res));
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  return response;
}

std::vector<float> ClipEmbeddingClient::request_embedding(const std::string &input,
                                                          const std::string &modality) {
  nlohmann::json body;
  body["model"] = model_;
  body["input"] = nlohmann::json::array({input});
  body["modality"] = modality;
  const std::string payload = body.dump();

  long status = 0;
  const std::string response = perform_request(base_url_ + "/embeddings", &payload, status);
  if (status < 200 || status >= 300) {
    throw EmbeddingError("Embedding server returned HTTP " + std::to_string(status) + ": " +
                         response.substr(0, 200));
  }

  std::vector<float> values;
  try {
    auto json_response = nlohmann::json::parse(response);
    if (!json_response.contains("data") || !json_response["data"].is_array() ||
        json_response["data"].empty()) {
      throw EmbeddingError("Response does not contain a data array");
    }
    values = json_response["data"][0].at("embedding").get<std::vector<float>>();
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Malformed embedding response: " + std::string(e.what()));
  }

  if (values.size() != EMBEDDING_DIMENSION) {
    throw EmbeddingError("Embedding dimension mismatch from model " + model_ + ". Expected " +
                         std::to_string(EMBEDDING_DIMENSION) + ", got " +
                         std::to_string(values.size()));
  }
  try {
    normalize_l2(values);
  } catch (const InvalidArgumentError &e) {
    throw EmbeddingError("Embedding server returned a degenerate vector: " +
                         std::string(e.what()));
  }
  return values;
}

std::vector<float> ClipEmbeddingClient::encode_image(const std::vector<char> &image_bytes) {
  if (image_bytes.empty()) {
    throw InvalidArgumentError("Cannot embed an empty image");
  }
  const std::string data_uri =
      "data:" + sniff_image_mime(image_bytes) + ";base64," + base64_encode(image_bytes);
  return request_embedding(data_uri, "image");
}

std::vector<float> ClipEmbeddingClient::encode_text(const std::string &text) {
  if (text.empty()) {
    throw InvalidArgumentError("Cannot embed an empty query");
  }
  return request_embedding(text, "text");
}

bool ClipEmbeddingClient::is_server_available() {
  try {
    long status = 0;
    perform_request(base_url_ + "/health", nullptr, status);
    return status >= 200 && status < 300;
  } catch (const EmbeddingError &) {
    return false;
  }
}

}  // namespace media_core
