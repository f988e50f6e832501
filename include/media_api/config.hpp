#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace media_api {

class Config {
 public:
  std::string api_base_url;
  std::string store_dir;
  std::string backup_dir;

  // Embedding service
  std::string embedding_url;
  std::string embedding_model;
  int embedding_timeout_seconds;

  double frame_offset_seconds;
  int db_pool_size;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    config.api_base_url = json_config.value("api_base_url", std::string("0.0.0.0:8422"));
    config.store_dir = json_config.value("store_dir", std::string("./data/media_assets.store"));
    config.backup_dir = json_config.value("backup_dir", std::string("./backup/media_assets.store"));
    config.embedding_url = json_config.value("embedding_url", std::string("http://localhost:7997"));
    config.embedding_model =
        json_config.value("embedding_model", std::string("openai/clip-vit-base-patch32"));
    config.embedding_timeout_seconds = json_config.value("embedding_timeout_seconds", 60);
    config.frame_offset_seconds = json_config.value("frame_offset_seconds", 1.0);

    try {
      if (json_config.contains("db_pool_size")) {
        config.db_pool_size = json_config.at("db_pool_size").get<int>();
      } else {
        config.db_pool_size = 4;
      }
    } catch (const std::exception&) {
      // Fallback to default if wrong type provided
      config.db_pool_size = 4;
    }

    config.validate();
    return config;
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.rfind(':'));
  }

  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.rfind(':') + 1));
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    const auto colon = api_base_url.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (store_dir.empty()) {
      throw std::runtime_error("store_dir cannot be empty");
    }
    if (backup_dir.empty()) {
      throw std::runtime_error("backup_dir cannot be empty");
    }
    if (backup_dir == store_dir) {
      throw std::runtime_error("backup_dir must differ from store_dir");
    }
    if (embedding_url.empty()) {
      throw std::runtime_error("embedding_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_timeout_seconds <= 0) {
      throw std::runtime_error("embedding_timeout_seconds must be greater than 0");
    }
    if (frame_offset_seconds < 0) {
      throw std::runtime_error("frame_offset_seconds cannot be negative");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
  }
};

}  // namespace media_api
