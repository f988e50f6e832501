#include "media_api/routes.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "media_api/json_mapping.hpp"
#include "media_core/services/asset_info_service.hpp"
#include "media_core/services/backup_service.hpp"
#include "media_core/services/curation_service.hpp"
#include "media_core/services/ingestion_service.hpp"
#include "media_core/services/search_service.hpp"
#include "media_core/services/stats_service.hpp"
#include "media_core/utils/crypto_utils.hpp"
#include "media_core/utils/time_utils.hpp"

namespace media_api {

namespace {

constexpr const char *kVersion = "0.1.0";

// Private directory holding one uploaded file under its original name; removed on scope exit.
class UploadDir {
 public:
  UploadDir()
      : path_(std::filesystem::temp_directory_path() /
              ("media_vault_upload_" + media_core::generate_uuid_v4())) {
    std::filesystem::create_directories(path_);
  }
  ~UploadDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
      std::cerr << "[API] Could not remove upload dir " << path_ << ": " << ec.message()
                << std::endl;
    }
  }
  UploadDir(const UploadDir &) = delete;
  UploadDir &operator=(const UploadDir &) = delete;

  std::filesystem::path write(const std::string &filename, const std::vector<char> &bytes) const {
    const std::filesystem::path name = std::filesystem::path(filename).filename();
    if (name.empty() || name == "." || name == "..") {
      throw media_core::InvalidArgumentError("filename must name a file");
    }
    const std::filesystem::path target = path_ / name;
    std::ofstream out(target, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
      throw media_core::StorageIOError("Failed to stage upload " + target.string());
    }
    return target;
  }

 private:
  std::filesystem::path path_;
};

std::string required_string(const nlohmann::json &body, const char *key) {
  if (!body.contains(key) || !body.at(key).is_string() || body.at(key).get<std::string>().empty()) {
    throw media_core::InvalidArgumentError(std::string("Missing required field '") + key + "'");
  }
  return body.at(key).get<std::string>();
}

int required_int(const nlohmann::json &body, const char *key) {
  if (!body.contains(key) || body.at(key).is_null()) {
    throw media_core::InvalidArgumentError(std::string("Missing integer field '") + key + "'");
  }
  return checked_int(body.at(key), key);
}

// Quotes, backslashes and control characters become '_' so the name stays one quoted parameter.
std::string disposition_filename(const std::string &filename) {
  std::string safe;
  safe.reserve(filename.size());
  for (unsigned char c : filename) {
    safe.push_back(c < 0x20 || c == 0x7f || c == '"' || c == '\\' ? '_' : static_cast<char>(c));
  }
  return safe;
}

nlohmann::json results_to_json(const std::vector<media_core::AssetSearchResult> &results) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto &result : results) {
    out.push_back(search_result_to_json(result));
  }
  return out;
}

nlohmann::json assets_to_json(const std::vector<media_core::MediaAsset> &assets) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto &asset : assets) {
    out.push_back(asset_to_json(asset));
  }
  return out;
}

}  // namespace

Routes::Routes(std::shared_ptr<media_core::IngestionService> ingestion_service,
               std::shared_ptr<media_core::SearchService> search_service,
               std::shared_ptr<media_core::AssetInfoService> asset_info_service,
               std::shared_ptr<media_core::CurationService> curation_service,
               std::shared_ptr<media_core::StatsService> stats_service,
               std::shared_ptr<media_core::BackupService> backup_service,
               std::filesystem::path default_backup_dir)
    : ingestion_service_(ingestion_service),
      search_service_(search_service),
      asset_info_service_(asset_info_service),
      curation_service_(curation_service),
      stats_service_(stats_service),
      backup_service_(backup_service),
      default_backup_dir_(std::move(default_backup_dir)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/stats")
  ([this](const crow::request &req) { return handle_stats(req); });

  // Search endpoints
  CROW_ROUTE(app, "/search/theme")
  ([this](const crow::request &req) { return handle_search_theme(req); });

  CROW_ROUTE(app, "/search/similar").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search_similar(req);
  });

  CROW_ROUTE(app, "/search/subject/<string>")
  ([this](const crow::request &req, const std::string &subject) {
    return handle_search_subject(req, subject);
  });

  CROW_ROUTE(app, "/search/episode/<int>")
  ([this](const crow::request &req, int episode) { return handle_search_episode(req, episode); });

  // Ingestion and curation. Static paths are registered before /asset/<string>.
  CROW_ROUTE(app, "/asset/image").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_add_image(req);
  });

  CROW_ROUTE(app, "/asset/video").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_add_video(req);
  });

  CROW_ROUTE(app, "/asset/rate").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_rate(req);
  });

  CROW_ROUTE(app, "/asset/assign-episode")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_assign_episode(req); });

  // Retrieval
  CROW_ROUTE(app, "/asset/<string>")
  ([this](const crow::request &req, const std::string &id) { return handle_get_asset(req, id); });

  CROW_ROUTE(app, "/asset/<string>/content")
  ([this](const crow::request &req, const std::string &id) { return handle_get_content(req, id); });

  CROW_ROUTE(app, "/assets")
  ([this](const crow::request &req) { return handle_list_assets(req); });

  // Maintenance
  CROW_ROUTE(app, "/import").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_import(req);
  });

  CROW_ROUTE(app, "/backup").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_backup(req);
  });

  std::cout << "[API] All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Media asset store is running");
  response["status"] = "healthy";
  response["version"] = kVersion;
  response["timestamp"] = media_core::time_point_to_string(std::chrono::system_clock::now());
  return create_json_response(response);
}

crow::response Routes::handle_stats(const crow::request &req) {
  try {
    return create_json_response(stats_to_json(stats_service_->stats()));
  } catch (const std::exception &e) {
    return create_exception_response("handle_stats", e);
  }
}

crow::response Routes::handle_search_theme(const crow::request &req) {
  try {
    const char *query = req.url_params.get("query");
    if (query == nullptr || *query == '\0') {
      throw media_core::InvalidArgumentError("Missing query parameter 'query'");
    }
    const int limit = int_param(req, "limit", 20);
    std::cout << "[API] Theme search for: " << query << " (limit " << limit << ")" << std::endl;

    auto results = search_service_->find_by_theme(
        query, limit, optional_int_param(req, "min_quality"),
        optional_media_type(req.url_params.get("media_type")));
    return create_json_response(results_to_json(results));
  } catch (const std::exception &e) {
    return create_exception_response("handle_search_theme", e);
  }
}

crow::response Routes::handle_search_similar(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    std::vector<char> reference = media_core::base64_decode(required_string(body, "image_base64"));
    const int limit = body.contains("limit") ? checked_int(body["limit"], "limit") : 10;
    std::optional<media_core::MediaType> media_type;
    if (body.contains("media_type") && body["media_type"].is_string()) {
      media_type = optional_media_type(body["media_type"].get<std::string>().c_str());
    }

    auto results = search_service_->find_similar(reference, limit, media_type);
    return create_json_response(results_to_json(results));
  } catch (const std::exception &e) {
    return create_exception_response("handle_search_similar", e);
  }
}

crow::response Routes::handle_search_subject(const crow::request &req, const std::string &subject) {
  try {
    auto assets = search_service_->find_by_subject(
        subject, optional_media_type(req.url_params.get("media_type")));
    return create_json_response(assets_to_json(assets));
  } catch (const std::exception &e) {
    return create_exception_response("handle_search_subject", e);
  }
}

crow::response Routes::handle_search_episode(const crow::request &req, int episode) {
  try {
    const char *unassigned = req.url_params.get("unassigned");
    const bool unassigned_only =
        unassigned != nullptr && (std::string(unassigned) == "true" || std::string(unassigned) == "1");
    auto assets = search_service_->find_for_episode(episode, unassigned_only);
    return create_json_response(assets_to_json(assets));
  } catch (const std::exception &e) {
    return create_exception_response("handle_search_episode", e);
  }
}

crow::response Routes::handle_get_asset(const crow::request &req, const std::string &id) {
  try {
    auto asset = asset_info_service_->get_asset(id);
    if (!asset) {
      return create_json_response(create_error_response("Asset not found: " + id), 404);
    }
    return create_json_response(asset_to_json(*asset));
  } catch (const std::exception &e) {
    return create_exception_response("handle_get_asset", e);
  }
}

crow::response Routes::handle_get_content(const crow::request &req, const std::string &id) {
  try {
    auto asset = asset_info_service_->get_asset(id);
    auto content = asset ? asset_info_service_->get_content(id) : std::nullopt;
    if (!asset || !content) {
      return create_json_response(create_error_response("Asset not found: " + id), 404);
    }

    const std::vector<char> &bytes = media_core::primary_bytes(*content);
    crow::response resp(200, std::string(bytes.begin(), bytes.end()));
    resp.add_header("Content-Type", media_core::to_string(asset->media_type) + "/" + asset->format);
    resp.add_header("Content-Disposition",
                    "attachment; filename=\"" + disposition_filename(asset->filename) + "\"");
    return resp;
  } catch (const std::exception &e) {
    return create_exception_response("handle_get_content", e);
  }
}

crow::response Routes::ingest_upload(const crow::request &req, media_core::MediaType media_type) {
  auto body = parse_json_body(req.body);
  const char *payload_key =
      media_type == media_core::MediaType::Image ? "image_base64" : "video_base64";
  std::vector<char> bytes = media_core::base64_decode(required_string(body, payload_key));
  const std::string filename = required_string(body, "filename");
  media_core::IngestOptions options = ingest_options_from_json(body, media_type);

  UploadDir upload;
  const std::filesystem::path staged = upload.write(filename, bytes);
  const std::string id = media_type == media_core::MediaType::Image
                             ? ingestion_service_->add_image(staged, options)
                             : ingestion_service_->add_video(staged, options);

  nlohmann::json response =
      create_success_response(media_core::to_string(media_type) + " added successfully");
  response["asset_id"] = id;
  return create_json_response(response);
}

crow::response Routes::handle_add_image(const crow::request &req) {
  try {
    return ingest_upload(req, media_core::MediaType::Image);
  } catch (const std::exception &e) {
    return create_exception_response("handle_add_image", e);
  }
}

crow::response Routes::handle_add_video(const crow::request &req) {
  try {
    return ingest_upload(req, media_core::MediaType::Video);
  } catch (const std::exception &e) {
    return create_exception_response("handle_add_video", e);
  }
}

crow::response Routes::handle_rate(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    const std::string id = required_string(body, "asset_id");
    const int rating = required_int(body, "rating");
    std::optional<std::string> notes;
    if (body.contains("notes") && body["notes"].is_string()) {
      notes = body["notes"].get<std::string>();
    }

    curation_service_->rate_asset(id, rating, notes);
    return create_json_response(create_success_response("Asset rated"));
  } catch (const std::exception &e) {
    return create_exception_response("handle_rate", e);
  }
}

crow::response Routes::handle_assign_episode(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    const std::string id = required_string(body, "asset_id");
    const int episode = required_int(body, "episode");

    auto episodes = curation_service_->assign_to_episode(id, episode);
    nlohmann::json response = create_success_response("Asset assigned to episode");
    response["episode_assignments"] = episodes;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_assign_episode", e);
  }
}

crow::response Routes::handle_list_assets(const crow::request &req) {
  try {
    std::optional<std::string> source;
    if (const char *value = req.url_params.get("source"); value != nullptr && *value != '\0') {
      source = value;
    }
    auto page = asset_info_service_->list_assets(
        optional_media_type(req.url_params.get("media_type")), source,
        int_param(req, "limit", media_core::AssetInfoService::DEFAULT_PAGE_SIZE),
        int_param(req, "offset", 0));
    return create_json_response(page_to_json(page));
  } catch (const std::exception &e) {
    return create_exception_response("handle_list_assets", e);
  }
}

crow::response Routes::handle_import(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    const std::string path = required_string(body, "path");
    media_core::IngestOptions options =
        ingest_options_from_json(body, media_core::MediaType::Image);
    const bool recursive = body.value("recursive", true);

    std::cout << "[API] Importing directory " << path << std::endl;
    const int imported = ingestion_service_->import_directory(path, options, recursive);
    nlohmann::json response = create_success_response("Import finished");
    response["imported"] = imported;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_import", e);
  }
}

crow::response Routes::handle_backup(const crow::request &req) {
  try {
    std::filesystem::path dest = default_backup_dir_;
    if (!req.body.empty()) {
      auto body = parse_json_body(req.body);
      if (body.contains("dest") && body["dest"].is_string() &&
          !body["dest"].get<std::string>().empty()) {
        dest = body["dest"].get<std::string>();
      }
    }

    backup_service_->backup_to(dest);
    nlohmann::json response = create_success_response("Backup completed");
    response["backup_path"] = dest.string();
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_backup", e);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

crow::response Routes::create_exception_response(const std::string &handler,
                                                 const std::exception &e) {
  int status = 500;
  if (const auto *media_error = dynamic_cast<const media_core::MediaError *>(&e)) {
    status = http_status_for(media_error->kind());
  } else if (dynamic_cast<const nlohmann::json::exception *>(&e) != nullptr) {
    status = 400;
  }
  if (status >= 500) {
    std::cerr << "[API] Exception in " << handler << ": " << e.what() << std::endl;
  }
  return create_json_response(create_error_response(e.what()), status);
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  try {
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw media_core::InvalidArgumentError(std::string("Malformed JSON body: ") + e.what());
  }
}

int Routes::int_param(const crow::request &req, const char *name, int default_value) {
  return optional_int_param(req, name).value_or(default_value);
}

std::optional<int> Routes::optional_int_param(const crow::request &req, const char *name) {
  const char *value = req.url_params.get(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  try {
    size_t consumed = 0;
    const int parsed = std::stoi(value, &consumed);
    if (value[consumed] != '\0') {
      throw std::invalid_argument(name);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw media_core::InvalidArgumentError(std::string("Query parameter '") + name +
                                           "' must be an integer");
  }
}

}  // namespace media_api
