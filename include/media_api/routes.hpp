#pragma once
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "media_core/types/media_asset.hpp"
#include "server.hpp"

// Forward declarations
namespace media_core {
class IngestionService;
class SearchService;
class AssetInfoService;
class CurationService;
class StatsService;
class BackupService;
}  // namespace media_core

namespace media_api {

// JSON-over-HTTP boundary. Each handler maps onto exactly one core operation;
// binary payloads travel base64-encoded.
class Routes {
 public:
  Routes(std::shared_ptr<media_core::IngestionService> ingestion_service,
         std::shared_ptr<media_core::SearchService> search_service,
         std::shared_ptr<media_core::AssetInfoService> asset_info_service,
         std::shared_ptr<media_core::CurationService> curation_service,
         std::shared_ptr<media_core::StatsService> stats_service,
         std::shared_ptr<media_core::BackupService> backup_service,
         std::filesystem::path default_backup_dir);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(Server &server);

  // Route handlers, public so they can be exercised without a listening socket
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_stats(const crow::request &req);
  crow::response handle_search_theme(const crow::request &req);
  crow::response handle_search_similar(const crow::request &req);
  crow::response handle_search_subject(const crow::request &req, const std::string &subject);
  crow::response handle_search_episode(const crow::request &req, int episode);
  crow::response handle_get_asset(const crow::request &req, const std::string &id);
  crow::response handle_get_content(const crow::request &req, const std::string &id);
  crow::response handle_add_image(const crow::request &req);
  crow::response handle_add_video(const crow::request &req);
  crow::response handle_rate(const crow::request &req);
  crow::response handle_assign_episode(const crow::request &req);
  crow::response handle_list_assets(const crow::request &req);
  crow::response handle_import(const crow::request &req);
  crow::response handle_backup(const crow::request &req);

 private:
  std::shared_ptr<media_core::IngestionService> ingestion_service_;
  std::shared_ptr<media_core::SearchService> search_service_;
  std::shared_ptr<media_core::AssetInfoService> asset_info_service_;
  std::shared_ptr<media_core::CurationService> curation_service_;
  std::shared_ptr<media_core::StatsService> stats_service_;
  std::shared_ptr<media_core::BackupService> backup_service_;
  std::filesystem::path default_backup_dir_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  static int int_param(const crow::request &req, const char *name, int default_value);
  static std::optional<int> optional_int_param(const crow::request &req, const char *name);
  crow::response ingest_upload(const crow::request &req, media_core::MediaType media_type);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response create_exception_response(const std::string &handler, const std::exception &e);
};

}  // namespace media_api
