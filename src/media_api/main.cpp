#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "media_api/config.hpp"
#include "media_api/routes.hpp"
#include "media_api/server.hpp"
#include "media_core/db/database_manager.hpp"
#include "media_core/db/metadata_store.hpp"
#include "media_core/embedding/clip_embedding_client.hpp"
#include "media_core/media/opencv_frame_extractor.hpp"
#include "media_core/services/asset_info_service.hpp"
#include "media_core/services/backup_service.hpp"
#include "media_core/services/curation_service.hpp"
#include "media_core/services/ingestion_service.hpp"
#include "media_core/services/search_service.hpp"
#include "media_core/services/stats_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main(int argc, char *argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "mediarc.json";
    media_api::Config config = media_api::Config::from_file(config_path);

    std::cout << "Starting Media Vault API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Store Directory: " << config.store_dir << std::endl;
    std::cout << "Backup Directory: " << config.backup_dir << std::endl;
    std::cout << "Embedding URL: " << config.embedding_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;

    // Initialize core components
    auto embedding_client = std::make_shared<media_core::ClipEmbeddingClient>(
        config.embedding_url, config.embedding_model, config.embedding_timeout_seconds);
    if (!embedding_client->is_server_available()) {
      std::cerr << "Warning: embedding server is not reachable at " << config.embedding_url
                << "; ingestion and search will fail until it is up" << std::endl;
    }
    auto frame_extractor = std::make_shared<media_core::OpenCvFrameExtractor>();

    media_core::DatabaseManager db_manager;
    db_manager.initialize(config.store_dir, config.db_pool_size);
    auto metadata_store = std::make_shared<media_core::MetadataStore>(db_manager);

    for (const auto &model : metadata_store->embedding_models_in_use()) {
      if (model != config.embedding_model) {
        std::cerr << "Warning: store contains embeddings from model '" << model
                  << "' but the configured model is '" << config.embedding_model
                  << "'; similarity across models is meaningless" << std::endl;
      }
    }

    auto ingestion_service = std::make_shared<media_core::IngestionService>(
        metadata_store, embedding_client, frame_extractor, config.frame_offset_seconds);
    auto search_service =
        std::make_shared<media_core::SearchService>(metadata_store, embedding_client);
    auto asset_info_service = std::make_shared<media_core::AssetInfoService>(metadata_store);
    auto curation_service = std::make_shared<media_core::CurationService>(metadata_store);
    auto stats_service = std::make_shared<media_core::StatsService>(metadata_store);
    auto backup_service = std::make_shared<media_core::BackupService>(db_manager);

    media_api::Server server(config.host(), config.port());
    media_api::Routes routes(ingestion_service, search_service, asset_info_service,
                             curation_service, stats_service, backup_service, config.backup_dir);
    routes.register_routes(server);

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
