#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "media_core/db/metadata_store.hpp"

namespace media_core {

struct AssetPage {
  // Number of assets matching the filters, before pagination.
  int total = 0;
  int offset = 0;
  int limit = 0;
  std::vector<MediaAsset> assets;
};

class AssetInfoService {
 public:
  static constexpr int DEFAULT_PAGE_SIZE = 100;

  explicit AssetInfoService(std::shared_ptr<MetadataStore> metadata_store);

  std::optional<MediaAsset> get_asset(const std::string &id);
  std::optional<MediaContent> get_content(const std::string &id);

  // Writes the asset's primary bytes to `output_path`, byte-identical to the ingested file.
  void export_asset(const std::string &id, const std::filesystem::path &output_path);

  AssetPage list_assets(std::optional<MediaType> media_type = std::nullopt,
                        std::optional<std::string> source = std::nullopt,
                        int limit = DEFAULT_PAGE_SIZE,
                        int offset = 0);

 private:
  std::shared_ptr<MetadataStore> metadata_store_;
};

}  // namespace media_core
