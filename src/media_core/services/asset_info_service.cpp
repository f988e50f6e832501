#include "media_core/services/asset_info_service.hpp"

#include <fstream>
#include <iostream>

namespace media_core {

AssetInfoService::AssetInfoService(std::shared_ptr<MetadataStore> metadata_store)
    : metadata_store_(metadata_store) {}

std::optional<MediaAsset> AssetInfoService::get_asset(const std::string &id) {
  return metadata_store_->get_asset(id);
}

std::optional<MediaContent> AssetInfoService::get_content(const std::string &id) {
  return metadata_store_->get_asset_content(id);
}

void AssetInfoService::export_asset(const std::string &id, const std::filesystem::path &output_path) {
  auto content = metadata_store_->get_asset_content(id);
  if (!content) {
    throw NotFoundError("Asset not found: " + id);
  }

  const std::vector<char> &bytes = primary_bytes(*content);
  std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw StorageIOError("Cannot open " + output_path.string() + " for writing");
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (!out) {
    throw StorageIOError("Failed to write " + output_path.string());
  }
  std::cout << "[Store] Exported " << id.substr(0, 8) << " to " << output_path << std::endl;
}

AssetPage AssetInfoService::list_assets(std::optional<MediaType> media_type,
                                        std::optional<std::string> source,
                                        int limit,
                                        int offset) {
  if (limit <= 0) {
    throw InvalidArgumentError("limit must be positive, got " + std::to_string(limit));
  }
  if (offset < 0) {
    throw InvalidArgumentError("offset must not be negative, got " + std::to_string(offset));
  }

  auto matching = metadata_store_->list_assets(predicates::all_of(
      {media_type ? predicates::has_media_type(*media_type) : AssetPredicate{},
       source ? predicates::has_source(*source) : AssetPredicate{}}));

  AssetPage page;
  page.total = static_cast<int>(matching.size());
  page.offset = offset;
  page.limit = limit;
  for (int i = offset; i < page.total && i - offset < limit; ++i) {
    page.assets.push_back(std::move(matching[i]));
  }
  return page;
}

}  // namespace media_core
