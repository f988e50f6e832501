#include "media_core/db/asset_predicates.hpp"

#include <algorithm>

namespace media_core {
namespace predicates {

AssetPredicate has_media_type(MediaType type) {
  return [type](const MediaAsset &asset) { return asset.media_type == type; };
}

AssetPredicate min_quality(int threshold) {
  return [threshold](const MediaAsset &asset) {
    return asset.quality_rating.has_value() && *asset.quality_rating >= threshold;
  };
}

AssetPredicate has_subject(const std::string &subject) {
  return [subject](const MediaAsset &asset) { return asset.subjects.count(subject) > 0; };
}

AssetPredicate has_source(const std::string &source) {
  return [source](const MediaAsset &asset) { return asset.source == source; };
}

AssetPredicate in_episode(int episode) {
  return [episode](const MediaAsset &asset) {
    const auto &eps = asset.episode_assignments;
    return std::find(eps.begin(), eps.end(), episode) != eps.end();
  };
}

AssetPredicate not_in_episode(int episode) {
  auto member = in_episode(episode);
  return [member](const MediaAsset &asset) { return !member(asset); };
}

AssetPredicate all_of(std::vector<AssetPredicate> parts) {
  parts.erase(std::remove_if(parts.begin(), parts.end(),
                             [](const AssetPredicate &p) { return !p; }),
              parts.end());
  if (parts.empty()) {
    return {};
  }
  if (parts.size() == 1) {
    return parts.front();
  }
  return [parts](const MediaAsset &asset) {
    return std::all_of(parts.begin(), parts.end(),
                       [&asset](const AssetPredicate &p) { return p(asset); });
  };
}

}  // namespace predicates
}  // namespace media_core
