#pragma once

#include <functional>
#include <string>
#include <vector>

#include "media_core/types/media_asset.hpp"

namespace media_core {

// Row filter applied to typed assets. An empty predicate accepts everything.
using AssetPredicate = std::function<bool(const MediaAsset &)>;

namespace predicates {

AssetPredicate has_media_type(MediaType type);

// Unrated assets never satisfy a quality threshold.
AssetPredicate min_quality(int threshold);

// Exact set membership, no substring matching.
AssetPredicate has_subject(const std::string &subject);

AssetPredicate has_source(const std::string &source);

AssetPredicate in_episode(int episode);
AssetPredicate not_in_episode(int episode);

// Conjunction of the non-empty predicates; empty if none are set.
AssetPredicate all_of(std::vector<AssetPredicate> parts);

}  // namespace predicates
}  // namespace media_core
