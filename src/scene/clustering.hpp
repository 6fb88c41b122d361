#pragma once

/// @file clustering.hpp
/// @brief Groups screen-overlapping landmarks (and nearby friends) into display clusters.

#include "core/types.hpp"
#include "scene/entities.hpp"

#include <span>
#include <string>
#include <unordered_set>
#include <vector>

namespace skyradar::scene
{
    /// @brief Co-located landmarks and friends sharing one on-screen anchor.
    ///
    /// Recomputed from scratch every frame; id() stays the same as long as
    /// membership does, so UI state such as "expanded" can key on it.
    struct EntityCluster
    {
        std::vector<ResolvedLandmark> landmarks;   ///< Closest first
        std::vector<ResolvedFriend> friends;
        ScreenPoint anchor;                        ///< Screen position of the seed landmark

        /// @brief Sorted landmark ids joined by '-', then '+' and sorted friend ids if any.
        [[nodiscard]] std::string id() const;

        /// @brief Exactly one landmark and no friends: drawn as a plain icon.
        [[nodiscard]] bool is_single() const { return landmarks.size() == 1 && friends.empty(); }

        [[nodiscard]] bool is_mixed() const { return !friends.empty(); }

        [[nodiscard]] std::size_t total_count() const { return landmarks.size() + friends.size(); }
    };

    /// @brief Default pixel distance under which two icons overlap.
    inline constexpr f64 kDefaultClusterThresholdPx = 60.0;

    /// @brief Greedy overlap clustering.
    ///
    /// Unassigned landmarks seed clusters in input order; each seed absorbs
    /// every other unassigned landmark closer than `threshold_px` to it, then
    /// every unassigned friend closer than `threshold_px` to the seed.
    /// Distances are measured from the seed only, not chained.
    ///
    /// @return Clusters in seed order. Empty when there are no landmarks.
    [[nodiscard]] std::vector<EntityCluster> cluster_landmarks(
        std::span<const ResolvedLandmark> landmarks,
        std::span<const ResolvedFriend> friends,
        f64 threshold_px = kDefaultClusterThresholdPx);

    /// @brief Ids of friends that were absorbed into a cluster.
    [[nodiscard]] std::unordered_set<std::string> clustered_friend_ids(
        std::span<const EntityCluster> clusters);

} // namespace skyradar::scene
