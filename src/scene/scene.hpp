#pragma once

/// @file scene.hpp
/// @brief Per-frame output handed to the presentation layer.

#include "astro/lunar_position.hpp"
#include "core/types.hpp"
#include "projection/horizon.hpp"
#include "scene/clustering.hpp"
#include "scene/entities.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace skyradar::scene
{
    /// @brief A decorative star placed on screen.
    struct NightStar
    {
        ScreenPoint screen;
        f64 radius;
        f64 opacity;
    };

    /// @brief Everything to draw for one frame. Rebuilt from scratch by
    /// FrameComposer::compose(); never mutated afterwards.
    struct Scene
    {
        std::vector<ResolvedFriend> visible_friends;
        std::vector<EntityCluster> landmark_clusters;
        std::vector<ScreenPoint> horizon_polyline;
        projection::EarthRegion earth_region;

        bool is_daytime = true;
        std::optional<ResolvedBody> sun;
        std::optional<ResolvedBody> moon;
        std::optional<astro::MoonPhase> moon_phase;
        std::optional<std::string_view> moon_phase_id;

        f64 heading_deg = 0.0;
        std::optional<TargetIndicator> target;

        std::vector<NightStar> night_stars;                         ///< Empty during the day
        std::vector<std::vector<ScreenPoint>> continent_outlines;   ///< Visible runs only

        /// @brief Visible friends not absorbed into a landmark cluster.
        [[nodiscard]] std::vector<const ResolvedFriend*> unclustered_friends() const
        {
            const auto clustered = clustered_friend_ids(landmark_clusters);

            std::vector<const ResolvedFriend*> result;
            for (const auto& f : visible_friends)
            {
                if (!clustered.contains(f.person.id))
                {
                    result.push_back(&f);
                }
            }
            return result;
        }
    };

} // namespace skyradar::scene
