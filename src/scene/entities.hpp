#pragma once

/// @file entities.hpp
/// @brief Tracked entities and their per-frame resolved screen placements.

#include "astro/coordinates.hpp"
#include "catalog/landmark.hpp"
#include "core/types.hpp"
#include "geo/geo_math.hpp"

#include <optional>
#include <string>
#include <unordered_set>

namespace skyradar::scene
{
    /// @brief Last reported position of a friend.
    struct FriendLocation
    {
        geo::GeoPoint position;
        f64 timestamp_jd;       ///< When the fix was reported (Julian Date, UTC)
    };

    /// @brief A friend from the synced roster.
    struct Friend
    {
        std::string id;
        std::string display_name;
        std::optional<std::string> avatar_ref;
        std::optional<FriendLocation> location;
    };

    /// @brief Landmark visibility switches owned by the settings collaborator.
    struct LandmarkSettings
    {
        bool show_landmarks = true;
        std::unordered_set<std::string> disabled_ids;

        [[nodiscard]] bool is_enabled(const std::string& id) const
        {
            return show_landmarks && !disabled_ids.contains(id);
        }
    };

    /// @brief A friend placed on screen this frame.
    struct ResolvedFriend
    {
        Friend person;
        ScreenPoint screen;
        f64 distance_m;
        f64 bearing_deg;
    };

    /// @brief A landmark placed on screen this frame.
    struct ResolvedLandmark
    {
        catalog::Landmark landmark;
        ScreenPoint screen;
        f64 distance_m;
        f64 bearing_deg;
    };

    /// @brief Sun or moon: position always known, screen point only when in front.
    struct ResolvedBody
    {
        astro::HorizontalPosition position;
        std::optional<ScreenPoint> screen;
    };

    /// @brief Navigation state toward a friend the user is looking for.
    struct TargetIndicator
    {
        std::string friend_id;
        std::optional<ScreenPoint> screen;  ///< Unclamped; absent when behind the device
        f64 arrow_angle_deg;                ///< Relative bearing from the heading, [-180, 180]
        f64 distance_m;
        bool found;                         ///< Close enough to screen centre to stop guiding

        [[nodiscard]] bool show_arrow() const { return !found; }
    };

} // namespace skyradar::scene
