#pragma once

/// @file entity_resolver.hpp
/// @brief Places friends, landmarks and celestial bodies on screen for one frame.

#include "core/types.hpp"
#include "scene/entities.hpp"
#include "scene/radar_config.hpp"

#include <optional>

namespace skyradar::scene
{
    /// @brief Per-frame resolver bound to one observer, attitude and viewport.
    ///
    /// Cheap to construct; the frame composer builds a fresh one per frame.
    /// Keeps a reference to the configuration, which must outlive it.
    class EntityResolver
    {
    public:
        EntityResolver(const RadarConfig& config,
                       const geo::GeoPoint& observer,
                       const RotationMatrix& rotation,
                       const ScreenSize& screen);

        /// @brief True if the friend's last fix is within the staleness window.
        [[nodiscard]] bool is_fresh(const Friend& person, f64 now_jd) const;

        /// @brief Place a friend, or std::nullopt if unlocated, stale or not in front.
        [[nodiscard]] std::optional<ResolvedFriend> resolve_friend(const Friend& person, f64 now_jd) const;

        /// @brief Place a landmark, or std::nullopt if hidden, disabled or not in front.
        [[nodiscard]] std::optional<ResolvedLandmark> resolve_landmark(
            const catalog::Landmark& landmark,
            const LandmarkSettings& settings) const;

        /// @brief Attach an optional screen point to a sun/moon position.
        [[nodiscard]] ResolvedBody resolve_celestial(const astro::HorizontalPosition& position) const;

        /// @brief Navigation indicator toward a friend (staleness ignored).
        /// @return std::nullopt when the friend has no location at all.
        [[nodiscard]] std::optional<TargetIndicator> resolve_target(const Friend& person,
                                                                    f64 heading_deg) const;

    private:
        [[nodiscard]] std::optional<ScreenPoint> project(const geo::GeoPoint& target) const;

        const RadarConfig& m_config;
        geo::GeoPoint m_observer;
        RotationMatrix m_rotation;
        ScreenSize m_screen;
    };

} // namespace skyradar::scene
