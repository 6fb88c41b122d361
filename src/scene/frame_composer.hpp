#pragma once

/// @file frame_composer.hpp
/// @brief Builds a Scene from a snapshot of sensor and roster state.

#include "catalog/landmark.hpp"
#include "core/types.hpp"
#include "scene/entities.hpp"
#include "scene/radar_config.hpp"
#include "scene/scene.hpp"
#include "scene/star_table.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace skyradar::scene
{
    /// @brief Inputs for a single frame, snapshotted by the caller.
    struct FrameInputs
    {
        std::optional<geo::GeoPoint> observer;      ///< Absent until the first location fix
        std::optional<RotationMatrix> orientation;  ///< World → device; absent until motion starts
        std::span<const Friend> friends;
        LandmarkSettings landmark_settings;
        f64 now_jd = 0.0;
        i32 utc_offset_minutes = 0;
        ScreenSize screen{};
        std::optional<std::string> target_friend_id;
    };

    /// @brief Per-frame orchestrator.
    ///
    /// Holds only immutable state after construction (configuration, the
    /// landmark catalog, continent outlines and the star table), so
    /// compose() is const and may be called from any single thread.
    class FrameComposer
    {
    public:
        explicit FrameComposer(RadarConfig config,
                               std::vector<catalog::Landmark> landmarks = {},
                               std::vector<catalog::ContinentOutline> continents = {});

        [[nodiscard]] Scene compose(const FrameInputs& inputs) const;

        [[nodiscard]] const RadarConfig& config() const { return m_config; }
        [[nodiscard]] std::span<const catalog::Landmark> landmarks() const { return m_landmarks; }

    private:
        [[nodiscard]] bool is_daytime(const FrameInputs& inputs) const;

        void place_night_stars(Scene& scene, const RotationMatrix& rotation, const ScreenSize& screen) const;

        void place_continents(Scene& scene, const geo::GeoPoint& observer,
                              const RotationMatrix& rotation, const ScreenSize& screen) const;

        RadarConfig m_config;
        std::vector<catalog::Landmark> m_landmarks;
        std::vector<catalog::ContinentOutline> m_continents;
        StarTable m_star_table;
    };

} // namespace skyradar::scene
