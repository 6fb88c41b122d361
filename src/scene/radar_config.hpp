#pragma once

/// @file radar_config.hpp
/// @brief Tunable constants of the radar view.

#include "core/types.hpp"
#include "projection/projector.hpp"

namespace skyradar::scene
{
    /// @brief Radar view configuration.
    /// Use designated initializers: FrameComposer c({.cluster_threshold_px = 48.0}, ...);
    struct RadarConfig
    {
        f64 horizontal_fov_deg = 60.0;
        f64 vertical_fov_deg = 90.0;
        f64 friend_staleness_s = 300.0;         ///< Older friend fixes are not drawn
        f64 cluster_threshold_px = 60.0;
        f64 earth_radius_m = geo_constants::kEarthRadiusM;
        f64 horizon_step_deg = 2.0;
        i32 horizon_bisection_iterations = 20;
        f64 target_found_radius_px = 150.0;     ///< Navigation arrow hides inside this radius
        f64 civil_twilight_deg = -6.0;
        f64 day_start_hour = 6.0;               ///< Clock fallback when location is unknown
        f64 day_end_hour = 20.0;
        u32 star_count = 80;
        u64 star_seed = 42;

        [[nodiscard]] projection::FieldOfView field_of_view() const
        {
            return projection::FieldOfView{
                .horizontal_deg = horizontal_fov_deg,
                .vertical_deg   = vertical_fov_deg,
            };
        }
    };

} // namespace skyradar::scene
