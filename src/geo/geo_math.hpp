#pragma once

/// @file geo_math.hpp
/// @brief Great-circle bearing/distance, angle wrapping, field-of-view tests, chord elevation.

#include "core/types.hpp"

#include <string_view>

namespace skyradar::geo
{
    /// @brief Geographic position on a spherical Earth.
    struct GeoPoint
    {
        f64 latitude_deg;   ///< Latitude (degrees, north positive)
        f64 longitude_deg;  ///< Longitude (degrees, east positive)
    };

    /// @brief Static utility class for angular and geographic math.
    ///
    /// Angles crossing the public boundary are degrees (0 = North, clockwise);
    /// elevation results are radians. All functions are total: NaN inputs
    /// propagate as NaN, nothing throws.
    class GeoMath
    {
    public:
        GeoMath() = delete;

        /// @brief Initial great-circle bearing from one point to another.
        /// @return Bearing in degrees, [0, 360). Identical points give 0.
        [[nodiscard]] static f64 bearing(const GeoPoint& from, const GeoPoint& to);

        /// @brief Great-circle (haversine) distance in meters.
        /// Identical points give exactly 0.
        [[nodiscard]] static f64 distance(const GeoPoint& from, const GeoPoint& to,
                                          f64 earth_radius_m = geo_constants::kEarthRadiusM);

        /// @brief Wrap an angle into [-180, 180]. Exactly ±180 is kept as-is.
        [[nodiscard]] static f64 normalize_angle(f64 angle_deg);

        /// @brief Angle from the device heading to a target bearing.
        /// @return Degrees in [-180, 180]; positive = right, negative = left.
        [[nodiscard]] static f64 relative_bearing(f64 target_bearing_deg, f64 device_heading_deg);

        /// @brief True if |relative bearing| <= fov/2 (inclusive at the edge).
        [[nodiscard]] static bool is_within_horizontal_fov(f64 bearing_deg,
                                                           f64 device_heading_deg,
                                                           f64 fov_deg);

        /// @brief Elevation of the straight chord through the Earth to a point
        /// at the given great-circle distance.
        ///
        /// Central angle θ = d / R; elevation = -min(θ/2, π/2).
        /// @return Radians in [-π/2, 0].
        [[nodiscard]] static f64 true_elevation_angle(f64 distance_m,
                                                      f64 earth_radius_m = geo_constants::kEarthRadiusM);

        /// @brief Display-compressed elevation, linear in min(d / max_distance, 1).
        /// @return Radians in [-max_angle, 0].
        [[nodiscard]] static f64 scaled_elevation_angle(f64 distance_m,
                                                        f64 max_distance_m = 20'000'000.0,
                                                        f64 max_angle_deg = 20.0);

        /// @brief 8-point compass label ("N", "NE", ... "NW") for a heading in degrees.
        /// Non-finite headings give "N".
        [[nodiscard]] static std::string_view cardinal_direction(f64 heading_deg);

        /// @brief Wrap an angle into [0, 360).
        [[nodiscard]] static f64 wrap_degrees(f64 angle_deg);
    };

} // namespace skyradar::geo
