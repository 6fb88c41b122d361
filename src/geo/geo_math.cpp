/// @file geo_math.cpp
/// @brief Implementation of geographic and angular math on a spherical Earth.

#include "geo/geo_math.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace skyradar::geo
{

using astro_constants::kDegToRad;
using astro_constants::kRadToDeg;

// -----------------------------------------------------------------
// Initial bearing
//
//   y = sin(Δlon) × cos(lat2)
//   x = cos(lat1) × sin(lat2) − sin(lat1) × cos(lat2) × cos(Δlon)
//   θ = atan2(y, x)
// -----------------------------------------------------------------

f64 GeoMath::bearing(const GeoPoint& from, const GeoPoint& to)
{
    const f64 lat1 = from.latitude_deg * kDegToRad;
    const f64 lat2 = to.latitude_deg * kDegToRad;
    const f64 d_lon = (to.longitude_deg - from.longitude_deg) * kDegToRad;

    const f64 y = std::sin(d_lon) * std::cos(lat2);
    const f64 x = std::cos(lat1) * std::sin(lat2)
                - std::sin(lat1) * std::cos(lat2) * std::cos(d_lon);

    // atan2(0, 0) == 0, so identical points report due north
    return wrap_degrees(std::atan2(y, x) * kRadToDeg);
}

// -----------------------------------------------------------------
// Haversine distance
//
//   a = sin²(Δlat/2) + cos(lat1) × cos(lat2) × sin²(Δlon/2)
//   d = 2R × atan2(√a, √(1−a))
// -----------------------------------------------------------------

f64 GeoMath::distance(const GeoPoint& from, const GeoPoint& to, f64 earth_radius_m)
{
    const f64 lat1 = from.latitude_deg * kDegToRad;
    const f64 lat2 = to.latitude_deg * kDegToRad;
    const f64 d_lat = lat2 - lat1;
    const f64 d_lon = (to.longitude_deg - from.longitude_deg) * kDegToRad;

    const f64 sin_half_lat = std::sin(d_lat * 0.5);
    const f64 sin_half_lon = std::sin(d_lon * 0.5);

    f64 a = sin_half_lat * sin_half_lat
          + std::cos(lat1) * std::cos(lat2) * sin_half_lon * sin_half_lon;
    a = std::clamp(a, 0.0, 1.0);

    return 2.0 * earth_radius_m * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
}

f64 GeoMath::normalize_angle(f64 angle_deg)
{
    // fmod first keeps the loops below to at most one step
    angle_deg = std::fmod(angle_deg, 360.0);
    while (angle_deg > 180.0)
    {
        angle_deg -= 360.0;
    }
    while (angle_deg < -180.0)
    {
        angle_deg += 360.0;
    }
    return angle_deg;
}

f64 GeoMath::relative_bearing(f64 target_bearing_deg, f64 device_heading_deg)
{
    return normalize_angle(target_bearing_deg - device_heading_deg);
}

bool GeoMath::is_within_horizontal_fov(f64 bearing_deg, f64 device_heading_deg, f64 fov_deg)
{
    return std::abs(relative_bearing(bearing_deg, device_heading_deg)) <= fov_deg / 2.0;
}

f64 GeoMath::true_elevation_angle(f64 distance_m, f64 earth_radius_m)
{
    const f64 central_angle = distance_m / earth_radius_m;
    return -std::min(central_angle / 2.0, astro_constants::kHalfPi);
}

f64 GeoMath::scaled_elevation_angle(f64 distance_m, f64 max_distance_m, f64 max_angle_deg)
{
    const f64 normalized = std::min(distance_m / max_distance_m, 1.0);
    return -normalized * max_angle_deg * kDegToRad;
}

std::string_view GeoMath::cardinal_direction(f64 heading_deg)
{
    static constexpr std::array<std::string_view, 8> kDirections = {
        "N", "NE", "E", "SE", "S", "SW", "W", "NW",
    };

    if (!std::isfinite(heading_deg))
    {
        return kDirections[0];
    }

    const auto index = static_cast<std::size_t>((wrap_degrees(heading_deg) + 22.5) / 45.0) % 8;
    return kDirections[index];
}

f64 GeoMath::wrap_degrees(f64 angle_deg)
{
    angle_deg = std::fmod(angle_deg, 360.0);
    if (angle_deg < 0.0)
    {
        angle_deg += 360.0;
    }
    // Tiny negative inputs round up to exactly 360 after the shift
    return (angle_deg >= 360.0) ? 0.0 : angle_deg;
}

} // namespace skyradar::geo
