/// @file solar_position.cpp
/// @brief Implementation of the low-precision solar ephemeris.

#include "astro/solar_position.hpp"

#include "astro/time_system.hpp"

#include <cmath>

namespace skyradar::astro
{

using astro_constants::kDegToRad;

// -----------------------------------------------------------------
// Sun: mean elements → ecliptic longitude
//
//   n = JD − 2451545.0
//   L = 280.460°  + 0.9856474° × n         (mean longitude)
//   g = 357.528°  + 0.9856003° × n         (mean anomaly)
//   λ = L + 1.915° × sin(g) + 0.020° × sin(2g)
//   ε = 23.439° − 0.0000004° × n
// -----------------------------------------------------------------

EquatorialCoord SolarPosition::equatorial(f64 jd)
{
    const f64 n = TimeSystem::days_since_j2000(jd);

    const f64 mean_longitude = std::fmod(280.460 + 0.9856474 * n, 360.0);
    const f64 g = std::fmod(357.528 + 0.9856003 * n, 360.0) * kDegToRad;

    const f64 lambda = mean_longitude + 1.915 * std::sin(g) + 0.020 * std::sin(2.0 * g);
    const f64 obliquity = (23.439 - 0.0000004 * n) * kDegToRad;

    return Coordinates::ecliptic_to_equatorial(
        EclipticCoord{.lon = lambda * kDegToRad, .lat = 0.0},
        obliquity);
}

HorizontalPosition SolarPosition::sun_position(f64 jd, f64 latitude_deg, f64 longitude_deg)
{
    const auto hz = Coordinates::equatorial_to_horizontal(
        equatorial(jd),
        latitude_deg * kDegToRad,
        TimeSystem::lmst_rad(jd, longitude_deg));

    return Coordinates::to_degrees(hz);
}

bool SolarPosition::is_daytime(f64 jd, f64 latitude_deg, f64 longitude_deg, f64 threshold_deg)
{
    return sun_position(jd, latitude_deg, longitude_deg).elevation_deg > threshold_deg;
}

bool SolarPosition::is_daytime_by_clock(f64 local_hour, f64 start_hour, f64 end_hour)
{
    return local_hour >= start_hour && local_hour < end_hour;
}

} // namespace skyradar::astro
