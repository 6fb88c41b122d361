/// @file coordinates.cpp
/// @brief Implementation of ecliptic/equatorial/horizontal/world transforms.

#include "astro/coordinates.hpp"

#include "astro/time_system.hpp"

#include <algorithm>
#include <cmath>

namespace skyradar::astro
{

using astro_constants::kDegToRad;
using astro_constants::kRadToDeg;

// -----------------------------------------------------------------
// Ecliptic → Equatorial
//
//   sin(δ) = sin(β) × cos(ε) + cos(β) × sin(ε) × sin(λ)
//   α      = atan2(sin(λ) × cos(ε) − tan(β) × sin(ε), cos(λ))
// -----------------------------------------------------------------

EquatorialCoord Coordinates::ecliptic_to_equatorial(const EclipticCoord& ecl, f64 obliquity_rad)
{
    const f64 sin_eps = std::sin(obliquity_rad);
    const f64 cos_eps = std::cos(obliquity_rad);
    const f64 sin_lon = std::sin(ecl.lon);

    const f64 sin_dec = std::sin(ecl.lat) * cos_eps
                      + std::cos(ecl.lat) * sin_eps * sin_lon;

    const f64 ra = std::atan2(sin_lon * cos_eps - std::tan(ecl.lat) * sin_eps,
                              std::cos(ecl.lon));

    return EquatorialCoord{
        .ra  = TimeSystem::normalize_radians(ra),
        .dec = std::asin(std::clamp(sin_dec, -1.0, 1.0)),
    };
}

// -----------------------------------------------------------------
// Equatorial (RA/Dec) → Horizontal (Alt/Az)
//
// Hour angle: H = LST − RA
//
// sin(alt) = sin(dec) × sin(lat) + cos(dec) × cos(lat) × cos(H)
//
// Azimuth (north-based):
//   az = atan2(−cos(dec)×sin(H), sin(dec)×cos(lat) − cos(dec)×sin(lat)×cos(H))
//
// The atan2 form stays defined at the poles, where the acos form
// divides by cos(lat) × cos(alt).
// -----------------------------------------------------------------

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    f64 latitude_rad,
    f64 local_sidereal_time_rad)
{
    const f64 hour_angle = local_sidereal_time_rad - eq.ra;

    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_dec = std::cos(eq.dec);
    const f64 sin_lat = std::sin(latitude_rad);
    const f64 cos_lat = std::cos(latitude_rad);
    const f64 cos_ha  = std::cos(hour_angle);
    const f64 sin_ha  = std::sin(hour_angle);

    const f64 sin_alt = sin_dec * sin_lat + cos_dec * cos_lat * cos_ha;

    const f64 az_y = -cos_dec * sin_ha;
    const f64 az_x = sin_dec * cos_lat - cos_dec * sin_lat * cos_ha;

    return HorizontalCoord{
        .alt = std::asin(std::clamp(sin_alt, -1.0, 1.0)),
        .az  = TimeSystem::normalize_radians(std::atan2(az_y, az_x)),
    };
}

HorizontalPosition Coordinates::to_degrees(const HorizontalCoord& hz)
{
    return HorizontalPosition{
        .azimuth_deg   = hz.az * kRadToDeg,
        .elevation_deg = hz.alt * kRadToDeg,
    };
}

Vec3d Coordinates::horizontal_to_world(const HorizontalPosition& pos)
{
    const f64 az = pos.azimuth_deg * kDegToRad;
    const f64 el = pos.elevation_deg * kDegToRad;
    const f64 cos_el = std::cos(el);

    return Vec3d{cos_el * std::cos(az), -cos_el * std::sin(az), std::sin(el)};
}

} // namespace skyradar::astro
