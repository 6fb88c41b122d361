/// @file lunar_position.cpp
/// @brief Implementation of the low-precision lunar ephemeris.

#include "astro/lunar_position.hpp"

#include "astro/time_system.hpp"

#include <cmath>

namespace skyradar::astro
{

using astro_constants::kDegToRad;

// -----------------------------------------------------------------
// Moon: mean elements with one leading perturbation each
//
//   L0 = 218.316° + 13.176396° × n        (mean longitude)
//   M  = 134.963° + 13.064993° × n        (mean anomaly)
//   F  =  93.272° + 13.229350° × n        (argument of latitude)
//
//   λ = L0 + 6.289° × sin(M)
//   β = 5.128° × sin(F)
// -----------------------------------------------------------------

EquatorialCoord LunarPosition::equatorial(f64 jd)
{
    const f64 n = TimeSystem::days_since_j2000(jd);

    const f64 mean_longitude = std::fmod(218.316 + 13.176396 * n, 360.0);
    const f64 m = std::fmod(134.963 + 13.064993 * n, 360.0) * kDegToRad;
    const f64 f = std::fmod(93.272 + 13.229350 * n, 360.0) * kDegToRad;

    const f64 ecl_lon = mean_longitude + 6.289 * std::sin(m);
    const f64 ecl_lat = 5.128 * std::sin(f);
    const f64 obliquity = (23.439 - 0.0000004 * n) * kDegToRad;

    return Coordinates::ecliptic_to_equatorial(
        EclipticCoord{.lon = ecl_lon * kDegToRad, .lat = ecl_lat * kDegToRad},
        obliquity);
}

HorizontalPosition LunarPosition::moon_position(f64 jd, f64 latitude_deg, f64 longitude_deg)
{
    const auto hz = Coordinates::equatorial_to_horizontal(
        equatorial(jd),
        latitude_deg * kDegToRad,
        TimeSystem::lmst_rad(jd, longitude_deg));

    return Coordinates::to_degrees(hz);
}

f64 LunarPosition::moon_age_days(f64 jd)
{
    const f64 age = std::fmod(jd - kReferenceNewMoonJd, kSynodicPeriodDays);
    return (age < 0.0) ? age + kSynodicPeriodDays : age;
}

// -----------------------------------------------------------------
// Phase bands by age (days):
//   [0, 1.85) ∪ [27.7, 29.53)  new moon, nothing drawn
//   [1.85, 5.5)   waxing crescent
//   [5.5,  9.2)   waxing half
//   [9.2,  20.3)  full
//   [20.3, 24.0)  waning half
//   [24.0, 27.7)  waning crescent
// -----------------------------------------------------------------

std::optional<MoonPhase> LunarPosition::moon_phase(f64 jd)
{
    const f64 age = moon_age_days(jd);

    if (age < 1.85 || age >= 27.7)
    {
        return std::nullopt;
    }
    if (age < 5.5)
    {
        return MoonPhase::WaxingCrescent;
    }
    if (age < 9.2)
    {
        return MoonPhase::WaxingHalf;
    }
    if (age < 20.3)
    {
        return MoonPhase::Full;
    }
    if (age < 24.0)
    {
        return MoonPhase::WaningHalf;
    }
    return MoonPhase::WaningCrescent;
}

std::optional<std::string_view> LunarPosition::moon_phase_id(f64 jd)
{
    const auto phase = moon_phase(jd);
    if (!phase)
    {
        return std::nullopt;
    }
    return phase_id(*phase);
}

std::string_view LunarPosition::phase_id(MoonPhase phase)
{
    switch (phase)
    {
        case MoonPhase::WaxingCrescent: return "moon-crescent-waxing";
        case MoonPhase::WaxingHalf:     return "moon-half-waxing";
        case MoonPhase::Full:           return "moon-full";
        case MoonPhase::WaningHalf:     return "moon-half-waning";
        case MoonPhase::WaningCrescent: return "moon-crescent-waning";
    }
    return "moon-full";
}

} // namespace skyradar::astro
