/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include <chrono>
#include <cmath>

namespace skyradar::astro
{

namespace
{

/// Wrap a value into [0, period).
f64 wrap(f64 value, f64 period)
{
    value = std::fmod(value, period);
    if (value < 0.0)
    {
        value += period;
    }
    return (value >= period) ? 0.0 : value;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Julian Date: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + static_cast<f64>(dt.day)
         + day_fraction
         + static_cast<f64>(b)
         - 1524.5;
}

f64 TimeSystem::from_unix_seconds(f64 unix_seconds)
{
    return astro_constants::kUnixEpochJd + unix_seconds / astro_constants::kSecondsPerDay;
}

f64 TimeSystem::days_since_j2000(f64 jd)
{
    return jd - astro_constants::kJ2000;
}

// Julian days start at noon, civil days at midnight
f64 TimeSystem::ut_hours(f64 jd)
{
    return wrap(jd + 0.5, 1.0) * 24.0;
}

// -----------------------------------------------------------------
// GMST: linear approximation
//
// GMST (hours) = 6.697375 + 0.0657098242 × n + UT
//
// n counts whole and fractional days since J2000.0. Because
// 0.0657098242 / 24 equals the sidereal excess per solar hour,
// the fractional-day term and UT together give 1.0027379 × UT.
// -----------------------------------------------------------------

f64 TimeSystem::gmst_hours(f64 jd)
{
    const f64 n = days_since_j2000(jd);
    return wrap(6.697375 + 0.0657098242 * n + ut_hours(jd), 24.0);
}

f64 TimeSystem::lmst_rad(f64 jd, f64 longitude_deg)
{
    const f64 lmst_hours = gmst_hours(jd) + longitude_deg / 15.0;
    return normalize_radians(lmst_hours * astro_constants::kHourToRad);
}

f64 TimeSystem::local_hours(f64 jd, i32 utc_offset_minutes)
{
    return wrap(ut_hours(jd) + static_cast<f64>(utc_offset_minutes) / 60.0, 24.0);
}

// -----------------------------------------------------------------
// Current system time → Julian Date
// -----------------------------------------------------------------

f64 TimeSystem::now_as_jd()
{
    using namespace std::chrono;

    const auto since_epoch = system_clock::now().time_since_epoch();
    return from_unix_seconds(duration_cast<duration<f64>>(since_epoch).count());
}

f64 TimeSystem::normalize_radians(f64 angle)
{
    return wrap(angle, astro_constants::kTwoPi);
}

} // namespace skyradar::astro
