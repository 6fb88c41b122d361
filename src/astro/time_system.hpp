#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Date, Unix time, linear sidereal time.

#include "core/types.hpp"

namespace skyradar::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Instants are carried as Julian Dates (f64) across the library.
    /// Julian Date conversion follows Meeus (Astronomical Algorithms, Ch. 7);
    /// sidereal time uses the linear low-precision formula (no nutation),
    /// which is all the solar/lunar placement needs.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert seconds since 1970-01-01 00:00 UTC to Julian Date.
        [[nodiscard]] static f64 from_unix_seconds(f64 unix_seconds);

        /// @brief Days elapsed since J2000.0 (JD 2451545.0), fractional.
        [[nodiscard]] static f64 days_since_j2000(f64 jd);

        /// @brief Hour of the UTC day, [0, 24).
        [[nodiscard]] static f64 ut_hours(f64 jd);

        /// @brief Greenwich Mean Sidereal Time in hours, [0, 24).
        ///
        /// GMST = 6.697375 + 0.0657098242 × n + UT  (n = days since J2000.0)
        [[nodiscard]] static f64 gmst_hours(f64 jd);

        /// @brief Local Mean Sidereal Time (radians, [0, 2π)).
        /// @param longitude_deg Observer longitude in degrees (east positive).
        [[nodiscard]] static f64 lmst_rad(f64 jd, f64 longitude_deg);

        /// @brief Local civil hour of day for a fixed UTC offset, [0, 24).
        [[nodiscard]] static f64 local_hours(f64 jd, i32 utc_offset_minutes);

        /// @brief Get current system time as a Julian Date.
        [[nodiscard]] static f64 now_as_jd();

        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace skyradar::astro
