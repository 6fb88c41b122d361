#pragma once

/// @file solar_position.hpp
/// @brief Low-precision solar ephemeris and day/night classification.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

namespace skyradar::astro
{
    /// @brief Static solar position calculator.
    ///
    /// Mean longitude/anomaly with a two-term equation of centre, slowly varying
    /// obliquity and linear sidereal time. Errors are on the order of an
    /// arcminute: good for placing an icon, not for navigation.
    class SolarPosition
    {
    public:
        SolarPosition() = delete;

        /// @brief Civil twilight: the sun's centre 6° below the horizon.
        static constexpr f64 kCivilTwilightDeg = -6.0;

        /// @brief Geocentric equatorial position of the sun at an instant.
        [[nodiscard]] static EquatorialCoord equatorial(f64 jd);

        /// @brief Sun azimuth/elevation for an observer.
        /// @param jd Instant as a Julian Date (UTC).
        /// @param latitude_deg Observer latitude (degrees).
        /// @param longitude_deg Observer longitude (degrees, east positive).
        [[nodiscard]] static HorizontalPosition sun_position(f64 jd, f64 latitude_deg, f64 longitude_deg);

        /// @brief True while the sun is above the twilight threshold.
        [[nodiscard]] static bool is_daytime(f64 jd, f64 latitude_deg, f64 longitude_deg,
                                             f64 threshold_deg = kCivilTwilightDeg);

        /// @brief Fallback day/night rule when no observer location is known.
        /// @return True for start_hour <= local_hour < end_hour.
        [[nodiscard]] static bool is_daytime_by_clock(f64 local_hour,
                                                      f64 start_hour = 6.0,
                                                      f64 end_hour = 20.0);
    };

} // namespace skyradar::astro
