#pragma once

/// @file coordinates.hpp
/// @brief Coordinate transforms: ecliptic → equatorial → horizontal → NWU world direction.

#include "core/types.hpp"

namespace skyradar::astro
{
    /// @brief Geocentric ecliptic coordinate of date.
    struct EclipticCoord
    {
        f64 lon;    ///< Ecliptic longitude (radians)
        f64 lat;    ///< Ecliptic latitude (radians)
    };

    /// @brief Equatorial coordinate of date.
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Horizontal (topocentric) coordinate.
    struct HorizontalCoord
    {
        f64 alt;    ///< Altitude (radians, negative = below horizon)
        f64 az;     ///< Azimuth (radians, 0..2π, 0=North, π/2=East)
    };

    /// @brief Horizontal position in public-boundary units.
    struct HorizontalPosition
    {
        f64 azimuth_deg;    ///< [0, 360), 0 = North, clockwise
        f64 elevation_deg;  ///< Degrees above (+) / below (−) the horizon
    };

    /// @brief Static utility class for coordinate transformations.
    ///
    /// Shared by the solar and lunar calculators so both bodies run the
    /// same mean elements → ecliptic → equatorial → horizontal pipeline.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Ecliptic (λ, β) → Equatorial (RA/Dec).
        /// @param obliquity_rad Obliquity of the ecliptic ε (radians).
        [[nodiscard]] static EquatorialCoord ecliptic_to_equatorial(
            const EclipticCoord& ecl,
            f64 obliquity_rad
        );

        /// @brief Equatorial (RA/Dec) → Horizontal (Alt/Az).
        /// @param latitude_rad Observer latitude (radians).
        /// @param local_sidereal_time_rad Local Mean Sidereal Time (radians).
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            f64 latitude_rad,
            f64 local_sidereal_time_rad
        );

        /// @brief Radians Alt/Az → degrees azimuth/elevation.
        [[nodiscard]] static HorizontalPosition to_degrees(const HorizontalCoord& hz);

        /// @brief Azimuth/elevation (degrees) → unit direction in the NWU frame.
        ///
        /// {cosE·cosAz, −cosE·sinAz, sinE}: y is negated because azimuth runs
        /// clockwise from North while the y axis points West.
        [[nodiscard]] static Vec3d horizontal_to_world(const HorizontalPosition& pos);
    };

} // namespace skyradar::astro
