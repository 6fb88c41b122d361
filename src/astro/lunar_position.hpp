#pragma once

/// @file lunar_position.hpp
/// @brief Low-precision lunar ephemeris and phase banding.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace skyradar::astro
{
    /// @brief Drawable moon phase bands. New moon has no band (nothing drawn).
    enum class MoonPhase : u8
    {
        WaxingCrescent,
        WaxingHalf,
        Full,
        WaningHalf,
        WaningCrescent,
    };

    /// @brief Static lunar position and phase calculator.
    class LunarPosition
    {
    public:
        LunarPosition() = delete;

        /// @brief Mean synodic month used for phase banding (days).
        static constexpr f64 kSynodicPeriodDays = 29.53;

        /// @brief Reference new moon: 2000-01-06 18:14 UTC.
        static constexpr f64 kReferenceNewMoonJd = 2451550.2597222;

        /// @brief Geocentric equatorial position of the moon at an instant.
        [[nodiscard]] static EquatorialCoord equatorial(f64 jd);

        /// @brief Moon azimuth/elevation for an observer (geocentric, no parallax).
        [[nodiscard]] static HorizontalPosition moon_position(f64 jd, f64 latitude_deg, f64 longitude_deg);

        /// @brief Moon age in days since the last new moon, [0, kSynodicPeriodDays).
        [[nodiscard]] static f64 moon_age_days(f64 jd);

        /// @brief Phase band for the instant, or std::nullopt around new moon.
        [[nodiscard]] static std::optional<MoonPhase> moon_phase(f64 jd);

        /// @brief Asset identifier for the phase band, or std::nullopt around new moon.
        [[nodiscard]] static std::optional<std::string_view> moon_phase_id(f64 jd);

        /// @brief Asset identifier for a phase band ("moon-full", ...).
        [[nodiscard]] static std::string_view phase_id(MoonPhase phase);
    };

} // namespace skyradar::astro
