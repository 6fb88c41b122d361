#pragma once

/// @file horizon.hpp
/// @brief Horizon line sampling and earth/sky region fill by edge bisection.

#include "core/types.hpp"
#include "projection/projector.hpp"

#include <vector>

namespace skyradar::projection
{
    /// @brief How much of the viewport the earth fill covers.
    enum class EarthCoverage : u8
    {
        None,       ///< Every corner sees sky: draw no ground
        Partial,    ///< The horizon crosses the viewport
        Full,       ///< Every corner sees earth: fill the whole screen
    };

    /// @brief Screen polygon to fill as ground.
    struct EarthRegion
    {
        std::vector<ScreenPoint> polygon;   ///< Clockwise from top-left; empty when coverage is None
        EarthCoverage coverage = EarthCoverage::None;
    };

    /// @brief Static horizon utilities.
    class Horizon
    {
    public:
        Horizon() = delete;

        static constexpr f64 kDefaultStepDeg = 2.0;
        static constexpr i32 kDefaultBisectionIterations = 20;

        /// @brief Sample the horizon (elevation 0) every step_deg of azimuth.
        ///
        /// Only visible samples are kept. The polyline starts right after the
        /// first hidden sample so it never jumps across the hidden arc; when
        /// every sample is visible it is the full ring in azimuth order.
        /// Breaks down near straight up/down, where it may be empty.
        [[nodiscard]] static std::vector<ScreenPoint> horizon_screen_points(
            const RotationMatrix& rotation,
            const FieldOfView& fov,
            const ScreenSize& screen,
            f64 step_deg = kDefaultStepDeg
        );

        /// @brief True if the world ray through the screen point points below the horizon.
        [[nodiscard]] static bool is_earth_at(
            const ScreenPoint& point,
            const RotationMatrix& rotation,
            const FieldOfView& fov,
            const ScreenSize& screen
        );

        /// @brief Earth fill polygon for any device attitude.
        ///
        /// Corners are classified by casting their rays back into the world.
        /// Walking the rectangle clockwise (TL, TR, BR, BL), earth corners are
        /// emitted as-is and every edge whose endpoints disagree contributes
        /// one crossing found by bisection.
        [[nodiscard]] static EarthRegion earth_region(
            const RotationMatrix& rotation,
            const FieldOfView& fov,
            const ScreenSize& screen,
            i32 iterations = kDefaultBisectionIterations
        );
    };

} // namespace skyradar::projection
