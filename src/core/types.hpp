#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace skyradar
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Geometry is done in double precision throughout
    using Vec2d = glm::dvec2;
    using Vec3d = glm::dvec3;
    using Mat3d = glm::dmat3;

    /// @brief Pixel/point position on screen. Origin top-left, y grows downward.
    using ScreenPoint = Vec2d;

    /// @brief Orthonormal WORLD -> DEVICE rotation (device = R * world).
    using RotationMatrix = Mat3d;

    /// @brief Viewport size in pixels/points.
    struct ScreenSize
    {
        f64 width;
        f64 height;
    };

    // Angular and astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi            = glm::pi<f64>();
        constexpr f64 kTwoPi         = 2.0 * kPi;
        constexpr f64 kHalfPi        = kPi / 2.0;
        constexpr f64 kDegToRad      = kPi / 180.0;
        constexpr f64 kRadToDeg      = 180.0 / kPi;
        constexpr f64 kHourToRad     = kPi / 12.0;
        constexpr f64 kJ2000         = 2451545.0;   // Julian Date of J2000.0 epoch
        constexpr f64 kUnixEpochJd   = 2440587.5;   // 1970-01-01 00:00 UTC
        constexpr f64 kSecondsPerDay = 86400.0;
    }

    namespace geo_constants
    {
        constexpr f64 kEarthRadiusM = 6'371'000.0;  // Mean spherical Earth radius
    }
}
