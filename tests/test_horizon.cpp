/// @file test_horizon.cpp
/// @brief Unit tests for skyradar::projection::Horizon.
///
/// Horizon polyline sampling for a level device and the bisection-based
/// earth fill at level, tilted, straight-up and straight-down attitudes.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/types.hpp"
#include "projection/horizon.hpp"
#include "projection/projector.hpp"

#include <cmath>

using namespace skyradar;
using namespace skyradar::projection;

// =================================================================
// Fixture values and tolerances
// =================================================================

static constexpr ScreenSize kScreen{400.0, 800.0};
static constexpr FieldOfView kFov{};

/// Bisection with 20 iterations resolves an 800 px edge to < 0.001 px
static constexpr f64 kCrossingTolPx = 0.01;
static constexpr f64 kPixelTol = 1e-6;

// =================================================================
// Horizon polyline
// =================================================================

TEST_CASE("Level device: horizon runs across the middle of the screen")
{
    const auto rotation = Projector::rotation_facing(0.0, 0.0);
    const auto points = Horizon::horizon_screen_points(rotation, kFov, kScreen);

    REQUIRE_FALSE(points.empty());
    for (const auto& p : points)
    {
        CHECK(std::abs(p.y - kScreen.height / 2.0) < kPixelTol);
    }
}

TEST_CASE("Level device: polyline is ordered left to right without a jump")
{
    const auto rotation = Projector::rotation_facing(0.0, 0.0);
    const auto points = Horizon::horizon_screen_points(rotation, kFov, kScreen);

    // Roughly the front half of the 180 samples
    CHECK(points.size() >= 88);
    CHECK(points.size() <= 91);
    for (std::size_t i = 1; i < points.size(); ++i)
    {
        CHECK(points[i].x > points[i - 1].x);
    }
}

TEST_CASE("Horizon step controls the sample count")
{
    const auto rotation = Projector::rotation_facing(0.0, 0.0);
    const auto fine = Horizon::horizon_screen_points(rotation, kFov, kScreen, 2.0);
    const auto coarse = Horizon::horizon_screen_points(rotation, kFov, kScreen, 10.0);

    CHECK(coarse.size() >= 17);
    CHECK(coarse.size() < fine.size());
}

TEST_CASE("Non-positive step yields no samples")
{
    const auto rotation = Projector::rotation_facing(0.0, 0.0);
    CHECK(Horizon::horizon_screen_points(rotation, kFov, kScreen, 0.0).empty());
    CHECK(Horizon::horizon_screen_points(rotation, kFov, kScreen, -2.0).empty());
}

TEST_CASE("Tilting up moves the horizon down the screen")
{
    const auto rotation = Projector::rotation_facing(0.0, 20.0);
    const auto points = Horizon::horizon_screen_points(rotation, kFov, kScreen);

    REQUIRE_FALSE(points.empty());

    // The sample straight ahead (azimuth 0) sits 20° below the centre
    const f64 expected_y = kScreen.height / 2.0 + (20.0 / 45.0) * kScreen.height / 2.0;
    bool found_ahead = false;
    for (const auto& p : points)
    {
        if (std::abs(p.x - kScreen.width / 2.0) < kPixelTol)
        {
            found_ahead = true;
            CHECK(p.y == doctest::Approx(expected_y));
        }
    }
    CHECK(found_ahead);
}

// =================================================================
// Earth classification
// =================================================================

TEST_CASE("Level device: top of the screen is sky, bottom is earth")
{
    const auto rotation = Projector::rotation_facing(0.0, 0.0);

    CHECK_FALSE(Horizon::is_earth_at({200.0, 10.0}, rotation, kFov, kScreen));
    CHECK(Horizon::is_earth_at({200.0, 790.0}, rotation, kFov, kScreen));
}

// =================================================================
// Earth region
// =================================================================

TEST_CASE("Level device: partial coverage with crossings at mid-height")
{
    const auto rotation = Projector::rotation_facing(0.0, 0.0);
    const auto region = Horizon::earth_region(rotation, kFov, kScreen);

    CHECK(region.coverage == EarthCoverage::Partial);
    REQUIRE(region.polygon.size() == 4);

    // Clockwise from the right-edge crossing: (w, h/2), BR, BL, (0, h/2)
    CHECK(region.polygon[0].x == kScreen.width);
    CHECK(std::abs(region.polygon[0].y - kScreen.height / 2.0) < kCrossingTolPx);
    CHECK(region.polygon[1] == ScreenPoint{kScreen.width, kScreen.height});
    CHECK(region.polygon[2] == ScreenPoint{0.0, kScreen.height});
    CHECK(region.polygon[3].x == 0.0);
    CHECK(std::abs(region.polygon[3].y - kScreen.height / 2.0) < kCrossingTolPx);
}

TEST_CASE("Looking straight up: no earth")
{
    const auto region = Horizon::earth_region(Projector::rotation_facing(0.0, 90.0), kFov, kScreen);

    CHECK(region.coverage == EarthCoverage::None);
    CHECK(region.polygon.empty());
}

TEST_CASE("Looking straight down: the whole screen is earth")
{
    const auto region = Horizon::earth_region(Projector::rotation_facing(0.0, -90.0), kFov, kScreen);

    CHECK(region.coverage == EarthCoverage::Full);
    REQUIRE(region.polygon.size() == 4);
    CHECK(region.polygon[0] == ScreenPoint{0.0, 0.0});
    CHECK(region.polygon[2] == ScreenPoint{kScreen.width, kScreen.height});
}

TEST_CASE("Rolled device: horizon crosses the top and bottom edges")
{
    // Roll the level device 75° about its forward axis
    const auto level = Projector::rotation_facing(0.0, 0.0);
    const f64 roll = 75.0 * astro_constants::kDegToRad;
    const RotationMatrix roll_z = Projector::rotation_from_rows(
        Vec3d{std::cos(roll), std::sin(roll), 0.0},
        Vec3d{-std::sin(roll), std::cos(roll), 0.0},
        Vec3d{0.0, 0.0, 1.0});
    const auto rotation = roll_z * level;

    const auto region = Horizon::earth_region(rotation, kFov, kScreen);
    CHECK(region.coverage == EarthCoverage::Partial);

    // TL corner, top-edge crossing, bottom-edge crossing, BL corner
    REQUIRE(region.polygon.size() == 4);
    CHECK(region.polygon[0] == ScreenPoint{0.0, 0.0});
    CHECK(region.polygon[1].y == 0.0);
    CHECK(region.polygon[2].y == kScreen.height);
    CHECK(region.polygon[3] == ScreenPoint{0.0, kScreen.height});

    // Both crossings lie on the horizon: their rays have zero world elevation
    for (std::size_t i = 1; i <= 2; ++i)
    {
        const auto ray = Projector::screen_ray(region.polygon[i], rotation, kFov, kScreen);
        CHECK(std::abs(ray.z) < 1e-4);
    }
}

TEST_CASE("Fewer bisection iterations give a coarser crossing")
{
    const auto rotation = Projector::rotation_facing(0.0, 10.0);
    const auto fine = Horizon::earth_region(rotation, kFov, kScreen, 20);
    const auto coarse = Horizon::earth_region(rotation, kFov, kScreen, 2);

    REQUIRE(fine.polygon.size() == coarse.polygon.size());
    CHECK(std::abs(fine.polygon[0].y - coarse.polygon[0].y) > kCrossingTolPx);
}
