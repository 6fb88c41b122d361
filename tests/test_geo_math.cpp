/// @file test_geo_math.cpp
/// @brief Unit tests for skyradar::geo::GeoMath.
///
/// Reference distances and bearings between world cities, angle wrapping,
/// field-of-view edges and the two below-horizon elevation models.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "geo/geo_math.hpp"
#include "core/types.hpp"

#include <cmath>
#include <limits>

using namespace skyradar;
using namespace skyradar::geo;

// =================================================================
// Reference points and tolerances
// =================================================================

static constexpr GeoPoint kNewYork{40.7128, -74.0060};
static constexpr GeoPoint kLondon{51.5074, -0.1278};
static constexpr GeoPoint kLosAngeles{34.0522, -118.2437};
static constexpr GeoPoint kSydney{-33.8688, 151.2093};

static constexpr f64 kBearingTolDeg = 5.0;
static constexpr f64 kDistanceTolKm = 50.0;

// =================================================================
// Distance
// =================================================================

TEST_CASE("New York to London is about 5,570 km")
{
    CHECK(std::abs(GeoMath::distance(kNewYork, kLondon) / 1000.0 - 5570.0) < kDistanceTolKm);
}

TEST_CASE("New York to Los Angeles is about 3,940 km")
{
    CHECK(std::abs(GeoMath::distance(kNewYork, kLosAngeles) / 1000.0 - 3940.0) < kDistanceTolKm);
}

TEST_CASE("Sydney to London is about 16,990 km")
{
    CHECK(std::abs(GeoMath::distance(kSydney, kLondon) / 1000.0 - 16990.0) < 2.0 * kDistanceTolKm);
}

TEST_CASE("Distance is symmetric")
{
    CHECK(GeoMath::distance(kLondon, kSydney) == doctest::Approx(GeoMath::distance(kSydney, kLondon)));
}

TEST_CASE("Identical points: distance 0 and bearing 0")
{
    CHECK(GeoMath::distance(kNewYork, kNewYork) == 0.0);
    CHECK(GeoMath::bearing(kNewYork, kNewYork) == 0.0);
}

TEST_CASE("Distance scales with the sphere radius")
{
    const f64 unit = GeoMath::distance({0.0, 0.0}, {0.0, 90.0}, 1.0);
    CHECK(unit == doctest::Approx(astro_constants::kHalfPi).epsilon(1e-12));
}

// =================================================================
// Bearing
// =================================================================

TEST_CASE("New York to London bears about 51° (NE)")
{
    CHECK(std::abs(GeoMath::bearing(kNewYork, kLondon) - 51.0) < kBearingTolDeg);
}

TEST_CASE("London to New York bears about 288° (WNW)")
{
    CHECK(std::abs(GeoMath::bearing(kLondon, kNewYork) - 288.0) < kBearingTolDeg);
}

TEST_CASE("Cardinal bearings along meridian and equator")
{
    CHECK(GeoMath::bearing({0.0, 0.0}, {10.0, 0.0}) == doctest::Approx(0.0));
    CHECK(GeoMath::bearing({0.0, 0.0}, {0.0, 10.0}) == doctest::Approx(90.0));
    CHECK(GeoMath::bearing({10.0, 0.0}, {0.0, 0.0}) == doctest::Approx(180.0));
    CHECK(GeoMath::bearing({0.0, 10.0}, {0.0, 0.0}) == doctest::Approx(270.0));
}

TEST_CASE("Bearing is always in [0, 360)")
{
    const GeoPoint points[] = {kNewYork, kLondon, kLosAngeles, kSydney, {89.9, 0.0}, {-89.9, 179.9}};

    for (const auto& a : points)
    {
        for (const auto& b : points)
        {
            const f64 bearing = GeoMath::bearing(a, b);
            CHECK(bearing >= 0.0);
            CHECK(bearing < 360.0);
        }
    }
}

// =================================================================
// Angle wrapping
// =================================================================

TEST_CASE("normalize_angle wraps into [-180, 180]")
{
    CHECK(GeoMath::normalize_angle(190.0) == doctest::Approx(-170.0));
    CHECK(GeoMath::normalize_angle(-190.0) == doctest::Approx(170.0));
    CHECK(GeoMath::normalize_angle(720.0 + 45.0) == doctest::Approx(45.0));
    CHECK(GeoMath::normalize_angle(180.0) == 180.0);
    CHECK(GeoMath::normalize_angle(-180.0) == -180.0);
    CHECK(GeoMath::normalize_angle(0.0) == 0.0);
}

TEST_CASE("normalize_angle is idempotent")
{
    const f64 samples[] = {
        0.0, 45.0, -45.0, 179.999, -179.999, 180.0, -180.0, 181.0, -181.0,
        359.0, 360.0, -360.0, 540.0, -540.0, 725.5, -725.5,
        360.0 * 1000.0 + 12.5, -360.0 * 1000.0 - 12.5, 1e9, -1e9,
    };

    for (const f64 x : samples)
    {
        const f64 once = GeoMath::normalize_angle(x);
        CHECK(once >= -180.0);
        CHECK(once <= 180.0);
        CHECK(GeoMath::normalize_angle(once) == once);
    }

    for (f64 x = -1080.0; x <= 1080.0; x += 7.25)
    {
        const f64 once = GeoMath::normalize_angle(x);
        CHECK(GeoMath::normalize_angle(once) == once);
    }
}

TEST_CASE("relative_bearing: positive right, negative left, across north")
{
    CHECK(GeoMath::relative_bearing(10.0, 350.0) == doctest::Approx(20.0));
    CHECK(GeoMath::relative_bearing(350.0, 10.0) == doctest::Approx(-20.0));
    CHECK(GeoMath::relative_bearing(90.0, 90.0) == 0.0);
}

TEST_CASE("wrap_degrees maps into [0, 360)")
{
    CHECK(GeoMath::wrap_degrees(-90.0) == doctest::Approx(270.0));
    CHECK(GeoMath::wrap_degrees(360.0) == 0.0);
    CHECK(GeoMath::wrap_degrees(-1e-15) < 360.0);
}

// =================================================================
// Horizontal field of view
// =================================================================

TEST_CASE("FOV check is inclusive at the edge")
{
    CHECK(GeoMath::is_within_horizontal_fov(30.0, 0.0, 60.0));
    CHECK(GeoMath::is_within_horizontal_fov(330.0, 0.0, 60.0));
    CHECK_FALSE(GeoMath::is_within_horizontal_fov(30.01, 0.0, 60.0));
    CHECK_FALSE(GeoMath::is_within_horizontal_fov(180.0, 0.0, 60.0));
}

TEST_CASE("FOV edge holds for any heading")
{
    constexpr f64 kFov = 60.0;
    constexpr f64 kEpsilon = 0.01;

    for (f64 heading = 0.0; heading < 360.0; heading += 17.0)
    {
        CAPTURE(heading);
        CHECK(GeoMath::is_within_horizontal_fov(heading + kFov / 2.0 - kEpsilon, heading, kFov));
        CHECK(GeoMath::is_within_horizontal_fov(heading - kFov / 2.0 + kEpsilon, heading, kFov));
        CHECK_FALSE(GeoMath::is_within_horizontal_fov(heading + kFov / 2.0 + kEpsilon, heading, kFov));
        CHECK_FALSE(GeoMath::is_within_horizontal_fov(heading - kFov / 2.0 - kEpsilon, heading, kFov));
    }
}

TEST_CASE("FOV check handles the wrap at north")
{
    CHECK(GeoMath::is_within_horizontal_fov(5.0, 355.0, 60.0));
    CHECK(GeoMath::is_within_horizontal_fov(355.0, 5.0, 60.0));
}

// =================================================================
// Elevation models
// =================================================================

TEST_CASE("True elevation: zero at the observer, negative beyond")
{
    CHECK(GeoMath::true_elevation_angle(0.0) == 0.0);
    CHECK(GeoMath::true_elevation_angle(100.0) < 0.0);
}

TEST_CASE("True elevation: 1000 km is about 4.5° below the horizon")
{
    const f64 deg = GeoMath::true_elevation_angle(1'000'000.0) * astro_constants::kRadToDeg;
    CHECK(std::abs(deg - (-4.5)) < 0.5);
}

TEST_CASE("True elevation saturates at -90° beyond the antipode")
{
    const f64 antipode = astro_constants::kPi * geo_constants::kEarthRadiusM;

    CHECK(GeoMath::true_elevation_angle(antipode) == doctest::Approx(-astro_constants::kHalfPi));
    CHECK(GeoMath::true_elevation_angle(3.0 * antipode) == -astro_constants::kHalfPi);
}

TEST_CASE("True elevation decreases monotonically with distance")
{
    f64 previous = GeoMath::true_elevation_angle(0.0);
    for (f64 d = 500'000.0; d <= 20'000'000.0; d += 500'000.0)
    {
        const f64 current = GeoMath::true_elevation_angle(d);
        CHECK(current <= previous);
        previous = current;
    }
}

TEST_CASE("Scaled elevation is linear then clamps at the maximum angle")
{
    const f64 max_rad = 20.0 * astro_constants::kDegToRad;

    CHECK(GeoMath::scaled_elevation_angle(0.0) == 0.0);
    CHECK(GeoMath::scaled_elevation_angle(10'000'000.0) == doctest::Approx(-max_rad / 2.0));
    CHECK(GeoMath::scaled_elevation_angle(20'000'000.0) == doctest::Approx(-max_rad));
    CHECK(GeoMath::scaled_elevation_angle(40'000'000.0) == doctest::Approx(-max_rad));
}

// =================================================================
// Compass labels
// =================================================================

TEST_CASE("Cardinal direction labels")
{
    CHECK(GeoMath::cardinal_direction(0.0) == "N");
    CHECK(GeoMath::cardinal_direction(22.4) == "N");
    CHECK(GeoMath::cardinal_direction(22.6) == "NE");
    CHECK(GeoMath::cardinal_direction(90.0) == "E");
    CHECK(GeoMath::cardinal_direction(225.0) == "SW");
    CHECK(GeoMath::cardinal_direction(350.0) == "N");
    CHECK(GeoMath::cardinal_direction(-45.0) == "NW");
}

TEST_CASE("cardinal_direction falls back to N for non-finite headings")
{
    CHECK(GeoMath::cardinal_direction(std::nan("")) == "N");
    CHECK(GeoMath::cardinal_direction(std::numeric_limits<f64>::infinity()) == "N");
}
