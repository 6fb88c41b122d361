/// @file horizon.cpp
/// @brief Implementation of horizon sampling and earth-region bisection.

#include "projection/horizon.hpp"

#include "astro/coordinates.hpp"

#include <array>
#include <cmath>
#include <optional>

namespace skyradar::projection
{

std::vector<ScreenPoint> Horizon::horizon_screen_points(
    const RotationMatrix& rotation,
    const FieldOfView& fov,
    const ScreenSize& screen,
    f64 step_deg)
{
    std::vector<ScreenPoint> points;
    if (!(step_deg > 0.0))
    {
        return points;
    }

    const auto sample_count = static_cast<std::size_t>(std::ceil(360.0 / step_deg));

    std::vector<std::optional<ScreenPoint>> samples;
    samples.reserve(sample_count);

    std::optional<std::size_t> first_hidden;
    for (std::size_t i = 0; i < sample_count; ++i)
    {
        const auto dir = astro::Coordinates::horizontal_to_world(
            astro::HorizontalPosition{.azimuth_deg = static_cast<f64>(i) * step_deg, .elevation_deg = 0.0});

        samples.push_back(Projector::project_to_screen(dir, rotation, fov, screen));
        if (!samples.back() && !first_hidden)
        {
            first_hidden = i;
        }
    }

    // Rotate the walk so it begins after a gap
    const std::size_t start = first_hidden ? (*first_hidden + 1) : 0;

    points.reserve(sample_count);
    for (std::size_t k = 0; k < sample_count; ++k)
    {
        const auto& sample = samples[(start + k) % sample_count];
        if (sample)
        {
            points.push_back(*sample);
        }
    }

    return points;
}

bool Horizon::is_earth_at(
    const ScreenPoint& point,
    const RotationMatrix& rotation,
    const FieldOfView& fov,
    const ScreenSize& screen)
{
    return Projector::screen_ray(point, rotation, fov, screen).z < 0.0;
}

// -----------------------------------------------------------------
// Earth region
//
// The classification flips exactly once along an edge whose endpoints
// disagree (for the attitudes a handheld device reaches), so plain
// bisection on the edge parameter converges to the crossing. Twenty
// iterations put it within edge_length / 2^20 of the true point.
// -----------------------------------------------------------------

EarthRegion Horizon::earth_region(
    const RotationMatrix& rotation,
    const FieldOfView& fov,
    const ScreenSize& screen,
    i32 iterations)
{
    const std::array<ScreenPoint, 4> corners = {
        ScreenPoint{0.0, 0.0},
        ScreenPoint{screen.width, 0.0},
        ScreenPoint{screen.width, screen.height},
        ScreenPoint{0.0, screen.height},
    };

    std::array<bool, 4> is_earth{};
    std::size_t earth_count = 0;
    for (std::size_t i = 0; i < corners.size(); ++i)
    {
        is_earth[i] = is_earth_at(corners[i], rotation, fov, screen);
        earth_count += is_earth[i] ? 1 : 0;
    }

    EarthRegion region;

    if (earth_count == 0)
    {
        region.coverage = EarthCoverage::None;
        return region;
    }

    if (earth_count == corners.size())
    {
        region.coverage = EarthCoverage::Full;
        region.polygon.assign(corners.begin(), corners.end());
        return region;
    }

    region.coverage = EarthCoverage::Partial;

    for (std::size_t i = 0; i < corners.size(); ++i)
    {
        const std::size_t next = (i + 1) % corners.size();

        if (is_earth[i])
        {
            region.polygon.push_back(corners[i]);
        }

        if (is_earth[i] == is_earth[next])
        {
            continue;
        }

        // Bisect on t ∈ [0, 1] along corners[i] → corners[next]
        f64 lo = 0.0;
        f64 hi = 1.0;
        for (i32 iter = 0; iter < iterations; ++iter)
        {
            const f64 mid = 0.5 * (lo + hi);
            const ScreenPoint p = corners[i] + (corners[next] - corners[i]) * mid;

            if (is_earth_at(p, rotation, fov, screen) == is_earth[i])
            {
                lo = mid;
            }
            else
            {
                hi = mid;
            }
        }

        const f64 t = 0.5 * (lo + hi);
        region.polygon.push_back(corners[i] + (corners[next] - corners[i]) * t);
    }

    return region;
}

} // namespace skyradar::projection
