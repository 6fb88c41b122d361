/// @file display_format.cpp
/// @brief Distance and staleness label formatting.

#include "scene/display_format.hpp"

#include <spdlog/fmt/fmt.h>

namespace skyradar::scene
{

namespace
{

constexpr f64 kFeetPerMeter = 3.28084;
constexpr f64 kMetersPerMile = 1609.344;
constexpr f64 kFeetThresholdMiles = 0.1;

} // anonymous namespace

// Whole meters and feet are truncated, not rounded
std::string format_distance(f64 meters, DistanceUnit unit)
{
    if (unit == DistanceUnit::Miles)
    {
        const f64 miles = meters / kMetersPerMile;
        if (miles < kFeetThresholdMiles)
        {
            return fmt::format("{} ft", static_cast<i64>(meters * kFeetPerMeter));
        }
        return fmt::format("{:.1f} mi", miles);
    }

    if (meters < 1000.0)
    {
        return fmt::format("{} m", static_cast<i64>(meters));
    }
    return fmt::format("{:.1f} km", meters / 1000.0);
}

std::string last_seen_text(f64 age_seconds)
{
    if (age_seconds < 60.0)
    {
        return "Updated just now";
    }

    const auto minutes = static_cast<i64>(age_seconds / 60.0);
    if (minutes < 60)
    {
        return fmt::format("Updated {}m ago", minutes);
    }

    const i64 hours = minutes / 60;
    if (hours < 24)
    {
        return fmt::format("Updated {}h ago", hours);
    }

    return fmt::format("Updated {}d ago", hours / 24);
}

} // namespace skyradar::scene
