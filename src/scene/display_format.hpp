#pragma once

/// @file display_format.hpp
/// @brief Short human-readable labels shown next to radar markers.

#include "core/types.hpp"

#include <string>

namespace skyradar::scene
{
    enum class DistanceUnit : u8
    {
        Kilometers,
        Miles,
    };

    /// @brief "850 m" / "12.3 km", or "300 ft" / "7.6 mi" in miles mode.
    [[nodiscard]] std::string format_distance(f64 meters, DistanceUnit unit = DistanceUnit::Kilometers);

    /// @brief "Updated just now", "Updated 5m ago", "Updated 3h ago", "Updated 2d ago".
    /// Negative ages (clock skew) read as "just now".
    [[nodiscard]] std::string last_seen_text(f64 age_seconds);

} // namespace skyradar::scene
