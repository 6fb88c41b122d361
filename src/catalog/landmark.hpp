#pragma once

/// @file landmark.hpp
/// @brief Static points of interest and continent outlines.

#include "core/types.hpp"
#include "geo/geo_math.hpp"

#include <string>
#include <vector>

namespace skyradar::catalog
{
    /// @brief A famous place shown on the radar.
    struct Landmark
    {
        std::string id;         ///< Stable key, also used by the enabled/disabled settings set
        std::string name;
        std::string icon;       ///< UTF-8 glyph drawn by the presentation layer
        geo::GeoPoint position;
        std::string city;
        std::string country;
    };

    /// @brief Simplified continent outline drawn below the horizon.
    struct ContinentOutline
    {
        std::string name;
        std::vector<geo::GeoPoint> vertices;   ///< Closed ring (first == last in the shipped data)
    };

} // namespace skyradar::catalog
