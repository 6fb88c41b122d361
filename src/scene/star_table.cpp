/// @file star_table.cpp
/// @brief Seeded generation of the decorative star table.

#include "scene/star_table.hpp"

namespace skyradar::scene
{

StarTable::StarTable(u32 count, u64 seed)
{
    PcgRng rng(seed);
    m_stars.reserve(count);

    for (u32 i = 0; i < count; ++i)
    {
        // Draw order is fixed: x, y, radius, opacity
        const f64 x = rng.next_double();
        const f64 y = rng.next_double();
        const f64 radius = rng.next_in_range(1.0, 2.0);
        const f64 opacity = rng.next_in_range(0.3, 0.6);

        m_stars.push_back(TableStar{.x = x, .y = y, .radius = radius, .opacity = opacity});
    }
}

} // namespace skyradar::scene
