#pragma once

/// @file star_table.hpp
/// @brief Fixed decorative night-sky stars, generated once from a seed.

#include "core/types.hpp"

#include <span>
#include <vector>

namespace skyradar::scene
{
    /// @brief PCG-XSH-RR 32/64 pseudorandom generator. Same seed, same sequence.
    class PcgRng
    {
    public:
        explicit PcgRng(u64 seed, u64 stream = 1)
            : m_state(seed + (stream | 1u))
            , m_inc((stream << 1u) | 1u)
        {
            next();
        }

        u32 next()
        {
            const u64 old = m_state;
            m_state = old * 6364136223846793005ULL + m_inc;
            const auto xorshifted = static_cast<u32>(((old >> 18u) ^ old) >> 27u);
            const auto rot = static_cast<u32>(old >> 59u);
            return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
        }

        /// Uniform double in [0, 1)
        f64 next_double() { return static_cast<f64>(next()) / 4294967296.0; }

        /// Uniform double in [lo, hi)
        f64 next_in_range(f64 lo, f64 hi) { return lo + next_double() * (hi - lo); }

    private:
        u64 m_state;
        u64 m_inc;
    };

    /// @brief One decorative star in normalized screen coordinates.
    struct TableStar
    {
        f64 x;          ///< [0, 1) of screen width
        f64 y;          ///< [0, 1) of screen height
        f64 radius;     ///< Points, [1, 2)
        f64 opacity;    ///< [0.3, 0.6)
    };

    /// @brief Immutable star table, a pure function of (count, seed).
    class StarTable
    {
    public:
        StarTable(u32 count, u64 seed);

        [[nodiscard]] std::span<const TableStar> stars() const { return m_stars; }

    private:
        std::vector<TableStar> m_stars;
    };

} // namespace skyradar::scene
