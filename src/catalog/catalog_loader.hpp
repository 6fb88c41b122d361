#pragma once

/// @file catalog_loader.hpp
/// @brief Loads the landmark and continent catalogs from CSV files.

#include "catalog/landmark.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace skyradar::catalog
{
    /// @brief Static utility class for loading catalog files.
    ///
    /// Both formats carry a header row, which is skipped. Malformed rows are
    /// logged and skipped; a file that cannot be opened or yields no valid
    /// rows is reported as std::nullopt.
    class CatalogLoader
    {
    public:
        CatalogLoader() = delete;

        /// @brief Load landmarks from a CSV file.
        ///
        /// Expected columns (header row required):
        ///   Id, Name, Icon, Lat_deg, Lon_deg, City, Country
        ///
        /// Rows repeating an earlier Id are skipped.
        [[nodiscard]] static std::optional<std::vector<Landmark>>
            load_landmarks_csv(const std::filesystem::path& path);

        /// @brief Load continent outlines from a CSV file.
        ///
        /// Expected columns (header row required):
        ///   Continent, Lat_deg, Lon_deg
        ///
        /// Consecutive rows with the same Continent name form one outline,
        /// in file order.
        [[nodiscard]] static std::optional<std::vector<ContinentOutline>>
            load_continents_csv(const std::filesystem::path& path);

    private:
        /// @brief Split a CSV row into exactly `count` trimmed fields.
        /// @return The fields, or std::nullopt if the column count differs.
        [[nodiscard]] static std::optional<std::vector<std::string_view>>
            split_row(std::string_view line, std::size_t count);

        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
    };

} // namespace skyradar::catalog
