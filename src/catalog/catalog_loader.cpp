/// @file catalog_loader.cpp
/// @brief Implementation of the CSV catalog loaders.

#include "catalog/catalog_loader.hpp"

#include "core/logger.hpp"

#include <charconv>
#include <fstream>
#include <string>
#include <unordered_set>

namespace skyradar::catalog
{

// -----------------------------------------------------------------
// Landmarks: Id,Name,Icon,Lat_deg,Lon_deg,City,Country
// -----------------------------------------------------------------

std::optional<std::vector<Landmark>>
CatalogLoader::load_landmarks_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SKR_CORE_ERROR("CatalogLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        SKR_CORE_ERROR("CatalogLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    std::vector<Landmark> landmarks;
    std::unordered_set<std::string> seen_ids;
    u32 line_number = 1;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty())
        {
            continue;
        }

        const auto fields = split_row(line, 7);
        if (!fields)
        {
            SKR_CORE_WARN("CatalogLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const auto& f = *fields;
        const auto lat = parse_f64(f[3]);
        const auto lon = parse_f64(f[4]);

        if (f[0].empty() || !lat || !lon)
        {
            SKR_CORE_WARN("CatalogLoader: Failed to parse values on line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        if (!seen_ids.emplace(f[0]).second)
        {
            SKR_CORE_WARN("CatalogLoader: Duplicate landmark id '{}' on line {}", f[0], line_number);
            ++skipped;
            continue;
        }

        landmarks.push_back(Landmark{
            .id       = std::string(f[0]),
            .name     = std::string(f[1]),
            .icon     = std::string(f[2]),
            .position = geo::GeoPoint{.latitude_deg = *lat, .longitude_deg = *lon},
            .city     = std::string(f[5]),
            .country  = std::string(f[6]),
        });
    }

    if (landmarks.empty())
    {
        SKR_CORE_ERROR("CatalogLoader: No valid landmarks found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        SKR_CORE_WARN("CatalogLoader: Skipped {} malformed lines", skipped);
    }

    SKR_CORE_INFO("CatalogLoader: Loaded {} landmarks from {}", landmarks.size(), path.string());

    return landmarks;
}

// -----------------------------------------------------------------
// Continents: Continent,Lat_deg,Lon_deg
// -----------------------------------------------------------------

std::optional<std::vector<ContinentOutline>>
CatalogLoader::load_continents_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SKR_CORE_ERROR("CatalogLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string line;

    if (!std::getline(file, line))
    {
        SKR_CORE_ERROR("CatalogLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    std::vector<ContinentOutline> outlines;
    u32 line_number = 1;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty())
        {
            continue;
        }

        const auto fields = split_row(line, 3);
        const auto lat = fields ? parse_f64((*fields)[1]) : std::nullopt;
        const auto lon = fields ? parse_f64((*fields)[2]) : std::nullopt;

        if (!fields || (*fields)[0].empty() || !lat || !lon)
        {
            SKR_CORE_WARN("CatalogLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const std::string_view name = (*fields)[0];
        if (outlines.empty() || outlines.back().name != name)
        {
            outlines.push_back(ContinentOutline{.name = std::string(name), .vertices = {}});
        }

        outlines.back().vertices.push_back(geo::GeoPoint{.latitude_deg = *lat, .longitude_deg = *lon});
    }

    if (outlines.empty())
    {
        SKR_CORE_ERROR("CatalogLoader: No valid outline vertices found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        SKR_CORE_WARN("CatalogLoader: Skipped {} malformed lines", skipped);
    }

    SKR_CORE_INFO("CatalogLoader: Loaded {} continent outlines from {}", outlines.size(), path.string());

    return outlines;
}

// -----------------------------------------------------------------
// Utility: split a row on commas into exactly `count` fields
// -----------------------------------------------------------------

std::optional<std::vector<std::string_view>>
CatalogLoader::split_row(std::string_view line, std::size_t count)
{
    std::vector<std::string_view> fields;
    fields.reserve(count);

    while (true)
    {
        const auto comma = line.find(',');
        fields.push_back(trim(line.substr(0, comma)));

        if (comma == std::string_view::npos)
        {
            break;
        }
        line.remove_prefix(comma + 1);
    }

    if (fields.size() != count)
    {
        return std::nullopt;
    }
    return fields;
}

std::string_view CatalogLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

std::optional<f64> CatalogLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace skyradar::catalog
