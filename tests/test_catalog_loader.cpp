/// @file test_catalog_loader.cpp
/// @brief Unit tests for skyradar::catalog::CatalogLoader.
///
/// Verifies landmark and continent CSV parsing, error handling,
/// and the catalogs shipped under data/catalogs.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "catalog/catalog_loader.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace skyradar;
using namespace skyradar::catalog;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    skyradar::core::Logger::init({.enable_file = false});
    const int result = doctest::Context(argc, argv).run();
    skyradar::core::Logger::shutdown();
    return result;
}

// =================================================================
// Helper: temporary CSV file removed on scope exit
// =================================================================

class TempCsvFile
{
public:
    explicit TempCsvFile(const std::string& filename, const std::string& content)
        : m_path(std::filesystem::temp_directory_path() / filename)
    {
        std::ofstream file(m_path);
        file << content;
    }

    ~TempCsvFile()
    {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    TempCsvFile(const TempCsvFile&) = delete;
    TempCsvFile& operator=(const TempCsvFile&) = delete;

private:
    std::filesystem::path m_path;
};

static constexpr f64 kDegTol = 1e-9;

static const std::string kLandmarkHeader = "Id,Name,Icon,Lat_deg,Lon_deg,City,Country\n";
static const std::string kContinentHeader = "Continent,Lat_deg,Lon_deg\n";

// =================================================================
// Landmark CSV
// =================================================================

TEST_CASE("Load landmarks CSV")
{
    const TempCsvFile csv("skr_landmarks.csv",
        kLandmarkHeader +
        "eiffel_tower,Eiffel Tower,T,48.8584,2.2945,Paris,France\n"
        "christ_redeemer,Christ the Redeemer,C,-22.9519,-43.2105,Rio de Janeiro,Brazil\n"
    );

    const auto result = CatalogLoader::load_landmarks_csv(csv.path());
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);

    SUBCASE("Eiffel Tower: every column")
    {
        const auto& l = (*result)[0];
        CHECK(l.id == "eiffel_tower");
        CHECK(l.name == "Eiffel Tower");
        CHECK(l.icon == "T");
        CHECK(l.position.latitude_deg == doctest::Approx(48.8584).epsilon(kDegTol));
        CHECK(l.position.longitude_deg == doctest::Approx(2.2945).epsilon(kDegTol));
        CHECK(l.city == "Paris");
        CHECK(l.country == "France");
    }

    SUBCASE("Southern and western coordinates are negative")
    {
        const auto& l = (*result)[1];
        CHECK(l.position.latitude_deg == doctest::Approx(-22.9519).epsilon(kDegTol));
        CHECK(l.position.longitude_deg == doctest::Approx(-43.2105).epsilon(kDegTol));
    }
}

TEST_CASE("Whitespace and CRLF line endings are tolerated")
{
    const TempCsvFile csv("skr_landmarks_crlf.csv",
        "Id,Name,Icon,Lat_deg,Lon_deg,City,Country\r\n"
        " big_ben , Big Ben ,B, 51.5007 ,-0.1246,London,United Kingdom\r\n"
    );

    const auto result = CatalogLoader::load_landmarks_csv(csv.path());
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);
    CHECK((*result)[0].id == "big_ben");
    CHECK((*result)[0].name == "Big Ben");
    CHECK((*result)[0].country == "United Kingdom");
}

TEST_CASE("Malformed landmark lines are skipped, valid lines still loaded")
{
    const TempCsvFile csv("skr_landmarks_bad.csv",
        kLandmarkHeader +
        "colosseum,Colosseum,C,41.8902,12.4922,Rome,Italy\n"
        "bad,Bad,X,north,east,Nowhere,None\n"
        "short,Too Few,X,1.0\n"
        "\n"
        ",No Id,X,1.0,2.0,City,Country\n"
        "acropolis,Acropolis,A,37.9715,23.7257,Athens,Greece\n"
    );

    const auto result = CatalogLoader::load_landmarks_csv(csv.path());
    REQUIRE(result.has_value());
    CHECK(result->size() == 2);
}

TEST_CASE("Duplicate landmark ids keep the first entry")
{
    const TempCsvFile csv("skr_landmarks_dup.csv",
        kLandmarkHeader +
        "taj_mahal,Taj Mahal,T,27.1751,78.0421,Agra,India\n"
        "taj_mahal,Other,O,0.0,0.0,X,Y\n"
    );

    const auto result = CatalogLoader::load_landmarks_csv(csv.path());
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);
    CHECK((*result)[0].name == "Taj Mahal");
}

// =================================================================
// Continent CSV
// =================================================================

TEST_CASE("Consecutive rows with the same name form one outline")
{
    const TempCsvFile csv("skr_continents.csv",
        kContinentHeader +
        "Australia,-10.7,142.5\n"
        "Australia,-39.1,146.4\n"
        "Australia,-10.7,142.5\n"
        "Africa,37.3,9.8\n"
        "Africa,-34.8,20.0\n"
    );

    const auto result = CatalogLoader::load_continents_csv(csv.path());
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);

    CHECK((*result)[0].name == "Australia");
    CHECK((*result)[0].vertices.size() == 3);
    CHECK((*result)[1].name == "Africa");
    CHECK((*result)[1].vertices.size() == 2);
    CHECK((*result)[1].vertices[1].latitude_deg == doctest::Approx(-34.8).epsilon(kDegTol));
}

TEST_CASE("Malformed continent rows are skipped")
{
    const TempCsvFile csv("skr_continents_bad.csv",
        kContinentHeader +
        "Europe,36.0,-5.6\n"
        "Europe,abc,1.0\n"
        "Europe,71.1\n"
        "Europe,59.9,30.3\n"
    );

    const auto result = CatalogLoader::load_continents_csv(csv.path());
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);
    CHECK((*result)[0].vertices.size() == 2);
}

// =================================================================
// Error handling
// =================================================================

TEST_CASE("Non-existent file returns nullopt")
{
    CHECK_FALSE(CatalogLoader::load_landmarks_csv("this_file_does_not_exist.csv").has_value());
    CHECK_FALSE(CatalogLoader::load_continents_csv("this_file_does_not_exist.csv").has_value());
}

TEST_CASE("Empty file returns nullopt")
{
    const TempCsvFile csv("skr_empty.csv", "");
    CHECK_FALSE(CatalogLoader::load_landmarks_csv(csv.path()).has_value());
}

TEST_CASE("Header-only file returns nullopt")
{
    const TempCsvFile landmarks("skr_header_only.csv", kLandmarkHeader);
    const TempCsvFile continents("skr_header_only_c.csv", kContinentHeader);

    CHECK_FALSE(CatalogLoader::load_landmarks_csv(landmarks.path()).has_value());
    CHECK_FALSE(CatalogLoader::load_continents_csv(continents.path()).has_value());
}

// =================================================================
// Shipped catalogs
// =================================================================

#ifdef SKR_DATA_DIR

TEST_CASE("Shipped landmark catalog loads all 21 landmarks")
{
    const auto result = CatalogLoader::load_landmarks_csv(
        std::filesystem::path(SKR_DATA_DIR) / "catalogs" / "landmarks.csv");

    REQUIRE(result.has_value());
    CHECK(result->size() == 21);
    CHECK(result->front().id == "eiffel_tower");
}

TEST_CASE("Shipped continent outlines are closed rings")
{
    const auto result = CatalogLoader::load_continents_csv(
        std::filesystem::path(SKR_DATA_DIR) / "catalogs" / "continents.csv");

    REQUIRE(result.has_value());
    CHECK(result->size() == 6);

    for (const auto& outline : *result)
    {
        REQUIRE(outline.vertices.size() >= 4);
        CHECK(outline.vertices.front().latitude_deg == outline.vertices.back().latitude_deg);
        CHECK(outline.vertices.front().longitude_deg == outline.vertices.back().longitude_deg);
    }
}

#endif
