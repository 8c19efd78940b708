/// @file test_catalog_loader.cpp
/// @brief Unit tests for skychart::catalog::CatalogLoader.
///
/// Verifies CSV parsing, unit conversion to radians, error handling and the
/// cross-references between constellation lines and their bright stars.

#include <doctest/doctest.h>

#include "catalog/catalog_loader.hpp"
#include "catalog/deepsky_object.hpp"
#include "catalog/star_entry.hpp"
#include "core/types.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

using namespace skychart;
using namespace skychart::catalog;

// =================================================================
// Helper: create a temporary CSV file for testing
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

// =================================================================
// Tolerance
// =================================================================

static constexpr f64 kRadTol = 1e-9;
static constexpr f32 kMagTol = 0.01f;

// =================================================================
// Field stars
// =================================================================

TEST_CASE("Load field stars")
{
    const TempCsvFile csv("skychart_test_stars.csv",
        "ID,RA_deg,Dec_deg,Vmag,BV\n"
        "32349,101.287,-16.716,-1.46,0.009\n"
        "91262,279.235,38.784,0.03,0.000\n"
        "11767,37.954,89.264,1.98,\n"
    );

    const auto result = CatalogLoader::load_star_csv(csv.path());

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 3);

    SUBCASE("Sirius: ID, RA, Dec, magnitude, color")
    {
        const auto& sirius = (*result)[0];
        CHECK(sirius.catalog_id == 32349);
        CHECK(sirius.ra  == doctest::Approx(101.287 * astro_constants::kDegToRad).epsilon(kRadTol));
        CHECK(sirius.dec == doctest::Approx(-16.716 * astro_constants::kDegToRad).epsilon(kRadTol));
        CHECK(sirius.mag_v    == doctest::Approx(-1.46f).epsilon(kMagTol));
        CHECK(sirius.color_bv == doctest::Approx(0.009f).epsilon(kMagTol));
        CHECK(sirius.greek.empty());
    }

    SUBCASE("Missing B-V defaults to zero")
    {
        CHECK((*result)[2].color_bv == doctest::Approx(0.0f));
        CHECK((*result)[2].dec == doctest::Approx(89.264 * astro_constants::kDegToRad).epsilon(kRadTol));
    }
}

TEST_CASE("RA 180 deg converts to pi radians, Dec -90 to -pi/2")
{
    const TempCsvFile csv("skychart_test_180_ra.csv",
        "ID,RA_deg,Dec_deg,Vmag,BV\n"
        "1,180.0,-90.0,5.0,0.5\n"
    );

    const auto result = CatalogLoader::load_star_csv(csv.path());

    REQUIRE(result.has_value());
    CHECK((*result)[0].ra  == doctest::Approx(astro_constants::kPi).epsilon(1e-10));
    CHECK((*result)[0].dec == doctest::Approx(-astro_constants::kHalfPi).epsilon(1e-10));
}

// =================================================================
// Deep-sky objects
// =================================================================

TEST_CASE("Load deep-sky objects")
{
    const TempCsvFile csv("skychart_test_deepsky.csv",
        "Cat,Names,Type,RA_deg,Dec_deg,Mag,Rlong_arcmin,Rshort_arcmin,PA_deg,Messier\n"
        "NGC,224,G,10.6847,41.2690,3.4,95.3,30.9,35,31\n"
        "NGC,5195;5194,G,202.4696,47.1952,8.4,5.6,3.5,163,51\n"
        "IC,434,N,85.2458,-2.4583,7.3,30,,,\n"
        "Sh2,155,N,344.25,62.62,,25,20,0,\n"
        "Abell,2151,GALCL,241.3125,17.7486,13.8,28,,,\n"
        "NGC,6543,PN,269.6392,66.6331,8.1,0.3,0.4,,\n"
    );

    const auto result = CatalogLoader::load_deepsky_csv(csv.path());

    REQUIRE(result.has_value());
    // The Sh2 row has no magnitude and is skipped.
    REQUIRE(result->size() == 5);

    SUBCASE("M31: galaxy with sizes, position angle and Messier number")
    {
        const auto& m31 = (*result)[0];
        CHECK(m31.cat == "NGC");
        REQUIRE(m31.names.size() == 1);
        CHECK(m31.names[0] == "224");
        CHECK(m31.type == DsoType::Galaxy);
        CHECK(m31.messier == 31);
        CHECK(m31.rlong  == doctest::Approx(95.3 * astro_constants::kArcMinToRad).epsilon(kRadTol));
        CHECK(m31.rshort == doctest::Approx(30.9 * astro_constants::kArcMinToRad).epsilon(kRadTol));
        CHECK(m31.position_angle == doctest::Approx(35.0 * astro_constants::kDegToRad).epsilon(kRadTol));
    }

    SUBCASE("Names are split on semicolons in file order")
    {
        const auto& m51 = (*result)[1];
        REQUIRE(m51.names.size() == 2);
        CHECK(m51.names[0] == "5195");
        CHECK(m51.names[1] == "5194");
    }

    SUBCASE("Empty optional columns")
    {
        const auto& ic434 = (*result)[2];
        CHECK(ic434.type == DsoType::DiffuseNebula);
        CHECK(ic434.messier == 0);
        CHECK(ic434.rshort == doctest::Approx(ic434.rlong));
        CHECK(ic434.position_angle == doctest::Approx(0.0));
    }

    SUBCASE("Type codes")
    {
        CHECK((*result)[3].type == DsoType::GalaxyCluster);
        CHECK((*result)[4].type == DsoType::PlanetaryNebula);
    }

    SUBCASE("The long axis is never shorter than the short axis")
    {
        const auto& pn = (*result)[4];
        CHECK(pn.rlong >= pn.rshort);
        CHECK(pn.rlong == doctest::Approx(0.4 * astro_constants::kArcMinToRad).epsilon(kRadTol));
    }
}

TEST_CASE("Deep-sky type codes")
{
    CHECK(parse_dso_type("G") == DsoType::Galaxy);
    CHECK(parse_dso_type("OC") == DsoType::OpenCluster);
    CHECK(parse_dso_type("OCL") == DsoType::OpenCluster);
    CHECK(parse_dso_type("GCL") == DsoType::GlobularCluster);
    CHECK(parse_dso_type("SNR") == DsoType::SupernovaRemnant);
    CHECK(parse_dso_type("AST") == DsoType::Asterism);
    CHECK(parse_dso_type("STARS") == DsoType::Asterism);
    CHECK(parse_dso_type("QSO") == DsoType::Unknown);
    CHECK(parse_dso_type("") == DsoType::Unknown);
}

// =================================================================
// Constellations
// =================================================================

TEST_CASE("Load constellation stars and lines")
{
    const TempCsvFile stars("skychart_test_cst_stars.csv",
        "Constellation,Greek,RA_deg,Dec_deg,Vmag\n"
        "And,alp,2.0965,29.0904,2.06\n"
        "And,del,9.8320,30.8610,3.27\n"
        "And,bet,17.4330,35.6206,2.05\n"
        "And,,30.9748,42.3297,2.10\n"
    );
    const TempCsvFile lines("skychart_test_cst_lines.csv",
        "Constellation,From,To\n"
        "And,1,2\n"
        "And,2,3\n"
        "Peg,1,7\n"
        "And,3,4\n"
    );

    const auto catalog = CatalogLoader::load_constellations(stars.path(), lines.path());

    REQUIRE(catalog.has_value());
    REQUIRE(catalog->bright_stars.size() == 4);
    REQUIRE(catalog->constellations.size() == 2);

    SUBCASE("Stars keep Greek letter, constellation and line index")
    {
        const auto& alpheratz = catalog->bright_stars[0];
        CHECK(alpheratz.greek == "alp");
        CHECK(alpheratz.constellation == "And");
        CHECK(alpheratz.catalog_id == 1);
        CHECK(catalog->bright_stars[3].greek.empty());
        CHECK(catalog->bright_stars[3].catalog_id == 4);
    }

    SUBCASE("Lines are grouped per constellation in order of appearance")
    {
        const auto& andromeda = catalog->constellations[0];
        CHECK(andromeda.abbreviation == "And");
        REQUIRE(andromeda.lines.size() == 3);
        CHECK(andromeda.lines[2].first == 3);
        CHECK(andromeda.lines[2].second == 4);
    }

    SUBCASE("Lines referencing unknown stars are dropped")
    {
        const auto& pegasus = catalog->constellations[1];
        CHECK(pegasus.abbreviation == "Peg");
        CHECK(pegasus.lines.empty());
    }

    SUBCASE("Line indices are 1-based")
    {
        CHECK(catalog->star_for_index(0) == nullptr);
        CHECK(catalog->star_for_index(1) == &catalog->bright_stars[0]);
        CHECK(catalog->star_for_index(4) == &catalog->bright_stars[3]);
        CHECK(catalog->star_for_index(5) == nullptr);
    }
}

// =================================================================
// Error handling
// =================================================================

TEST_CASE("Non-existent file returns nullopt")
{
    CHECK_FALSE(CatalogLoader::load_star_csv("this_file_does_not_exist.csv").has_value());
    CHECK_FALSE(CatalogLoader::load_deepsky_csv("this_file_does_not_exist.csv").has_value());
    CHECK_FALSE(CatalogLoader::load_constellations("this_file_does_not_exist.csv",
                                                   "this_file_does_not_exist_either.csv").has_value());
}

TEST_CASE("Header-only file returns nullopt")
{
    const TempCsvFile csv("skychart_test_empty.csv",
        "ID,RA_deg,Dec_deg,Vmag,BV\n"
    );

    CHECK_FALSE(CatalogLoader::load_star_csv(csv.path()).has_value());
}

TEST_CASE("Malformed lines are skipped, valid lines still loaded")
{
    const TempCsvFile csv("skychart_test_malformed.csv",
        "ID,RA_deg,Dec_deg,Vmag,BV\n"
        "1,101.287,-16.716,-1.46,0.009\n"
        "2,not_a_number,bad,bad,bad\n"
        "\n"
        "3,279.235,38.784,0.03,0.000\n"
        "4,101.287\n"
        "x,10.0,10.0,5.0,0.0\n"
    );

    const auto result = CatalogLoader::load_star_csv(csv.path());

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);
    CHECK((*result)[0].catalog_id == 1);
    CHECK((*result)[1].catalog_id == 3);
}

TEST_CASE("Windows line endings are accepted")
{
    const TempCsvFile csv("skychart_test_crlf.csv",
        "ID,RA_deg,Dec_deg,Vmag,BV\r\n"
        "7,10.0,20.0,4.5,0.1\r\n"
    );

    const auto result = CatalogLoader::load_star_csv(csv.path());

    REQUIRE(result.has_value());
    CHECK((*result)[0].color_bv == doctest::Approx(0.1f).epsilon(kMagTol));
}
