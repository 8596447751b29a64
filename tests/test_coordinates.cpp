/// @file test_coordinates.cpp
/// @brief Unit tests for sexagesimal parsing, J2000 file names and
///        angular separations.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "xraylc/Coordinates.hpp"

#include <stdexcept>

using namespace xraylc;

/// 0.01 arcsec in degrees
static constexpr Real kTol = 0.01 / 3600.0;

TEST_CASE("Sexagesimal to degrees")
{
    SUBCASE("M33 field source")
    {
        const SkyPosition p = to_degrees("01 33 51.02 +30 38 29.4");
        CHECK(p.ra  == doctest::Approx(23.462583333).epsilon(kTol));
        CHECK(p.dec == doctest::Approx(30.641500000).epsilon(kTol));
    }
    SUBCASE("colon separators and southern declination")
    {
        const SkyPosition p = to_degrees("12:00:00.0 -45:30:00");
        CHECK(p.ra  == doctest::Approx(180.0));
        CHECK(p.dec == doctest::Approx(-45.5));
    }
    SUBCASE("negative zero degrees keeps its sign")
    {
        const SkyPosition p = to_degrees("00 00 00 -00 30 00");
        CHECK(p.dec == doctest::Approx(-0.5));
    }
}

TEST_CASE("Malformed sexagesimal strings")
{
    CHECK_THROWS_AS(to_degrees("01 33 51.02 30 38 29.4"), std::invalid_argument);
    CHECK_THROWS_AS(to_degrees("01 33 +30 38 29.4"), std::invalid_argument);
    CHECK_THROWS_AS(to_degrees("25 00 00 +10 00 00"), std::invalid_argument);
    CHECK_THROWS_AS(to_degrees("01 61 00 +10 00 00"), std::invalid_argument);
    CHECK_THROWS_AS(to_degrees("01 00 00 +91 00 00"), std::invalid_argument);
    CHECK_THROWS_AS(to_degrees("01 aa 00 +10 00 00"), std::invalid_argument);
}

TEST_CASE("Archive file names")
{
    SUBCASE("designation and ObsID")
    {
        const SourceName sn = parse_source_name("/data/m33/J013351.02+303829.4_1730_lc.fits");
        CHECK(sn.designation == "J013351.02+303829.4");
        CHECK(sn.sexagesimal == "01 33 51.02 +30 38 29.4");
        CHECK(sn.position.ra  == doctest::Approx(23.462583333).epsilon(kTol));
        CHECK(sn.position.dec == doctest::Approx(30.6415).epsilon(kTol));
        REQUIRE(sn.obsid.has_value());
        CHECK(*sn.obsid == 1730);
    }
    SUBCASE("southern source, no ObsID")
    {
        const SourceName sn = parse_source_name("J004231.20-411621.7.txt");
        CHECK(sn.designation == "J004231.20-411621.7");
        CHECK(sn.position.dec == doctest::Approx(-41.272694444).epsilon(kTol));
        CHECK_FALSE(sn.obsid.has_value());
    }
    SUBCASE("non-numeric second token")
    {
        const SourceName sn = parse_source_name("J004231.20-411621.7_lc.txt");
        CHECK(sn.position.dec < 0.0);
        CHECK_FALSE(sn.obsid.has_value());
    }
    CHECK_THROWS_AS(parse_source_name("obs_1730_lc.fits"), std::invalid_argument);
    CHECK_THROWS_AS(parse_source_name("J0133_1730_lc.fits"), std::invalid_argument);
}

TEST_CASE("Angular separation")
{
    CHECK(angular_separation({10.0, 20.0}, {10.0, 20.0}) == doctest::Approx(0.0));
    CHECK(angular_separation({0.0, 0.0}, {90.0, 0.0}) == doctest::Approx(90.0));
    CHECK(angular_separation({0.0, 90.0}, {123.0, -90.0}) == doctest::Approx(180.0));
    CHECK(angular_separation({359.9, 0.0}, {0.1, 0.0}) == doctest::Approx(0.2));

    // 1 arcsec in declination
    CHECK(angular_separation({50.0, 10.0}, {50.0, 10.0 + 1.0 / 3600.0})
          == doctest::Approx(1.0 / 3600.0).epsilon(1e-6));
    CHECK(angular_separation({1.0, 2.0}, {3.0, 4.0})
          == doctest::Approx(angular_separation({3.0, 4.0}, {1.0, 2.0})));
}
