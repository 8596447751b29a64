/// @file test_loaders.cpp
/// @brief Unit tests for the text and .clc lightcurve readers.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "xraylc/Errors.hpp"
#include "xraylc/LightcurveLoaders.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace xraylc;
namespace fs = std::filesystem;

namespace {

/// Scratch directory removed when the fixture goes out of scope
struct TempDir
{
    fs::path root;

    TempDir()
    {
        static int counter = 0;
        root = fs::temp_directory_path() / ("xraylc_loaders_" + std::to_string(counter++));
        fs::remove_all(root);
        fs::create_directories(root);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::string write(const std::string& name, const std::string& content) const
    {
        const fs::path p = root / name;
        std::ofstream(p) << content;
        return p.string();
    }
};

} // namespace

TEST_CASE("Archive text table with header and dead time")
{
    TempDir dir;
    const std::string path = dir.write("J013351.02+303829.4_1730_lc.txt",
        "TIME_BIN TIME_MIN TIME TIME_MAX COUNTS STAT_ERR AREA EXPOSURE COUNT_RATE COUNT_RATE_ERR\n"
        "1 100.0 101.6 103.2 2 1.4 1 3.2 0.62 0.44\n"
        "2 103.2 104.8 106.4 0 1.0 1 0.0 0.00 0.00\n"
        "3 106.4 108.0 109.6 5 2.2 1 3.2 1.56 0.70\n"
        "4 109.6 111.2 112.8 1 1.0 1 3.2 0.31 0.31\n");

    const Observation obs = load_ascii_lightcurve(path);

    REQUIRE(obs.size() == 3);
    CHECK(obs.samples()[0].time == doctest::Approx(0.0));
    CHECK(obs.samples()[1].time == doctest::Approx(6.4));
    CHECK(obs.samples()[2].time == doctest::Approx(9.6));
    CHECK(obs.total_counts() == 8);
    CHECK(obs.meta().obsid == 1730);
    CHECK(obs.meta().ra  == doctest::Approx(23.462583).epsilon(1e-6));
    CHECK(obs.meta().dec == doctest::Approx(30.6415).epsilon(1e-6));
}

TEST_CASE("Headerless tables")
{
    TempDir dir;

    SUBCASE("two columns")
    {
        const Observation obs = load_ascii_lightcurve(dir.write("lc2.txt",
            "# time counts\n"
            "10 1\n"
            "\n"
            "20 3\n"
            "30 2\n"));
        CHECK(obs.size() == 3);
        CHECK(obs.total_counts() == 6);
        CHECK(obs.last_time() == doctest::Approx(20.0));
        CHECK(obs.meta().obsid == 0);
    }
    SUBCASE("three columns drop zero exposure")
    {
        const Observation obs = load_ascii_lightcurve(dir.write("lc3.txt",
            "0 1 3.2\n"
            "3.2 4 0\n"
            "6.4 2 3.2\n"));
        CHECK(obs.size() == 2);
        CHECK(obs.total_counts() == 3);
    }
    SUBCASE("ten columns in archive order")
    {
        const Observation obs = load_ascii_lightcurve(dir.write("lc10.txt",
            "1 0.0 1.6 3.2 7 2.6 1 3.2 2.1 0.8\n"
            "2 3.2 4.8 6.4 3 1.7 1 3.2 0.9 0.5\n"));
        CHECK(obs.size() == 2);
        CHECK(obs.samples()[1].time == doctest::Approx(3.2));
        CHECK(obs.samples()[0].counts == 7);
    }
}

TEST_CASE("Malformed text tables")
{
    TempDir dir;
    CHECK_THROWS_AS(load_ascii_lightcurve(dir.write("frac.txt", "0 1.5\n1 2\n")), InvalidObservation);
    CHECK_THROWS_AS(load_ascii_lightcurve(dir.write("dead.txt", "0 1 0\n1 2 0\n")), InvalidObservation);
    CHECK_THROWS_AS(load_ascii_lightcurve(dir.write("ragged.txt", "0 1\n1 2 3\n")), std::runtime_error);
    CHECK_THROWS_AS(load_ascii_lightcurve(dir.write("text.txt", "0 1\n1 x\n")), std::runtime_error);
    CHECK_THROWS_AS(load_ascii_lightcurve(dir.write("four.txt", "0 1 2 3\n")), std::runtime_error);
    CHECK_THROWS_AS(load_ascii_lightcurve(dir.write("empty.txt", "# nothing\n")), std::runtime_error);
    CHECK_THROWS_AS(load_ascii_lightcurve((dir.root / "missing.txt").string()), std::runtime_error);
}

TEST_CASE(".clc files")
{
    TempDir dir;
    const std::string path = dir.write("source.clc", R"({
        "coords": "01 33 51.02 +30 38 29.4",
        "gal":    "M33",
        "obsid":  "6376",
        "band":   "0.5:7.0",
        "t_res":  3.24104,
        "phot":   [0, 1, 0, 2, 1]
    })");

    const Observation obs = load_clc(path);
    REQUIRE(obs.size() == 5);
    CHECK(obs.samples()[4].time == doctest::Approx(4 * 3.24104));
    CHECK(obs.total_counts() == 4);
    CHECK(obs.meta().obsid == 6376);
    CHECK(obs.meta().galaxy == "M33");
    CHECK(obs.meta().energy_band == "0.5:7.0");
    CHECK(obs.meta().ra == doctest::Approx(23.462583).epsilon(1e-6));

    CHECK_THROWS_AS(load_clc(dir.write("nophot.clc", R"({"t_res": 1.0})")), InvalidObservation);
    CHECK_THROWS_AS(load_clc(dir.write("badres.clc", R"({"t_res": 0, "phot": [1]})")), InvalidObservation);
    CHECK_THROWS_AS(load_clc(dir.write("badid.clc", R"({"t_res": 1, "phot": [1], "obsid": "x12"})")),
                    InvalidObservation);
}

TEST_CASE("Format dispatch")
{
    TempDir dir;
    const std::string txt = dir.write("a.txt", "0 1\n1 2\n");
    const std::string clc = dir.write("b.clc", R"({"t_res": 2.0, "phot": [3, 4]})");

    CHECK(load_lightcurve(txt).total_counts() == 3);
    CHECK(load_lightcurve(clc).samples()[1].time == doctest::Approx(2.0));
    CHECK(load_lightcurve(txt, "ascii").size() == 2);

    CHECK_THROWS_AS(load_lightcurve(dir.write("c.fits", "")), std::runtime_error);
    CHECK_THROWS_AS(load_lightcurve(txt, "votable"), std::runtime_error);
}
