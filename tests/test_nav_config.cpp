// tests/test_nav_config.cpp
//
// Robustness tests for LoadNavConfig / SaveNavConfig:
//   - Saving creates the directory and round-trips every field
//   - Invalid JSON or a missing file leaves the config untouched
//   - Wrong types are ignored, out-of-range values are clamped

#include <doctest/doctest.h>

#include "trailnav/nav/NavConfig.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using trailnav::nav::NavConfig;

namespace {

fs::path make_unique_temp_dir(const char* tag)
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / (std::string("trailnav_nav_config_tests_") + tag + "_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

void write_text(const fs::path& p, const std::string& text)
{
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << text;
}

} // namespace

TEST_CASE("NavConfig defaults")
{
    const NavConfig cfg;
    CHECK(cfg.nodeSpacing == doctest::Approx(2.0));
    CHECK(cfg.searchRadius == doctest::Approx(200.0));
    CHECK(cfg.connectionRange == doctest::Approx(10.0));
    CHECK(cfg.maxInteriorDistance == doctest::Approx(30.0));
    CHECK(cfg.maxVerticalStep == doctest::Approx(1.5));
    CHECK(cfg.exitSearchRange == 32);
    CHECK(cfg.maxExitCandidates == 3);
    CHECK(cfg.IsRoad(15.0));
    CHECK_FALSE(cfg.IsRoad(15.5));
}

TEST_CASE("SaveNavConfig creates the file and LoadNavConfig round-trips values")
{
    const fs::path file = make_unique_temp_dir("roundtrip") / "nested" / "nav.json";

    NavConfig cfg;
    cfg.nodeSpacing = 3.0;
    cfg.searchRadius = 150.0;
    cfg.offRoadMultiplier = 250.0;
    cfg.exitSearchRange = 12;
    cfg.maxExitCandidates = 5;
    cfg.maxVerticalStep = 1.0;
    cfg.trace = true;

    REQUIRE(trailnav::nav::SaveNavConfig(cfg, file));
    CHECK(fs::exists(file));

    NavConfig loaded;
    REQUIRE(trailnav::nav::LoadNavConfig(loaded, file));
    CHECK(loaded.nodeSpacing == doctest::Approx(3.0));
    CHECK(loaded.searchRadius == doctest::Approx(150.0));
    CHECK(loaded.offRoadMultiplier == doctest::Approx(250.0));
    CHECK(loaded.exitSearchRange == 12);
    CHECK(loaded.maxExitCandidates == 5);
    CHECK(loaded.maxVerticalStep == doctest::Approx(1.0));
    CHECK(loaded.trace);
}

TEST_CASE("LoadNavConfig returns false for missing or invalid files")
{
    const fs::path dir = make_unique_temp_dir("invalid");

    NavConfig cfg;
    cfg.nodeSpacing = 4.0;

    CHECK_FALSE(trailnav::nav::LoadNavConfig(cfg, dir / "does_not_exist.json"));
    CHECK(cfg.nodeSpacing == doctest::Approx(4.0));

    write_text(dir / "broken.json", "{ \"graph\": { \"nodeSpacing\": ");
    CHECK_FALSE(trailnav::nav::LoadNavConfig(cfg, dir / "broken.json"));
    CHECK(cfg.nodeSpacing == doctest::Approx(4.0));

    write_text(dir / "array.json", "[1, 2, 3]");
    CHECK_FALSE(trailnav::nav::LoadNavConfig(cfg, dir / "array.json"));
}

TEST_CASE("LoadNavConfig ignores wrong types and clamps bad values")
{
    const fs::path file = make_unique_temp_dir("clamp") / "nav.json";
    write_text(file, R"({
        // comments are allowed
        "version": 1,
        "graph":    { "nodeSpacing": "wide", "connectionRange": -5, "searchRadius": 80 },
        "interior": { "exitSearchRange": 100000, "maxExitCandidates": 2.5 },
        "smoothing": { "maxVerticalStep": 0 },
        "debug": { "trace": 1 }
    })");

    NavConfig cfg;
    REQUIRE(trailnav::nav::LoadNavConfig(cfg, file));
    CHECK(cfg.nodeSpacing == doctest::Approx(2.0));   // wrong type: kept
    CHECK(cfg.connectionRange == doctest::Approx(1.0)); // clamped up
    CHECK(cfg.searchRadius == doctest::Approx(80.0));
    CHECK(cfg.exitSearchRange == 256);                  // clamped down
    CHECK(cfg.maxExitCandidates == 3);                  // not an integer: kept
    CHECK(cfg.maxVerticalStep == doctest::Approx(0.1));
    CHECK_FALSE(cfg.trace);
}

TEST_CASE("LoadNavConfig reads known keys from newer versions")
{
    const fs::path file = make_unique_temp_dir("newer") / "nav.json";
    write_text(file, R"({ "version": 99, "search": { "verticalPenalty": 9.5, "somethingNew": true } })");

    NavConfig cfg;
    REQUIRE(trailnav::nav::LoadNavConfig(cfg, file));
    CHECK(cfg.verticalPenalty == doctest::Approx(9.5));
}
