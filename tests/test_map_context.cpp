// tests/test_map_context.cpp (doctest)

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>

#include "map_context.h"

TEST_SUITE("map_context") {

TEST_CASE("empty config path keeps the built-in defaults") {
    MapContext ctx("");
    CHECK(ctx.configHash == "defaults");
    CHECK(ctx.config.terrain.treeVoteWeight == 2);
    CHECK(ctx.config.terrain.treeTiebreakOffset == 255);
    CHECK(ctx.config.terrain.excludedTreeIndices == std::vector<int>{12, 27, 28, 29, 30});
    CHECK(ctx.config.terrain.riverSuppressMin == 3);
    CHECK(ctx.config.terrain.riverSuppressMax == 254);
    CHECK(ctx.config.terrain.fallbackCategory == "pti");
    CHECK(ctx.config.borders.mode == MapConfig::Borders::Mode::Double);
    CHECK(ctx.config.borders.source == MapConfig::Borders::Source::Provinces);
    CHECK(ctx.config.output.dir == "out");
}

TEST_CASE("toml sections override only the keys they set") {
    MapContext ctx("");
    std::string err;
    const char* text = R"(
[map]
provinces = "maps/p.bmp"
seas = [1, 2, 3]
lakes = [9]

[terrain]
treeVoteWeight = 3
excludedTreeIndices = [12, 400, -1]
parallel = false

[borders]
mode = "Single"
source = "terrain"
thick = true
exclude = [5, 6]

[output]
dir = "build/out"
dumpTreeLayer = true
)";
    REQUIRE_MESSAGE(ctx.loadConfigFromString(text, &err), err);
    CHECK(ctx.config.map.provinces == "maps/p.bmp");
    CHECK(ctx.config.map.definitions == "map/definition.csv");
    CHECK(ctx.config.map.seas == std::vector<int>{1, 2, 3});
    CHECK(ctx.config.map.lakes == std::vector<int>{9});
    CHECK(ctx.config.terrain.treeVoteWeight == 3);
    CHECK(ctx.config.terrain.excludedTreeIndices == std::vector<int>{12});
    CHECK_FALSE(ctx.config.terrain.parallel);
    CHECK(ctx.config.terrain.noTreeIndex == 0);
    CHECK(ctx.config.borders.mode == MapConfig::Borders::Mode::Single);
    CHECK(ctx.config.borders.source == MapConfig::Borders::Source::Terrain);
    CHECK(ctx.config.borders.thick);
    CHECK(ctx.config.borders.exclude == std::vector<int>{5, 6});
    CHECK(ctx.config.output.dir == "build/out");
    CHECK(ctx.config.output.dumpTreeLayer);
}

TEST_CASE("out-of-range values are clamped") {
    MapContext ctx("");
    REQUIRE(ctx.loadConfigFromString("[terrain]\ntreeTiebreakOffset = 10\nnoTreeIndex = 999\n[borders]\nborderValue = -4\n"));
    CHECK(ctx.config.terrain.treeTiebreakOffset == 255);
    CHECK(ctx.config.terrain.noTreeIndex == 255);
    CHECK(ctx.config.borders.borderValue == 0);
}

TEST_CASE("parse errors report and fall back to defaults") {
    MapContext ctx("");
    std::string err;
    CHECK_FALSE(ctx.loadConfigFromString("[terrain\ntreeVoteWeight = 7\n", &err));
    CHECK(err.find("Failed to parse config") != std::string::npos);
    CHECK(ctx.config.terrain.treeVoteWeight == 2);
}

TEST_CASE("config files are hashed for provenance") {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "provmap_test_config.toml";
    {
        std::ofstream out(path);
        out << "[provinces]\ndoubleMap = true\n";
    }
    MapContext ctx(path.string());
    CHECK(ctx.config.provinces.doubleMap);
    CHECK(ctx.configHash == MapContext::hashFileFNV1a(path.string()));
    CHECK(ctx.configHash != "defaults");
    CHECK(MapContext::hashFileFNV1a("does/not/exist.toml") == "missing");
    std::filesystem::remove(path);
}

} // TEST_SUITE
