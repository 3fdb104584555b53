#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct MapConfig {
    struct MapFiles {
        std::string provinces = "map/provinces.bmp";
        std::string definitions = "map/definition.csv";
        std::string terrain = "map/terrain.bmp";
        std::string trees = "map/trees.bmp";
        std::string rivers = "map/rivers.bmp";
        std::string terrainDefinition = "data/terrain.toml";
        std::vector<int> seas;
        std::vector<int> lakes;
    } map{};

    struct Terrain {
        int treeVoteWeight = 2;         // trees count double; empirically approximate
        int treeTiebreakOffset = 255;   // keeps every tree tiebreak behind every terrain tiebreak
        std::vector<int> excludedTreeIndices = {12, 27, 28, 29, 30}; // palms and savanna
        int riverSuppressMin = 3;       // exclusive
        int riverSuppressMax = 254;     // exclusive
        int terrainIgnoreIndex = 255;
        int noTreeIndex = 0;
        std::string fallbackCategory = "pti";
        bool parallel = true;
    } terrain{};

    struct Provinces {
        bool doubleMap = false;
        bool warnUnrecognizedColors = true;
    } provinces{};

    struct Borders {
        enum class Mode {
            Single,
            Double
        };
        enum class Source {
            Provinces,
            Terrain
        };
        Mode mode = Mode::Double;
        bool thick = false;
        Source source = Source::Provinces;
        std::vector<int> exclude;
        int borderValue = 0;
        int backgroundValue = 255;
    } borders{};

    struct Output {
        std::string dir = "out";
        bool dumpTreeLayer = false;
    } output{};
};

struct MapContext {
    MapConfig config;
    std::string configPath;
    std::string configHash;

    explicit MapContext(const std::string& runtimeConfigPath = "data/provmap.toml");

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    bool loadConfigFromString(const std::string& text, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);
};
