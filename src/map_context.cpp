#include "map_context.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>

#include <toml++/toml.hpp>

namespace {

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    const toml::node_view<const toml::node> view = root[section][key];
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<int>(*v);
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto v = view.value<bool>()) {
            target = *v;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto v = view.value<std::string>()) {
            target = *v;
        }
    }
}

void readTomlIntArray(const toml::table& root,
                      std::string_view section,
                      std::string_view key,
                      std::vector<int>& target) {
    const toml::array* values = root[section][key].as_array();
    if (!values) {
        return;
    }
    std::vector<int> parsed;
    parsed.reserve(values->size());
    for (const auto& node : *values) {
        if (const auto v = node.value<std::int64_t>()) {
            parsed.push_back(static_cast<int>(*v));
        }
    }
    target = std::move(parsed);
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

MapConfig::Borders::Mode parseBorderMode(std::string value) {
    value = toLowerAscii(std::move(value));
    if (value == "single") {
        return MapConfig::Borders::Mode::Single;
    }
    return MapConfig::Borders::Mode::Double;
}

MapConfig::Borders::Source parseBorderSource(std::string value) {
    value = toLowerAscii(std::move(value));
    if (value == "terrain") {
        return MapConfig::Borders::Source::Terrain;
    }
    return MapConfig::Borders::Source::Provinces;
}

void applyConfigTable(const toml::table& root, MapConfig& config) {
    readTomlValue(root, "map", "provinces", config.map.provinces);
    readTomlValue(root, "map", "definitions", config.map.definitions);
    readTomlValue(root, "map", "terrain", config.map.terrain);
    readTomlValue(root, "map", "trees", config.map.trees);
    readTomlValue(root, "map", "rivers", config.map.rivers);
    readTomlValue(root, "map", "terrainDefinition", config.map.terrainDefinition);
    readTomlIntArray(root, "map", "seas", config.map.seas);
    readTomlIntArray(root, "map", "lakes", config.map.lakes);

    readTomlValue(root, "terrain", "treeVoteWeight", config.terrain.treeVoteWeight);
    readTomlValue(root, "terrain", "treeTiebreakOffset", config.terrain.treeTiebreakOffset);
    readTomlIntArray(root, "terrain", "excludedTreeIndices", config.terrain.excludedTreeIndices);
    readTomlValue(root, "terrain", "riverSuppressMin", config.terrain.riverSuppressMin);
    readTomlValue(root, "terrain", "riverSuppressMax", config.terrain.riverSuppressMax);
    readTomlValue(root, "terrain", "terrainIgnoreIndex", config.terrain.terrainIgnoreIndex);
    readTomlValue(root, "terrain", "noTreeIndex", config.terrain.noTreeIndex);
    readTomlValue(root, "terrain", "fallbackCategory", config.terrain.fallbackCategory);
    readTomlValue(root, "terrain", "parallel", config.terrain.parallel);

    readTomlValue(root, "provinces", "doubleMap", config.provinces.doubleMap);
    readTomlValue(root, "provinces", "warnUnrecognizedColors", config.provinces.warnUnrecognizedColors);

    if (const auto mode = root["borders"]["mode"].value<std::string>()) {
        config.borders.mode = parseBorderMode(*mode);
    }
    if (const auto source = root["borders"]["source"].value<std::string>()) {
        config.borders.source = parseBorderSource(*source);
    }
    readTomlValue(root, "borders", "thick", config.borders.thick);
    readTomlIntArray(root, "borders", "exclude", config.borders.exclude);
    readTomlValue(root, "borders", "borderValue", config.borders.borderValue);
    readTomlValue(root, "borders", "backgroundValue", config.borders.backgroundValue);

    readTomlValue(root, "output", "dir", config.output.dir);
    readTomlValue(root, "output", "dumpTreeLayer", config.output.dumpTreeLayer);

    // Palette indices are bytes; the tiebreak offset must clear every terrain index.
    config.terrain.treeVoteWeight = std::max(0, config.terrain.treeVoteWeight);
    config.terrain.treeTiebreakOffset = std::max(255, config.terrain.treeTiebreakOffset);
    config.terrain.riverSuppressMin = std::clamp(config.terrain.riverSuppressMin, -1, 255);
    config.terrain.riverSuppressMax = std::clamp(config.terrain.riverSuppressMax, 0, 256);
    config.terrain.terrainIgnoreIndex = std::clamp(config.terrain.terrainIgnoreIndex, 0, 255);
    config.terrain.noTreeIndex = std::clamp(config.terrain.noTreeIndex, 0, 255);
    config.borders.borderValue = std::clamp(config.borders.borderValue, 0, 255);
    config.borders.backgroundValue = std::clamp(config.borders.backgroundValue, 0, 255);
    config.terrain.excludedTreeIndices.erase(
        std::remove_if(config.terrain.excludedTreeIndices.begin(),
                       config.terrain.excludedTreeIndices.end(),
                       [](int v) { return v < 0 || v > 255; }),
        config.terrain.excludedTreeIndices.end());
}

} // namespace

MapContext::MapContext(const std::string& runtimeConfigPath)
    : config(), configPath(runtimeConfigPath), configHash("defaults") {
    if (!runtimeConfigPath.empty()) {
        std::string err;
        if (!loadConfig(runtimeConfigPath, &err)) {
            std::cerr << "[Config] " << err << " Using built-in defaults.\n";
        }
    }
}

bool MapContext::loadConfig(const std::string& path, std::string* errorMessage) {
    config = MapConfig{};
    configPath = path;
    configHash = "defaults";

    if (path.empty()) {
        return true;
    }

    try {
        const toml::table root = toml::parse_file(path);
        applyConfigTable(root, config);
        configHash = hashFileFNV1a(path);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    config = MapConfig{};
    return false;
}

bool MapContext::loadConfigFromString(const std::string& text, std::string* errorMessage) {
    config = MapConfig{};
    configPath.clear();
    configHash = "inline";
    try {
        const toml::table root = toml::parse(text);
        applyConfigTable(root, config);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config: " << err.description();
            *errorMessage = oss.str();
        }
    }
    config = MapConfig{};
    return false;
}

std::string MapContext::hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}
