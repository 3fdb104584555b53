#include <SFML/Graphics.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "border_renderer.h"
#include "map_context.h"
#include "palette_raster.h"
#include "province_map.h"
#include "province_recolor.h"
#include "terrain_classifier.h"
#include "terrain_definition.h"

namespace {

struct RunOptions {
    std::string configPath = "data/provmap.toml";
    std::string outDir;
    std::string borderMode;   // empty means "use config value"
    std::string borderSource;
    int thick = -1;           // -1 means "use config value", 0/1 are explicit overrides
    int doubleMap = -1;
    int dumpTreeLayer = -1;
    std::vector<int> exclude;
};

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseBool01(const std::string& s, int& out) {
    if (s == "1" || s == "true" || s == "TRUE") {
        out = 1;
        return true;
    }
    if (s == "0" || s == "false" || s == "FALSE") {
        out = 0;
        return true;
    }
    return false;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "provmap_cli")
              << " [--config path] [--outDir path]\n"
              << "       [--borders single|double] [--thick 0|1] [--border-source provinces|terrain]\n"
              << "       [--exclude ID] (repeatable)\n"
              << "       [--double-map 0|1] [--dump-tree-layer 0|1]\n";
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--outDir") {
            if (!requireValue(opt.outDir)) return false;
        } else if (arg.rfind("--outDir=", 0) == 0) {
            opt.outDir = arg.substr(9);
        } else if (arg == "--borders") {
            if (!requireValue(opt.borderMode)) return false;
            if (opt.borderMode != "single" && opt.borderMode != "double") return false;
        } else if (arg == "--thick") {
            std::string v;
            if (!requireValue(v) || !parseBool01(v, opt.thick)) return false;
        } else if (arg == "--border-source") {
            if (!requireValue(opt.borderSource)) return false;
            if (opt.borderSource != "provinces" && opt.borderSource != "terrain") return false;
        } else if (arg == "--exclude") {
            std::string v;
            int id = 0;
            if (!requireValue(v) || !parseInt(v, id)) return false;
            opt.exclude.push_back(id);
        } else if (arg == "--double-map") {
            std::string v;
            if (!requireValue(v) || !parseBool01(v, opt.doubleMap)) return false;
        } else if (arg == "--dump-tree-layer") {
            std::string v;
            if (!requireValue(v) || !parseBool01(v, opt.dumpTreeLayer)) return false;
        } else {
            std::cerr << "Unknown flag: " << arg << "\n";
            return false;
        }
    }
    return true;
}

void applyOverrides(const RunOptions& opt, MapConfig& config) {
    if (!opt.outDir.empty()) config.output.dir = opt.outDir;
    if (opt.borderMode == "single") config.borders.mode = MapConfig::Borders::Mode::Single;
    if (opt.borderMode == "double") config.borders.mode = MapConfig::Borders::Mode::Double;
    if (opt.borderSource == "provinces") config.borders.source = MapConfig::Borders::Source::Provinces;
    if (opt.borderSource == "terrain") config.borders.source = MapConfig::Borders::Source::Terrain;
    if (opt.thick >= 0) config.borders.thick = (opt.thick != 0);
    if (opt.doubleMap >= 0) config.provinces.doubleMap = (opt.doubleMap != 0);
    if (opt.dumpTreeLayer >= 0) config.output.dumpTreeLayer = (opt.dumpTreeLayer != 0);
    config.borders.exclude.insert(config.borders.exclude.end(), opt.exclude.begin(), opt.exclude.end());
}

struct MapInputs {
    ProvinceColorTable colorTable;
    sf::Image provinceImage;
    PaletteRaster terrain;
    PaletteRaster trees;
    PaletteRaster rivers;
    TerrainDefinition definition;
};

bool loadInputs(const MapConfig& config, MapInputs& inputs, std::string* errorMessage) {
    if (!inputs.colorTable.loadFromCsvFile(config.map.definitions, errorMessage)) return false;
    if (!inputs.provinceImage.loadFromFile(config.map.provinces)) {
        if (errorMessage) *errorMessage = "Could not load province map: " + config.map.provinces;
        return false;
    }
    if (!inputs.terrain.loadFromBmpFile(config.map.terrain, errorMessage)) return false;
    if (!inputs.trees.loadFromBmpFile(config.map.trees, errorMessage)) return false;
    if (!inputs.rivers.loadFromBmpFile(config.map.rivers, errorMessage)) return false;
    return inputs.definition.loadFromTomlFile(config.map.terrainDefinition, config.terrain.fallbackCategory, errorMessage);
}

void reportUnrecognizedColors(const ProvinceMap& provinces) {
    const std::vector<UnrecognizedColor>& unrecognized = provinces.getUnrecognizedColors();
    if (unrecognized.empty()) return;
    std::cerr << "[ProvinceMap] " << unrecognized.size() << " colour(s) on the map are not in the definition file:\n";
    for (const UnrecognizedColor& entry : unrecognized) {
        std::cerr << "[ProvinceMap]   (" << static_cast<int>(entry.color.r) << ", " << static_cast<int>(entry.color.g)
                  << ", " << static_cast<int>(entry.color.b) << ") " << entry.pixelCount << " px\n";
    }
}

void reportUnmappedPixels(const std::vector<TerrainVoteReport>& reports) {
    size_t terrainPixels = 0;
    size_t treePixels = 0;
    size_t affected = 0;
    for (const TerrainVoteReport& report : reports) {
        terrainPixels += report.unmappedTerrainPixels;
        treePixels += report.unmappedTreePixels;
        if (report.unmappedTerrainPixels > 0 || report.unmappedTreePixels > 0) affected++;
    }
    if (affected == 0) return;
    std::cerr << "[Terrain] Skipped " << terrainPixels << " terrain and " << treePixels
              << " tree pixels with unmapped palette indices in " << affected << " province(s).\n";
}

bool writeTerrainCsv(const std::filesystem::path& path,
                     const ProvinceMap& provinces,
                     const TerrainDefinition& definition,
                     const std::vector<TerrainVoteReport>& reports) {
    std::ofstream out(path);
    if (!out) return false;
    out << "id;r;g;b;terrain\n";
    const std::vector<Province>& list = provinces.getProvinces();
    for (size_t i = 0; i < list.size() && i < reports.size(); ++i) {
        const Province& province = list[i];
        out << province.id << ';' << static_cast<int>(province.color.r) << ';' << static_cast<int>(province.color.g)
            << ';' << static_cast<int>(province.color.b) << ';' << definition.getCategory(reports[i].category).name << '\n';
    }
    return static_cast<bool>(out);
}

sf::Image renderBorderRaster(const MapConfig& config,
                             const ProvinceMap& provinces,
                             const ProvinceColorTable& colorTable,
                             const TerrainDefinition& definition,
                             const std::vector<TerrainVoteReport>& reports) {
    BorderStyle style;
    style.border = static_cast<sf::Uint8>(config.borders.borderValue);
    style.background = static_cast<sf::Uint8>(config.borders.backgroundValue);

    sf::Image regions = provinces.getImage();
    if (config.borders.source == MapConfig::Borders::Source::Terrain) {
        ProvinceRecolor recolor(colorTable);
        for (const TerrainVoteReport& report : reports) {
            recolor.set(report.provinceId, definition.getCategory(report.category).displayColor);
        }
        regions = recolor.generate(provinces);
    }

    if (config.borders.mode == MapConfig::Borders::Mode::Single) {
        if (!config.borders.exclude.empty()) {
            std::cerr << "[Borders] Exclusions are ignored for single borders; use --borders double.\n";
        }
        return renderBorders(regions, style);
    }
    sf::Image borders = renderDoubleBorders(regions, config.borders.thick, style);
    excludeRegions(borders, provinces, config.borders.exclude, style);
    return borders;
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }

    MapContext ctx(opt.configPath);
    MapConfig& config = ctx.config;
    applyOverrides(opt, config);
    std::cout << "[Config] " << (ctx.configPath.empty() ? "<defaults>" : ctx.configPath)
              << " hash=" << ctx.configHash << "\n";

    MapInputs inputs;
    std::string error;
    auto loadStart = std::chrono::high_resolution_clock::now();
    if (!loadInputs(config, inputs, &error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    auto loadEnd = std::chrono::high_resolution_clock::now();
    std::cout << "Loaded map inputs in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(loadEnd - loadStart).count() << " ms\n";

    auto segmentStart = std::chrono::high_resolution_clock::now();
    const ProvinceMap provinces(inputs.provinceImage, inputs.colorTable);
    auto segmentEnd = std::chrono::high_resolution_clock::now();
    std::cout << "[ProvinceMap] " << provinces.getProvinces().size() << " provinces on a "
              << provinces.getWidth() << "x" << provinces.getHeight() << " map in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(segmentEnd - segmentStart).count() << " ms\n";
    if (config.provinces.warnUnrecognizedColors) {
        reportUnrecognizedColors(provinces);
    }

    std::unordered_set<int> water(config.map.seas.begin(), config.map.seas.end());
    water.insert(config.map.lakes.begin(), config.map.lakes.end());

    const TerrainClassifier classifier(config.terrain, inputs.definition, provinces, inputs.terrain, inputs.trees,
                                       inputs.rivers, std::move(water));
    if (!classifier.validate(&error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    auto classifyStart = std::chrono::high_resolution_clock::now();
    const std::vector<TerrainVoteReport> reports = classifier.explainAll();
    auto classifyEnd = std::chrono::high_resolution_clock::now();
    std::cout << "[Terrain] Classified " << reports.size() << " provinces in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(classifyEnd - classifyStart).count() << " ms\n";
    reportUnmappedPixels(reports);

    const std::filesystem::path outDir(config.output.dir);
    std::error_code ec;
    std::filesystem::create_directories(outDir, ec);
    if (ec) {
        std::cerr << "Error: could not create output directory " << outDir.string() << ": " << ec.message() << "\n";
        return 1;
    }

    const std::filesystem::path csvPath = outDir / "terrain.csv";
    if (!writeTerrainCsv(csvPath, provinces, inputs.definition, reports)) {
        std::cerr << "Error: could not write " << csvPath.string() << "\n";
        return 1;
    }

    auto borderStart = std::chrono::high_resolution_clock::now();
    sf::Image borders;
    if (config.provinces.doubleMap) {
        const ProvinceMap doubled = provinces.doubled();
        borders = renderBorderRaster(config, doubled, inputs.colorTable, inputs.definition, reports);
    } else {
        borders = renderBorderRaster(config, provinces, inputs.colorTable, inputs.definition, reports);
    }
    auto borderEnd = std::chrono::high_resolution_clock::now();
    std::cout << "[Borders] Rendered " << borders.getSize().x << "x" << borders.getSize().y << " borders in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(borderEnd - borderStart).count() << " ms\n";

    const std::filesystem::path bordersPath = outDir / "borders.png";
    if (!borders.saveToFile(bordersPath.string())) {
        std::cerr << "Error: could not write " << bordersPath.string() << "\n";
        return 1;
    }

    std::cout << "Wrote " << csvPath.string() << ", " << bordersPath.string();
    if (config.output.dumpTreeLayer) {
        const std::filesystem::path treePath = outDir / "tree_layer.bmp";
        if (!classifier.getTreeLayer()->saveToBmpFile(treePath.string(), &error)) {
            std::cerr << "\nError: " << error << "\n";
            return 1;
        }
        std::cout << ", " << treePath.string();
    }
    std::cout << "\n";
    return 0;
}
