#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "map_context.h"
#include "palette_raster.h"
#include "province_map.h"
#include "terrain_definition.h"

struct TerrainVote {
    int category = -1;
    int votes = 0;
    int tiebreak = 0; // lowest contributing palette index; tree indices carry the tiebreak offset
};

struct TerrainVoteReport {
    int provinceId = -1;
    int category = -1;
    bool overridden = false;
    bool usedFallback = false;
    std::vector<TerrainVote> ranking; // votes descending, tiebreak ascending
    size_t unmappedTerrainPixels = 0;
    size_t unmappedTreePixels = 0;
};

struct TerrainAssignment {
    int provinceId = -1;
    int category = -1;
};

// Assigns one terrain category per province by weighted voting over the terrain map and the
// projected tree layer, after masking out pixels outside the province and under wide rivers.
// Manual overrides win without voting. All inputs are shared read-only, so provinces can be
// classified concurrently.
class TerrainClassifier {
public:
    // Takes a tree layer already projected onto the province map grid (see buildTreeLayer()).
    TerrainClassifier(const MapConfig::Terrain& settings,
                      const TerrainDefinition& definition,
                      const ProvinceMap& provinces,
                      const PaletteRaster& terrain,
                      std::shared_ptr<const PaletteRaster> treeLayer,
                      const PaletteRaster& rivers,
                      std::unordered_set<int> waterProvinces);

    // Projects the raw tree map onto the province map grid once, here.
    TerrainClassifier(const MapConfig::Terrain& settings,
                      const TerrainDefinition& definition,
                      const ProvinceMap& provinces,
                      const PaletteRaster& terrain,
                      const PaletteRaster& trees,
                      const PaletteRaster& rivers,
                      std::unordered_set<int> waterProvinces);

    // Checks that a tree layer was given and that terrain, tree layer and river rasters
    // cover the province map.
    bool validate(std::string* errorMessage = nullptr) const;

    // Category index for the province. Never fails: falls back to the definition's fallback category.
    int classify(int provinceId) const;
    TerrainVoteReport explain(int provinceId) const;

    // Every segmented province, in province map order.
    std::vector<TerrainAssignment> classifyAll() const;
    std::vector<TerrainVoteReport> explainAll() const;

    bool isWaterProvince(int provinceId) const { return m_waterProvinces.count(provinceId) > 0; }
    const std::shared_ptr<const PaletteRaster>& getTreeLayer() const { return m_treeLayer; }

private:
    void tally(const Province& province, TerrainVoteReport& report) const;
    void pickCategory(TerrainVoteReport& report) const;

    MapConfig::Terrain m_settings;
    const TerrainDefinition* m_definition = nullptr;
    const ProvinceMap* m_provinces = nullptr;
    const PaletteRaster* m_terrain = nullptr;
    std::shared_ptr<const PaletteRaster> m_treeLayer;
    const PaletteRaster* m_rivers = nullptr;
    std::unordered_set<int> m_waterProvinces;
    std::array<bool, 256> m_excludedTree{};
};
