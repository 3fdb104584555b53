#include "terrain_classifier.h"

#include <algorithm>
#include <limits>
#include <sstream>
#include <utility>

#include "tree_layout.h"

namespace {

bool coversMap(const PaletteRaster& raster, const ProvinceMap& provinces) {
    return raster.getWidth() >= provinces.getWidth() && raster.getHeight() >= provinces.getHeight();
}

void describeMismatch(std::ostringstream& oss, const char* name, const PaletteRaster& raster, const ProvinceMap& provinces) {
    oss << name << " map is " << raster.getWidth() << "x" << raster.getHeight()
        << " but the province map is " << provinces.getWidth() << "x" << provinces.getHeight() << ". ";
}

} // namespace

TerrainClassifier::TerrainClassifier(const MapConfig::Terrain& settings,
                                     const TerrainDefinition& definition,
                                     const ProvinceMap& provinces,
                                     const PaletteRaster& terrain,
                                     std::shared_ptr<const PaletteRaster> treeLayer,
                                     const PaletteRaster& rivers,
                                     std::unordered_set<int> waterProvinces) :
    m_settings(settings),
    m_definition(&definition),
    m_provinces(&provinces),
    m_terrain(&terrain),
    m_treeLayer(std::move(treeLayer)),
    m_rivers(&rivers),
    m_waterProvinces(std::move(waterProvinces))
{
    for (int index : m_settings.excludedTreeIndices) {
        if (index >= 0 && index < 256) {
            m_excludedTree[static_cast<size_t>(index)] = true;
        }
    }
}

TerrainClassifier::TerrainClassifier(const MapConfig::Terrain& settings,
                                     const TerrainDefinition& definition,
                                     const ProvinceMap& provinces,
                                     const PaletteRaster& terrain,
                                     const PaletteRaster& trees,
                                     const PaletteRaster& rivers,
                                     std::unordered_set<int> waterProvinces) :
    TerrainClassifier(settings,
                      definition,
                      provinces,
                      terrain,
                      buildTreeLayer(trees, provinces.getWidth(), provinces.getHeight(),
                                     static_cast<std::uint8_t>(settings.noTreeIndex)),
                      rivers,
                      std::move(waterProvinces))
{
}

bool TerrainClassifier::validate(std::string* errorMessage) const {
    std::ostringstream oss;
    bool ok = true;
    if (!coversMap(*m_terrain, *m_provinces)) {
        describeMismatch(oss, "Terrain", *m_terrain, *m_provinces);
        ok = false;
    }
    if (!m_treeLayer) {
        oss << "No tree layer was given. ";
        ok = false;
    } else if (!coversMap(*m_treeLayer, *m_provinces)) {
        describeMismatch(oss, "Projected tree", *m_treeLayer, *m_provinces);
        ok = false;
    }
    if (!coversMap(*m_rivers, *m_provinces)) {
        describeMismatch(oss, "River", *m_rivers, *m_provinces);
        ok = false;
    }
    if (m_definition->getFallbackIndex() < 0) {
        oss << "Terrain definition has no fallback category. ";
        ok = false;
    }
    if (!ok && errorMessage) {
        *errorMessage = oss.str();
    }
    return ok;
}

int TerrainClassifier::classify(int provinceId) const {
    return explain(provinceId).category;
}

TerrainVoteReport TerrainClassifier::explain(int provinceId) const {
    TerrainVoteReport report;
    report.provinceId = provinceId;

    const int overrideCategory = m_definition->overrideFor(provinceId);
    if (overrideCategory >= 0) {
        report.category = overrideCategory;
        report.overridden = true;
        return report;
    }

    if (const Province* province = m_provinces->findProvince(provinceId)) {
        tally(*province, report);
    }
    pickCategory(report);
    return report;
}

void TerrainClassifier::tally(const Province& province, TerrainVoteReport& report) const {
    const TerrainDefinition& definition = *m_definition;
    static const PaletteRaster kNoTrees;
    const PaletteRaster& trees = m_treeLayer ? *m_treeLayer : kNoTrees;
    const PaletteRaster& terrain = *m_terrain;
    const PaletteRaster& rivers = *m_rivers;

    const size_t categoryCount = definition.getCategories().size();
    std::vector<int> votes(categoryCount, 0);
    std::vector<int> tiebreak(categoryCount, std::numeric_limits<int>::max());
    std::vector<bool> seen(categoryCount, false);

    const std::uint8_t noTree = static_cast<std::uint8_t>(m_settings.noTreeIndex);
    const std::uint8_t terrainIgnore = static_cast<std::uint8_t>(m_settings.terrainIgnoreIndex);
    const PixelBox& box = province.boundingBox;

    for (int ly = 0; ly < box.height(); ++ly) {
        const int y = box.top + ly;
        for (int lx = 0; lx < box.width(); ++lx) {
            if (!province.mask.contains(lx, ly)) continue;
            const int x = box.left + lx;
            const unsigned int ux = static_cast<unsigned int>(x);
            const unsigned int uy = static_cast<unsigned int>(y);

            // Rivers wider than the narrowest class hide both layers.
            if (ux < rivers.getWidth() && uy < rivers.getHeight()) {
                const int river = rivers.getIndex(ux, uy);
                if (river > m_settings.riverSuppressMin && river < m_settings.riverSuppressMax) {
                    continue;
                }
            }

            const std::uint8_t tree = (ux < trees.getWidth() && uy < trees.getHeight()) ? trees.getIndex(ux, uy) : noTree;
            if (tree != noTree) {
                // A tree pixel always hides the terrain pixel below it, even when the tree
                // type itself does not vote.
                if (m_excludedTree[tree]) continue;
                const int category = definition.treeCategoryAt(tree);
                if (category < 0) {
                    report.unmappedTreePixels++;
                    continue;
                }
                votes[static_cast<size_t>(category)] += m_settings.treeVoteWeight;
                tiebreak[static_cast<size_t>(category)] = std::min(tiebreak[static_cast<size_t>(category)],
                                                                   static_cast<int>(tree) + m_settings.treeTiebreakOffset);
                seen[static_cast<size_t>(category)] = true;
                continue;
            }

            if (ux >= terrain.getWidth() || uy >= terrain.getHeight()) continue;
            const std::uint8_t index = terrain.getIndex(ux, uy);
            if (index == terrainIgnore) continue;
            const int category = definition.terrainCategoryAt(index);
            if (category < 0) {
                report.unmappedTerrainPixels++;
                continue;
            }
            votes[static_cast<size_t>(category)] += 1;
            tiebreak[static_cast<size_t>(category)] = std::min(tiebreak[static_cast<size_t>(category)], static_cast<int>(index));
            seen[static_cast<size_t>(category)] = true;
        }
    }

    for (size_t c = 0; c < categoryCount; ++c) {
        if (seen[c]) {
            report.ranking.push_back(TerrainVote{static_cast<int>(c), votes[c], tiebreak[c]});
        }
    }
    std::sort(report.ranking.begin(), report.ranking.end(), [](const TerrainVote& a, const TerrainVote& b) {
        if (a.votes != b.votes) return a.votes > b.votes;
        return a.tiebreak < b.tiebreak;
    });
}

void TerrainClassifier::pickCategory(TerrainVoteReport& report) const {
    const bool waterProvince = isWaterProvince(report.provinceId);
    for (const TerrainVote& vote : report.ranking) {
        // Water terrain only for seas and lakes, land terrain only for everything else.
        if (m_definition->getCategory(vote.category).isWater != waterProvince) continue;
        report.category = vote.category;
        return;
    }
    report.category = m_definition->getFallbackIndex();
    report.usedFallback = true;
}

std::vector<TerrainAssignment> TerrainClassifier::classifyAll() const {
    const std::vector<Province>& provinces = m_provinces->getProvinces();
    std::vector<TerrainAssignment> assignments(provinces.size());
    const int count = static_cast<int>(provinces.size());

    #pragma omp parallel for schedule(dynamic, 16) if(m_settings.parallel)
    for (int i = 0; i < count; ++i) {
        const int provinceId = provinces[static_cast<size_t>(i)].id;
        assignments[static_cast<size_t>(i)] = TerrainAssignment{provinceId, classify(provinceId)};
    }
    return assignments;
}

std::vector<TerrainVoteReport> TerrainClassifier::explainAll() const {
    const std::vector<Province>& provinces = m_provinces->getProvinces();
    std::vector<TerrainVoteReport> reports(provinces.size());
    const int count = static_cast<int>(provinces.size());

    #pragma omp parallel for schedule(dynamic, 16) if(m_settings.parallel)
    for (int i = 0; i < count; ++i) {
        reports[static_cast<size_t>(i)] = explain(provinces[static_cast<size_t>(i)].id);
    }
    return reports;
}
