#include "terrain_definition.h"

#include <algorithm>
#include <sstream>

#include <toml++/toml.hpp>

namespace {

bool setError(std::string* errorMessage, const std::string& message) {
    if (errorMessage) {
        *errorMessage = message;
    }
    return false;
}

bool readIndexList(const toml::table& t, std::string_view key, std::vector<std::uint8_t>& out) {
    const toml::array* values = t[key].as_array();
    if (!values) {
        return false;
    }
    for (const auto& node : *values) {
        const auto v = node.value<std::int64_t>();
        if (!v || *v < 0 || *v > 255) {
            return false;
        }
        out.push_back(static_cast<std::uint8_t>(*v));
    }
    return true;
}

bool buildFromTable(const toml::table& root,
                    const std::string& fallbackCategory,
                    TerrainDefinition& out,
                    std::string* errorMessage) {
    if (const toml::array* categories = root["category"].as_array()) {
        for (const auto& node : *categories) {
            const toml::table* t = node.as_table();
            if (!t) {
                return setError(errorMessage, "Invalid terrain category: expected a table");
            }
            TerrainCategory category;
            if (const auto v = (*t)["name"].value<std::string>()) category.name = *v;
            if (category.name.empty()) {
                return setError(errorMessage, "Terrain category without a name");
            }
            if (const toml::array* color = (*t)["color"].as_array()) {
                if (color->size() >= 3) {
                    const auto r = (*color)[0].value<std::int64_t>();
                    const auto g = (*color)[1].value<std::int64_t>();
                    const auto b = (*color)[2].value<std::int64_t>();
                    if (r && g && b) {
                        category.displayColor = sf::Color(static_cast<sf::Uint8>(std::clamp<std::int64_t>(*r, 0, 255)),
                                                          static_cast<sf::Uint8>(std::clamp<std::int64_t>(*g, 0, 255)),
                                                          static_cast<sf::Uint8>(std::clamp<std::int64_t>(*b, 0, 255)));
                    }
                }
            }
            if (const auto v = (*t)["type"].value<std::string>()) {
                category.gameplayTypeName = *v;
                category.gameplayType = parseTerrainGameplayType(*v);
            }
            if (const auto v = (*t)["sound_type"].value<std::string>()) {
                category.soundTypeName = *v;
                category.soundType = parseTerrainSoundType(*v);
            }
            if (const auto v = (*t)["is_water"].value<bool>()) category.isWater = *v;
            if (const auto v = (*t)["inland_sea"].value<bool>()) category.isInlandSea = *v;
            if (const toml::array* overrides = (*t)["terrain_override"].as_array()) {
                for (const auto& idNode : *overrides) {
                    if (const auto id = idNode.value<std::int64_t>()) {
                        category.overrideProvinceIds.push_back(static_cast<int>(*id));
                    }
                }
            }
            if (out.findCategory(category.name) >= 0) {
                return setError(errorMessage, "Duplicate terrain category: " + category.name);
            }
            out.addCategory(category);
        }
    }

    if (!out.setFallbackCategory(fallbackCategory)) {
        return setError(errorMessage, "Fallback terrain category '" + fallbackCategory + "' is not defined");
    }

    struct IndexSection {
        const char* table;
        const char* categoryKey;
        bool tree;
    };
    const IndexSection sections[] = {
        {"terrain", "type", false},
        {"tree", "terrain", true},
    };
    for (const IndexSection& section : sections) {
        const toml::array* entries = root[section.table].as_array();
        if (!entries) continue;
        for (const auto& node : *entries) {
            const toml::table* t = node.as_table();
            if (!t) {
                return setError(errorMessage, std::string("Invalid ") + section.table + " entry: expected a table");
            }
            const std::string name = (*t)["name"].value_or(std::string());
            const auto categoryName = (*t)[section.categoryKey].value<std::string>();
            if (!categoryName) {
                std::ostringstream oss;
                oss << "The " << section.table << " entry '" << name << "' has no '" << section.categoryKey << "'";
                return setError(errorMessage, oss.str());
            }
            std::vector<std::uint8_t> indices;
            if (!readIndexList(*t, "color", indices)) {
                std::ostringstream oss;
                oss << "The " << section.table << " entry '" << name << "' needs a list of palette indices 0..255";
                return setError(errorMessage, oss.str());
            }
            for (std::uint8_t index : indices) {
                const bool mapped = section.tree ? out.mapTreeIndex(index, *categoryName)
                                                 : out.mapTerrainIndex(index, *categoryName);
                if (!mapped) {
                    std::ostringstream oss;
                    oss << "The " << section.table << " entry '" << name
                        << "' refers to undefined terrain category '" << *categoryName << "'";
                    return setError(errorMessage, oss.str());
                }
            }
        }
    }
    return true;
}

} // namespace

TerrainGameplayType parseTerrainGameplayType(const std::string& name) {
    if (name == "pti") return TerrainGameplayType::Pti;
    if (name == "plains") return TerrainGameplayType::Plains;
    if (name == "forest") return TerrainGameplayType::Forest;
    if (name == "hills") return TerrainGameplayType::Hills;
    if (name == "mountains") return TerrainGameplayType::Mountains;
    if (name == "jungle") return TerrainGameplayType::Jungle;
    if (name == "marsh") return TerrainGameplayType::Marsh;
    if (name == "desert") return TerrainGameplayType::Desert;
    return TerrainGameplayType::Unknown;
}

TerrainSoundType parseTerrainSoundType(const std::string& name) {
    if (name == "plains") return TerrainSoundType::Plains;
    if (name == "forest") return TerrainSoundType::Forest;
    if (name == "desert") return TerrainSoundType::Desert;
    if (name == "sea") return TerrainSoundType::Sea;
    if (name == "jungle") return TerrainSoundType::Jungle;
    if (name == "mountains") return TerrainSoundType::Mountains;
    return TerrainSoundType::Unknown;
}

const char* toString(TerrainGameplayType type) {
    switch (type) {
        case TerrainGameplayType::Pti: return "pti";
        case TerrainGameplayType::Plains: return "plains";
        case TerrainGameplayType::Forest: return "forest";
        case TerrainGameplayType::Hills: return "hills";
        case TerrainGameplayType::Mountains: return "mountains";
        case TerrainGameplayType::Jungle: return "jungle";
        case TerrainGameplayType::Marsh: return "marsh";
        case TerrainGameplayType::Desert: return "desert";
        case TerrainGameplayType::Unknown: break;
    }
    return "unknown";
}

const char* toString(TerrainSoundType type) {
    switch (type) {
        case TerrainSoundType::Plains: return "plains";
        case TerrainSoundType::Forest: return "forest";
        case TerrainSoundType::Desert: return "desert";
        case TerrainSoundType::Sea: return "sea";
        case TerrainSoundType::Jungle: return "jungle";
        case TerrainSoundType::Mountains: return "mountains";
        case TerrainSoundType::Unknown: break;
    }
    return "unknown";
}

TerrainDefinition::TerrainDefinition() {
    clear();
}

void TerrainDefinition::clear() {
    m_categories.clear();
    m_indexByName.clear();
    m_terrainIndex.fill(-1);
    m_treeIndex.fill(-1);
    m_overrides.clear();
    m_fallback = -1;
}

bool TerrainDefinition::loadFromTomlFile(const std::string& path,
                                         const std::string& fallbackCategory,
                                         std::string* errorMessage) {
    try {
        const toml::table root = toml::parse_file(path);
        TerrainDefinition loaded;
        std::string err;
        if (!buildFromTable(root, fallbackCategory, loaded, &err)) {
            return setError(errorMessage, "Invalid terrain definition '" + path + "': " + err);
        }
        *this = std::move(loaded);
        return true;
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse terrain definition '" << path << "': " << err.description();
        return setError(errorMessage, oss.str());
    }
}

bool TerrainDefinition::loadFromTomlString(const std::string& text,
                                           const std::string& fallbackCategory,
                                           std::string* errorMessage) {
    try {
        const toml::table root = toml::parse(text);
        TerrainDefinition loaded;
        if (!buildFromTable(root, fallbackCategory, loaded, errorMessage)) {
            return false;
        }
        *this = std::move(loaded);
        return true;
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse terrain definition: " << err.description();
        return setError(errorMessage, oss.str());
    }
}

int TerrainDefinition::addCategory(const TerrainCategory& category) {
    const int index = static_cast<int>(m_categories.size());
    m_categories.push_back(category);
    m_indexByName.emplace(category.name, index);
    for (int provinceId : category.overrideProvinceIds) {
        // First declared category keeps the province.
        m_overrides.emplace(provinceId, index);
    }
    return index;
}

bool TerrainDefinition::mapTerrainIndex(std::uint8_t index, const std::string& categoryName) {
    const int category = findCategory(categoryName);
    if (category < 0) return false;
    m_terrainIndex[index] = category;
    return true;
}

bool TerrainDefinition::mapTreeIndex(std::uint8_t index, const std::string& categoryName) {
    const int category = findCategory(categoryName);
    if (category < 0) return false;
    m_treeIndex[index] = category;
    return true;
}

bool TerrainDefinition::setFallbackCategory(const std::string& categoryName) {
    const int category = findCategory(categoryName);
    if (category < 0) return false;
    m_fallback = category;
    return true;
}

int TerrainDefinition::findCategory(const std::string& name) const {
    auto it = m_indexByName.find(name);
    return it == m_indexByName.end() ? -1 : it->second;
}

int TerrainDefinition::overrideFor(int provinceId) const {
    auto it = m_overrides.find(provinceId);
    return it == m_overrides.end() ? -1 : it->second;
}
