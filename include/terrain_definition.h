// terrain_definition.h
#pragma once

#include <SFML/Graphics.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Broad terrain family used by gameplay effects (e.g. farmlands and grasslands are both Plains).
enum class TerrainGameplayType {
    Pti,
    Plains,
    Forest,
    Hills,
    Mountains,
    Jungle,
    Marsh,
    Desert,
    Unknown
};

// Ambient sound played while the camera is over the terrain.
enum class TerrainSoundType {
    Plains,
    Forest,
    Desert,
    Sea,
    Jungle,
    Mountains,
    Unknown
};

// Unrecognised names map to Unknown rather than to a default.
TerrainGameplayType parseTerrainGameplayType(const std::string& name);
TerrainSoundType parseTerrainSoundType(const std::string& name);
const char* toString(TerrainGameplayType type);
const char* toString(TerrainSoundType type);

struct TerrainCategory {
    std::string name;
    sf::Color displayColor = sf::Color::White;
    std::optional<TerrainGameplayType> gameplayType; // nullopt when not declared
    std::string gameplayTypeName;                     // as authored
    std::optional<TerrainSoundType> soundType;
    std::string soundTypeName;
    bool isWater = false;
    bool isInlandSea = false;
    std::vector<int> overrideProvinceIds;
};

// Terrain categories plus the palette-index and province-override tables that point at them.
// Categories are addressed by their index in declaration order; -1 means "none".
class TerrainDefinition {
public:
    TerrainDefinition();

    // TOML layout:
    //   [[category]] name, color = [r, g, b], type, sound_type, is_water, inland_sea, terrain_override = [ids]
    //   [[terrain]]  name, type = <category>, color = [terrain bitmap indices]
    //   [[tree]]     name, terrain = <category>, color = [tree bitmap indices]
    bool loadFromTomlFile(const std::string& path,
                          const std::string& fallbackCategory = "pti",
                          std::string* errorMessage = nullptr);
    bool loadFromTomlString(const std::string& text,
                            const std::string& fallbackCategory = "pti",
                            std::string* errorMessage = nullptr);

    // Overrides listed by the category are registered unless an earlier category claimed them.
    int addCategory(const TerrainCategory& category);
    bool mapTerrainIndex(std::uint8_t index, const std::string& categoryName);
    bool mapTreeIndex(std::uint8_t index, const std::string& categoryName);
    bool setFallbackCategory(const std::string& categoryName);

    const std::vector<TerrainCategory>& getCategories() const { return m_categories; }
    const TerrainCategory& getCategory(int categoryIndex) const { return m_categories[static_cast<size_t>(categoryIndex)]; }
    int findCategory(const std::string& name) const;

    int terrainCategoryAt(std::uint8_t index) const { return m_terrainIndex[index]; }
    int treeCategoryAt(std::uint8_t index) const { return m_treeIndex[index]; }
    int overrideFor(int provinceId) const;
    const std::unordered_map<int, int>& getOverrides() const { return m_overrides; }
    int getFallbackIndex() const { return m_fallback; }

private:
    void clear();

    std::vector<TerrainCategory> m_categories;
    std::unordered_map<std::string, int> m_indexByName;
    std::array<int, 256> m_terrainIndex;
    std::array<int, 256> m_treeIndex;
    std::unordered_map<int, int> m_overrides; // province id -> category index
    int m_fallback = -1;
};
