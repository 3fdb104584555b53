// province_recolor.h
#pragma once

#include <SFML/Graphics.hpp>
#include <unordered_map>

#include "province_map.h"

// Renders a copy of a province map with provinces repainted. Typical use is feeding the border
// renderer something other than the raw province colours, e.g. one colour per terrain category.
class ProvinceRecolor {
public:
    enum class Special {
        Keep,          // original province colour
        ShadesOfWhite, // unique near-white colour, never equal to any other colour left on the output
        Transparent    // alpha 0
    };

    explicit ProvinceRecolor(const ProvinceColorTable& colorTable, Special defaultColor = Special::Keep);

    // Return false (and change nothing) for ids the colour table does not know.
    bool set(int provinceId, const sf::Color& color);
    bool set(int provinceId, Special color);
    void setDefault(Special color) { m_default = color; }

    // Pixels with unrecognised colours are left as they are.
    sf::Image generate(const ProvinceMap& provinces) const;

private:
    struct Target {
        bool special = true;
        Special kind = Special::Keep;
        sf::Color color;
    };

    Target targetFor(int provinceId) const;

    const ProvinceColorTable* m_colorTable = nullptr;
    Special m_default = Special::Keep;
    std::unordered_map<int, Target> m_targets;
};
