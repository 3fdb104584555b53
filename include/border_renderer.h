// border_renderer.h
#pragma once

#include <SFML/Graphics.hpp>
#include <cstdint>
#include <vector>

class ProvinceMap;

// Grey levels written to border rasters.
struct BorderStyle {
    sf::Uint8 border = 0;
    sf::Uint8 background = 255;
};

// Per-channel absolute difference between `regions` and a copy of itself moved by (shiftX, shiftY).
// The band of width |shift| exposed at the image edge is cleared to zero so the image boundary
// never reads as a border.
sf::Image shiftDifference(const sf::Image& regions, int shiftX, int shiftY);

// Borders between same-coloured regions, compared against the (+1,0), (0,+1) and (+1,+1) shifts.
// Border pixels only land on the south/east side of each boundary, so regions must not be
// excluded from this variant afterwards: that would open gaps.
sf::Image renderBorders(const sf::Image& regions, const BorderStyle& style = BorderStyle());

// Borders on both sides of every boundary (all four cardinal shifts; all eight directions
// when `thick`). Safe to use with excludeRegions().
sf::Image renderDoubleBorders(const sf::Image& regions, bool thick = false, const BorderStyle& style = BorderStyle());

// Paints the listed provinces' own pixels back to background. Ids without a province are ignored.
// Only for double borders, and `borders` must have the province map's dimensions.
void excludeRegions(sf::Image& borders,
                    const ProvinceMap& provinces,
                    const std::vector<int>& provinceIds,
                    const BorderStyle& style = BorderStyle());

// Background with every border pixel replaced by `borderColor`.
sf::Image overlayBorders(const sf::Image& background,
                         const sf::Image& borders,
                         const sf::Color& borderColor,
                         const BorderStyle& style = BorderStyle());
