#include "border_renderer.h"

#include <algorithm>
#include <cstdlib>

#include "province_map.h"

namespace {

struct Shift {
    int x;
    int y;
};

// Adds every channel of the shift difference into the accumulator, saturating at 255.
void accumulateShift(const sf::Image& regions, const Shift& shift, std::vector<std::uint8_t>& accumulator) {
    const sf::Image diff = shiftDifference(regions, shift.x, shift.y);
    const sf::Uint8* pixels = diff.getPixelsPtr();
    for (size_t i = 0; i < accumulator.size(); ++i) {
        const int sum = accumulator[i] + pixels[i * 4] + pixels[i * 4 + 1] + pixels[i * 4 + 2];
        accumulator[i] = static_cast<std::uint8_t>(std::min(sum, 255));
    }
}

// Flatten (any difference counts) and invert into the border polarity.
sf::Image differencesToBorders(const sf::Image& regions, const std::vector<Shift>& shifts, const BorderStyle& style) {
    const sf::Vector2u size = regions.getSize();
    std::vector<std::uint8_t> accumulator(static_cast<size_t>(size.x) * size.y, 0);
    for (const Shift& shift : shifts) {
        accumulateShift(regions, shift, accumulator);
    }

    sf::Image borders;
    borders.create(size.x, size.y, sf::Color(style.background, style.background, style.background));
    const sf::Color border(style.border, style.border, style.border);
    for (unsigned int y = 0; y < size.y; ++y) {
        for (unsigned int x = 0; x < size.x; ++x) {
            if (accumulator[static_cast<size_t>(y) * size.x + x] != 0) {
                borders.setPixel(x, y, border);
            }
        }
    }
    return borders;
}

} // namespace

sf::Image shiftDifference(const sf::Image& regions, int shiftX, int shiftY) {
    const sf::Vector2u size = regions.getSize();
    const int width = static_cast<int>(size.x);
    const int height = static_cast<int>(size.y);
    sf::Image diff;
    diff.create(size.x, size.y, sf::Color::Black);
    if (width == 0 || height == 0) {
        return diff;
    }

    // Band exposed by the shift: [x0, x1) columns and [y0, y1) rows with a valid source pixel.
    const int x0 = std::max(0, shiftX);
    const int x1 = std::min(width, width + shiftX);
    const int y0 = std::max(0, shiftY);
    const int y1 = std::min(height, height + shiftY);

    const sf::Uint8* src = regions.getPixelsPtr();
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            const size_t here = (static_cast<size_t>(y) * width + x) * 4;
            const size_t there = (static_cast<size_t>(y - shiftY) * width + (x - shiftX)) * 4;
            diff.setPixel(static_cast<unsigned int>(x), static_cast<unsigned int>(y),
                          sf::Color(static_cast<sf::Uint8>(std::abs(src[here] - src[there])),
                                    static_cast<sf::Uint8>(std::abs(src[here + 1] - src[there + 1])),
                                    static_cast<sf::Uint8>(std::abs(src[here + 2] - src[there + 2]))));
        }
    }
    return diff;
}

sf::Image renderBorders(const sf::Image& regions, const BorderStyle& style) {
    return differencesToBorders(regions, {{0, 1}, {1, 0}, {1, 1}}, style);
}

sf::Image renderDoubleBorders(const sf::Image& regions, bool thick, const BorderStyle& style) {
    std::vector<Shift> shifts = {{0, 1}, {1, 0}, {0, -1}, {-1, 0}};
    if (thick) {
        shifts.push_back({1, 1});
        shifts.push_back({-1, 1});
        shifts.push_back({1, -1});
        shifts.push_back({-1, -1});
    }
    return differencesToBorders(regions, shifts, style);
}

void excludeRegions(sf::Image& borders,
                    const ProvinceMap& provinces,
                    const std::vector<int>& provinceIds,
                    const BorderStyle& style) {
    const sf::Vector2u size = borders.getSize();
    const sf::Color background(style.background, style.background, style.background);
    for (int provinceId : provinceIds) {
        const Province* province = provinces.findProvince(provinceId);
        if (!province) continue;
        const PixelBox& box = province->boundingBox;
        for (int ly = 0; ly < box.height(); ++ly) {
            const int y = box.top + ly;
            if (y < 0 || y >= static_cast<int>(size.y)) continue;
            for (int lx = 0; lx < box.width(); ++lx) {
                const int x = box.left + lx;
                if (x < 0 || x >= static_cast<int>(size.x)) continue;
                if (province->mask.contains(lx, ly)) {
                    borders.setPixel(static_cast<unsigned int>(x), static_cast<unsigned int>(y), background);
                }
            }
        }
    }
}

sf::Image overlayBorders(const sf::Image& background,
                         const sf::Image& borders,
                         const sf::Color& borderColor,
                         const BorderStyle& style) {
    sf::Image out(background);
    const sf::Vector2u size = background.getSize();
    const sf::Vector2u borderSize = borders.getSize();
    const unsigned int width = std::min(size.x, borderSize.x);
    const unsigned int height = std::min(size.y, borderSize.y);
    for (unsigned int y = 0; y < height; ++y) {
        for (unsigned int x = 0; x < width; ++x) {
            if (borders.getPixel(x, y).r != style.background) {
                out.setPixel(x, y, borderColor);
            }
        }
    }
    return out;
}
