#include "province_recolor.h"

#include <cstdint>
#include <unordered_set>

namespace {

// Walks down from pure white, one blue step at a time, skipping reserved colours.
class ShadeOfWhiteGenerator {
public:
    explicit ShadeOfWhiteGenerator(const std::unordered_set<sf::Color>& reserved) : m_reserved(&reserved) {}

    sf::Color next() {
        for (;;) {
            const std::uint32_t k = m_counter++;
            const sf::Color color(static_cast<sf::Uint8>(255 - ((k >> 16) & 0xFF)),
                                  static_cast<sf::Uint8>(255 - ((k >> 8) & 0xFF)),
                                  static_cast<sf::Uint8>(255 - (k & 0xFF)));
            if (m_reserved->count(color) == 0) {
                return color;
            }
        }
    }

private:
    const std::unordered_set<sf::Color>* m_reserved;
    std::uint32_t m_counter = 0;
};

} // namespace

ProvinceRecolor::ProvinceRecolor(const ProvinceColorTable& colorTable, Special defaultColor) :
    m_colorTable(&colorTable),
    m_default(defaultColor)
{
}

bool ProvinceRecolor::set(int provinceId, const sf::Color& color) {
    if (!m_colorTable->findColor(provinceId)) return false;
    Target target;
    target.special = false;
    target.color = color;
    m_targets[provinceId] = target;
    return true;
}

bool ProvinceRecolor::set(int provinceId, Special color) {
    if (!m_colorTable->findColor(provinceId)) return false;
    Target target;
    target.kind = color;
    m_targets[provinceId] = target;
    return true;
}

ProvinceRecolor::Target ProvinceRecolor::targetFor(int provinceId) const {
    auto it = m_targets.find(provinceId);
    if (it != m_targets.end()) {
        return it->second;
    }
    Target target;
    target.kind = m_default;
    return target;
}

sf::Image ProvinceRecolor::generate(const ProvinceMap& provinces) const {
    // Every colour that ends up on the output besides the generated shades.
    std::unordered_set<sf::Color> reserved;
    for (const Province& province : provinces.getProvinces()) {
        const Target target = targetFor(province.id);
        if (!target.special) {
            reserved.insert(target.color);
        } else if (target.kind == Special::Keep) {
            reserved.insert(province.color);
        }
    }
    for (const UnrecognizedColor& unknown : provinces.getUnrecognizedColors()) {
        reserved.insert(unknown.color);
    }
    ShadeOfWhiteGenerator shades(reserved);

    sf::Image out(provinces.getImage());
    for (const Province& province : provinces.getProvinces()) {
        const Target target = targetFor(province.id);

        sf::Color color = province.color;
        if (!target.special) {
            color = target.color;
        } else if (target.kind == Special::ShadesOfWhite) {
            color = shades.next();
        } else if (target.kind == Special::Transparent) {
            color = sf::Color::Transparent;
        } else {
            continue;
        }

        const PixelBox& box = province.boundingBox;
        for (int ly = 0; ly < box.height(); ++ly) {
            for (int lx = 0; lx < box.width(); ++lx) {
                if (province.mask.contains(lx, ly)) {
                    out.setPixel(static_cast<unsigned int>(box.left + lx), static_cast<unsigned int>(box.top + ly), color);
                }
            }
        }
    }
    return out;
}
