// province_map.h
#pragma once

#include <SFML/Graphics.hpp>
#include <cstdint>
#include <functional>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

#include "palette_raster.h"

namespace std {
    template <>
    struct hash<sf::Color> {
        size_t operator()(const sf::Color& color) const {
            return (static_cast<size_t>(color.r) << 24) |
                (static_cast<size_t>(color.g) << 16) |
                (static_cast<size_t>(color.b) << 8) |
                static_cast<size_t>(color.a);
        }
    };
}

// Province id <-> RGB colour, as authored in the map's definition file.
class ProvinceColorTable {
public:
    // Binds `color` to `provinceId`. A colour already bound to another id is rebound.
    void add(int provinceId, const sf::Color& color);

    // Semicolon separated rows: id;red;green;blue;name;...
    // Rows that are too short or have an empty/non-numeric id or colour are skipped.
    bool loadFromCsvFile(const std::string& path, std::string* errorMessage = nullptr);
    bool loadFromCsvStream(std::istream& in, std::string* errorMessage = nullptr);

    const sf::Color* findColor(int provinceId) const;
    bool findProvince(const sf::Color& color, int& provinceId) const;

    size_t size() const { return m_colorById.size(); }
    const std::unordered_map<int, sf::Color>& getColors() const { return m_colorById; }

private:
    std::unordered_map<int, sf::Color> m_colorById;
    std::unordered_map<sf::Color, int> m_idByColor;
};

// Bit-packed membership raster cropped to a province's bounding box.
// Rows are padded to whole bytes, most significant bit first.
class ProvinceMask {
public:
    ProvinceMask() = default;
    ProvinceMask(int width, int height);

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }
    int getStride() const { return m_stride; } // bytes per row

    bool contains(int x, int y) const {
        if (x < 0 || y < 0 || x >= m_width || y >= m_height) return false;
        const size_t byte = static_cast<size_t>(y) * static_cast<size_t>(m_stride) + static_cast<size_t>(x >> 3);
        return (m_bits[byte] >> (7 - (x & 7))) & 1u;
    }
    void set(int x, int y) {
        const size_t byte = static_cast<size_t>(y) * static_cast<size_t>(m_stride) + static_cast<size_t>(x >> 3);
        m_bits[byte] = static_cast<std::uint8_t>(m_bits[byte] | (1u << (7 - (x & 7))));
    }

    size_t pixelCount() const;
    ProvinceMask doubled() const;
    const std::vector<std::uint8_t>& getBits() const { return m_bits; }

private:
    int m_width = 0;
    int m_height = 0;
    int m_stride = 0;
    std::vector<std::uint8_t> m_bits;
};

struct Province {
    int id = -1;
    sf::Color color;
    PixelBox boundingBox;
    ProvinceMask mask;
};

struct UnrecognizedColor {
    sf::Color color;
    size_t pixelCount = 0;
};

// Provinces segmented out of a colour-coded map. Immutable once built; rebuild when the
// underlying map files change.
class ProvinceMap {
public:
    ProvinceMap() = default;
    ProvinceMap(const sf::Image& image, const ProvinceColorTable& colorTable);

    const sf::Image& getImage() const { return m_image; }
    unsigned int getWidth() const { return m_image.getSize().x; }
    unsigned int getHeight() const { return m_image.getSize().y; }

    // In order of first appearance in a row-major scan.
    const std::vector<Province>& getProvinces() const { return m_provinces; }
    const Province* findProvince(int provinceId) const;

    // Colours present on the map but absent from the colour table. They produce no province.
    const std::vector<UnrecognizedColor>& getUnrecognizedColors() const { return m_unrecognized; }

    // 2x nearest-neighbour copy of the map and every mask; bounding boxes scale with it.
    // Makes borders half as thick relative to very small provinces.
    ProvinceMap doubled() const;

private:
    sf::Image m_image;
    std::vector<Province> m_provinces;
    std::unordered_map<int, size_t> m_indexById;
    std::vector<UnrecognizedColor> m_unrecognized;
};
