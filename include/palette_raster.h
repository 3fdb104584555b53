// palette_raster.h
#pragma once

#include <SFML/Graphics.hpp>
#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Axis-aligned pixel rectangle. right/bottom are exclusive.
struct PixelBox {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
    bool empty() const { return right <= left || bottom <= top; }
    bool operator==(const PixelBox& other) const {
        return left == other.left && top == other.top && right == other.right && bottom == other.bottom;
    }
    bool operator!=(const PixelBox& other) const { return !(*this == other); }
};

// 8-bit indexed raster (terrain, tree and river maps). One palette index per pixel, row-major.
class PaletteRaster {
public:
    PaletteRaster() = default;
    PaletteRaster(unsigned int width, unsigned int height, std::uint8_t fill = 0);

    unsigned int getWidth() const { return m_width; }
    unsigned int getHeight() const { return m_height; }
    bool empty() const { return m_width == 0 || m_height == 0; }

    std::uint8_t getIndex(unsigned int x, unsigned int y) const { return m_indices[static_cast<size_t>(y) * m_width + x]; }
    void setIndex(unsigned int x, unsigned int y, std::uint8_t index) { m_indices[static_cast<size_t>(y) * m_width + x] = index; }
    void fill(std::uint8_t index);

    const std::vector<std::uint8_t>& getIndices() const { return m_indices; }
    std::uint8_t* rowPtr(unsigned int y) { return m_indices.data() + static_cast<size_t>(y) * m_width; }
    const std::uint8_t* rowPtr(unsigned int y) const { return m_indices.data() + static_cast<size_t>(y) * m_width; }

    const std::array<sf::Color, 256>& getPalette() const { return m_palette; }
    void setPalette(const std::array<sf::Color, 256>& palette) { m_palette = palette; }

    // Sub-raster covering `box`; pixels of the box outside this raster read as `outside`.
    PaletteRaster crop(const PixelBox& box, std::uint8_t outside = 0) const;
    PaletteRaster resizedNearest(unsigned int width, unsigned int height) const;

    // Palette index -> number of pixels using it (only indices that occur).
    std::map<std::uint8_t, std::size_t> usedIndices() const;

    bool loadFromBmpFile(const std::string& path, std::string* errorMessage = nullptr);
    bool saveToBmpFile(const std::string& path, std::string* errorMessage = nullptr) const;

private:
    unsigned int m_width = 0;
    unsigned int m_height = 0;
    std::vector<std::uint8_t> m_indices;
    std::array<sf::Color, 256> m_palette{};
};
