#include "palette_raster.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace {

constexpr std::uint32_t kBmpFileHeaderSize = 14;
constexpr std::uint32_t kBmpInfoHeaderSize = 40;
constexpr std::uint32_t kBmpCompressionRgb = 0;

std::uint16_t readU16(const std::vector<unsigned char>& data, size_t offset) {
    return static_cast<std::uint16_t>(data[offset] | (data[offset + 1] << 8));
}

std::uint32_t readU32(const std::vector<unsigned char>& data, size_t offset) {
    return static_cast<std::uint32_t>(data[offset]) |
           (static_cast<std::uint32_t>(data[offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data[offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

void writeU16(std::vector<unsigned char>& out, std::uint16_t v) {
    out.push_back(static_cast<unsigned char>(v & 0xFF));
    out.push_back(static_cast<unsigned char>((v >> 8) & 0xFF));
}

void writeU32(std::vector<unsigned char>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<unsigned char>((v >> (8 * i)) & 0xFF));
    }
}

bool fail(std::string* errorMessage, const std::string& path, const std::string& what) {
    if (errorMessage) {
        std::ostringstream oss;
        oss << "Failed to read bitmap '" << path << "': " << what;
        *errorMessage = oss.str();
    }
    return false;
}

size_t bmpRowStride(unsigned int width) {
    return (static_cast<size_t>(width) + 3u) & ~static_cast<size_t>(3u);
}

} // namespace

PaletteRaster::PaletteRaster(unsigned int width, unsigned int height, std::uint8_t fill)
    : m_width(width),
      m_height(height),
      m_indices(static_cast<size_t>(width) * height, fill) {
    for (int i = 0; i < 256; ++i) {
        const auto v = static_cast<sf::Uint8>(i);
        m_palette[static_cast<size_t>(i)] = sf::Color(v, v, v);
    }
}

void PaletteRaster::fill(std::uint8_t index) {
    std::fill(m_indices.begin(), m_indices.end(), index);
}

PaletteRaster PaletteRaster::crop(const PixelBox& box, std::uint8_t outside) const {
    PaletteRaster out(static_cast<unsigned int>(std::max(0, box.width())),
                      static_cast<unsigned int>(std::max(0, box.height())),
                      outside);
    out.m_palette = m_palette;
    for (int y = box.top; y < box.bottom; ++y) {
        if (y < 0 || y >= static_cast<int>(m_height)) continue;
        for (int x = box.left; x < box.right; ++x) {
            if (x < 0 || x >= static_cast<int>(m_width)) continue;
            out.setIndex(static_cast<unsigned int>(x - box.left),
                         static_cast<unsigned int>(y - box.top),
                         getIndex(static_cast<unsigned int>(x), static_cast<unsigned int>(y)));
        }
    }
    return out;
}

PaletteRaster PaletteRaster::resizedNearest(unsigned int width, unsigned int height) const {
    PaletteRaster out(width, height, 0);
    out.m_palette = m_palette;
    if (empty()) {
        return out;
    }
    for (unsigned int y = 0; y < height; ++y) {
        // Pixel-centre sampling, same as a nearest-neighbour image resize.
        const unsigned int sy = std::min(m_height - 1,
            static_cast<unsigned int>((static_cast<double>(y) + 0.5) * m_height / height));
        for (unsigned int x = 0; x < width; ++x) {
            const unsigned int sx = std::min(m_width - 1,
                static_cast<unsigned int>((static_cast<double>(x) + 0.5) * m_width / width));
            out.setIndex(x, y, getIndex(sx, sy));
        }
    }
    return out;
}

std::map<std::uint8_t, std::size_t> PaletteRaster::usedIndices() const {
    std::array<std::size_t, 256> counts{};
    for (std::uint8_t index : m_indices) {
        counts[index]++;
    }
    std::map<std::uint8_t, std::size_t> used;
    for (int i = 0; i < 256; ++i) {
        if (counts[static_cast<size_t>(i)] > 0) {
            used.emplace(static_cast<std::uint8_t>(i), counts[static_cast<size_t>(i)]);
        }
    }
    return used;
}

bool PaletteRaster::loadFromBmpFile(const std::string& path, std::string* errorMessage) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail(errorMessage, path, "cannot open file");
    }
    const std::vector<unsigned char> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (data.size() < kBmpFileHeaderSize + kBmpInfoHeaderSize || data[0] != 'B' || data[1] != 'M') {
        return fail(errorMessage, path, "not a BMP file");
    }

    const std::uint32_t pixelOffset = readU32(data, 10);
    const std::uint32_t infoSize = readU32(data, 14);
    const std::int32_t rawWidth = static_cast<std::int32_t>(readU32(data, 18));
    const std::int32_t rawHeight = static_cast<std::int32_t>(readU32(data, 22));
    const std::uint16_t bitCount = readU16(data, 28);
    const std::uint32_t compression = readU32(data, 30);
    std::uint32_t colorsUsed = readU32(data, 46);

    if (infoSize < kBmpInfoHeaderSize) {
        return fail(errorMessage, path, "unsupported BMP header version");
    }
    if (bitCount != 8) {
        std::ostringstream oss;
        oss << "expected an 8-bit indexed bitmap, got " << bitCount << " bits per pixel";
        return fail(errorMessage, path, oss.str());
    }
    if (compression != kBmpCompressionRgb) {
        return fail(errorMessage, path, "compressed bitmaps are not supported");
    }
    if (rawWidth <= 0 || rawHeight == 0) {
        return fail(errorMessage, path, "invalid dimensions");
    }

    const bool topDown = rawHeight < 0;
    const unsigned int width = static_cast<unsigned int>(rawWidth);
    const unsigned int height = static_cast<unsigned int>(topDown ? -static_cast<std::int64_t>(rawHeight) : rawHeight);
    if (colorsUsed == 0 || colorsUsed > 256) {
        colorsUsed = 256;
    }

    const size_t paletteOffset = kBmpFileHeaderSize + infoSize;
    if (paletteOffset + static_cast<size_t>(colorsUsed) * 4u > data.size()) {
        return fail(errorMessage, path, "truncated palette");
    }
    const size_t stride = bmpRowStride(width);
    if (static_cast<size_t>(pixelOffset) + stride * height > data.size()) {
        return fail(errorMessage, path, "truncated pixel data");
    }

    PaletteRaster loaded(width, height, 0);
    loaded.m_palette.fill(sf::Color::Black);
    for (std::uint32_t i = 0; i < colorsUsed; ++i) {
        const size_t p = paletteOffset + static_cast<size_t>(i) * 4u;
        loaded.m_palette[i] = sf::Color(data[p + 2], data[p + 1], data[p]);
    }
    for (unsigned int row = 0; row < height; ++row) {
        const unsigned int y = topDown ? row : (height - 1 - row);
        const unsigned char* src = data.data() + pixelOffset + stride * row;
        std::copy(src, src + width, loaded.rowPtr(y));
    }

    *this = std::move(loaded);
    return true;
}

bool PaletteRaster::saveToBmpFile(const std::string& path, std::string* errorMessage) const {
    const size_t stride = bmpRowStride(m_width);
    const std::uint32_t pixelOffset = kBmpFileHeaderSize + kBmpInfoHeaderSize + 256u * 4u;
    const std::uint32_t imageSize = static_cast<std::uint32_t>(stride * m_height);

    std::vector<unsigned char> out;
    out.reserve(pixelOffset + imageSize);
    out.push_back('B');
    out.push_back('M');
    writeU32(out, pixelOffset + imageSize);
    writeU16(out, 0);
    writeU16(out, 0);
    writeU32(out, pixelOffset);

    writeU32(out, kBmpInfoHeaderSize);
    writeU32(out, m_width);
    writeU32(out, m_height); // bottom-up
    writeU16(out, 1);
    writeU16(out, 8);
    writeU32(out, kBmpCompressionRgb);
    writeU32(out, imageSize);
    writeU32(out, 2835);
    writeU32(out, 2835);
    writeU32(out, 256);
    writeU32(out, 0);

    for (const sf::Color& c : m_palette) {
        out.push_back(c.b);
        out.push_back(c.g);
        out.push_back(c.r);
        out.push_back(0);
    }
    for (unsigned int row = 0; row < m_height; ++row) {
        const std::uint8_t* src = rowPtr(m_height - 1 - row);
        out.insert(out.end(), src, src + m_width);
        out.insert(out.end(), stride - m_width, 0);
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        if (errorMessage) {
            *errorMessage = "Failed to open '" + path + "' for writing";
        }
        return false;
    }
    file.write(reinterpret_cast<const char*>(out.data()), static_cast<std::streamsize>(out.size()));
    if (!file) {
        if (errorMessage) {
            *errorMessage = "Failed to write bitmap '" + path + "'";
        }
        return false;
    }
    return true;
}
