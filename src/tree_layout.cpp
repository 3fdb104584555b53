#include "tree_layout.h"

#include <algorithm>
#include <cmath>
#include <vector>

PaletteRaster projectTreeLayout(const PaletteRaster& trees,
                                unsigned int destWidth,
                                unsigned int destHeight,
                                std::uint8_t noTreeIndex) {
    PaletteRaster out(destWidth, destHeight, noTreeIndex);
    out.setPalette(trees.getPalette());
    if (trees.empty() || destWidth == 0 || destHeight == 0) {
        return out;
    }

    const double xRatio = static_cast<double>(destWidth) / static_cast<double>(trees.getWidth());
    const double yRatio = static_cast<double>(destHeight) / static_cast<double>(trees.getHeight());
    const int lastColumn = static_cast<int>(destWidth) - 1;
    const int lastRow = static_cast<int>(destHeight) - 1;

    std::vector<std::uint8_t> row(destWidth, noTreeIndex);
    for (unsigned int Y = 0; Y < trees.getHeight(); ++Y) {
        std::fill(row.begin(), row.end(), noTreeIndex);
        const double shift = (Y % 2 == 0) ? 0.5 : 0.0;

        const std::uint8_t* src = trees.rowPtr(Y);
        for (unsigned int X = 0; X < trees.getWidth(); ++X) {
            const std::uint8_t index = src[X];
            if (index == noTreeIndex) continue;
            const int xStart = static_cast<int>(std::floor((static_cast<double>(X) - shift) * xRatio));
            // End is exclusive; clamping it to the last column means that column is never stamped.
            const int xEnd = std::min(static_cast<int>(std::ceil((static_cast<double>(X) + 1.0 - shift) * xRatio)), lastColumn);
            for (int x = std::max(0, xStart); x < xEnd; ++x) {
                row[static_cast<size_t>(x)] = index;
            }
        }

        const int yEnd = static_cast<int>(std::floor((static_cast<double>(Y) + 0.5) * yRatio));
        const int yStart = std::min(static_cast<int>(std::floor((static_cast<double>(Y) + 1.5) * yRatio)), lastRow);
        for (int y = yStart; y >= yEnd; y -= 2) {
            if (y < 0) break;
            std::uint8_t* dst = out.rowPtr(static_cast<unsigned int>(y));
            for (unsigned int x = 0; x < destWidth; ++x) {
                if (row[x] != noTreeIndex) {
                    dst[x] = row[x];
                }
            }
        }
    }
    return out;
}

std::shared_ptr<const PaletteRaster> buildTreeLayer(const PaletteRaster& trees,
                                                    unsigned int destWidth,
                                                    unsigned int destHeight,
                                                    std::uint8_t noTreeIndex) {
    return std::make_shared<const PaletteRaster>(projectTreeLayout(trees, destWidth, destHeight, noTreeIndex));
}
