// tree_layout.h
#pragma once

#include <cstdint>
#include <memory>

#include "palette_raster.h"

// Projects the low-resolution tree map onto the terrain grid the way the game places trees
// when it assigns terrain:
// - even source rows are shifted left by half a source pixel (hex-staggered tree models),
// - each source row is widened to [floor((X - shift) * xRatio), min(ceil((X + 1 - shift) * xRatio), W - 1)),
// - the widened row is stamped on every other destination row, from
//   min(floor((Y + 1.5) * yRatio), H - 1) upwards to floor((Y + 0.5) * yRatio) inclusive,
// - only pixels other than `noTreeIndex` are stamped; later source rows overwrite earlier ones.
// The gaps between stamped rows let the plain terrain map vote through.
PaletteRaster projectTreeLayout(const PaletteRaster& trees,
                                unsigned int destWidth,
                                unsigned int destHeight,
                                std::uint8_t noTreeIndex = 0);

// Projected layer as a shared immutable artifact; build once, then hand to any number of
// classifiers (or threads).
std::shared_ptr<const PaletteRaster> buildTreeLayer(const PaletteRaster& trees,
                                                    unsigned int destWidth,
                                                    unsigned int destHeight,
                                                    std::uint8_t noTreeIndex = 0);
