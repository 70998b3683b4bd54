//
//  color_convert.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "pgs_segments.hpp"

namespace pgsforge {

// 256 packed RGBA colors (R in the top byte, alpha in the low byte).
using RgbaPalette = std::array<uint32_t, 256>;

inline constexpr uint32_t pack_rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return (uint32_t(r) << 24) | (uint32_t(g) << 16) | (uint32_t(b) << 8) | uint32_t(a);
}

// BT.601 full-range YCbCr + alpha to packed RGBA.
uint32_t ycbcr_to_rgba(uint8_t y, uint8_t cb, uint8_t cr, uint8_t alpha);

// Packed RGBA to BT.601 YCbCr + alpha. The returned entry has index 0.
PaletteEntry rgba_to_ycbcr(uint32_t rgba);

// Positions not named by `entries` stay 0 (transparent black). Later duplicates win.
RgbaPalette build_palette(const std::vector<PaletteEntry> &entries);

}  // namespace pgsforge
