//
//  color_convert.cpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "color_convert.hpp"

#include <algorithm>
#include <cmath>

namespace pgsforge {

namespace {

uint8_t clamp_round(double v) {
    const double r = std::round(v);
    return static_cast<uint8_t>(std::clamp(r, 0.0, 255.0));
}

}  // namespace

uint32_t ycbcr_to_rgba(uint8_t y, uint8_t cb, uint8_t cr, uint8_t alpha) {
    const double yy = y;
    const double cbb = static_cast<double>(cb) - 128.0;
    const double crr = static_cast<double>(cr) - 128.0;
    const uint8_t r = clamp_round(yy + 1.402 * crr);
    const uint8_t g = clamp_round(yy - 0.344136 * cbb - 0.714136 * crr);
    const uint8_t b = clamp_round(yy + 1.772 * cbb);
    return pack_rgba(r, g, b, alpha);
}

PaletteEntry rgba_to_ycbcr(uint32_t rgba) {
    const double r = (rgba >> 24) & 0xFF;
    const double g = (rgba >> 16) & 0xFF;
    const double b = (rgba >> 8) & 0xFF;

    PaletteEntry e;
    e.index = 0;
    e.y = clamp_round(0.299 * r + 0.587 * g + 0.114 * b);
    e.cb = clamp_round(128.0 - 0.168736 * r - 0.331264 * g + 0.5 * b);
    e.cr = clamp_round(128.0 + 0.5 * r - 0.418688 * g - 0.081312 * b);
    e.alpha = static_cast<uint8_t>(rgba & 0xFF);
    return e;
}

RgbaPalette build_palette(const std::vector<PaletteEntry> &entries) {
    RgbaPalette palette{};
    for (const auto &e : entries) {
        palette[e.index] = ycbcr_to_rgba(e.y, e.cb, e.cr, e.alpha);
    }
    return palette;
}

}  // namespace pgsforge
