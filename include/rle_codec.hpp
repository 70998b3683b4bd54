//
//  rle_codec.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "byte_io.hpp"

namespace pgsforge {

// Longest run a single RLE code can carry (14 bits).
inline constexpr uint32_t kMaxRleRun = 16383;

// Decode PGS run-length data into width*height palette indices. The cursor advances
// linearly; end-of-line codes are accepted but not enforced. Never writes past the
// output buffer and never throws.
std::vector<uint8_t> decompress_rle(ByteView data, uint32_t width, uint32_t height);

// Encode palette indices as PGS run-length data. An end-of-line code follows every run
// that brings the horizontal cursor to `width`; runs are not split at row boundaries.
std::vector<uint8_t> compress_rle(const std::vector<uint8_t> &pixels, uint32_t width);

}  // namespace pgsforge
