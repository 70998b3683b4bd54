//
//  pgs_encoder.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "subtitle_document.hpp"

namespace pgsforge {

inline constexpr size_t kMaxSegmentPayload = 0xFFFF;
inline constexpr uint8_t kFrameRate23976 = 0x10;

struct EncodeOptions {
    uint16_t canvas_width = 1920;
    uint16_t canvas_height = 1080;
    uint8_t frame_rate_code = kFrameRate23976;
    // Object segments larger than this are split into fragments.
    size_t max_object_segment_payload = kMaxSegmentPayload;
};

// Encode every event that carries an image. Each event becomes
// Composition, Window, Palette, Object(s), End at its start time, followed by a clear
// display set at its end time unless the next event starts right there.
//
// Throws std::invalid_argument when an event is inconsistent (pixel count not matching
// width*height, dimensions outside 1..65535, end before start, timestamps beyond the 32-bit
// PTS range) or when the options are unusable.
std::vector<uint8_t> encode_pgs(const SubtitleDocument &doc, const EncodeOptions &options = {});

#ifdef PGSFORGE_TESTING
namespace testing {
// Object segment payloads (without segment headers) for one RLE blob.
std::vector<std::vector<uint8_t>> object_fragments_for_test(uint16_t object_id, uint16_t width,
                                                            uint16_t height,
                                                            const std::vector<uint8_t> &rle,
                                                            size_t max_payload);
}  // namespace testing
#endif

}  // namespace pgsforge
