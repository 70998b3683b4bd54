//
//  pgs_decoder.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "byte_io.hpp"
#include "event_builder.hpp"
#include "subtitle_document.hpp"

namespace pgsforge {

struct DecodeOptions {
    uint32_t default_duration_ms = kDefaultLastDurationMs;  // on-screen time of the last set
};

struct DecodeResult {
    SubtitleDocument document;
    std::vector<DecodeWarning> warnings;
    size_t display_set_count = 0;  // finalized sets, clears included
    size_t bytes_consumed = 0;     // up to the last complete segment
};

// Decode a fully buffered PGS stream. Never throws on malformed input: truncation stops
// decoding, broken segments are skipped, and every such condition lands in `warnings`.
DecodeResult decode_pgs(ByteView data, const DecodeOptions &options = {});
DecodeResult decode_pgs(const std::vector<uint8_t> &data, const DecodeOptions &options = {});

}  // namespace pgsforge
