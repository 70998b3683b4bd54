//
//  event_builder.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "display_set.hpp"
#include "pgs_timing.hpp"
#include "subtitle_document.hpp"

namespace pgsforge {

enum class WarningKind {
    Truncated,          // header or payload cut short; decoding stopped
    MalformedSegment,   // body too short for its type; segment skipped
    DroppedDisplaySet,  // composition without End, replaced or cut by end of input
    UnresolvedObject,   // composition object without a complete, non-empty object
};

struct DecodeWarning {
    WarningKind kind = WarningKind::MalformedSegment;
    size_t offset = 0;  // byte offset of the offending segment (0 for build-time warnings)
    uint32_t pts = 0;
    std::string message;
};

// Turn finalized display sets into document events, one per composition object of every
// non-empty set. Returns the number of events appended to `doc`.
size_t build_events(const std::vector<DisplaySet> &sets, SubtitleDocument &doc,
                    uint32_t last_duration_ms = kDefaultLastDurationMs,
                    std::vector<DecodeWarning> *warnings = nullptr);

}  // namespace pgsforge
