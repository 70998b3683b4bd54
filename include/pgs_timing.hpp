//
//  pgs_timing.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

#include "pgs_segments.hpp"

namespace pgsforge {

// Default on-screen time for the last display set of a stream.
inline constexpr uint32_t kDefaultLastDurationMs = 5000;

inline uint32_t pts_to_ms(uint32_t pts) {
    return static_cast<uint32_t>(std::lround(static_cast<double>(pts) / kPtsPerMs));
}

// nullopt when the result does not fit the 32-bit PTS field.
inline std::optional<uint32_t> ms_to_pts(uint32_t ms) {
    const uint64_t pts = static_cast<uint64_t>(ms) * kPtsPerMs;
    if (pts > std::numeric_limits<uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(pts);
}

// Derive end times (ms) from the presentation timestamps of consecutive display sets. Each
// set ends where the next one starts; the last one lasts `last_duration_ms`.
template <typename Set>
inline std::vector<uint32_t> derive_end_times_ms(const std::vector<Set> &sets,
                                                 uint32_t last_duration_ms =
                                                     kDefaultLastDurationMs) {
    std::vector<uint32_t> ends;
    ends.reserve(sets.size());
    for (size_t i = 0; i < sets.size(); ++i) {
        if (i + 1 < sets.size()) {
            ends.push_back(pts_to_ms(sets[i + 1].pts));
        } else {
            ends.push_back(pts_to_ms(sets[i].pts) + last_duration_ms);
        }
    }
    return ends;
}

}  // namespace pgsforge
