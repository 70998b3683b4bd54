//
//  display_set.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <variant>
#include <vector>

#include "byte_io.hpp"
#include "pgs_segments.hpp"

namespace pgsforge {

// Payload of one object id, kept as views into the source buffer in arrival order.
struct ObjectFragments {
    uint16_t width = 0;   // from the first fragment seen for the id
    uint16_t height = 0;
    std::vector<ByteView> fragments;

    size_t total_size() const;
    // Concatenated RLE bytes. Single-fragment objects still return a copy; use
    // `fragments.front()` directly when only one exists.
    std::vector<uint8_t> gather() const;
};

struct InProgressObject {
    ObjectFragments object;
};

// Reached once a fragment flagged last-in-sequence has been consumed.
struct CompleteObject {
    ObjectFragments object;
};

using ObjectAccumulator = std::variant<InProgressObject, CompleteObject>;

// Segments between a composition and its End marker. Views inside `objects` point into the
// buffer that was decoded; a DisplaySet must not outlive it.
struct DisplaySet {
    uint32_t pts = 0;
    CompositionSegment composition;
    std::map<uint8_t, WindowSegment> windows;
    std::map<uint16_t, ObjectAccumulator> objects;
    std::optional<PaletteSegment> palette;

    // nullptr when the id is unknown or still waiting for its last fragment.
    const CompleteObject *find_complete_object(uint16_t object_id) const;
};

enum class FeedResult {
    Accepted,   // merged into the open set (or opened / finalized one)
    Restarted,  // composition arrived while a set was open; the open set was dropped
    Ignored,    // no open set, End while idle, or unknown segment type
    Malformed,  // body too short for its type; segment discarded
};

// Groups segments into display sets:
//   idle --Composition--> open --End--> idle (set finalized)
//   open --Composition--> open (previous set dropped)
class DisplaySetAssembler {
   public:
    FeedResult feed(const SegmentHeader &header, ByteView payload);

    bool is_open() const { return current_.has_value(); }
    const std::vector<DisplaySet> &display_sets() const { return finished_; }
    std::vector<DisplaySet> take_display_sets();
    size_t dropped_sets() const { return dropped_; }

   private:
    FeedResult on_composition(const SegmentHeader &header, ByteView payload);
    FeedResult on_window(ByteView payload);
    FeedResult on_palette(ByteView payload);
    FeedResult on_object(ByteView payload);
    FeedResult on_end();

    std::optional<DisplaySet> current_;
    std::vector<DisplaySet> finished_;
    size_t dropped_ = 0;
};

}  // namespace pgsforge
