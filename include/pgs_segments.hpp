//
//  pgs_segments.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "byte_io.hpp"

namespace pgsforge {

// Every segment starts with "PG" + pts(4) + dts(4) + type(1) + size(2).
inline constexpr size_t kSegmentHeaderSize = 13;
inline constexpr uint8_t kSegmentMagic0 = 0x50;  // 'P'
inline constexpr uint8_t kSegmentMagic1 = 0x47;  // 'G'

// PTS/DTS clock.
inline constexpr uint32_t kPtsClockHz = 90000;
inline constexpr uint32_t kPtsPerMs = 90;

enum class SegmentType : uint8_t {
    Palette = 0x14,
    Object = 0x15,
    Composition = 0x16,
    Window = 0x17,
    End = 0x80,
};

// Human readable name for logs; unknown codes map to "reserved".
const char *segment_type_name(uint8_t type);

struct SegmentHeader {
    uint32_t pts = 0;  // 90 kHz units
    uint32_t dts = 0;  // 90 kHz units
    uint8_t type = 0;  // raw type code, may be outside SegmentType
    uint16_t size = 0;  // payload bytes following the header
};

struct PaletteEntry {
    uint8_t index = 0;
    uint8_t y = 0;
    uint8_t cr = 0;
    uint8_t cb = 0;
    uint8_t alpha = 0;
};

struct PaletteSegment {
    uint8_t palette_id = 0;
    uint8_t version = 0;
    std::vector<PaletteEntry> entries;  // in stream order, duplicates kept
};

inline constexpr uint8_t kObjectFirstInSequence = 0x80;
inline constexpr uint8_t kObjectLastInSequence = 0x40;
inline constexpr size_t kObjectFirstHeaderSize = 11;
inline constexpr size_t kObjectContinuationHeaderSize = 4;

struct ObjectSegment {
    uint16_t object_id = 0;
    uint8_t version = 0;
    bool first_in_sequence = false;
    bool last_in_sequence = false;
    uint32_t declared_length = 0;  // first fragment only (24 bit)
    uint16_t width = 0;            // first fragment only
    uint16_t height = 0;           // first fragment only
    ByteView data;                 // RLE bytes, points into the source buffer
};

inline constexpr uint8_t kCompositionObjectForced = 0x40;
inline constexpr uint8_t kCompositionObjectCropped = 0x80;
inline constexpr size_t kCompositionHeaderSize = 11;
inline constexpr size_t kCompositionObjectSize = 8;
inline constexpr size_t kCropRectSize = 8;

// Composition states.
inline constexpr uint8_t kCompositionStateNormal = 0x00;
inline constexpr uint8_t kCompositionStateAcquisitionPoint = 0x40;
inline constexpr uint8_t kCompositionStateEpochStart = 0x80;

struct CropRect {
    uint16_t x = 0;
    uint16_t y = 0;
    uint16_t width = 0;
    uint16_t height = 0;
};

struct CompositionObject {
    uint16_t object_id = 0;
    uint8_t window_id = 0;
    uint16_t x = 0;
    uint16_t y = 0;
    bool forced = false;
    bool cropped = false;
    std::optional<CropRect> crop;  // parsed but never applied to pixels
};

struct CompositionSegment {
    uint16_t width = 0;
    uint16_t height = 0;
    uint8_t frame_rate = 0;
    uint16_t composition_number = 0;
    uint8_t composition_state = 0;
    bool palette_update = false;
    uint8_t palette_id = 0;
    std::vector<CompositionObject> objects;  // empty == clear
};

inline constexpr size_t kWindowSegmentMinSize = 10;

struct WindowSegment {
    uint8_t window_id = 0;
    uint16_t x = 0;
    uint16_t y = 0;
    uint16_t width = 0;
    uint16_t height = 0;
};

// Reads the 13-byte preamble at offset. nullopt when the magic is missing or fewer than
// 13 bytes remain.
std::optional<SegmentHeader> read_segment_header(ByteView buffer, size_t offset);

// Body decoders. Each takes exactly the segment payload and returns nullopt when it is too
// short for its type.
std::optional<PaletteSegment> parse_palette_segment(ByteView payload);
std::optional<ObjectSegment> parse_object_segment(ByteView payload);
std::optional<CompositionSegment> parse_composition_segment(ByteView payload);
std::optional<WindowSegment> parse_window_segment(ByteView payload);

}  // namespace pgsforge
