//
//  pgs_segments.cpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "pgs_segments.hpp"

#include "logging.hpp"

namespace pgsforge {

const char *segment_type_name(uint8_t type) {
    switch (static_cast<SegmentType>(type)) {
    case SegmentType::Palette:
        return "Palette Definition";
    case SegmentType::Object:
        return "Object Definition";
    case SegmentType::Composition:
        return "Presentation Composition";
    case SegmentType::Window:
        return "Window Definition";
    case SegmentType::End:
        return "End Of Display";
    }
    return "reserved";
}

std::optional<SegmentHeader> read_segment_header(ByteView buffer, size_t offset) {
    if (offset > buffer.size || buffer.size - offset < kSegmentHeaderSize) {
        return std::nullopt;
    }
    const uint8_t *p = buffer.data + offset;
    if (p[0] != kSegmentMagic0 || p[1] != kSegmentMagic1) {
        return std::nullopt;
    }
    SegmentHeader header;
    header.pts = read_u32_be(p + 2);
    header.dts = read_u32_be(p + 6);
    header.type = p[10];
    header.size = read_u16_be(p + 11);
    return header;
}

std::optional<PaletteSegment> parse_palette_segment(ByteView payload) {
    if (payload.size < 2) {
        return std::nullopt;
    }
    PaletteSegment pds;
    pds.palette_id = payload[0];
    pds.version = payload[1];
    pds.entries.reserve((payload.size - 2) / 5);
    for (size_t pos = 2; pos + 5 <= payload.size; pos += 5) {
        PaletteEntry e;
        e.index = payload[pos];
        e.y = payload[pos + 1];
        e.cr = payload[pos + 2];
        e.cb = payload[pos + 3];
        e.alpha = payload[pos + 4];
        pds.entries.push_back(e);
    }
    if ((payload.size - 2) % 5 != 0) {
        PF_LOG("pgs", "palette " << int(pds.palette_id) << " has "
                                 << (payload.size - 2) % 5 << " trailing bytes; ignored");
    }
    return pds;
}

std::optional<ObjectSegment> parse_object_segment(ByteView payload) {
    if (payload.size < kObjectContinuationHeaderSize) {
        return std::nullopt;
    }
    ObjectSegment ods;
    ods.object_id = read_u16_be(payload.data);
    ods.version = payload[2];
    const uint8_t flags = payload[3];
    ods.first_in_sequence = (flags & kObjectFirstInSequence) != 0;
    ods.last_in_sequence = (flags & kObjectLastInSequence) != 0;

    size_t data_offset = kObjectContinuationHeaderSize;
    if (ods.first_in_sequence) {
        if (payload.size < kObjectFirstHeaderSize) {
            return std::nullopt;
        }
        ods.declared_length = read_u24_be(payload.data + 4);
        ods.width = read_u16_be(payload.data + 7);
        ods.height = read_u16_be(payload.data + 9);
        data_offset = kObjectFirstHeaderSize;
    }
    ods.data = payload.sub(data_offset, payload.size - data_offset);
    return ods;
}

std::optional<CompositionSegment> parse_composition_segment(ByteView payload) {
    if (payload.size < kCompositionHeaderSize) {
        return std::nullopt;
    }
    CompositionSegment pcs;
    pcs.width = read_u16_be(payload.data);
    pcs.height = read_u16_be(payload.data + 2);
    pcs.frame_rate = payload[4];
    pcs.composition_number = read_u16_be(payload.data + 5);
    pcs.composition_state = payload[7];
    pcs.palette_update = payload[8] != 0;
    pcs.palette_id = payload[9];
    const uint8_t object_count = payload[10];

    size_t pos = kCompositionHeaderSize;
    for (uint8_t i = 0; i < object_count; ++i) {
        if (pos + kCompositionObjectSize > payload.size) {
            PF_LOG("pgs", "composition " << pcs.composition_number << " truncated after "
                                         << pcs.objects.size() << " of " << int(object_count)
                                         << " objects");
            break;
        }
        CompositionObject obj;
        obj.object_id = read_u16_be(payload.data + pos);
        obj.window_id = payload[pos + 2];
        const uint8_t flags = payload[pos + 3];
        obj.x = read_u16_be(payload.data + pos + 4);
        obj.y = read_u16_be(payload.data + pos + 6);
        obj.forced = (flags & kCompositionObjectForced) != 0;
        obj.cropped = (flags & kCompositionObjectCropped) != 0;
        pos += kCompositionObjectSize;

        if (obj.cropped) {
            if (pos + kCropRectSize > payload.size) {
                PF_LOG("pgs", "composition " << pcs.composition_number
                                             << " crop rect truncated; dropping object "
                                             << obj.object_id);
                break;
            }
            CropRect crop;
            crop.x = read_u16_be(payload.data + pos);
            crop.y = read_u16_be(payload.data + pos + 2);
            crop.width = read_u16_be(payload.data + pos + 4);
            crop.height = read_u16_be(payload.data + pos + 6);
            obj.crop = crop;
            pos += kCropRectSize;
        }
        pcs.objects.push_back(obj);
    }
    return pcs;
}

std::optional<WindowSegment> parse_window_segment(ByteView payload) {
    if (payload.size < kWindowSegmentMinSize) {
        return std::nullopt;
    }
    const uint8_t count = payload[0];
    if (count < 1) {
        return std::nullopt;
    }
    if (count > 1) {
        PF_LOG("pgs", "window segment declares " << int(count) << " windows; using the first");
    }
    WindowSegment wds;
    wds.window_id = payload[1];
    wds.x = read_u16_be(payload.data + 2);
    wds.y = read_u16_be(payload.data + 4);
    wds.width = read_u16_be(payload.data + 6);
    wds.height = read_u16_be(payload.data + 8);
    return wds;
}

}  // namespace pgsforge
