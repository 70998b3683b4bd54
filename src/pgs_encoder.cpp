//
//  pgs_encoder.cpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "pgs_encoder.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "byte_io.hpp"
#include "color_convert.hpp"
#include "logging.hpp"
#include "pgs_segments.hpp"
#include "pgs_timing.hpp"
#include "rle_codec.hpp"

namespace pgsforge {

namespace {

constexpr uint16_t kObjectId = 0;
constexpr uint8_t kPaletteId = 0;
constexpr uint32_t kMaxDeclaredObjectLength = 0xFFFFFF;

void write_segment(std::vector<uint8_t> &out, uint32_t pts, SegmentType type,
                   const std::vector<uint8_t> &payload) {
    write_u8(out, kSegmentMagic0);
    write_u8(out, kSegmentMagic1);
    write_u32(out, pts);
    write_u32(out, pts);  // dts
    write_u8(out, static_cast<uint8_t>(type));
    write_u16(out, static_cast<uint16_t>(payload.size()));
    write_bytes(out, ByteView(payload));
}

[[noreturn]] void fail(const SubtitleEvent &event, const std::string &what) {
    throw std::invalid_argument("event " + std::to_string(event.id) + ": " + what);
}

// Start/end PTS of a validated event.
std::pair<uint32_t, uint32_t> validate_event(const SubtitleEvent &event) {
    const IndexedImage &img = *event.image;
    if (img.width == 0 || img.height == 0 || img.width > 0xFFFF || img.height > 0xFFFF) {
        fail(event, "image size " + std::to_string(img.width) + "x" +
                        std::to_string(img.height) + " outside 1..65535");
    }
    if (img.x > 0xFFFF || img.y > 0xFFFF) {
        fail(event, "image position outside 0..65535");
    }
    const size_t expected = static_cast<size_t>(img.width) * img.height;
    if (img.pixels.size() != expected) {
        fail(event, "pixel buffer holds " + std::to_string(img.pixels.size()) +
                        " indices, expected " + std::to_string(expected));
    }
    if (event.end_ms < event.start_ms) {
        fail(event, "end_ms precedes start_ms");
    }
    auto start = ms_to_pts(event.start_ms);
    auto end = ms_to_pts(event.end_ms);
    if (!start || !end) {
        fail(event, "timestamp exceeds the 32-bit 90 kHz range");
    }
    return {*start, *end};
}

std::vector<uint8_t> composition_payload(const EncodeOptions &options,
                                         uint16_t composition_number, uint8_t state,
                                         const std::optional<CompositionObject> &object) {
    std::vector<uint8_t> p;
    write_u16(p, options.canvas_width);
    write_u16(p, options.canvas_height);
    write_u8(p, options.frame_rate_code);
    write_u16(p, composition_number);
    write_u8(p, state);
    write_u8(p, 0x00);  // palette update flag
    write_u8(p, kPaletteId);
    write_u8(p, object ? 1 : 0);
    if (object) {
        write_u16(p, object->object_id);
        write_u8(p, object->window_id);
        write_u8(p, object->forced ? kCompositionObjectForced : 0x00);
        write_u16(p, object->x);
        write_u16(p, object->y);
    }
    return p;
}

std::vector<uint8_t> window_payload(const WindowSegment &w) {
    std::vector<uint8_t> p;
    write_u8(p, 1);  // number of windows
    write_u8(p, w.window_id);
    write_u16(p, w.x);
    write_u16(p, w.y);
    write_u16(p, w.width);
    write_u16(p, w.height);
    return p;
}

std::vector<uint8_t> palette_payload(uint8_t version, const RgbaPalette &palette) {
    std::vector<uint8_t> p;
    write_u8(p, kPaletteId);
    write_u8(p, version);
    for (size_t i = 0; i < palette.size(); ++i) {
        // Unlisted entries decode as transparent black.
        if (palette[i] == 0) {
            continue;
        }
        const PaletteEntry e = rgba_to_ycbcr(palette[i]);
        write_u8(p, static_cast<uint8_t>(i));
        write_u8(p, e.y);
        write_u8(p, e.cr);
        write_u8(p, e.cb);
        write_u8(p, e.alpha);
    }
    return p;
}

std::vector<std::vector<uint8_t>> object_fragments(uint16_t object_id, uint16_t width,
                                                   uint16_t height,
                                                   const std::vector<uint8_t> &rle,
                                                   size_t max_payload) {
    if (rle.size() + 4 > kMaxDeclaredObjectLength) {
        throw std::invalid_argument("compressed object of " + std::to_string(rle.size()) +
                                    " bytes exceeds the 24-bit object length field");
    }
    std::vector<std::vector<uint8_t>> fragments;
    size_t pos = 0;
    bool first = true;
    do {
        const size_t header_size =
            first ? kObjectFirstHeaderSize : kObjectContinuationHeaderSize;
        const size_t chunk = std::min(rle.size() - pos, max_payload - header_size);
        const bool last = pos + chunk == rle.size();

        std::vector<uint8_t> p;
        p.reserve(header_size + chunk);
        write_u16(p, object_id);
        write_u8(p, 0);  // version
        write_u8(p, static_cast<uint8_t>((first ? kObjectFirstInSequence : 0) |
                                         (last ? kObjectLastInSequence : 0)));
        if (first) {
            // Declared length counts width and height too.
            write_u24(p, static_cast<uint32_t>(rle.size() + 4));
            write_u16(p, width);
            write_u16(p, height);
        }
        p.insert(p.end(), rle.begin() + pos, rle.begin() + pos + chunk);
        fragments.push_back(std::move(p));

        pos += chunk;
        first = false;
    } while (pos < rle.size());
    return fragments;
}

class PgsEncoder {
   public:
    explicit PgsEncoder(const EncodeOptions &options) : options_(options) {}

    std::vector<uint8_t> encode(const SubtitleDocument &doc) {
        std::vector<const SubtitleEvent *> imaged;
        for (const auto &ev : doc.events) {
            if (ev.image) {
                imaged.push_back(&ev);
            }
        }
        // Display sets must go out in presentation order.
        std::stable_sort(imaged.begin(), imaged.end(),
                         [](const SubtitleEvent *a, const SubtitleEvent *b) {
                             return a->start_ms < b->start_ms;
                         });
        for (size_t i = 0; i < imaged.size(); ++i) {
            const SubtitleEvent *next = i + 1 < imaged.size() ? imaged[i + 1] : nullptr;
            write_event(*imaged[i], next);
        }
        PF_LOG("encoder", "encoded " << imaged.size() << " of " << doc.events.size()
                                     << " events into " << out_.size() << " bytes");
        return std::move(out_);
    }

   private:
    void write_event(const SubtitleEvent &event, const SubtitleEvent *next) {
        const auto [start_pts, end_pts] = validate_event(event);
        const IndexedImage &img = *event.image;

        uint16_t composition_number = next_composition_number_;
        CompositionObject ref;
        ref.object_id = kObjectId;
        ref.x = static_cast<uint16_t>(img.x);
        ref.y = static_cast<uint16_t>(img.y);
        if (event.pgs) {
            composition_number = event.pgs->composition_number;
            ref.window_id = event.pgs->window_id;
            ref.forced = event.pgs->forced;
        }
        next_composition_number_ = static_cast<uint16_t>(composition_number + 1);

        WindowSegment window;
        window.window_id = ref.window_id;
        window.x = ref.x;
        window.y = ref.y;
        window.width = static_cast<uint16_t>(img.width);
        window.height = static_cast<uint16_t>(img.height);

        const std::vector<uint8_t> rle = compress_rle(img.pixels, img.width);
        PF_LOG("encoder", "event " << event.id << " " << img.width << "x" << img.height
                                   << " rle=" << rle.size() << " bytes pts=" << start_pts);

        write_segment(out_, start_pts, SegmentType::Composition,
                      composition_payload(options_, composition_number,
                                          kCompositionStateEpochStart, ref));
        write_segment(out_, start_pts, SegmentType::Window, window_payload(window));
        write_segment(out_, start_pts, SegmentType::Palette, palette_for(img.palette));
        for (const auto &frag : object_fragments(kObjectId, window.width, window.height, rle,
                                                 options_.max_object_segment_payload)) {
            write_segment(out_, start_pts, SegmentType::Object, frag);
        }
        write_segment(out_, start_pts, SegmentType::End, {});

        // A next event starting at or before end_ms replaces this one; overlaps are cut
        // at the next start.
        if (!next || next->start_ms > event.end_ms) {
            write_clear(end_pts, window);
        }
    }

    void write_clear(uint32_t pts, const WindowSegment &window) {
        const uint16_t composition_number = next_composition_number_;
        next_composition_number_ = static_cast<uint16_t>(composition_number + 1);
        write_segment(out_, pts, SegmentType::Composition,
                      composition_payload(options_, composition_number,
                                          kCompositionStateNormal, std::nullopt));
        write_segment(out_, pts, SegmentType::Window, window_payload(window));
        write_segment(out_, pts, SegmentType::End, {});
    }

    // Consecutive events usually share one palette; convert it only when it changes.
    const std::vector<uint8_t> &palette_for(const RgbaPalette &palette) {
        if (last_palette_ && *last_palette_ == palette) {
            return palette_payload_;
        }
        palette_version_ = last_palette_ ? static_cast<uint8_t>(palette_version_ + 1) : 0;
        palette_payload_ = palette_payload(palette_version_, palette);
        last_palette_ = palette;
        return palette_payload_;
    }

    EncodeOptions options_;
    std::vector<uint8_t> out_;
    uint16_t next_composition_number_ = 0;
    std::optional<RgbaPalette> last_palette_;
    std::vector<uint8_t> palette_payload_;
    uint8_t palette_version_ = 0;
};

}  // namespace

std::vector<uint8_t> encode_pgs(const SubtitleDocument &doc, const EncodeOptions &options) {
    if (options.max_object_segment_payload <= kObjectFirstHeaderSize ||
        options.max_object_segment_payload > kMaxSegmentPayload) {
        throw std::invalid_argument("max_object_segment_payload must be in " +
                                    std::to_string(kObjectFirstHeaderSize + 1) + ".." +
                                    std::to_string(kMaxSegmentPayload));
    }
    const auto t0 = std::chrono::steady_clock::now();
    PgsEncoder encoder(options);
    std::vector<uint8_t> out = encoder.encode(doc);
    const auto t1 = std::chrono::steady_clock::now();
    PF_LOG("encoder", "encode_pgs ms="
                          << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0)
                                 .count());
    return out;
}

#ifdef PGSFORGE_TESTING
namespace testing {
std::vector<std::vector<uint8_t>> object_fragments_for_test(uint16_t object_id, uint16_t width,
                                                            uint16_t height,
                                                            const std::vector<uint8_t> &rle,
                                                            size_t max_payload) {
    return object_fragments(object_id, width, height, rle, max_payload);
}
}  // namespace testing
#endif

}  // namespace pgsforge
