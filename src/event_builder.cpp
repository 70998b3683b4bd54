//
//  event_builder.cpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "event_builder.hpp"

#include <sstream>
#include <utility>

#include "color_convert.hpp"
#include "logging.hpp"
#include "rle_codec.hpp"

namespace pgsforge {

namespace {

// Decoded objects are capped well above any Blu-ray canvas (at most 1920x1080).
constexpr size_t kMaxObjectPixels = size_t{4096} * 4096;

void note_unresolved(std::vector<DecodeWarning> *warnings, const DisplaySet &set,
                     const CompositionObject &ref, const char *reason) {
    std::ostringstream msg;
    msg << "composition " << set.composition.composition_number << " object " << ref.object_id
        << ": " << reason;
    PF_LOG("pgs", msg.str() << " (pts " << set.pts << "); skipped");
    if (warnings) {
        DecodeWarning w;
        w.kind = WarningKind::UnresolvedObject;
        w.pts = set.pts;
        w.message = msg.str();
        warnings->push_back(std::move(w));
    }
}

// False when the declared dimensions cannot come from the payload: no RLE code yields
// more than kMaxRleRun pixels per input byte.
bool plausible_size(const ObjectFragments &obj) {
    const size_t pixels = static_cast<size_t>(obj.width) * obj.height;
    return pixels <= kMaxObjectPixels && pixels <= obj.total_size() * kMaxRleRun;
}

std::vector<uint8_t> decode_object_pixels(const ObjectFragments &obj) {
    if (obj.fragments.size() == 1) {
        return decompress_rle(obj.fragments.front(), obj.width, obj.height);
    }
    const std::vector<uint8_t> joined = obj.gather();
    return decompress_rle(ByteView(joined), obj.width, obj.height);
}

}  // namespace

size_t build_events(const std::vector<DisplaySet> &sets, SubtitleDocument &doc,
                    uint32_t last_duration_ms, std::vector<DecodeWarning> *warnings) {
    const std::vector<uint32_t> ends = derive_end_times_ms(sets, last_duration_ms);
    size_t produced = 0;

    for (size_t i = 0; i < sets.size(); ++i) {
        const DisplaySet &set = sets[i];
        if (set.composition.objects.empty()) {
            continue;  // clear: only terminates the previous set
        }
        const uint32_t start = pts_to_ms(set.pts);
        const uint32_t end = ends[i];
        const RgbaPalette palette =
            set.palette ? build_palette(set.palette->entries) : RgbaPalette{};

        for (const auto &ref : set.composition.objects) {
            auto it = set.objects.find(ref.object_id);
            if (it == set.objects.end()) {
                note_unresolved(warnings, set, ref, "no object segment");
                continue;
            }
            const CompleteObject *obj = set.find_complete_object(ref.object_id);
            if (!obj) {
                note_unresolved(warnings, set, ref, "last fragment missing");
                continue;
            }
            if (obj->object.width == 0 || obj->object.height == 0) {
                note_unresolved(warnings, set, ref, "zero-sized object");
                continue;
            }
            if (!plausible_size(obj->object)) {
                note_unresolved(warnings, set, ref, "oversized object");
                continue;
            }

            IndexedImage image;
            image.width = obj->object.width;
            image.height = obj->object.height;
            image.x = ref.x;
            image.y = ref.y;
            image.pixels = decode_object_pixels(obj->object);
            image.palette = palette;

            PgsMeta meta;
            meta.composition_number = set.composition.composition_number;
            meta.window_id = ref.window_id;
            meta.forced = ref.forced;

            SubtitleEvent event;
            event.start_ms = start;
            event.end_ms = end;
            event.image = std::move(image);
            event.pgs = meta;
            doc.add_event(std::move(event));
            ++produced;

            PF_LOG("pgs", "event " << start << "-" << end << "ms object " << ref.object_id
                                   << " " << obj->object.width << "x" << obj->object.height
                                   << " at " << ref.x << "," << ref.y << " fragments="
                                   << obj->object.fragments.size());
        }
    }
    return produced;
}

}  // namespace pgsforge
