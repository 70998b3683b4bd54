//
//  pgs_decoder.cpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "pgs_decoder.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <utility>

#include "display_set.hpp"
#include "logging.hpp"
#include "pgs_segments.hpp"

namespace pgsforge {

namespace {

void add_warning(DecodeResult &res, WarningKind kind, size_t offset, uint32_t pts,
                 const std::string &message) {
    PF_LOG("pgs", message << " at offset " << offset);
    DecodeWarning w;
    w.kind = kind;
    w.offset = offset;
    w.pts = pts;
    w.message = message;
    res.warnings.push_back(std::move(w));
}

}  // namespace

DecodeResult decode_pgs(ByteView data, const DecodeOptions &options) {
    const auto t0 = std::chrono::steady_clock::now();
    DecodeResult res;
    DisplaySetAssembler assembler;

    size_t pos = 0;
    while (pos < data.size) {
        auto header = read_segment_header(data, pos);
        if (!header) {
            std::ostringstream msg;
            if (data.size - pos < kSegmentHeaderSize) {
                msg << "trailing " << (data.size - pos) << " bytes too short for a segment header";
            } else {
                msg << "missing PG marker (found " << hex_prefix(data.sub(pos, 2)) << ")";
            }
            add_warning(res, WarningKind::Truncated, pos, 0, msg.str());
            break;
        }
        const size_t payload_offset = pos + kSegmentHeaderSize;
        if (header->size > data.size - payload_offset) {
            std::ostringstream msg;
            msg << segment_type_name(header->type) << " segment declares " << header->size
                << " bytes but only " << (data.size - payload_offset) << " remain";
            add_warning(res, WarningKind::Truncated, pos, header->pts, msg.str());
            break;
        }
        const ByteView payload = data.sub(payload_offset, header->size);
        PF_LOG("pgs", segment_type_name(header->type) << " pts=" << header->pts << " size="
                                                      << header->size << " data="
                                                      << hex_prefix(payload));

        switch (assembler.feed(*header, payload)) {
        case FeedResult::Malformed: {
            std::ostringstream msg;
            msg << segment_type_name(header->type) << " segment of " << header->size
                << " bytes is malformed";
            add_warning(res, WarningKind::MalformedSegment, pos, header->pts, msg.str());
            break;
        }
        case FeedResult::Restarted:
            add_warning(res, WarningKind::DroppedDisplaySet, pos, header->pts,
                        "display set without End replaced by a new composition");
            break;
        case FeedResult::Accepted:
        case FeedResult::Ignored:
            break;
        }
        pos = payload_offset + header->size;
        res.bytes_consumed = pos;
    }

    if (assembler.is_open()) {
        add_warning(res, WarningKind::DroppedDisplaySet, pos, 0,
                    "stream ended inside an unterminated display set");
    }

    const std::vector<DisplaySet> sets = assembler.take_display_sets();
    res.display_set_count = sets.size();
    const size_t events =
        build_events(sets, res.document, options.default_duration_ms, &res.warnings);

    const auto t1 = std::chrono::steady_clock::now();
    PF_LOG("pgs", "decode_pgs bytes=" << data.size << " consumed=" << res.bytes_consumed
                                      << " display_sets=" << sets.size() << " events=" << events
                                      << " warnings=" << res.warnings.size() << " ms="
                                      << std::chrono::duration_cast<std::chrono::milliseconds>(
                                             t1 - t0)
                                             .count());
    return res;
}

DecodeResult decode_pgs(const std::vector<uint8_t> &data, const DecodeOptions &options) {
    return decode_pgs(ByteView(data), options);
}

}  // namespace pgsforge
