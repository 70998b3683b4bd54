//
//  display_set.cpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "display_set.hpp"

#include <utility>

#include "logging.hpp"

namespace pgsforge {

size_t ObjectFragments::total_size() const {
    size_t n = 0;
    for (const auto &f : fragments) {
        n += f.size;
    }
    return n;
}

std::vector<uint8_t> ObjectFragments::gather() const {
    std::vector<uint8_t> out;
    out.reserve(total_size());
    for (const auto &f : fragments) {
        write_bytes(out, f);
    }
    return out;
}

const CompleteObject *DisplaySet::find_complete_object(uint16_t object_id) const {
    auto it = objects.find(object_id);
    if (it == objects.end()) {
        return nullptr;
    }
    return std::get_if<CompleteObject>(&it->second);
}

std::vector<DisplaySet> DisplaySetAssembler::take_display_sets() {
    std::vector<DisplaySet> out = std::move(finished_);
    finished_.clear();
    return out;
}

FeedResult DisplaySetAssembler::feed(const SegmentHeader &header, ByteView payload) {
    switch (static_cast<SegmentType>(header.type)) {
    case SegmentType::Composition:
        return on_composition(header, payload);
    case SegmentType::Window:
        return on_window(payload);
    case SegmentType::Palette:
        return on_palette(payload);
    case SegmentType::Object:
        return on_object(payload);
    case SegmentType::End:
        return on_end();
    }
    PF_LOG("pgs", "ignoring unknown segment type 0x" << std::hex << int(header.type));
    return FeedResult::Ignored;
}

FeedResult DisplaySetAssembler::on_composition(const SegmentHeader &header, ByteView payload) {
    auto pcs = parse_composition_segment(payload);
    if (!pcs) {
        return FeedResult::Malformed;
    }
    FeedResult result = FeedResult::Accepted;
    if (current_) {
        PF_LOG("pgs", "composition " << current_->composition.composition_number
                                     << " at pts " << current_->pts
                                     << " never saw an End segment; dropped");
        ++dropped_;
        result = FeedResult::Restarted;
    }
    current_.emplace();
    current_->pts = header.pts;
    current_->composition = std::move(*pcs);
    return result;
}

FeedResult DisplaySetAssembler::on_window(ByteView payload) {
    if (!current_) {
        return FeedResult::Ignored;
    }
    auto wds = parse_window_segment(payload);
    if (!wds) {
        return FeedResult::Malformed;
    }
    current_->windows[wds->window_id] = *wds;
    return FeedResult::Accepted;
}

FeedResult DisplaySetAssembler::on_palette(ByteView payload) {
    if (!current_) {
        return FeedResult::Ignored;
    }
    auto pds = parse_palette_segment(payload);
    if (!pds) {
        return FeedResult::Malformed;
    }
    current_->palette = std::move(*pds);
    return FeedResult::Accepted;
}

FeedResult DisplaySetAssembler::on_object(ByteView payload) {
    if (!current_) {
        return FeedResult::Ignored;
    }
    auto ods = parse_object_segment(payload);
    if (!ods) {
        return FeedResult::Malformed;
    }

    auto &objects = current_->objects;
    auto it = objects.find(ods->object_id);
    if (ods->first_in_sequence || it == objects.end()) {
        ObjectFragments frags;
        frags.width = ods->width;
        frags.height = ods->height;
        frags.fragments.push_back(ods->data);
        if (ods->last_in_sequence) {
            objects.insert_or_assign(ods->object_id, CompleteObject{std::move(frags)});
        } else {
            objects.insert_or_assign(ods->object_id, InProgressObject{std::move(frags)});
        }
        return FeedResult::Accepted;
    }

    if (auto *pending = std::get_if<InProgressObject>(&it->second)) {
        pending->object.fragments.push_back(ods->data);
        if (ods->last_in_sequence) {
            it->second = CompleteObject{std::move(pending->object)};
        }
    } else {
        // Already complete; the extra bytes still belong to the object.
        std::get<CompleteObject>(it->second).object.fragments.push_back(ods->data);
    }
    return FeedResult::Accepted;
}

FeedResult DisplaySetAssembler::on_end() {
    if (!current_) {
        return FeedResult::Ignored;
    }
    finished_.push_back(std::move(*current_));
    current_.reset();
    return FeedResult::Accepted;
}

}  // namespace pgsforge
