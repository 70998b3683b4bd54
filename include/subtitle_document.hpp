//
//  subtitle_document.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "color_convert.hpp"

namespace pgsforge {

/// @ingroup api
/// Positioned bitmap in palette-index form.
struct IndexedImage {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t x = 0;
    uint32_t y = 0;
    std::vector<uint8_t> pixels;  ///< width*height palette indices, row-major
    RgbaPalette palette{};        ///< packed RGBA, index 0 usually transparent
};

/// @ingroup api
/// PGS specific metadata carried alongside an image event.
struct PgsMeta {
    uint16_t composition_number = 0;
    uint8_t window_id = 0;
    bool forced = false;
};

/// @ingroup api
/// One timed subtitle event. Only the image-related fields are owned by this library.
struct SubtitleEvent {
    uint64_t id = 0;
    uint32_t start_ms = 0;
    uint32_t end_ms = 0;
    std::optional<IndexedImage> image;
    std::optional<PgsMeta> pgs;
};

/// @ingroup api
struct SubtitleDocument {
    std::vector<SubtitleEvent> events;

    // Appends and assigns the next sequential id (1-based).
    SubtitleEvent &add_event(SubtitleEvent event) {
        event.id = events.empty() ? 1 : events.back().id + 1;
        events.push_back(std::move(event));
        return events.back();
    }
};

}  // namespace pgsforge
