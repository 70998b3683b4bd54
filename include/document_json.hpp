//
//  document_json.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <nlohmann/json.hpp>

#include "subtitle_document.hpp"

namespace pgsforge {

// {"events": [{"id", "start_ms", "end_ms", "image": {...}, "pgs": {...}}]}
// Pixels are stored base64 encoded, palettes as 256 packed RGBA integers.
nlohmann::json document_to_json(const SubtitleDocument &doc);

// Throws std::runtime_error on malformed image data (bad base64, palette not 256 entries,
// pixel count not matching width*height) and nlohmann::json::exception on type errors.
SubtitleDocument document_from_json(const nlohmann::json &j);

}  // namespace pgsforge
