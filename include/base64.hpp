//
//  base64.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pgsforge {

// RFC 4648 alphabet with '=' padding, no line breaks.
std::string base64_encode(const std::vector<uint8_t> &data);

// Whitespace is skipped. nullopt on characters outside the alphabet or a dangling
// single character.
std::optional<std::vector<uint8_t>> base64_decode(const std::string &text);

}  // namespace pgsforge
