//
//  rle_codec.cpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "rle_codec.hpp"

#include "logging.hpp"

namespace pgsforge {

namespace {

constexpr uint8_t kRunKindMask = 0xC0;
constexpr uint8_t kShortTransparent = 0x00;
constexpr uint8_t kColorRun = 0x40;
constexpr uint8_t kLongTransparent = 0x80;
constexpr uint8_t kLongColorRun = 0xC0;
constexpr uint32_t kShortRunLimit = 64;
// Up to this many identical pixels are cheaper as literals than as a 4-byte run code.
constexpr uint32_t kLiteralRunLimit = 3;

}  // namespace

std::vector<uint8_t> decompress_rle(ByteView data, uint32_t width, uint32_t height) {
    const size_t total = static_cast<size_t>(width) * static_cast<size_t>(height);
    std::vector<uint8_t> out(total, 0);
    size_t out_pos = 0;
    size_t in_pos = 0;

    // Truncated run codes read missing bytes as 0.
    auto next = [&]() -> uint8_t { return in_pos < data.size ? data[in_pos++] : 0; };

    while (in_pos < data.size && out_pos < total) {
        const uint8_t byte = data[in_pos++];
        if (byte != 0) {
            out[out_pos++] = byte;
            continue;
        }
        if (in_pos >= data.size) {
            break;
        }
        const uint8_t flag = data[in_pos++];
        if (flag == 0) {
            // End of line.
            continue;
        }
        switch (flag & kRunKindMask) {
        case kShortTransparent:
            out_pos += flag & 0x3F;
            break;
        case kLongTransparent: {
            const uint32_t len = (uint32_t(flag & 0x3F) << 8) | next();
            out_pos += len;
            break;
        }
        case kColorRun:
        case kLongColorRun: {
            const uint32_t len = (uint32_t(flag & 0x3F) << 8) | next();
            const uint8_t color = next();
            for (uint32_t i = 0; i < len && out_pos < total; ++i) {
                out[out_pos++] = color;
            }
            break;
        }
        }
    }
    if (in_pos < data.size) {
        PF_LOG("rle", "decoded " << width << "x" << height << " with " << (data.size - in_pos)
                                 << " input bytes left over");
    }
    return out;
}

std::vector<uint8_t> compress_rle(const std::vector<uint8_t> &pixels, uint32_t width) {
    std::vector<uint8_t> out;
    out.reserve(pixels.size() / 2 + 16);
    uint32_t x = 0;

    for (size_t i = 0; i < pixels.size();) {
        const uint8_t color = pixels[i];
        uint32_t run = 1;
        while (i + run < pixels.size() && pixels[i + run] == color && run < kMaxRleRun) {
            ++run;
        }

        if (color == 0) {
            if (run < kShortRunLimit) {
                write_u8(out, 0);
                write_u8(out, static_cast<uint8_t>(run));
            } else {
                write_u8(out, 0);
                write_u8(out, static_cast<uint8_t>(kLongTransparent | (run >> 8)));
                write_u8(out, static_cast<uint8_t>(run & 0xFF));
            }
        } else if (run <= kLiteralRunLimit) {
            for (uint32_t k = 0; k < run; ++k) {
                write_u8(out, color);
            }
        } else {
            const uint8_t kind = run < kShortRunLimit ? kColorRun : kLongColorRun;
            write_u8(out, 0);
            write_u8(out, static_cast<uint8_t>(kind | (run >> 8)));
            write_u8(out, static_cast<uint8_t>(run & 0xFF));
            write_u8(out, color);
        }

        i += run;
        x += run;
        if (x >= width) {
            // End of line; a run crossing the row edge still resets the cursor to 0.
            write_u8(out, 0);
            write_u8(out, 0);
            x = 0;
        }
    }
    return out;
}

}  // namespace pgsforge
