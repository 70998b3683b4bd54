//
//  byte_io.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pgsforge {

// Non-owning view into a caller-owned byte buffer.
struct ByteView {
    const uint8_t *data = nullptr;
    size_t size = 0;

    ByteView() = default;
    ByteView(const uint8_t *d, size_t s) : data(d), size(s) {}
    explicit ByteView(const std::vector<uint8_t> &v) : data(v.data()), size(v.size()) {}

    bool empty() const { return size == 0; }
    const uint8_t *begin() const { return data; }
    const uint8_t *end() const { return data + size; }
    uint8_t operator[](size_t i) const { return data[i]; }

    // Sub-view; clamps to the available bytes.
    ByteView sub(size_t offset, size_t len) const {
        if (offset >= size) {
            return ByteView(data + size, 0);
        }
        if (len > size - offset) {
            len = size - offset;
        }
        return ByteView(data + offset, len);
    }
};

// ------------- Big-endian readers (caller checks bounds) --------------------

inline uint16_t read_u16_be(const uint8_t *p) {
    return static_cast<uint16_t>((uint16_t(p[0]) << 8) | uint16_t(p[1]));
}

inline uint32_t read_u24_be(const uint8_t *p) {
    return (uint32_t(p[0]) << 16) | (uint32_t(p[1]) << 8) | uint32_t(p[2]);
}

inline uint32_t read_u32_be(const uint8_t *p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) |
           uint32_t(p[3]);
}

// ------------- Helper write functions ---------------------------------------

inline void write_u8(std::vector<uint8_t> &p, uint8_t v) { p.push_back(v); }

inline void write_u16(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u24(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u32(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 24) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_bytes(std::vector<uint8_t> &p, ByteView bytes) {
    p.insert(p.end(), bytes.begin(), bytes.end());
}

}  // namespace pgsforge
