// Unit coverage for the PGS run-length codec.
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "rle_codec.hpp"

namespace {

using Bytes = std::vector<uint8_t>;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[rle_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

Bytes decode(const Bytes &rle, uint32_t w, uint32_t h) {
    return pgsforge::decompress_rle(pgsforge::ByteView(rle), w, h);
}

bool test_decode_alphabet() {
    bool ok = check(decode({1, 1, 1, 0, 0}, 3, 1) == Bytes({1, 1, 1}),
                    "literals followed by end of line");
    ok &= check(decode({0, 4, 0, 0}, 4, 1) == Bytes({0, 0, 0, 0}), "short transparent run");
    ok &= check(decode({0, 0x40, 5, 7}, 5, 1) == Bytes(5, 7), "color run (0x40 form)");
    ok &= check(decode({0, 0x80, 5, 3}, 6, 1) == Bytes({0, 0, 0, 0, 0, 3}),
                "long transparent run");
    ok &= check(decode({0, 0xC1, 0x00, 2}, 256, 1) == Bytes(256, 2), "long color run (0xC0 form)");

    Bytes mixed = {5, 0, 2, 0, 0x42, 0x00, 9, 0, 0};
    Bytes expected = {5, 0, 0};
    expected.insert(expected.end(), 512, 9);
    ok &= check(decode(mixed, 515, 1) == expected, "mixed codes with 14-bit length");

    // Two rows; end-of-line codes do not move the cursor.
    ok &= check(decode({1, 2, 0, 0, 3, 4, 0, 0}, 2, 2) == Bytes({1, 2, 3, 4}),
                "two rows decoded linearly");
    return ok;
}

bool test_decode_robustness() {
    bool ok = check(decode({0, 0x40, 0x10, 5}, 4, 1) == Bytes(4, 5),
                    "run longer than the image is clipped");
    ok &= check(decode({7}, 3, 1) == Bytes({7, 0, 0}), "short input leaves zeros");
    ok &= check(decode({}, 2, 2) == Bytes(4, 0), "empty input gives transparent image");
    ok &= check(decode({0, 0x40, 3}, 3, 1) == Bytes(3, 0), "missing color byte reads as 0");
    ok &= check(decode({0}, 2, 1) == Bytes(2, 0), "dangling escape byte ignored");
    ok &= check(decode({0, 0x3F, 1, 1}, 4, 1) == Bytes(4, 0), "skip past the end stops decoding");
    ok &= check(decode({1, 2, 3}, 0, 0).empty(), "zero-sized image");
    ok &= check(decode({1, 2, 3, 4, 5}, 2, 1) == Bytes({1, 2}), "extra input ignored");
    return ok;
}

bool test_encode_choices() {
    using pgsforge::compress_rle;
    bool ok = check(compress_rle({5, 5, 5, 5, 5}, 5) == Bytes({0, 0x40, 5, 5, 0, 0}),
                    "colored run uses 0x40 code");
    ok &= check(compress_rle({3, 3}, 2) == Bytes({3, 3, 0, 0}), "short colored run as literals");
    ok &= check(compress_rle({3, 3, 3}, 3) == Bytes({3, 3, 3, 0, 0}),
                "three identical pixels as literals");
    ok &= check(compress_rle({0, 0, 0}, 3) == Bytes({0, 3, 0, 0}), "short transparent run");
    ok &= check(compress_rle(Bytes(100, 0), 100) == Bytes({0, 0x80, 100, 0, 0}),
                "long transparent run");
    ok &= check(compress_rle(Bytes(200, 9), 200) == Bytes({0, 0xC0, 200, 9, 0, 0}),
                "long colored run uses 0xC0 code");
    ok &= check(compress_rle(Bytes(20000, 0), 20000) ==
                    Bytes({0, 0xBF, 0xFF, 0, 0x8E, 0x21, 0, 0}),
                "runs split at 16383");
    ok &= check(compress_rle({}, 4).empty(), "empty image encodes to nothing");
    return ok;
}

bool test_end_of_line_placement() {
    using pgsforge::compress_rle;
    Bytes pixels = {1, 1, 0, 0, 2, 2, 2, 2};
    Bytes rle = compress_rle(pixels, 4);
    bool ok = check(rle == Bytes({1, 1, 0, 2, 0, 0, 0, 0x40, 4, 2, 0, 0}),
                    "end of line after each row");
    ok &= check(decode(rle, 4, 2) == pixels, "two-row image survives the codec");

    // A run crossing the row edge is emitted whole and the cursor restarts at 0.
    Bytes spanning(6, 7);
    Bytes rle_span = compress_rle(spanning, 3);
    ok &= check(rle_span == Bytes({0, 0x40, 6, 7, 0, 0}), "run across rows gets one end of line");
    ok &= check(decode(rle_span, 3, 2) == spanning, "spanning run still decodes");

    // Varied content through both directions.
    Bytes pattern;
    for (uint32_t y = 0; y < 10; ++y) {
        for (uint32_t x = 0; x < 40; ++x) {
            pattern.push_back(static_cast<uint8_t>(x < 8 ? 0 : (x / 4 + y) % 5));
        }
    }
    ok &= check(decode(compress_rle(pattern, 40), 40, 10) == pattern, "patterned 40x10 image");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_decode_alphabet();
    ok &= test_decode_robustness();
    ok &= test_encode_choices();
    ok &= test_end_of_line_placement();
    return ok ? 0 : 1;
}
