// Decoder coverage: hand-built .sup streams through decode_pgs, checking event timing,
// image reconstruction and how damaged input is reported.
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "color_convert.hpp"
#include "pgs_decoder.hpp"
#include "pgs_test_utils.hpp"

using namespace pgs_test_utils;
using pgsforge::WarningKind;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[decoder_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

size_t count_kind(const pgsforge::DecodeResult &res, WarningKind kind) {
    size_t n = 0;
    for (const auto &w : res.warnings) {
        if (w.kind == kind) ++n;
    }
    return n;
}

const std::vector<uint8_t> kTwoWhite = {1, 1, 0, 0};

bool test_consecutive_timing() {
    std::vector<uint8_t> stream;
    append_display_set(stream, 0, 0, 2, 1, kTwoWhite);
    append_display_set(stream, 9000, 1, 2, 1, kTwoWhite);
    append_display_set(stream, 18000, 2, 2, 1, kTwoWhite);

    auto res = pgsforge::decode_pgs(stream);
    const auto &events = res.document.events;
    bool ok = check(events.size() == 3, "three events");
    if (events.size() != 3) return false;
    ok &= check(events[0].start_ms == 0 && events[0].end_ms == 100, "first 0-100");
    ok &= check(events[1].start_ms == 100 && events[1].end_ms == 200, "second 100-200");
    ok &= check(events[2].start_ms == 200 && events[2].end_ms == 5200,
                "last gets the default duration");
    ok &= check(events[0].id == 1 && events[1].id == 2 && events[2].id == 3, "sequential ids");
    ok &= check(res.warnings.empty(), "clean stream has no warnings");
    ok &= check(res.display_set_count == 3, "display sets counted");
    ok &= check(res.bytes_consumed == stream.size(), "whole stream consumed");

    const auto &img = *events[0].image;
    ok &= check(img.width == 2 && img.height == 1 && img.pixels == std::vector<uint8_t>({1, 1}),
                "pixels decoded");
    ok &= check(img.palette[1] == pgsforge::pack_rgba(235, 235, 235, 255),
                "palette converted to RGBA");
    ok &= check(img.palette[0] == 0, "unlisted palette entries transparent");
    ok &= check(events[2].pgs && events[2].pgs->composition_number == 2,
                "composition number kept");
    return ok;
}

bool test_clear_ends_event() {
    std::vector<uint8_t> stream;
    append_display_set(stream, 0, 0, 2, 1, kTwoWhite);
    append_clear(stream, 45000, 1);
    append_display_set(stream, 90000, 2, 2, 1, kTwoWhite);

    auto res = pgsforge::decode_pgs(stream);
    const auto &events = res.document.events;
    bool ok = check(events.size() == 2, "clear produces no event");
    ok &= check(res.display_set_count == 3, "clear still counts as a display set");
    if (events.size() != 2) return false;
    ok &= check(events[0].start_ms == 0 && events[0].end_ms == 500, "clear sets the end time");
    ok &= check(events[1].start_ms == 1000 && events[1].end_ms == 6000, "event after the clear");
    ok &= check(events[1].id == 2, "ids skip nothing for clears");
    return ok;
}

bool test_rounding_and_duration_option() {
    std::vector<uint8_t> stream;
    append_display_set(stream, 135, 0, 2, 1, kTwoWhite);

    pgsforge::DecodeOptions opts;
    opts.default_duration_ms = 1000;
    auto res = pgsforge::decode_pgs(stream, opts);
    const auto &events = res.document.events;
    bool ok = check(events.size() == 1, "one event");
    if (events.size() != 1) return false;
    ok &= check(events[0].start_ms == 2, "1.5 ms rounds to 2");
    ok &= check(events[0].end_ms == 1002, "custom last duration");
    return ok;
}

bool test_end_alone_and_empty() {
    std::vector<uint8_t> stream;
    append_segment(stream, kEND, 0, {});
    auto res = pgsforge::decode_pgs(stream);
    bool ok = check(res.document.events.empty(), "End alone yields nothing");
    ok &= check(res.warnings.empty(), "End alone is not an error");

    auto empty = pgsforge::decode_pgs(std::vector<uint8_t>{});
    ok &= check(empty.document.events.empty() && empty.warnings.empty(), "empty input");
    return ok;
}

bool test_truncated_header() {
    std::vector<uint8_t> stream;
    append_display_set(stream, 0, 0, 2, 1, kTwoWhite);
    const size_t complete = stream.size();
    stream.insert(stream.end(), {'P', 'G', 0, 0, 0});

    auto res = pgsforge::decode_pgs(stream);
    bool ok = check(res.document.events.size() == 1, "events before the cut survive");
    ok &= check(count_kind(res, WarningKind::Truncated) == 1, "truncation reported");
    ok &= check(!res.warnings.empty() && res.warnings[0].offset == complete,
                "warning offset points at the partial header");
    ok &= check(res.bytes_consumed == complete, "consumed up to the last whole segment");
    return ok;
}

bool test_truncated_payload() {
    std::vector<uint8_t> stream;
    TestCompObject obj;
    append_segment(stream, kPCS, 0, make_pcs(0, {obj}));
    auto wds = make_wds(0, 0, 0, 2, 1);
    append_segment(stream, kWDS, 0, wds);
    stream.resize(stream.size() - 4);

    auto res = pgsforge::decode_pgs(stream);
    bool ok = check(res.document.events.empty(), "no event from an unfinished set");
    ok &= check(count_kind(res, WarningKind::Truncated) == 1, "short payload reported");
    ok &= check(count_kind(res, WarningKind::DroppedDisplaySet) == 1,
                "open set at end of input reported");
    return ok;
}

bool test_missing_magic() {
    std::vector<uint8_t> stream;
    append_display_set(stream, 0, 0, 2, 1, kTwoWhite);
    std::vector<uint8_t> junk(20, 0xEE);
    stream.insert(stream.end(), junk.begin(), junk.end());
    append_display_set(stream, 9000, 1, 2, 1, kTwoWhite);

    auto res = pgsforge::decode_pgs(stream);
    bool ok = check(res.document.events.size() == 1, "decoding stops at the bad marker");
    ok &= check(count_kind(res, WarningKind::Truncated) == 1, "bad marker reported");
    ok &= check(!res.warnings.empty() &&
                    res.warnings[0].message.find("missing PG marker") != std::string::npos,
                "warning names the marker");
    ok &= check(res.document.events.size() == 1 && res.document.events[0].end_ms == 5000,
                "surviving event uses the default duration");
    return ok;
}

bool test_malformed_segment_is_skipped() {
    std::vector<uint8_t> stream;
    TestCompObject obj;
    append_segment(stream, kPCS, 0, make_pcs(0, {obj}));
    append_segment(stream, kWDS, 0, std::vector<uint8_t>(4, 0));
    append_segment(stream, kPDS, 0, make_pds({{1, 235, 128, 128, 255}}));
    append_segment(stream, kODS, 0, make_ods_first(0, 2, 1, kTwoWhite, true));
    append_segment(stream, kEND, 0, {});

    auto res = pgsforge::decode_pgs(stream);
    bool ok = check(count_kind(res, WarningKind::MalformedSegment) == 1, "malformed reported");
    ok &= check(res.document.events.size() == 1, "rest of the set still decodes");
    return ok;
}

bool test_unresolved_objects() {
    std::vector<uint8_t> stream;
    TestCompObject missing;
    missing.object_id = 3;
    append_segment(stream, kPCS, 0, make_pcs(0, {missing}));
    append_segment(stream, kEND, 0, {});

    TestCompObject partial;
    append_segment(stream, kPCS, 9000, make_pcs(1, {partial}));
    append_segment(stream, kODS, 9000, make_ods_first(0, 2, 1, {1, 1}, false));
    append_segment(stream, kEND, 9000, {});

    auto res = pgsforge::decode_pgs(stream);
    bool ok = check(res.document.events.empty(), "unresolved objects produce no events");
    ok &= check(count_kind(res, WarningKind::UnresolvedObject) == 2, "both objects reported");
    if (res.warnings.size() == 2) {
        ok &= check(res.warnings[0].message.find("no object segment") != std::string::npos,
                    "missing object named");
        ok &= check(res.warnings[1].message.find("last fragment missing") != std::string::npos,
                    "incomplete object named");
        ok &= check(res.warnings[1].pts == 9000, "warning carries the set pts");
    }
    return ok;
}

bool test_oversized_object_is_skipped() {
    std::vector<uint8_t> stream;
    TestCompObject obj;
    append_segment(stream, kPCS, 0, make_pcs(0, {obj}));
    append_segment(stream, kODS, 0, make_ods_first(0, 65535, 65535, {1}, true));
    append_segment(stream, kEND, 0, {});

    bool ok = true;
    try {
        auto res = pgsforge::decode_pgs(stream);
        ok &= check(res.document.events.empty(), "65535x65535 object from one byte skipped");
        ok &= check(res.warnings.size() == 1 &&
                        count_kind(res, WarningKind::UnresolvedObject) == 1,
                    "oversized object reported once");
        ok &= check(!res.warnings.empty() &&
                        res.warnings[0].message.find("oversized object") != std::string::npos,
                    "oversized object named");
    } catch (const std::exception &e) {
        ok = check(false, std::string("decode threw: ") + e.what());
    }

    // Enough payload for the ratio, but beyond the absolute pixel cap.
    std::vector<uint8_t> big;
    append_segment(big, kPCS, 0, make_pcs(0, {obj}));
    append_segment(big, kODS, 0,
                   make_ods_first(0, 8192, 4096, std::vector<uint8_t>(4096, 1), true));
    append_segment(big, kEND, 0, {});
    auto capped = pgsforge::decode_pgs(big);
    ok &= check(capped.document.events.empty() &&
                    count_kind(capped, WarningKind::UnresolvedObject) == 1,
                "object above the pixel cap skipped");

    // A long transparent run legitimately covers many pixels per byte.
    std::vector<uint8_t> sparse;
    append_segment(sparse, kPCS, 0, make_pcs(0, {obj}));
    append_segment(sparse, kODS, 0, make_ods_first(0, 1000, 50, {0, 0xBF, 0xFF, 0, 0}, true));
    append_segment(sparse, kEND, 0, {});
    auto kept = pgsforge::decode_pgs(sparse);
    ok &= check(kept.document.events.size() == 1 && kept.warnings.empty(),
                "sparse object within the run bound decodes");
    return ok;
}

bool test_fragmented_object() {
    std::vector<uint8_t> stream;
    TestCompObject obj;
    append_segment(stream, kPCS, 0, make_pcs(0, {obj}));
    append_segment(stream, kPDS, 0, make_pds({{1, 235, 128, 128, 255}}));
    append_segment(stream, kODS, 0, make_ods_first(0, 4, 2, {1, 1, 0, 2}, false, 16));
    append_segment(stream, kODS, 0, make_ods_next(0, {0, 0, 0, 0x40}, false));
    append_segment(stream, kODS, 0, make_ods_next(0, {4, 3, 0, 0}, true));
    append_segment(stream, kEND, 0, {});

    auto res = pgsforge::decode_pgs(stream);
    const auto &events = res.document.events;
    bool ok = check(events.size() == 1, "one event from three fragments");
    if (events.size() != 1) return false;
    ok &= check(events[0].image->pixels == std::vector<uint8_t>({1, 1, 0, 0, 3, 3, 3, 3}),
                "fragments joined before RLE decoding");

    // Same payload in a single fragment.
    std::vector<uint8_t> single;
    append_segment(single, kPCS, 0, make_pcs(0, {obj}));
    append_segment(single, kPDS, 0, make_pds({{1, 235, 128, 128, 255}}));
    append_segment(single, kODS, 0,
                   make_ods_first(0, 4, 2, {1, 1, 0, 2, 0, 0, 0, 0x40, 4, 3, 0, 0}, true));
    append_segment(single, kEND, 0, {});
    auto whole = pgsforge::decode_pgs(single);
    ok &= check(whole.document.events.size() == 1 &&
                    whole.document.events[0].image->pixels == events[0].image->pixels,
                "split and unsplit objects decode identically");
    return ok;
}

bool test_position_forced_and_crop() {
    std::vector<uint8_t> stream;
    TestCompObject obj;
    obj.x = 100;
    obj.y = 50;
    obj.window_id = 1;
    obj.forced = true;
    obj.cropped = true;
    obj.crop[2] = 1;
    obj.crop[3] = 1;
    append_segment(stream, kPCS, 0, make_pcs(0, {obj}));
    append_segment(stream, kWDS, 0, make_wds(1, 100, 50, 2, 1));
    append_segment(stream, kODS, 0, make_ods_first(0, 2, 1, kTwoWhite, true));
    append_segment(stream, kEND, 0, {});

    auto res = pgsforge::decode_pgs(stream);
    const auto &events = res.document.events;
    bool ok = check(events.size() == 1, "one event");
    if (events.size() != 1) return false;
    const auto &img = *events[0].image;
    ok &= check(img.x == 100 && img.y == 50, "position from the composition object");
    ok &= check(img.width == 2 && img.pixels.size() == 2, "crop rectangle not applied");
    ok &= check(events[0].pgs && events[0].pgs->forced && events[0].pgs->window_id == 1,
                "forced flag and window id kept");
    ok &= check(img.palette[1] == 0, "set without palette decodes transparent");
    return ok;
}

bool test_two_objects_in_one_set() {
    std::vector<uint8_t> stream;
    TestCompObject a;
    a.object_id = 0;
    TestCompObject b;
    b.object_id = 1;
    b.y = 900;
    append_segment(stream, kPCS, 0, make_pcs(0, {a, b}));
    append_segment(stream, kODS, 0, make_ods_first(0, 2, 1, kTwoWhite, true));
    append_segment(stream, kODS, 0, make_ods_first(1, 1, 1, {2}, true));
    append_segment(stream, kEND, 0, {});
    append_clear(stream, 18000, 1);

    auto res = pgsforge::decode_pgs(stream);
    const auto &events = res.document.events;
    bool ok = check(events.size() == 2, "one event per composition object");
    if (events.size() != 2) return false;
    ok &= check(events[0].end_ms == 200 && events[1].end_ms == 200, "objects share timing");
    ok &= check(events[1].image->y == 900 && events[1].image->pixels[0] == 2,
                "second object placed separately");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_consecutive_timing();
    ok &= test_clear_ends_event();
    ok &= test_rounding_and_duration_option();
    ok &= test_end_alone_and_empty();
    ok &= test_truncated_header();
    ok &= test_truncated_payload();
    ok &= test_missing_magic();
    ok &= test_malformed_segment_is_skipped();
    ok &= test_unresolved_objects();
    ok &= test_oversized_object_is_skipped();
    ok &= test_fragmented_object();
    ok &= test_position_forced_and_crop();
    ok &= test_two_objects_in_one_set();
    return ok ? 0 : 1;
}
