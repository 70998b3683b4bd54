//
//  document_json.cpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "document_json.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "base64.hpp"
#include "logging.hpp"

using json = nlohmann::json;

namespace pgsforge {

namespace {

// Converts an unsigned JSON number, rejecting values `T` cannot hold instead of wrapping.
template <typename T>
T bounded(const json &v, const std::string &name) {
    constexpr T kMax = std::numeric_limits<T>::max();
    if (v.is_number_unsigned()) {
        if (v.get<uint64_t>() <= kMax) {
            return static_cast<T>(v.get<uint64_t>());
        }
    } else if (v.is_number_integer()) {
        const int64_t n = v.get<int64_t>();
        if (n >= 0 && static_cast<uint64_t>(n) <= kMax) {
            return static_cast<T>(n);
        }
    } else if (v.is_number_float()) {
        const double d = v.get<double>();
        if (d >= 0 && d < static_cast<double>(kMax) + 1.0) {
            return static_cast<T>(d);
        }
    } else {
        return v.get<T>();  // wrong type: json::type_error
    }
    throw std::runtime_error(name + " out of range 0.." + std::to_string(uint64_t{kMax}));
}

template <typename T>
T bounded_value(const json &j, const char *key, T fallback, const std::string &where) {
    return j.contains(key) ? bounded<T>(j.at(key), where + "." + key) : fallback;
}

json image_to_json(const IndexedImage &img) {
    json j;
    j["width"] = img.width;
    j["height"] = img.height;
    j["x"] = img.x;
    j["y"] = img.y;
    j["palette"] = json(img.palette);
    j["pixels"] = base64_encode(img.pixels);
    return j;
}

IndexedImage image_from_json(const json &j, size_t event_index) {
    auto where = [&] { return "event[" + std::to_string(event_index) + "].image"; };
    IndexedImage img;
    img.width = bounded_value<uint32_t>(j, "width", 0, where());
    img.height = bounded_value<uint32_t>(j, "height", 0, where());
    img.x = bounded_value<uint32_t>(j, "x", 0, where());
    img.y = bounded_value<uint32_t>(j, "y", 0, where());

    if (j.contains("palette")) {
        const auto &p = j["palette"];
        if (!p.is_array() || p.size() != img.palette.size()) {
            throw std::runtime_error(where() + ".palette must hold 256 entries");
        }
        for (size_t i = 0; i < img.palette.size(); ++i) {
            img.palette[i] =
                bounded<uint32_t>(p[i], where() + ".palette[" + std::to_string(i) + "]");
        }
    }

    auto pixels = base64_decode(j.value("pixels", std::string()));
    if (!pixels) {
        throw std::runtime_error(where() + ".pixels is not valid base64");
    }
    const size_t expected = static_cast<size_t>(img.width) * img.height;
    if (pixels->size() != expected) {
        throw std::runtime_error(where() + ".pixels holds " + std::to_string(pixels->size()) +
                                 " bytes, expected " + std::to_string(expected));
    }
    img.pixels = std::move(*pixels);
    return img;
}

}  // namespace

json document_to_json(const SubtitleDocument &doc) {
    json events = json::array();
    for (const auto &ev : doc.events) {
        json e;
        e["id"] = ev.id;
        e["start_ms"] = ev.start_ms;
        e["end_ms"] = ev.end_ms;
        if (ev.image) {
            e["image"] = image_to_json(*ev.image);
        }
        if (ev.pgs) {
            e["pgs"] = {{"composition_number", ev.pgs->composition_number},
                        {"window_id", ev.pgs->window_id},
                        {"forced", ev.pgs->forced}};
        }
        events.push_back(std::move(e));
    }
    json j;
    j["events"] = std::move(events);
    return j;
}

SubtitleDocument document_from_json(const json &j) {
    SubtitleDocument doc;
    if (!j.contains("events")) {
        PF_LOG("warn", "document JSON carries no \"events\" array; nothing to encode");
        return doc;
    }
    const auto &events = j["events"];
    if (!events.is_array()) {
        throw std::runtime_error("\"events\" must be an array");
    }
    doc.events.reserve(events.size());
    for (size_t i = 0; i < events.size(); ++i) {
        const auto &e = events[i];
        const std::string where = "event[" + std::to_string(i) + "]";
        SubtitleEvent ev;
        ev.start_ms = bounded_value<uint32_t>(e, "start_ms", 0, where);
        ev.end_ms = bounded_value<uint32_t>(e, "end_ms", 0, where);
        if (e.contains("image")) {
            ev.image = image_from_json(e["image"], i);
        }
        if (e.contains("pgs")) {
            const auto &p = e["pgs"];
            PgsMeta meta;
            meta.composition_number =
                bounded_value<uint16_t>(p, "composition_number", 0, where + ".pgs");
            meta.window_id = bounded_value<uint8_t>(p, "window_id", 0, where + ".pgs");
            meta.forced = p.value("forced", false);
            ev.pgs = meta;
        }
        auto &added = doc.add_event(std::move(ev));
        if (e.contains("id")) {
            added.id = bounded_value<uint64_t>(e, "id", added.id, where);
        }
    }
    return doc;
}

}  // namespace pgsforge
