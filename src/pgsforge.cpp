//
//  pgsforge.cpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "pgsforge.hpp"
#include "pgsforge_version.hpp"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "document_json.hpp"
#include "logging.hpp"

using json = nlohmann::json;

namespace pgsforge {

std::string version_string() { return PGSFORGE_VERSION_DISPLAY; }

}  // namespace pgsforge

namespace {

static bool read_file(const std::string &path, std::vector<uint8_t> &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        PF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    f.seekg(0, std::ios::end);
    std::streamoff len = f.tellg();
    if (len < 0) {
        PF_LOG("error", "cannot determine size of " << path);
        return false;
    }
    f.seekg(0, std::ios::beg);
    out.resize(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(len));
    if (f.gcount() != len) {
        PF_LOG("error", "short read for " << path);
        return false;
    }
    return true;
}

static bool write_file(const std::string &path, const std::vector<uint8_t> &data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        PF_LOG("error", "open for write failed for " << path << " errno=" << errno << " ("
                                                     << std::generic_category().message(errno)
                                                     << ")");
        return false;
    }
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return out.good();
}

}  // namespace

namespace pgsforge {

namespace {
Status make_status(bool ok, std::string msg = {}) { return Status{ok, std::move(msg)}; }
}  // namespace

ReadResult read_sup(const std::string &sup_path, const DecodeOptions &options) {
    ReadResult res;
    std::vector<uint8_t> bytes;
    if (!read_file(sup_path, bytes)) {
        res.status = make_status(false, "Failed to read " + sup_path);
        return res;
    }
    DecodeResult decoded = decode_pgs(bytes, options);
    if (!decoded.warnings.empty()) {
        PF_LOG("warn", sup_path << ": " << decoded.warnings.size()
                                << " problem(s) while decoding; first: "
                                << decoded.warnings.front().message);
    }
    PF_LOG("info", sup_path << ": " << decoded.display_set_count << " display sets, "
                            << decoded.document.events.size() << " events");
    res.document = std::move(decoded.document);
    res.warnings = std::move(decoded.warnings);
    res.status = make_status(true);
    return res;
}

Status write_sup(const std::string &sup_path, const SubtitleDocument &doc,
                 const EncodeOptions &options) {
    const auto t0 = std::chrono::steady_clock::now();
    std::vector<uint8_t> bytes;
    try {
        bytes = encode_pgs(doc, options);
    } catch (const std::invalid_argument &e) {
        std::string msg = std::string("Cannot encode document: ") + e.what();
        PF_LOG("error", msg);
        return make_status(false, msg);
    }
    if (!write_file(sup_path, bytes)) {
        return make_status(false, "Failed to write " + sup_path);
    }
    const auto t1 = std::chrono::steady_clock::now();
    PF_LOG("debug", "write_sup " << sup_path << " bytes=" << bytes.size() << " ms="
                                 << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0)
                                        .count());
    return make_status(true);
}

Status sup_to_json(const std::string &sup_path, const std::string &json_path) {
    ReadResult res = read_sup(sup_path);
    if (!res.status.ok) {
        return res.status;
    }
    std::ofstream out(json_path);
    if (!out.is_open()) {
        std::string msg = "Failed to open " + json_path + " for writing";
        PF_LOG("error", msg);
        return make_status(false, msg);
    }
    out << document_to_json(res.document).dump(2) << "\n";
    if (!out.good()) {
        return make_status(false, "Failed to write " + json_path);
    }
    return make_status(true);
}

Status json_to_sup(const std::string &json_path, const std::string &sup_path,
                   const EncodeOptions &options) {
    std::ifstream f(json_path);
    if (!f.is_open()) {
        PF_LOG("error", "open failed for " << json_path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return make_status(false, "Failed to open " + json_path);
    }
    SubtitleDocument doc;
    try {
        json j;
        f >> j;
        doc = document_from_json(j);
    } catch (const json::exception &e) {
        std::string msg = "Invalid JSON document " + json_path + ": " + e.what();
        PF_LOG("error", msg);
        return make_status(false, msg);
    } catch (const std::runtime_error &e) {
        std::string msg = "Invalid JSON document " + json_path + ": " + e.what();
        PF_LOG("error", msg);
        return make_status(false, msg);
    }
    PF_LOG("debug", "json_to_sup " << json_path << " events=" << doc.events.size());
    return write_sup(sup_path, doc, options);
}

}  // namespace pgsforge
