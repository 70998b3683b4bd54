//
//  main.cpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "document_json.hpp"
#include "logging.hpp"
#include "pgsforge.hpp"
#include "pgsforge_version.hpp"
#include <nlohmann/json.hpp>

// "1920x1080" -> width/height.
bool parse_canvas(const std::string &s, uint16_t &width, uint16_t &height) {
    auto sep = s.find('x');
    if (sep == std::string::npos) {
        return false;
    }
    try {
        unsigned long w = std::stoul(s.substr(0, sep));
        unsigned long h = std::stoul(s.substr(sep + 1));
        if (w == 0 || h == 0 || w > 0xFFFF || h > 0xFFFF) {
            return false;
        }
        width = static_cast<uint16_t>(w);
        height = static_cast<uint16_t>(h);
    } catch (const std::logic_error &) {
        return false;
    }
    return true;
}

// Binary PAM (P7, RGB_ALPHA) with the palette applied.
bool write_pam(const std::filesystem::path &p, const pgsforge::IndexedImage &img) {
    std::ofstream out(p, std::ios::binary);
    if (!out.is_open()) return false;
    out << "P7\nWIDTH " << img.width << "\nHEIGHT " << img.height
        << "\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n";
    std::vector<char> row;
    row.reserve(static_cast<size_t>(img.width) * 4);
    for (uint32_t y = 0; y < img.height; ++y) {
        row.clear();
        for (uint32_t x = 0; x < img.width; ++x) {
            const uint32_t rgba = img.palette[img.pixels[static_cast<size_t>(y) * img.width + x]];
            row.push_back(static_cast<char>((rgba >> 24) & 0xFF));
            row.push_back(static_cast<char>((rgba >> 16) & 0xFF));
            row.push_back(static_cast<char>((rgba >> 8) & 0xFF));
            row.push_back(static_cast<char>(rgba & 0xFF));
        }
        out.write(row.data(), static_cast<std::streamsize>(row.size()));
    }
    return out.good();
}

bool emit_json(const pgsforge::ReadResult &res, const std::filesystem::path &bitmap_dir) {
    nlohmann::json j = pgsforge::document_to_json(res.document);

    // Optionally export bitmaps and reference them in JSON.
    if (!bitmap_dir.empty()) {
        std::filesystem::create_directories(bitmap_dir);
        auto &events = j["events"];
        for (size_t i = 0; i < res.document.events.size(); ++i) {
            const auto &ev = res.document.events[i];
            if (!ev.image) {
                continue;
            }
            auto path = bitmap_dir / ("event" + std::to_string(i + 1) + ".pam");
            if (!write_pam(path, *ev.image)) {
                PF_LOG("error", "failed to write " << path.string());
                return false;
            }
            events[i]["bitmap"] = path.string();
        }
    }

    nlohmann::json warnings = nlohmann::json::array();
    for (const auto &w : res.warnings) {
        warnings.push_back({{"offset", w.offset}, {"pts", w.pts}, {"message", w.message}});
    }
    j["warnings"] = warnings;

    std::cout << j.dump(2) << "\n";
    return true;
}

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "PgsForge " << PGSFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    std::filesystem::path export_dir;
    pgsforge::EncodeOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            const auto level = pgsforge::parse_log_verbosity(argv[++i]);
            if (!level) {
                std::cerr << "Unknown log level: " << argv[i]
                          << " (expected error|warn|info|debug)\n";
                return 2;
            }
            pgsforge::set_log_verbosity(*level);
        } else if (arg == "--export-bitmaps" && i + 1 < argc) {
            export_dir = argv[++i];
        } else if (arg == "--canvas" && i + 1 < argc) {
            if (!parse_canvas(argv[++i], options.canvas_width, options.canvas_height)) {
                std::cerr << "Invalid canvas size: " << argv[i] << " (expected WxH)\n";
                return 2;
            }
        } else if (arg == "--max-segment" && i + 1 < argc) {
            try {
                options.max_object_segment_payload = std::stoul(argv[++i]);
            } catch (const std::logic_error &) {
                std::cerr << "Invalid segment size: " << argv[i] << "\n";
                return 2;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        std::cerr << "PgsForge " << PGSFORGE_VERSION_DISPLAY << "\n"
                  << "Copyright (c) 2025 Till Toenshoff\n\n"
                  << "usage for reading:\n"
                  << "  pgsforge <input.sup> [--export-bitmaps DIR] "
                  << "[--log-level error|warn|info|debug]\n"
                  << "usage for writing:\n"
                  << "  pgsforge <input.json> <output.sup> [--canvas WxH] [--max-segment N] "
                  << "[--log-level error|warn|info|debug]\n"
                  << "Options:\n"
                  << "  --export-bitmaps DIR  When reading, write each bitmap as a PAM image to DIR.\n"
                  << "                        JSON is always written to stdout when reading.\n"
                  << "  --canvas WxH          Video size stored in compositions (default: 1920x1080).\n"
                  << "  --max-segment N       Split object data above N bytes per segment (default: 65535).\n"
                  << "  --log-level LEVEL     Set logging verbosity (default: info).\n";
        return 2;
    }

    // Reading mode: one positional argument (input).
    if (positional.size() == 1) {
        auto res = pgsforge::read_sup(positional[0]);
        if (!res.status.ok) {
            PF_LOG("error", "pgsforge: failed to read sup: " << res.status.message);
            return 1;
        }
        if (!emit_json(res, export_dir)) {
            PF_LOG("error", "pgsforge: failed to emit JSON or export bitmaps");
            return 1;
        }
        return 0;
    }

    // Writing mode: two positional arguments.
    if (positional.size() != 2) {
        std::cerr << "Invalid arguments. Run pgsforge without arguments for usage.\n";
        return 2;
    }
    const std::string json_path = positional[0];
    const std::string output_path = positional[1];

    auto status = pgsforge::json_to_sup(json_path, output_path, options);
    if (!status.ok) {
        PF_LOG("error", "pgsforge: failed to encode sup: " << status.message);
        return 1;
    }

    std::cout << "Wrote: " << output_path << "\n";
    return 0;
}
