//
//  pgsforge.hpp
//  PgsForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "pgs_decoder.hpp"
#include "pgs_encoder.hpp"
#include "subtitle_document.hpp"

namespace pgsforge {

/// @defgroup api PgsForge Public API
/// Public, supported C++ interfaces for reading and writing PGS (.sup) subtitle streams.
/// @{

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `message` contains a short description of
 * what went wrong (e.g., failure to open files, parse JSON, or encode an inconsistent event).
 */
struct Status {
    bool ok{false};
    std::string message;
};

/**
 * @brief Decoded `.sup` file.
 *
 * `status.ok` only reports file access; malformed stream content never fails the read and is
 * described by `warnings` instead.
 */
struct ReadResult {
    Status status;
    SubtitleDocument document;
    std::vector<DecodeWarning> warnings;
};

/**
 * @brief Return the PgsForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// Read and decode a `.sup` file.
ReadResult read_sup(const std::string &sup_path,
                    const DecodeOptions &options = {});  ///< @ingroup api

/// Encode a document and write it as a `.sup` file.
Status write_sup(const std::string &sup_path, const SubtitleDocument &doc,
                 const EncodeOptions &options = {});  ///< @ingroup api

/**
 * @brief Decode a `.sup` file and store the document as JSON.
 *
 * @param sup_path Input PGS stream.
 * @param json_path Destination JSON file (see document_json.hpp for the layout).
 */
Status sup_to_json(const std::string &sup_path, const std::string &json_path);  ///< @ingroup api

/**
 * @brief Load a JSON document and encode it as a `.sup` file.
 *
 * @param json_path Input JSON document.
 * @param sup_path Destination PGS stream.
 * @param options Canvas size, frame rate code and object fragment ceiling.
 */
Status json_to_sup(const std::string &json_path, const std::string &sup_path,
                   const EncodeOptions &options = {});  ///< @ingroup api

/// @}

}  // namespace pgsforge
