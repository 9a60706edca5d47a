//
//  cuescribe.hpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "caption.hpp"
#include "transcript.hpp"
#include "vtt_parser.hpp"

namespace cuescribe {

/// @defgroup api CueScribe Public API
/// Public, supported C++ interfaces for turning WebVTT caption files into transcripts.
/// @{

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `message` contains a short description of
 * what went wrong (e.g., failure to open the file or a document that is not valid WebVTT).
 */
struct ReadStatus {
    bool ok{false};
    std::string message;
};

/// Captions parsed from a file; empty unless `status.ok`.
struct ReadResult {
    ReadStatus status;
    std::vector<Caption> captions;
};

/// Transcript lines rendered from a file; empty unless `status.ok`.
struct TranscriptResult {
    ReadStatus status;
    std::vector<std::string> lines;
};

/**
 * @brief Return the CueScribe library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// Read a WebVTT file from disk and parse it.
ReadResult read_vtt_file(const std::string &path);  ///< @ingroup api

/// Read, parse and render a WebVTT file into transcript lines.
TranscriptResult transcript_from_file(const std::string &path);  ///< @ingroup api

/// @}

}  // namespace cuescribe
