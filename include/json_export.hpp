//
//  json_export.hpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "caption.hpp"

namespace cuescribe {

// One object per caption: identifier, start/end (text and ms) and payload lines.
nlohmann::json captions_to_json(const std::vector<Caption> &captions);

nlohmann::json transcript_to_json(const std::vector<std::string> &lines);

// {"caption_count", "transcript"} plus "captions" when include_captions is set.
nlohmann::json document_to_json(const std::vector<Caption> &captions, bool include_captions);

// Pretty-printed document_to_json. Payload bytes are not checked for UTF-8 by the parser, so
// invalid sequences are written as U+FFFD instead of failing the dump.
std::string document_to_json_text(const std::vector<Caption> &captions, bool include_captions,
                                  int indent = 2);

}  // namespace cuescribe
