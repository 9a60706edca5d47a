//
//  vtt_parser.hpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "caption.hpp"

namespace cuescribe {

inline constexpr std::string_view kVttHeader = "WEBVTT\n\n";
inline constexpr std::string_view kCueArrow = " --> ";

// Main parsing entry point. Accepts the small WebVTT subset used for episode captions:
//
//   WEBVTT
//
//   1
//   00:00:00.000 --> 00:00:02.000
//   >> Hello,
//   world!
//
//   2
//   ...
//
// Returns nullopt when the whole document does not match; there is no partial result.
std::optional<std::vector<Caption>> parse_vtt(std::string_view document);

}  // namespace cuescribe
