//
//  transcript.hpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "caption.hpp"

namespace cuescribe {

inline constexpr std::string_view kSpeakerMarker = ">>";

// Collapse caption text into one line per speaker turn. Line wrapping and caption
// boundaries are dropped; a new line starts at every standalone ">>" word. Words before
// the first marker form a leading line when there are any.
std::vector<std::string> render_transcript(const std::vector<Caption> &captions);

namespace transcript_detail {
// Whitespace-delimited words of all lines, in order.
std::vector<std::string> split_words(const std::vector<std::string> &lines);
// Group words into speaker segments, each joined with single spaces.
std::vector<std::string> segment_words(const std::vector<std::string> &words);
}  // namespace transcript_detail

}  // namespace cuescribe
