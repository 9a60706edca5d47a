//
//  transcript.cpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "transcript.hpp"

#include <cctype>
#include <utility>

#include "logging.hpp"

namespace cuescribe {

namespace {

// Byte length of the whitespace character starting at `pos`, or 0. Besides ASCII
// whitespace this covers the UTF-8 encodings of the Unicode space separators: U+00A0,
// U+1680, U+2000..U+200A, U+202F, U+205F and U+3000.
size_t space_width(const std::string &text, size_t pos) {
    const auto byte = [&](size_t i) {
        return i < text.size() ? static_cast<unsigned char>(text[i]) : 0u;
    };
    const unsigned b0 = byte(pos);
    if (std::isspace(b0) != 0) {
        return 1;
    }
    const unsigned b1 = byte(pos + 1);
    if (b0 == 0xC2 && b1 == 0xA0) {
        return 2;
    }
    const unsigned b2 = byte(pos + 2);
    if (b0 == 0xE1 && b1 == 0x9A && b2 == 0x80) {
        return 3;
    }
    if (b0 == 0xE2 && b1 == 0x80 && ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xAF)) {
        return 3;
    }
    if (b0 == 0xE2 && b1 == 0x81 && b2 == 0x9F) {
        return 3;
    }
    if (b0 == 0xE3 && b1 == 0x80 && b2 == 0x80) {
        return 3;
    }
    return 0;
}

std::string join_words(const std::vector<std::string> &words) {
    std::string out;
    for (const auto &w : words) {
        if (!out.empty()) {
            out += ' ';
        }
        out += w;
    }
    return out;
}

}  // namespace

namespace transcript_detail {

std::vector<std::string> split_words(const std::vector<std::string> &lines) {
    std::vector<std::string> words;
    for (const auto &line : lines) {
        size_t i = 0;
        while (i < line.size()) {
            size_t width = 0;
            while (i < line.size() && (width = space_width(line, i)) > 0) {
                i += width;
            }
            const size_t begin = i;
            // Separators start with a lead byte, never a continuation byte, so a byte-wise
            // scan cannot match in the middle of another multi-byte character.
            while (i < line.size() && space_width(line, i) == 0) {
                ++i;
            }
            if (i > begin) {
                words.emplace_back(line, begin, i - begin);
            }
        }
    }
    return words;
}

std::vector<std::string> segment_words(const std::vector<std::string> &words) {
    std::vector<std::string> lines;
    std::vector<std::string> current;
    // Whatever precedes the first marker is kept as its own line unless it is empty.
    for (const auto &word : words) {
        if (word == kSpeakerMarker) {
            if (!current.empty()) {
                lines.push_back(join_words(current));
            }
            current.clear();
        }
        current.push_back(word);
    }
    if (!current.empty()) {
        lines.push_back(join_words(current));
    }
    return lines;
}

}  // namespace transcript_detail

std::vector<std::string> render_transcript(const std::vector<Caption> &captions) {
    std::vector<std::string> text;
    for (const auto &caption : captions) {
        const auto &payload = caption.payload().to_vector();
        text.insert(text.end(), payload.begin(), payload.end());
    }
    auto lines = transcript_detail::segment_words(transcript_detail::split_words(text));
    CS_LOG("render", "rendered " << captions.size() << " captions into " << lines.size()
                                 << " transcript lines");
    return lines;
}

}  // namespace cuescribe
