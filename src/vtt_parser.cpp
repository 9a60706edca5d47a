//
//  vtt_parser.cpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "vtt_parser.hpp"

#include <string>
#include <utility>

#include "logging.hpp"

namespace cuescribe {

namespace {

constexpr char kNewline = '\n';

// Forward-only reader over the document. Every rule either consumes its match and
// succeeds, or fails; a failed rule fails the whole document, so nothing ever rewinds.
class VttReader {
   public:
    explicit VttReader(std::string_view text) : text_(text) {}

    bool at_end() const { return pos_ >= text_.size(); }
    size_t position() const { return pos_; }
    std::string_view rest() const { return text_.substr(pos_); }

    bool peek(char c) const { return !at_end() && text_[pos_] == c; }

    bool literal(std::string_view expected) {
        if (text_.compare(pos_, expected.size(), expected) != 0) {
            return false;
        }
        pos_ += expected.size();
        return true;
    }

    bool newline() { return literal(std::string_view(&kNewline, 1)); }

    // One or more ASCII digits.
    std::string_view digits() {
        const size_t begin = pos_;
        while (!at_end() && is_ascii_digit(text_[pos_])) {
            ++pos_;
        }
        return text_.substr(begin, pos_ - begin);
    }

    // Exactly `count` characters, or an empty view if the document is shorter.
    std::string_view take(size_t count) {
        if (text_.size() - pos_ < count) {
            return {};
        }
        auto out = text_.substr(pos_, count);
        pos_ += count;
        return out;
    }

    // Non-empty run of characters up to (not including) the next newline.
    std::string_view line_body() {
        const size_t begin = pos_;
        while (!at_end() && text_[pos_] != kNewline) {
            ++pos_;
        }
        return text_.substr(begin, pos_ - begin);
    }

   private:
    std::string_view text_;
    size_t pos_ = 0;
};

std::optional<Natural> parse_identifier(VttReader &in) {
    auto digits = in.digits();
    if (digits.empty()) {
        CS_LOG("parser", "expected caption identifier at offset " << in.position() << ", got "
                                                                  << text_preview(in.rest()));
        return std::nullopt;
    }
    auto value = parse_natural(digits);
    if (!value) {
        CS_LOG("parser", "caption identifier " << digits << " does not fit a 64-bit value");
    }
    return value;
}

std::optional<Timestamp> parse_cue_time(VttReader &in) {
    const size_t at = in.position();
    auto ts = parse_timestamp(in.take(kTimestampLength));
    if (!ts) {
        CS_LOG("parser", "bad timestamp at offset "
                             << at << ": " << text_preview(in.rest(), kTimestampLength));
    }
    return ts;
}

// One or more lines of at least one character, each terminated by a newline. The run
// ends at a blank line or at the end of the document.
std::optional<NonEmpty<std::string>> parse_payload(VttReader &in) {
    std::vector<std::string> lines;
    while (!in.at_end() && !in.peek(kNewline)) {
        auto body = in.line_body();
        if (!in.newline()) {
            CS_LOG("parser", "payload line " << text_preview(body)
                                             << " is missing its trailing newline");
            return std::nullopt;
        }
        lines.emplace_back(body);
    }
    auto payload = NonEmpty<std::string>::from(std::move(lines));
    if (!payload) {
        CS_LOG("parser", "caption has no payload at offset " << in.position());
    }
    return payload;
}

std::optional<Caption> parse_caption(VttReader &in) {
    auto identifier = parse_identifier(in);
    if (!identifier) {
        return std::nullopt;
    }
    if (!in.newline()) {
        CS_LOG("parser", "caption " << *identifier << ": expected newline after identifier, got "
                                    << text_preview(in.rest()));
        return std::nullopt;
    }
    auto start = parse_cue_time(in);
    if (!start) {
        return std::nullopt;
    }
    if (!in.literal(kCueArrow)) {
        CS_LOG("parser", "caption " << *identifier << ": expected \" --> \", got "
                                    << text_preview(in.rest()));
        return std::nullopt;
    }
    auto end = parse_cue_time(in);
    if (!end) {
        return std::nullopt;
    }
    if (!in.newline()) {
        CS_LOG("parser", "caption " << *identifier << ": expected newline after time range, got "
                                    << text_preview(in.rest()));
        return std::nullopt;
    }
    if (!(*start < *end)) {
        CS_LOG("parser", "caption " << *identifier << ": start " << *start
                                    << " is not before end " << *end);
        return std::nullopt;
    }
    auto payload = parse_payload(in);
    if (!payload) {
        return std::nullopt;
    }
    return Caption::make(*identifier, *start, *end, std::move(*payload));
}

}  // namespace

std::optional<std::vector<Caption>> parse_vtt(std::string_view document) {
    VttReader in(document);
    if (!in.literal(kVttHeader)) {
        CS_LOG("parser", "missing WEBVTT header, document starts with " << text_preview(document));
        return std::nullopt;
    }

    std::vector<Caption> captions;
    // Captions are separated by exactly one newline, which after a payload line shows up as
    // a blank line. Zero captions is a valid document.
    if (!in.at_end()) {
        do {
            auto caption = parse_caption(in);
            if (!caption) {
                return std::nullopt;
            }
            captions.push_back(std::move(*caption));
        } while (in.newline());
    }

    if (!in.at_end()) {
        CS_LOG("parser", "unparsed trailing input at offset " << in.position() << ": "
                                                              << text_preview(in.rest()));
        return std::nullopt;
    }
    CS_LOG("parser", "parsed " << captions.size() << " captions");
    return captions;
}

}  // namespace cuescribe
