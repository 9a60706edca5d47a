//
//  caption.hpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "natural.hpp"
#include "non_empty.hpp"
#include "timestamp.hpp"

namespace cuescribe {

/**
 * @brief One WebVTT cue: identifier, time range and the dialogue lines.
 *
 * Immutable once built. `start() < end()` always holds and the payload carries at least
 * one line; each line is a single input line without its terminating newline.
 */
class Caption {
   public:
    /// Returns nullopt unless start < end.
    static std::optional<Caption> make(Natural identifier, Timestamp start, Timestamp end,
                                       NonEmpty<std::string> payload);

    Natural identifier() const { return identifier_; }
    Timestamp start() const { return start_; }
    Timestamp end() const { return end_; }
    const NonEmpty<std::string> &payload() const { return payload_; }

    bool operator==(const Caption &other) const;
    bool operator!=(const Caption &other) const { return !(*this == other); }

   private:
    Caption(Natural identifier, Timestamp start, Timestamp end, NonEmpty<std::string> payload);

    Natural identifier_;
    Timestamp start_;
    Timestamp end_;
    NonEmpty<std::string> payload_;
};

std::ostream &operator<<(std::ostream &os, const Caption &caption);

}  // namespace cuescribe
