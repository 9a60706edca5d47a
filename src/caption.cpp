//
//  caption.cpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "caption.hpp"

#include <utility>

namespace cuescribe {

Caption::Caption(Natural identifier, Timestamp start, Timestamp end,
                 NonEmpty<std::string> payload)
    : identifier_(identifier), start_(start), end_(end), payload_(std::move(payload)) {}

std::optional<Caption> Caption::make(Natural identifier, Timestamp start, Timestamp end,
                                     NonEmpty<std::string> payload) {
    if (!(start < end)) {
        return std::nullopt;
    }
    return Caption(identifier, start, end, std::move(payload));
}

bool Caption::operator==(const Caption &other) const {
    return identifier_ == other.identifier_ && start_ == other.start_ && end_ == other.end_ &&
           payload_ == other.payload_;
}

std::ostream &operator<<(std::ostream &os, const Caption &caption) {
    os << "Caption{" << caption.identifier() << ", " << caption.start() << " --> "
       << caption.end() << ", [";
    bool first = true;
    for (const auto &line : caption.payload()) {
        if (!first) {
            os << ", ";
        }
        os << '"' << line << '"';
        first = false;
    }
    return os << "]}";
}

}  // namespace cuescribe
