//
//  natural.cpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "natural.hpp"

#include <limits>

namespace cuescribe {

namespace {
constexpr Natural kNaturalMax = std::numeric_limits<Natural>::max();
constexpr Natural kRadix = 10;
}  // namespace

std::optional<Natural> checked_add(Natural a, Natural b) {
    if (a > kNaturalMax - b) {
        return std::nullopt;
    }
    return a + b;
}

std::optional<Natural> checked_mul(Natural a, Natural b) {
    if (a != 0 && b > kNaturalMax / a) {
        return std::nullopt;
    }
    return a * b;
}

std::optional<Natural> parse_natural(std::string_view digits) {
    if (digits.empty()) {
        return std::nullopt;
    }
    Natural value = 0;
    for (char c : digits) {
        if (!is_ascii_digit(c)) {
            return std::nullopt;
        }
        auto shifted = checked_mul(value, kRadix);
        if (!shifted) {
            return std::nullopt;
        }
        auto next = checked_add(*shifted, static_cast<Natural>(c - '0'));
        if (!next) {
            return std::nullopt;
        }
        value = *next;
    }
    return value;
}

}  // namespace cuescribe
