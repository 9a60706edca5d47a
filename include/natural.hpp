//
//  natural.hpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace cuescribe {

// Natural numbers are carried as uint64_t; every helper below fails instead of wrapping.
using Natural = uint64_t;

inline constexpr bool is_ascii_digit(char c) { return c >= '0' && c <= '9'; }

// Parse one or more ASCII decimal digits. Empty input, any other character, or a value
// that does not fit a Natural yields nullopt.
std::optional<Natural> parse_natural(std::string_view digits);

std::optional<Natural> checked_add(Natural a, Natural b);
std::optional<Natural> checked_mul(Natural a, Natural b);

}  // namespace cuescribe
