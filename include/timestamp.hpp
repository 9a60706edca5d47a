//
//  timestamp.hpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "natural.hpp"

namespace cuescribe {

inline constexpr Natural kMinutesPerHour = 60;
inline constexpr Natural kSecondsPerMinute = 60;
inline constexpr Natural kMillisPerSecond = 1000;

// Characters in "HH:MM:SS.mmm".
inline constexpr size_t kTimestampLength = 12;

/**
 * @brief Time-of-day offset of a cue, in whole milliseconds.
 *
 * WebVTT timestamps carry millisecond resolution, so an integral millisecond count
 * represents every parsed value exactly.
 */
class Timestamp {
   public:
    Timestamp() = default;

    /// Compose from clock fields. Fails if minutes/seconds >= 60, millis >= 1000, or the
    /// total does not fit.
    static std::optional<Timestamp> from_fields(Natural hours, Natural minutes, Natural seconds,
                                                Natural millis);
    static constexpr Timestamp from_milliseconds(Natural ms) { return Timestamp(ms); }

    constexpr Natural milliseconds() const { return ms_; }
    Natural hours() const;
    Natural minutes() const;
    Natural seconds() const;
    Natural millis() const;

    /// HH:MM:SS.mmm, hours padded to two digits.
    std::string to_string() const;

    constexpr bool operator==(const Timestamp &o) const { return ms_ == o.ms_; }
    constexpr bool operator!=(const Timestamp &o) const { return ms_ != o.ms_; }
    constexpr bool operator<(const Timestamp &o) const { return ms_ < o.ms_; }
    constexpr bool operator<=(const Timestamp &o) const { return ms_ <= o.ms_; }
    constexpr bool operator>(const Timestamp &o) const { return ms_ > o.ms_; }
    constexpr bool operator>=(const Timestamp &o) const { return ms_ >= o.ms_; }

   private:
    constexpr explicit Timestamp(Natural ms) : ms_(ms) {}

    Natural ms_ = 0;
};

// Parse exactly "HH:MM:SS.mmm" with nothing left over.
std::optional<Timestamp> parse_timestamp(std::string_view text);

std::ostream &operator<<(std::ostream &os, const Timestamp &ts);

}  // namespace cuescribe
