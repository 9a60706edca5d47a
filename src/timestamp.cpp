//
//  timestamp.cpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "timestamp.hpp"

#include <iomanip>
#include <sstream>

namespace cuescribe {

namespace {

constexpr Natural kMillisPerMinute = kSecondsPerMinute * kMillisPerSecond;
constexpr Natural kMillisPerHour = kMinutesPerHour * kMillisPerMinute;

std::optional<Natural> fixed_digits(std::string_view text, size_t pos, size_t count) {
    if (pos + count > text.size()) {
        return std::nullopt;
    }
    return parse_natural(text.substr(pos, count));
}

}  // namespace

std::optional<Timestamp> Timestamp::from_fields(Natural hours, Natural minutes, Natural seconds,
                                                Natural millis) {
    if (minutes >= kMinutesPerHour || seconds >= kSecondsPerMinute ||
        millis >= kMillisPerSecond) {
        return std::nullopt;
    }
    // ((h * 60 + m) * 60 + s) * 1000 + ms, failing on overflow at every step.
    auto total = checked_mul(hours, kMinutesPerHour);
    if (total) total = checked_add(*total, minutes);
    if (total) total = checked_mul(*total, kSecondsPerMinute);
    if (total) total = checked_add(*total, seconds);
    if (total) total = checked_mul(*total, kMillisPerSecond);
    if (total) total = checked_add(*total, millis);
    if (!total) {
        return std::nullopt;
    }
    return Timestamp(*total);
}

Natural Timestamp::hours() const { return ms_ / kMillisPerHour; }

Natural Timestamp::minutes() const { return (ms_ / kMillisPerMinute) % kMinutesPerHour; }

Natural Timestamp::seconds() const { return (ms_ / kMillisPerSecond) % kSecondsPerMinute; }

Natural Timestamp::millis() const { return ms_ % kMillisPerSecond; }

std::string Timestamp::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hours() << ':' << std::setw(2) << minutes()
        << ':' << std::setw(2) << seconds() << '.' << std::setw(3) << millis();
    return oss.str();
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    if (text.size() != kTimestampLength || text[2] != ':' || text[5] != ':' || text[8] != '.') {
        return std::nullopt;
    }
    auto hours = fixed_digits(text, 0, 2);
    auto minutes = fixed_digits(text, 3, 2);
    auto seconds = fixed_digits(text, 6, 2);
    auto millis = fixed_digits(text, 9, 3);
    if (!hours || !minutes || !seconds || !millis) {
        return std::nullopt;
    }
    return Timestamp::from_fields(*hours, *minutes, *seconds, *millis);
}

std::ostream &operator<<(std::ostream &os, const Timestamp &ts) { return os << ts.to_string(); }

}  // namespace cuescribe
