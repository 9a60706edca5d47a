//
//  non_empty.hpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace cuescribe {

/**
 * @brief Ordered sequence holding at least one element.
 *
 * The invariant is established at construction; there is no way to remove elements
 * afterwards, so `front()` is always valid.
 */
template <typename T>
class NonEmpty {
   public:
    using value_type = T;
    using const_iterator = typename std::vector<T>::const_iterator;

    explicit NonEmpty(T head, std::vector<T> tail = {}) {
        items_.reserve(tail.size() + 1);
        items_.push_back(std::move(head));
        for (auto &item : tail) {
            items_.push_back(std::move(item));
        }
    }

    // Throws std::invalid_argument for an empty vector; prefer from() when that can happen.
    explicit NonEmpty(std::vector<T> items) : items_(std::move(items)) {
        if (items_.empty()) {
            throw std::invalid_argument("NonEmpty requires at least one element");
        }
    }

    static std::optional<NonEmpty> from(std::vector<T> items) {
        if (items.empty()) {
            return std::nullopt;
        }
        return NonEmpty(std::move(items));
    }

    const T &front() const { return items_.front(); }
    const T &back() const { return items_.back(); }
    const T &operator[](size_t i) const { return items_[i]; }
    size_t size() const { return items_.size(); }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    const std::vector<T> &to_vector() const { return items_; }

    bool operator==(const NonEmpty &other) const { return items_ == other.items_; }
    bool operator!=(const NonEmpty &other) const { return !(*this == other); }

   private:
    std::vector<T> items_;
};

}  // namespace cuescribe
