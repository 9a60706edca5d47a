// NonEmpty invariant and Caption construction rules.
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "caption.hpp"
#include "non_empty.hpp"

using namespace cuescribe;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[caption_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

Timestamp at_ms(Natural ms) { return Timestamp::from_milliseconds(ms); }

bool test_non_empty() {
    bool ok = check(!NonEmpty<int>::from({}).has_value(), "from() rejects empty vector");

    auto three = NonEmpty<int>::from({4, 5, 6});
    ok &= check(three.has_value() && three->size() == 3 && three->front() == 4 &&
                    three->back() == 6,
                "from() keeps order");

    NonEmpty<int> head_tail(1, {2, 3});
    ok &= check(head_tail.to_vector() == std::vector<int>({1, 2, 3}), "head + tail");
    ok &= check(NonEmpty<int>(7).size() == 1, "single element");

    bool threw = false;
    try {
        NonEmpty<int> bad{std::vector<int>{}};
        (void)bad;
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    ok &= check(threw, "direct construction from empty vector throws");
    return ok;
}

bool test_caption_make() {
    NonEmpty<std::string> payload(std::string("Hello"));
    auto good = Caption::make(1, at_ms(0), at_ms(2000), payload);
    bool ok = check(good.has_value(), "start < end accepted");
    ok &= check(good && good->identifier() == 1 && good->start() == at_ms(0) &&
                    good->end() == at_ms(2000) && good->payload().front() == "Hello",
                "accessors return constructor values");

    ok &= check(!Caption::make(1, at_ms(2000), at_ms(2000), payload), "start == end rejected");
    ok &= check(!Caption::make(1, at_ms(3000), at_ms(2000), payload), "start > end rejected");

    auto same = Caption::make(1, at_ms(0), at_ms(2000), payload);
    auto other_id = Caption::make(2, at_ms(0), at_ms(2000), payload);
    ok &= check(good && same && *good == *same, "equal captions compare equal");
    ok &= check(good && other_id && *good != *other_id, "identifier participates in equality");

    if (good) {
        std::ostringstream oss;
        oss << *good;
        ok &= check(oss.str() == "Caption{1, 00:00:00.000 --> 00:00:02.000, [\"Hello\"]}",
                    "debug representation, got " + oss.str());
    }
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_non_empty();
    ok &= test_caption_make();
    return ok ? 0 : 1;
}
