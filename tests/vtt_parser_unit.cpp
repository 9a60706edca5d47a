// Grammar coverage for parse_vtt: accepted layouts, rejected documents, and debug diagnostics.
#include <iostream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "test_utils.hpp"
#include "vtt_parser.hpp"

using namespace cuescribe;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[vtt_parser_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

const std::string kSingle =
    "WEBVTT\n"
    "\n"
    "1\n"
    "00:00:00.000 --> 00:00:02.000\n"
    ">>\n"
    "Hello, world!\n";

bool test_single_caption() {
    auto parsed = parse_vtt(kSingle);
    bool ok = check(parsed.has_value(), "single caption parses");
    if (!parsed) {
        return false;
    }
    ok &= check(parsed->size() == 1, "exactly one caption");
    const auto &c = parsed->front();
    ok &= check(c.identifier() == 1, "identifier 1");
    ok &= check(c.start().milliseconds() == 0 && c.end().milliseconds() == 2000, "time range");
    ok &= check(c.payload().to_vector() == std::vector<std::string>({">>", "Hello, world!"}),
                "payload lines kept verbatim");
    return ok;
}

bool test_multiple_captions() {
    const std::string doc =
        "WEBVTT\n"
        "\n"
        "7\n"
        "00:00:05.000 --> 00:00:06.500\n"
        ">> We've been sent\n"
        "good weather.\n"
        "\n"
        "3\n"
        "00:00:01.000 --> 00:00:02.000\n"
        ">> Praise be.\n";
    auto parsed = parse_vtt(doc);
    bool ok = check(parsed.has_value() && parsed->size() == 2, "two captions parse");
    if (!parsed || parsed->size() != 2) {
        return false;
    }
    // Identifiers need not be sequential and ranges need not be increasing.
    ok &= check((*parsed)[0].identifier() == 7 && (*parsed)[1].identifier() == 3,
                "document order preserved");
    ok &= check((*parsed)[0].payload().size() == 2 && (*parsed)[1].payload().size() == 1,
                "payload line counts");
    ok &= check((*parsed)[0].end().milliseconds() == 6500, "end millis");
    return ok;
}

bool test_digit_payload_lines() {
    // A payload line that looks like an identifier stays payload; only a blank line starts
    // the next caption.
    const std::string doc =
        "WEBVTT\n"
        "\n"
        "1\n"
        "00:00:00.000 --> 00:00:01.000\n"
        "2\n"
        "00:00:01.000 --> 00:00:02.000\n"
        "\n"
        "3\n"
        "00:00:02.000 --> 00:00:03.000\n"
        "42\n";
    auto parsed = parse_vtt(doc);
    bool ok = check(parsed.has_value() && parsed->size() == 2, "digit lines consumed as payload");
    if (!parsed || parsed->size() != 2) {
        return false;
    }
    ok &= check((*parsed)[0].payload().to_vector() ==
                    std::vector<std::string>({"2", "00:00:01.000 --> 00:00:02.000"}),
                "first caption swallows the look-alike block");
    ok &= check((*parsed)[1].identifier() == 3 && (*parsed)[1].payload().front() == "42",
                "second caption has numeric payload");
    return ok;
}

bool test_empty_document_body() {
    auto parsed = parse_vtt("WEBVTT\n\n");
    bool ok = check(parsed.has_value() && parsed->empty(), "header only is zero captions");
    ok &= check(!parse_vtt("WEBVTT\n\n\n"), "header plus stray blank line");
    return ok;
}

bool test_rejections() {
    bool ok = check(!parse_vtt(""), "empty document");
    ok &= check(!parse_vtt("WEBVTT\n1\n00:00:00.000 --> 00:00:02.000\nHi\n"),
                "missing blank line after header");
    ok &= check(!parse_vtt("WEBVTT\r\n\r\n1\r\n00:00:00.000 --> 00:00:02.000\r\nHi\r\n"),
                "CRLF line endings");
    ok &= check(!parse_vtt("webvtt\n\n1\n00:00:00.000 --> 00:00:02.000\nHi\n"),
                "lowercase header");
    ok &= check(!parse_vtt("WEBVTT\n\n1\n00:00:00.000 --> 00:00:02.000\nHi"),
                "payload without trailing newline");
    ok &= check(!parse_vtt("WEBVTT\n\n1\n00:00:00.000 --> 00:00:02.000\n"), "missing payload");
    ok &= check(!parse_vtt("WEBVTT\n\n1\n00:00:00.000 --> 00:00:02.000\nHi\n\n"),
                "trailing blank line");
    ok &= check(!parse_vtt("WEBVTT\n\n1\n00:00:00.000 --> 00:00:02.000\nHi\n\n\n"
                           "2\n00:00:02.000 --> 00:00:03.000\nHo\n"),
                "two blank lines between captions");
    ok &= check(!parse_vtt("WEBVTT\n\nx1\n00:00:00.000 --> 00:00:02.000\nHi\n"),
                "non-digit identifier");
    ok &= check(!parse_vtt("WEBVTT\n\n\n00:00:00.000 --> 00:00:02.000\nHi\n"),
                "empty identifier");
    ok &= check(!parse_vtt("WEBVTT\n\n99999999999999999999999\n"
                           "00:00:00.000 --> 00:00:02.000\nHi\n"),
                "identifier overflow");
    ok &= check(!parse_vtt("WEBVTT\n\n1\n00:00:00.000 -> 00:00:02.000\nHi\n"),
                "short arrow");
    ok &= check(!parse_vtt("WEBVTT\n\n1\n00:00:00.000 --> 00:00:02.000 align:start\nHi\n"),
                "cue settings");
    ok &= check(!parse_vtt("WEBVTT\n\n1\n00:60:00.000 --> 01:00:00.000\nHi\n"),
                "minutes out of range");
    ok &= check(!parse_vtt("WEBVTT\n\n1\n00:00:00.000 --> 00:00:60.000\nHi\n"),
                "seconds out of range");
    ok &= check(!parse_vtt("WEBVTT\n\n1\n00:00:00.00 --> 00:00:02.000\nHi\n"),
                "short millisecond field");
    return ok;
}

bool test_time_range_must_increase() {
    bool ok = check(!parse_vtt("WEBVTT\n\n1\n00:00:02.000 --> 00:00:02.000\nHi\n"),
                    "start == end rejected");
    ok &= check(!parse_vtt("WEBVTT\n\n1\n00:00:03.000 --> 00:00:02.000\nHi\n"),
                "start > end rejected");
    // One bad caption rejects the whole document.
    ok &= check(!parse_vtt("WEBVTT\n\n1\n00:00:00.000 --> 00:00:01.000\nok\n\n"
                           "2\n00:00:05.000 --> 00:00:04.000\nbad\n"),
                "no partial result");
    ok &= check(parse_vtt("WEBVTT\n\n1\n00:00:01.999 --> 00:00:02.000\nHi\n").has_value(),
                "one millisecond apart is enough");
    return ok;
}

bool test_rejection_is_logged_at_debug() {
    set_log_verbosity(LogVerbosity::Debug);
    auto log_text = test_utils::capture_stderr([]() {
        auto parsed = parse_vtt("WEBVTT\n\n4\n00:00:03.000 --> 00:00:02.000\nHi\n");
        (void)parsed;
    });
    bool ok = check(log_text.find("caption 4") != std::string::npos &&
                        log_text.find("not before end") != std::string::npos,
                    "debug log names the failing caption, got: " + log_text);

    set_log_verbosity(LogVerbosity::Info);
    log_text = test_utils::capture_stderr([]() {
        auto parsed = parse_vtt("garbage");
        (void)parsed;
    });
    ok &= check(log_text.empty(), "parser diagnostics are silent at info level");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_single_caption();
    ok &= test_multiple_captions();
    ok &= test_digit_payload_lines();
    ok &= test_empty_document_body();
    ok &= test_rejections();
    ok &= test_time_range_must_increase();
    ok &= test_rejection_is_logged_at_debug();
    return ok ? 0 : 1;
}
