//
//  cuescribe.cpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "cuescribe.hpp"
#include "cuescribe_version.hpp"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include "logging.hpp"

namespace cuescribe {

std::string version_string() { return CUESCRIBE_VERSION_DISPLAY; }

}  // namespace cuescribe

namespace {

static bool read_file(const std::string &path, std::string &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        CS_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    if (f.bad()) {
        CS_LOG("error", "read failed for " << path);
        return false;
    }
    CS_LOG("io", "read " << out.size() << " bytes from " << path);
    return true;
}

}  // namespace

namespace cuescribe {

namespace {
ReadStatus make_status(bool ok, std::string msg = {}) { return ReadStatus{ok, std::move(msg)}; }
}  // namespace

ReadResult read_vtt_file(const std::string &path) {
    const auto t0 = std::chrono::steady_clock::now();
    ReadResult result;
    std::string document;
    if (!read_file(path, document)) {
        result.status = make_status(false, "open failed for " + path);
        return result;
    }
    auto captions = parse_vtt(document);
    if (!captions) {
        std::string msg = "Not a valid WebVTT document: " + path;
        CS_LOG("error", msg);
        result.status = make_status(false, msg);
        return result;
    }
    result.captions = std::move(*captions);
    result.status = make_status(true);
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - t0);
    CS_LOG("io", "read_vtt_file " << path << " captions=" << result.captions.size()
                                  << " took " << elapsed.count() << "us");
    return result;
}

TranscriptResult transcript_from_file(const std::string &path) {
    TranscriptResult result;
    auto read = read_vtt_file(path);
    result.status = std::move(read.status);
    if (!result.status.ok) {
        return result;
    }
    result.lines = render_transcript(read.captions);
    return result;
}

}  // namespace cuescribe
