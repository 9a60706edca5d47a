//
//  json_export.cpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "json_export.hpp"

#include "transcript.hpp"

using json = nlohmann::json;

namespace cuescribe {

json captions_to_json(const std::vector<Caption> &captions) {
    json out = json::array();
    for (const auto &caption : captions) {
        json c;
        c["identifier"] = caption.identifier();
        c["start"] = caption.start().to_string();
        c["end"] = caption.end().to_string();
        c["start_ms"] = caption.start().milliseconds();
        c["end_ms"] = caption.end().milliseconds();
        c["payload"] = caption.payload().to_vector();
        out.push_back(c);
    }
    return out;
}

json transcript_to_json(const std::vector<std::string> &lines) {
    json out = json::array();
    for (const auto &line : lines) {
        out.push_back(line);
    }
    return out;
}

json document_to_json(const std::vector<Caption> &captions, bool include_captions) {
    json j;
    j["caption_count"] = captions.size();
    j["transcript"] = transcript_to_json(render_transcript(captions));
    if (include_captions) {
        j["captions"] = captions_to_json(captions);
    }
    return j;
}

std::string document_to_json_text(const std::vector<Caption> &captions, bool include_captions,
                                  int indent) {
    return document_to_json(captions, include_captions)
        .dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace cuescribe
