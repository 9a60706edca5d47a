//
//  main.cpp
//  CueScribe
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "cuescribe.hpp"
#include "cuescribe_version.hpp"
#include "json_export.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>

static void print_usage() {
    std::cerr << "CueScribe " << CUESCRIBE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  cuescribe <input.vtt> [--json] [--captions] "
              << "[--log-level error|warn|info|debug]\n"
              << "Options:\n"
              << "  --json              Write a JSON document instead of plain transcript lines.\n"
              << "  --captions          With --json, also include the parsed captions.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "  --version, -v       Print the version and exit.\n";
}

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "CueScribe " << CUESCRIBE_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    bool as_json = false;
    bool with_captions = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            as_json = true;
        } else if (arg == "--captions") {
            with_captions = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            cuescribe::set_log_verbosity(cuescribe::parse_log_level(argv[i + 1]));
            ++i;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }
    if (positional.size() != 1) {
        std::cerr << "Invalid arguments. See usage with no arguments.\n";
        return 2;
    }
    if (with_captions && !as_json) {
        CS_LOG("warn", "--captions has no effect without --json");
    }

    const std::string input_path = positional[0];
    auto res = cuescribe::read_vtt_file(input_path);
    if (!res.status.ok) {
        CS_LOG("error", "cuescribe: failed to read captions: " << res.status.message);
        return 1;
    }

    if (as_json) {
        try {
            std::cout << cuescribe::document_to_json_text(res.captions, with_captions) << "\n";
        } catch (const nlohmann::json::exception &e) {
            CS_LOG("error", "cuescribe: failed to emit JSON: " << e.what());
            return 1;
        }
        return 0;
    }
    for (const auto &line : cuescribe::render_transcript(res.captions)) {
        std::cout << line << "\n";
    }
    return 0;
}
