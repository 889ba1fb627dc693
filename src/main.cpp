//
//  main.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "file_io.hpp"
#include "logging.hpp"
#include "webp_inspector.hpp"
#include "webpforge.hpp"
#include <nlohmann/json.hpp>

namespace {

bool emit_json(const std::string &path, const webpforge::WebPInfo &info) {
    nlohmann::json j;
    j["file"] = path;
    j["codec"] = webpforge::codec_name(info.codec);
    j["width"] = info.width;
    j["height"] = info.height;
    j["has_alpha"] = info.has_alpha;
    j["extended"] = info.extended;
    j["bitstream_bytes"] = info.bitstream.size;
    if (info.alpha) {
        j["alpha_bytes"] = info.alpha->size;
    }
    if (info.codec == webpforge::CodecKind::Lossless) {
        j["lossless_alpha_hint"] = info.lossless_alpha_hint;
    }
    std::cout << j.dump(2) << "\n";
    return static_cast<bool>(std::cout);
}

int print_usage() {
    std::cerr << "WebPForge " << webpforge::version_string() << "\n"
              << "Copyright (c) 2026 Till Toenshoff\n\n"
              << "usage for inspecting a still frame:\n"
              << "  webpforge <input.webp> [--log-level warn|info|debug]\n"
              << "usage for writing:\n"
              << "  webpforge <manifest.json> <output.webp> [--log-level warn|info|debug]\n"
              << "Options:\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "  --version, -v       Print the version and exit.\n";
    return 2;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "WebPForge " << webpforge::version_string() << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            webpforge::set_log_verbosity(webpforge::parse_log_verbosity(argv[i + 1]));
            ++i;
        } else if (arg == "--help" || arg == "-h") {
            return print_usage();
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        return print_usage();
    }

    // Inspect mode: one positional argument (still WebP).
    if (positional.size() == 1) {
        const std::string input_path = positional[0];
        std::vector<uint8_t> bytes;
        if (!webpforge::read_file(input_path, bytes)) {
            return 1;
        }
        auto res = webpforge::inspect_webp(bytes);
        if (!res.status.ok) {
            WF_LOG("error", "webpforge: " << input_path << ": "
                                          << webpforge::error_name(res.status.error) << ": "
                                          << res.status.message);
            return 1;
        }
        if (!emit_json(input_path, res.info)) {
            WF_LOG("error", "webpforge: failed to emit JSON");
            return 1;
        }
        return 0;
    }

    // Writing mode: manifest + output.
    if (positional.size() != 2) {
        std::cerr << "Invalid arguments. See --help for usage.\n";
        return 2;
    }
    const std::string manifest_path = positional[0];
    const std::string output_path = positional[1];

    auto status = webpforge::mux_manifest_to_webp(manifest_path, output_path);
    if (!status.ok) {
        WF_LOG("error", "webpforge: failed to mux animation: "
                            << webpforge::error_name(status.error) << ": " << status.message);
        return 1;
    }

    std::cout << "Wrote: " << output_path << "\n";
    return 0;
}
