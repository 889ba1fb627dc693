//
//  manifest.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "manifest.hpp"

#include <array>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>
#include <utility>

#include "logging.hpp"

using json = nlohmann::json;

namespace {

using webpforge::make_error;
using webpforge::MuxError;
using webpforge::MuxStatus;

MuxStatus manifest_error(const std::string &msg) {
    return make_error(MuxError::ManifestError, msg);
}

// Optional unsigned field; absent keeps `out` unchanged.
bool read_u32_field(const json &j, const char *key, std::optional<uint32_t> &out,
                    std::string &err) {
    if (!j.contains(key) || j[key].is_null()) {
        return true;
    }
    const auto &v = j[key];
    if (!v.is_number_integer() || v.get<int64_t>() < 0 ||
        v.get<int64_t>() > std::numeric_limits<uint32_t>::max()) {
        err = std::string("'") + key + "' must be an integer in [0, 4294967295]";
        return false;
    }
    out = static_cast<uint32_t>(v.get<int64_t>());
    return true;
}

bool read_u32_field(const json &j, const char *key, uint32_t &out, std::string &err) {
    std::optional<uint32_t> v;
    if (!read_u32_field(j, key, v, err)) {
        return false;
    }
    if (v) {
        out = *v;
    }
    return true;
}

bool read_path_field(const json &j, const char *key, const std::filesystem::path &base,
                     std::string &out, std::string &err) {
    if (!j.contains(key) || j[key].is_null()) {
        return true;
    }
    if (!j[key].is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    const auto rel = j[key].get<std::string>();
    out = rel.empty() ? std::string() : (base / rel).string();
    return true;
}

bool read_background(const json &j, std::array<uint8_t, 4> &bgra, std::string &err) {
    if (!j.contains("background")) {
        return true;
    }
    const auto &bg = j["background"];
    if (!bg.is_array() || bg.size() != 4) {
        err = "'background' must be an array of four values [b, g, r, a]";
        return false;
    }
    for (size_t i = 0; i < 4; ++i) {
        if (!bg[i].is_number_integer() || bg[i].get<int64_t>() < 0 ||
            bg[i].get<int64_t>() > 255) {
            err = "'background' entries must be integers in [0, 255]";
            return false;
        }
        bgra[i] = static_cast<uint8_t>(bg[i].get<int64_t>());
    }
    return true;
}

bool read_frame(const json &c, size_t index, const std::filesystem::path &base,
                webpforge::ManifestFrame &frame, std::string &err) {
    const std::string where = "frames[" + std::to_string(index) + "]: ";
    if (!c.is_object()) {
        err = where + "entry must be an object";
        return false;
    }
    if (!c.contains("file") || !c["file"].is_string() || c["file"].get<std::string>().empty()) {
        err = where + "'file' is required";
        return false;
    }
    frame.path = (base / c["file"].get<std::string>()).string();

    std::string field_err;
    if (!read_u32_field(c, "duration_ms", frame.duration_ms, field_err) ||
        !read_u32_field(c, "x", frame.x, field_err) ||
        !read_u32_field(c, "y", frame.y, field_err) ||
        !read_u32_field(c, "width", frame.width, field_err) ||
        !read_u32_field(c, "height", frame.height, field_err)) {
        err = where + field_err;
        return false;
    }

    const std::string disposal = c.value("disposal", "background");
    if (disposal == "background") {
        frame.disposal = webpforge::DisposalMethod::ClearToBackground;
    } else if (disposal == "none") {
        frame.disposal = webpforge::DisposalMethod::None;
    } else {
        err = where + "unknown disposal '" + disposal + "' (expected none|background)";
        return false;
    }

    const std::string blend = c.value("blend", "none");
    if (blend == "none") {
        frame.blend = webpforge::BlendMethod::NoBlend;
    } else if (blend == "alpha") {
        frame.blend = webpforge::BlendMethod::AlphaBlend;
    } else {
        err = where + "unknown blend '" + blend + "' (expected alpha|none)";
        return false;
    }
    return true;
}

MuxStatus parse_manifest_object(const json &j, const std::string &base_dir,
                                webpforge::AnimationManifest &out) {
    using webpforge::AnimationManifest;
    using webpforge::ManifestFrame;
    if (!j.is_object()) {
        return manifest_error("manifest must be a JSON object");
    }

    AnimationManifest m;
    const std::filesystem::path base(base_dir);
    std::string err;
    if (!read_u32_field(j, "width", m.params.canvas_width, err) ||
        !read_u32_field(j, "height", m.params.canvas_height, err) ||
        !read_u32_field(j, "loop_count", m.params.loop_count, err) ||
        !read_background(j, m.params.background_bgra, err) ||
        !read_path_field(j, "icc", base, m.icc_path, err) ||
        !read_path_field(j, "exif", base, m.exif_path, err) ||
        !read_path_field(j, "xmp", base, m.xmp_path, err)) {
        return manifest_error(err);
    }
    if (j.contains("has_alpha")) {
        if (!j["has_alpha"].is_boolean()) {
            return manifest_error("'has_alpha' must be a boolean");
        }
        m.params.declared_has_alpha = j["has_alpha"].get<bool>();
    }

    if (!j.contains("frames") || !j["frames"].is_array()) {
        return manifest_error("'frames' array is required");
    }
    const auto &frames = j["frames"];
    m.frames.reserve(frames.size());
    for (size_t i = 0; i < frames.size(); ++i) {
        ManifestFrame frame;
        if (!read_frame(frames[i], i, base, frame, err)) {
            return manifest_error(err);
        }
        m.frames.push_back(std::move(frame));
    }

    WF_LOG("debug", "manifest: canvas=" << m.params.canvas_width << "x" << m.params.canvas_height
                                        << " loop=" << m.params.loop_count
                                        << " frames=" << m.frames.size());
    out = std::move(m);
    return webpforge::make_ok();
}

}  // namespace

namespace webpforge {

MuxStatus parse_manifest(const std::string &json_text, const std::string &base_dir,
                         AnimationManifest &out) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::exception &e) {
        return manifest_error(std::string("manifest is not valid JSON: ") + e.what());
    }
    try {
        return parse_manifest_object(j, base_dir, out);
    } catch (const json::exception &e) {
        // value() throws on a type mismatch, e.g. a numeric "blend".
        return manifest_error(std::string("manifest has an unexpected value type: ") + e.what());
    }
}

MuxStatus load_manifest(const std::string &json_path, AnimationManifest &out) {
    std::ifstream f(json_path);
    if (!f.is_open()) {
        WF_LOG("error", "open failed for " << json_path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return manifest_error("cannot open manifest " + json_path);
    }
    std::ostringstream text;
    text << f.rdbuf();
    const auto base = std::filesystem::path(json_path).parent_path();
    return parse_manifest(text.str(), base.string(), out);
}

}  // namespace webpforge
