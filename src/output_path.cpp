//
//  output_path.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "output_path.hpp"

#include <algorithm>
#include <utility>

namespace oggfetch {

namespace {

std::string placeholder_value(const std::string &key, const TrackRecord &record, bool &known) {
    known = true;
    if (key == "author") {
        return record.artists.empty() ? std::string(kUnknownArtist) : record.artists.front();
    }
    if (key == "album") {
        return record.album_name;
    }
    if (key == "name") {
        std::string name = record.name;
        std::replace(name.begin(), name.end(), '/', ' ');
        return name;
    }
    if (key == "ext") {
        return kContainerExtension;
    }
    known = false;
    return {};
}

}  // namespace

std::string render_output_template(const std::string &tmpl, const TrackRecord &record) {
    std::string out;
    out.reserve(tmpl.size() + 64);
    size_t pos = 0;
    while (pos < tmpl.size()) {
        const size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        const size_t close = tmpl.find('}', open + 1);
        if (close == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        out.append(tmpl, pos, open - pos);
        bool known = false;
        const std::string value =
            placeholder_value(tmpl.substr(open + 1, close - open - 1), record, known);
        if (known) {
            out += value;
            pos = close + 1;
        } else {
            out += '{';
            pos = open + 1;
        }
    }
    return out;
}

Status derive_output_path(const std::string &tmpl, const TrackRecord &record, OutputPath &out) {
    std::string file = render_output_template(tmpl, record);
    const size_t slash = file.rfind('/');
    if (slash == std::string::npos) {
        return make_error(ErrorKind::PathTemplate, "invalid format string " + tmpl);
    }
    out.folder = file.substr(0, slash + 1);
    out.file = std::move(file);
    return make_ok();
}

}  // namespace oggfetch
