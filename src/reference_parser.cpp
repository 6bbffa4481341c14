//
//  reference_parser.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "reference_parser.hpp"

#include <regex>

#include "logging.hpp"

namespace oggfetch {

namespace {

constexpr ResourceKind kAllKinds[] = {ResourceKind::Track, ResourceKind::Playlist,
                                      ResourceKind::Album, ResourceKind::Artist};

struct KindPatterns {
    std::regex uri;
    std::regex url;
};

KindPatterns make_patterns(ResourceKind kind) {
    const std::string name = resource_kind_name(kind);
    return KindPatterns{
        std::regex("^spotify:" + name + ":([[:alnum:]]{22})$"),
        std::regex("^(https?://)?open\\.spotify\\.com/" + name + "/([[:alnum:]]{22})$"),
    };
}

const KindPatterns &patterns_for(ResourceKind kind) {
    static const KindPatterns track = make_patterns(ResourceKind::Track);
    static const KindPatterns playlist = make_patterns(ResourceKind::Playlist);
    static const KindPatterns album = make_patterns(ResourceKind::Album);
    static const KindPatterns artist = make_patterns(ResourceKind::Artist);
    switch (kind) {
        case ResourceKind::Playlist: return playlist;
        case ResourceKind::Album: return album;
        case ResourceKind::Artist: return artist;
        case ResourceKind::Track: break;
    }
    return track;
}

std::string_view trim(std::string_view s) {
    const char *ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

}  // namespace

const char *resource_kind_name(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Track: return "track";
        case ResourceKind::Playlist: return "playlist";
        case ResourceKind::Album: return "album";
        case ResourceKind::Artist: return "artist";
    }
    return "unknown";
}

std::optional<Reference> match_reference(std::string_view line, ResourceKind kind) {
    const std::string input(trim(line));
    const auto &p = patterns_for(kind);

    std::smatch match;
    if (!std::regex_match(input, match, p.uri) && !std::regex_match(input, match, p.url)) {
        return std::nullopt;
    }
    // The id is always the last capture group of either pattern.
    const std::string id_text = match[match.size() - 1].str();
    auto id = CatalogId::from_base62(id_text);
    if (!id) {
        OF_LOG("input", "reference id " << id_text << " does not fit 128 bits");
        return std::nullopt;
    }
    return Reference{kind, *id, id_text};
}

std::optional<Reference> classify_reference(std::string_view line) {
    for (auto kind : kAllKinds) {
        if (auto ref = match_reference(line, kind)) {
            return ref;
        }
    }
    return std::nullopt;
}

}  // namespace oggfetch
