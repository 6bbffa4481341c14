//
//  reference_parser.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "catalog_id.hpp"

namespace oggfetch {

enum class ResourceKind { Track, Playlist, Album, Artist };

const char *resource_kind_name(ResourceKind kind);

/// A classified input line.
struct Reference {
    ResourceKind kind = ResourceKind::Track;
    CatalogId id;
    std::string id_text;  ///< The exact 22 character id substring that matched.
};

// Try to match `line` as a reference of one specific kind. Accepts `spotify:<kind>:<id>` and
// `[http[s]://]open.spotify.com/<kind>/<id>`, anchored on the whole line.
std::optional<Reference> match_reference(std::string_view line, ResourceKind kind);

// Try all kinds (track, playlist, album, artist). Returns nullopt for unrecognized input.
std::optional<Reference> classify_reference(std::string_view line);

}  // namespace oggfetch
