//
//  output_path.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "catalog_types.hpp"
#include "status.hpp"

namespace oggfetch {

inline constexpr char kDefaultOutputTemplate[] = "{author}/{album}/{name}.{ext}";
inline constexpr char kContainerExtension[] = "ogg";
// Used for {author} when a track lists no artists.
inline constexpr char kUnknownArtist[] = "Unknown Artist";

struct OutputPath {
    std::string file;    ///< Full rendered path.
    std::string folder;  ///< Everything up to and including the last '/'.
};

// Substitute {author} (first artist), {album}, {name} ('/' replaced by ' ') and {ext}. Unknown
// placeholders are copied verbatim. Single pass: substituted values are not scanned again.
std::string render_output_template(const std::string &tmpl, const TrackRecord &record);

// Render and split the path. Fails with ErrorKind::PathTemplate when the result has no '/'.
Status derive_output_path(const std::string &tmpl, const TrackRecord &record, OutputPath &out);

}  // namespace oggfetch
