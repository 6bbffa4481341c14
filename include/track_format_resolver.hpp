//
//  track_format_resolver.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>

#include "catalog_id.hpp"
#include "catalog_types.hpp"
#include "providers.hpp"
#include "status.hpp"

namespace oggfetch {

/// Encodings the pipeline can handle, best first.
inline constexpr AudioFileFormat kPreferredFormats[] = {
    AudioFileFormat::OggVorbis320,
    AudioFileFormat::OggVorbis160,
    AudioFileFormat::OggVorbis96,
};

// Upper bound on track records fetched while walking one alternatives graph.
inline constexpr size_t kMaxAlternativeLookups = 64;

/// A track record together with the encrypted file chosen for it.
struct PlayableTrack {
    TrackRecord record;
    AudioFileFormat format = AudioFileFormat::OggVorbis320;
    FileId file;
};

// Pick the best acceptable file of a single record; false when none is offered.
bool select_audio_file(const TrackRecord &record, AudioFileFormat &format, FileId &file);

// Breadth-first walk from `id` over alternatives until a record offers an acceptable file.
// A failed track fetch ends the walk immediately with that error. Ids already visited are not
// fetched again.
Status resolve_playable(MetadataProvider &metadata, const TrackId &id, PlayableTrack &out);

}  // namespace oggfetch
