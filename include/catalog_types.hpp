//
//  catalog_types.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "catalog_id.hpp"

namespace oggfetch {

/// Audio encodings a catalog may offer for one track.
enum class AudioFileFormat {
    OggVorbis96,
    OggVorbis160,
    OggVorbis320,
    Mp3_96,
    Mp3_160,
    Mp3_256,
    Mp3_320,
    Aac24,
    Aac48,
    Flac,
};

// Names as used by the catalog ("OGG_VORBIS_320", ...).
const char *audio_file_format_name(AudioFileFormat format);
std::optional<AudioFileFormat> audio_file_format_from_name(std::string_view name);

inline constexpr size_t kAudioKeyBytes = 16;
using AudioKey = std::array<uint8_t, kAudioKeyBytes>;

/**
 * @brief One track as reported by the metadata provider.
 *
 * `id` is the canonical id of this record, which may differ from the id that was requested
 * when the record was reached through an alternative.
 */
struct TrackRecord {
    TrackId id;
    std::string name;
    std::string album_name;
    std::vector<std::string> artists;            ///< Ordered; first entry is the main artist.
    std::map<AudioFileFormat, FileId> files;     ///< Available encodings.
    std::vector<TrackId> alternatives;           ///< Ordered as returned.
};

/// A set of album ids (one grouping as returned for an artist).
struct AlbumGroup {
    std::vector<CatalogId> albums;
};

struct ArtistRecord {
    CatalogId id;
    std::string name;
    std::vector<AlbumGroup> albums;   ///< "albums" groupings.
    std::vector<AlbumGroup> singles;  ///< "singles" groupings.
};

}  // namespace oggfetch
